// ==============================================================================
// test_app_state_gtest.cpp - Тесты состояния приложений (GoogleTest)
// ==============================================================================
//
// tracking::AppPackageState: автомат состояния, метаданные
// tracking::AppPackageRegistry: политики, фильтр, каскад, замыкание
// завершения, порядок отображения, сводка
//
// ==============================================================================

#include <enrollwatch/app_state.hpp>

#include <cstdio>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace enrollwatch::tracking::test {

namespace {

const std::string APP_A = "11111111-1111-1111-1111-111111111111";
const std::string APP_B = "22222222-2222-2222-2222-222222222222";
const std::string APP_C = "33333333-3333-3333-3333-333333333333";

/// Запись политики IME; deps - идентификаторы ChildId
std::string policy(const std::string& id, const std::string& name, int intent,
                   const std::string& install_ex = "", const std::vector<std::string>& deps = {}) {
    std::string json = R"({"Id":")" + id + R"(","Name":")" + name +
                       R"(","Intent":)" + std::to_string(intent) + R"(,"TargetType":2)";
    if (!install_ex.empty()) {
        json += R"(,"InstallEx":)" + install_ex;
    }
    json += R"(,"FlatDependencies":[)";
    for (size_t i = 0; i < deps.size(); ++i) {
        if (i > 0) {
            json += ",";
        }
        json += R"({"Action":10,"AppId":")" + id + R"(","ChildId":")" + deps[i] +
                R"(","Type":0,"Level":0})";
    }
    json += "]}";
    return json;
}

std::string policies(const std::vector<std::string>& items) {
    std::string json = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            json += ",";
        }
        json += items[i];
    }
    return json + "]";
}

std::string guid(int n) {
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08d-0000-0000-0000-000000000000", n);
    return buf;
}

}  // namespace

// ==============================================================================
// Перечисления
// ==============================================================================

TEST(AppStateEnumTest, ParseWin32State) {
    EXPECT_EQ(parse_win32_state("2"), Win32AppState::InProgress);
    EXPECT_EQ(parse_win32_state("completed"), Win32AppState::Completed);
    EXPECT_EQ(parse_win32_state("0"), Win32AppState::Unknown);
    EXPECT_FALSE(parse_win32_state("5").has_value());
    EXPECT_FALSE(parse_win32_state("Done").has_value());
}

TEST(AppStateEnumTest, ParseTargetFilter) {
    EXPECT_EQ(parse_target_filter("All"), TargetFilter::All);
    EXPECT_EQ(parse_target_filter("device"), TargetFilter::DeviceOnly);
    EXPECT_EQ(parse_target_filter("USER"), TargetFilter::UserOnly);
    EXPECT_THROW(parse_target_filter("everything"), std::invalid_argument);
}

TEST(AppStateEnumTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(InstallState::Installing));
    EXPECT_TRUE(is_terminal(InstallState::Installed));
    EXPECT_TRUE(is_terminal(InstallState::Skipped));
    EXPECT_TRUE(is_terminal(InstallState::Postponed));
    EXPECT_TRUE(is_terminal(InstallState::Error));
}

// ==============================================================================
// AppPackageState
// ==============================================================================

TEST(AppPackageStateTest, IdIsLowercased) {
    AppPackageState pkg("ABCDEF01-0000-0000-0000-000000000000", 0);
    EXPECT_EQ(pkg.id(), "abcdef01-0000-0000-0000-000000000000");
    EXPECT_EQ(pkg.display_name(), pkg.id());
}

TEST(AppPackageStateTest, TerminalStateIsFinal) {
    // Arrange
    AppPackageState pkg(APP_A, 0);
    ASSERT_TRUE(pkg.update_state(InstallState::Installing));
    ASSERT_TRUE(pkg.update_state(InstallState::Error));

    // Act / Assert
    EXPECT_FALSE(pkg.update_state(InstallState::Installed));
    EXPECT_FALSE(pkg.update_state(InstallState::Downloading, 50));
    EXPECT_EQ(pkg.state(), InstallState::Error);
}

TEST(AppPackageStateTest, InstalledWithoutActivityBecomesSkipped) {
    AppPackageState pkg(APP_A, 0);

    ASSERT_TRUE(pkg.update_state(InstallState::Installed));

    EXPECT_EQ(pkg.state(), InstallState::Skipped);
    EXPECT_FALSE(pkg.downloading_or_installing_seen());
}

TEST(AppPackageStateTest, InstalledAfterDownloadFillsProgressAndBytes) {
    // Arrange
    AppPackageState pkg(APP_A, 0);
    ASSERT_TRUE(pkg.update_state(InstallState::Downloading, 0, false, 0, 4096));

    // Act
    ASSERT_TRUE(pkg.update_state(InstallState::Installed));

    // Assert
    EXPECT_EQ(pkg.state(), InstallState::Installed);
    EXPECT_EQ(pkg.progress_percent(), 100);
    EXPECT_EQ(pkg.bytes_total(), 4096);
    EXPECT_EQ(pkg.bytes_downloaded(), 4096);
}

TEST(AppPackageStateTest, UpgradeOnlyIgnoresLowerState) {
    AppPackageState pkg(APP_A, 0);
    ASSERT_TRUE(pkg.update_state(InstallState::Installing));

    EXPECT_FALSE(pkg.update_state(InstallState::InProgress, std::nullopt, true));
    EXPECT_EQ(pkg.state(), InstallState::Installing);

    // Без upgrade_only откат разрешён
    EXPECT_TRUE(pkg.update_state(InstallState::InProgress));
}

TEST(AppPackageStateTest, SameStateSameProgressIsNoChange) {
    AppPackageState pkg(APP_A, 0);
    ASSERT_TRUE(pkg.update_state(InstallState::Downloading, 10, false, 100, 1000));
    EXPECT_FALSE(pkg.update_state(InstallState::Downloading, 10, false, 100, 1000));
    EXPECT_TRUE(pkg.update_state(InstallState::Downloading, 20, false, 200, 1000));
}

TEST(AppPackageStateTest, Win32StateMapping) {
    AppPackageState pkg(APP_A, 0);

    EXPECT_FALSE(pkg.update_state_from_win32(Win32AppState::NotInstalled));
    EXPECT_TRUE(pkg.update_state_from_win32(Win32AppState::InProgress));
    EXPECT_EQ(pkg.state(), InstallState::InProgress);
    EXPECT_FALSE(pkg.update_state_from_win32(Win32AppState::Unknown));
    EXPECT_TRUE(pkg.update_state_from_win32(Win32AppState::Completed));
    // InProgress не отмечает загрузку/установку
    EXPECT_EQ(pkg.state(), InstallState::Skipped);
}

TEST(AppPackageStateTest, UpdateName_RejectsTruncatedPrefix) {
    AppPackageState pkg(APP_A, 0);

    EXPECT_TRUE(pkg.update_name("Microsoft 365 Apps for enterprise"));
    EXPECT_FALSE(pkg.update_name("Microsoft 365"));
    EXPECT_FALSE(pkg.update_name(""));
    EXPECT_TRUE(pkg.update_name("Office"));
    EXPECT_EQ(pkg.name(), "Office");
}

TEST(AppPackageStateTest, RecordRoundtrip) {
    // Arrange
    AppPackageState pkg(APP_A, 3);
    pkg.update_name("Company Portal");
    pkg.update_intent(Intent::Install);
    pkg.update_run_as(RunAs::System);
    pkg.update_depends_on({APP_B});
    pkg.update_state(InstallState::Downloading, 40, false, 400, 1000);

    // Act
    AppPackageState back = AppPackageState::from_record(pkg.record());

    // Assert
    EXPECT_EQ(back.id(), APP_A);
    EXPECT_EQ(back.list_pos(), 3);
    EXPECT_EQ(back.name(), "Company Portal");
    EXPECT_EQ(back.intent(), Intent::Install);
    EXPECT_EQ(back.run_as(), RunAs::System);
    EXPECT_EQ(back.depends_on().count(APP_B), 1u);
    EXPECT_EQ(back.state(), InstallState::Downloading);
    EXPECT_TRUE(back.downloading_or_installing_seen());
    EXPECT_EQ(back.progress_percent(), 40);
    EXPECT_EQ(back.bytes_downloaded(), 400);
    EXPECT_GT(pkg.last_changed(), 0);
    EXPECT_EQ(back.last_changed(), pkg.last_changed());
}

TEST(AppPackageStateTest, EventData) {
    AppPackageState pkg(APP_A, 0);
    pkg.update_name("Company Portal");
    pkg.update_state(InstallState::Installing);
    pkg.update_state(InstallState::Error);

    Value data = pkg.to_event_data();

    EXPECT_EQ(data.get("appId")->as_string(), APP_A);
    EXPECT_EQ(data.get("appName")->as_string(), "Company Portal");
    EXPECT_EQ(data.get("state")->as_string(), "Error");
    EXPECT_EQ(data.get("runAs")->as_string(), "Unknown");
    EXPECT_TRUE(data.get("isError")->as_bool());
    EXPECT_TRUE(data.get("isCompleted")->as_bool());
}

// ==============================================================================
// AppPackageRegistry: политики
// ==============================================================================

TEST(AppRegistryTest, Policies_CreateInOrderWithMetadata) {
    // Arrange
    AppPackageRegistry registry;
    std::string json = policies({
        policy(APP_A, "Company Portal", 3, R"("{\"RunAs\":1}")"),
        policy(APP_B, "Microsoft 365 Apps", 3, R"({"RunAs":0})", {APP_C}),
        policy(APP_C, "VC Redist", 0),
    });

    // Act
    PolicyResult result = registry.add_update_from_policies(json);

    // Assert
    ASSERT_TRUE(result) << result.error;
    EXPECT_EQ(result.discovered, 3u);
    EXPECT_EQ(result.created, 3u);
    EXPECT_EQ(result.tracked, 3u);
    ASSERT_EQ(registry.count_all(), 3u);

    const auto* a = registry.find(APP_A);
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(a->list_pos(), 0);
    EXPECT_EQ(a->run_as(), RunAs::System);
    EXPECT_EQ(a->intent(), Intent::Install);
    EXPECT_EQ(a->targeted(), Targeted::Device);

    const auto* b = registry.find(APP_B);
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->run_as(), RunAs::User);
    EXPECT_EQ(b->depends_on().count(APP_C), 1u);

    const auto* c = registry.find(APP_C);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->intent(), Intent::NotTargeted);
    EXPECT_FALSE(c->is_required());
}

TEST(AppRegistryTest, Policies_SecondDiscoveryUpdatesInPlace) {
    AppPackageRegistry registry;
    ASSERT_TRUE(registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)})));

    PolicyResult again = registry.add_update_from_policies(
        policies({policy(APP_A, "Company Portal", 3), policy(APP_B, "Teams", 3)}));

    ASSERT_TRUE(again);
    EXPECT_EQ(again.created, 1u);
    EXPECT_EQ(registry.count_all(), 2u);
    EXPECT_EQ(registry.find(APP_A)->name(), "Company Portal");
    EXPECT_EQ(registry.find(APP_B)->list_pos(), 1);
}

TEST(AppRegistryTest, Policies_InvalidJsonLeavesRegistryUntouched) {
    AppPackageRegistry registry;

    PolicyResult broken = registry.add_update_from_policies(R"([{"Id":"x")");
    PolicyResult not_array = registry.add_update_from_policies(R"({"Id":"x"})");

    EXPECT_FALSE(broken);
    EXPECT_NE(broken.error.find("parse error"), std::string::npos);
    EXPECT_FALSE(not_array);
    EXPECT_EQ(registry.count_all(), 0u);
}

TEST(AppRegistryTest, Policies_EntriesWithoutIdSkipped) {
    AppPackageRegistry registry;

    PolicyResult result = registry.add_update_from_policies(R"([{"Name":"nameless"},{"Id":""}])");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.discovered, 0u);
    EXPECT_EQ(registry.count_all(), 0u);
}

TEST(AppRegistryTest, DeviceFilter_IgnoresUserContextApps) {
    // Arrange
    AppPackageRegistry registry(nullptr, TargetFilter::DeviceOnly);
    std::string json = policies({
        policy(APP_A, "Company Portal", 3, R"({"RunAs":1})"),
        policy(APP_B, "OneDrive per-user", 3, R"({"RunAs":0})"),
    });

    // Act
    PolicyResult result = registry.add_update_from_policies(json);

    // Assert
    ASSERT_TRUE(result);
    EXPECT_EQ(result.ignored, 1u);
    EXPECT_EQ(registry.count_all(), 1u);
    EXPECT_TRUE(registry.is_ignored(APP_B));
    EXPECT_EQ(registry.find(APP_B), nullptr);

    // Повторное обнаружение не дублирует список игнорирования
    registry.add_update_from_policies(json);
    EXPECT_EQ(registry.ignored_count(), 1u);
}

TEST(AppRegistryTest, IgnoreList_RefusesTrackedAndDuplicates) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));

    EXPECT_FALSE(registry.add_to_ignore_list(APP_A));
    EXPECT_FALSE(registry.add_to_ignore_list(""));
    EXPECT_TRUE(registry.add_to_ignore_list(APP_B));
    EXPECT_FALSE(registry.add_to_ignore_list(APP_B));
    EXPECT_TRUE(registry.is_ignored(APP_B));
    EXPECT_EQ(registry.ignored_count(), 1u);
}

TEST(AppRegistryTest, SilenceAll_MovesTrackedAppsToIgnoreList) {
    // Arrange
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Portal", 3),
        policy(APP_B, "Office", 3),
    }));
    registry.add_to_ignore_list(APP_C);
    registry.set_current(APP_A);
    registry.update_state(APP_A, InstallState::Installing);
    registry.update_state(APP_A, InstallState::Installed);

    // Act
    std::size_t silenced = registry.silence_all();

    // Assert
    EXPECT_EQ(silenced, 2u);
    EXPECT_EQ(registry.count_all(), 0u);
    EXPECT_EQ(registry.ignored_count(), 3u);
    EXPECT_TRUE(registry.is_ignored(APP_A));
    EXPECT_TRUE(registry.is_ignored(APP_B));
    EXPECT_TRUE(registry.current_id().empty());
    EXPECT_FALSE(registry.sort_errors_to_top());

    // Повторное сообщение о пакете прошлой фазы
    PolicyResult result = registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));
    EXPECT_EQ(result.ignored, 1u);
    EXPECT_EQ(registry.count_all(), 0u);
    EXPECT_TRUE(registry.update_state(APP_A, InstallState::Error).empty());
}

TEST(AppRegistryTest, IgnoredAppNeverTracked) {
    AppPackageRegistry registry;
    ASSERT_TRUE(registry.add_to_ignore_list(APP_B));

    PolicyResult result = registry.add_update_from_policies(policies({policy(APP_B, "Teams", 3)}));

    EXPECT_EQ(result.ignored, 1u);
    EXPECT_EQ(registry.count_all(), 0u);
    EXPECT_TRUE(registry.update_state(APP_B, InstallState::Installing).empty());
}

// ==============================================================================
// AppPackageRegistry: переходы и каскад
// ==============================================================================

TEST(AppRegistryTest, UpdateState_CaseInsensitiveLookup) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(
        policies({policy("abcdef01-1111-1111-1111-111111111111", "Portal", 3)}));

    auto changes = registry.update_state("ABCDEF01-1111-1111-1111-111111111111", InstallState::Installing);

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].old_state, InstallState::Unknown);
    EXPECT_EQ(changes[0].new_state, InstallState::Installing);
    EXPECT_TRUE(registry.update_state("no-such-app", InstallState::Installing).empty());
}

TEST(AppRegistryTest, ErrorCascadesToDependents) {
    // Arrange: C зависит от B, B зависит от A
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Runtime", 3),
        policy(APP_B, "Framework", 3, "", {APP_A}),
        policy(APP_C, "Line of business", 3, "", {APP_B}),
    }));

    // Act
    auto changes = registry.update_state(APP_A, InstallState::Error);

    // Assert
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].id, APP_A);
    EXPECT_EQ(registry.find(APP_B)->state(), InstallState::Error);
    EXPECT_EQ(registry.find(APP_C)->state(), InstallState::Error);
    EXPECT_EQ(registry.error_count(), 3u);
    EXPECT_TRUE(registry.is_all_completed());
}

TEST(AppRegistryTest, PostponedCascadesButInstalledDoesNot) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Runtime", 3),
        policy(APP_B, "App", 3, "", {APP_A}),
    }));

    registry.update_state(APP_A, InstallState::Installing);
    registry.update_state(APP_A, InstallState::Installed);
    EXPECT_EQ(registry.find(APP_B)->state(), InstallState::Unknown);

    AppPackageRegistry second;
    second.add_update_from_policies(policies({
        policy(APP_A, "Runtime", 3),
        policy(APP_B, "App", 3, "", {APP_A}),
    }));
    second.update_state(APP_A, InstallState::Postponed);
    EXPECT_EQ(second.find(APP_B)->state(), InstallState::Postponed);
}

TEST(AppRegistryTest, CascadeSkipsCompletedDependents) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Runtime", 3),
        policy(APP_B, "App", 3, "", {APP_A}),
    }));
    registry.update_state(APP_B, InstallState::Installing);
    registry.update_state(APP_B, InstallState::Installed);

    auto changes = registry.update_state(APP_A, InstallState::Error);

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(registry.find(APP_B)->state(), InstallState::Installed);
}

TEST(AppRegistryTest, DependentsDeep_CycleTerminates) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "A", 3, "", {APP_B}),
        policy(APP_B, "B", 3, "", {APP_A}),
    }));

    auto dependents = registry.dependents_deep(APP_A);

    ASSERT_EQ(dependents.size(), 1u);
    EXPECT_EQ(*dependents.begin(), APP_B);
}

TEST(AppRegistryTest, DependentsDeep_LimitedToMaxDepth) {
    // Arrange: цепочка из 12 пакетов, каждый зависит от предыдущего
    AppPackageRegistry registry;
    std::vector<std::string> items;
    items.push_back(policy(guid(0), "p0", 3));
    for (int i = 1; i < 12; ++i) {
        items.push_back(policy(guid(i), "p" + std::to_string(i), 3, "", {guid(i - 1)}));
    }
    ASSERT_TRUE(registry.add_update_from_policies(policies(items)));

    // Act
    auto dependents = registry.dependents_deep(guid(0));

    // Assert
    EXPECT_EQ(dependents.size(), static_cast<size_t>(AppPackageRegistry::MAX_DEPENDENCY_DEPTH));
    EXPECT_EQ(dependents.count(guid(10)), 1u);
    EXPECT_EQ(dependents.count(guid(11)), 0u);
}

// ==============================================================================
// AppPackageRegistry: загрузка и Win32AppState
// ==============================================================================

TEST(AppRegistryTest, Downloading_ComputesPercentAndSuppressesPhantom) {
    // Arrange
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));

    // Act / Assert: фантомная загрузка подавлена
    EXPECT_TRUE(registry.update_downloading(APP_A, "0", "512").empty());
    EXPECT_TRUE(registry.update_downloading(APP_A, "abc", "xyz").empty());
    EXPECT_EQ(registry.find(APP_A)->state(), InstallState::Unknown);

    auto changes = registry.update_downloading(APP_A, "524288", "1048576");
    ASSERT_EQ(changes.size(), 1u);
    const auto* a = registry.find(APP_A);
    EXPECT_EQ(a->state(), InstallState::Downloading);
    EXPECT_EQ(a->progress_percent(), 50);
    EXPECT_EQ(a->bytes_downloaded(), 524288);
    EXPECT_EQ(a->bytes_total(), 1048576);
}

TEST(AppRegistryTest, Downloading_PercentClampedWhenBytesExceedTotal) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));

    auto changes = registry.update_downloading(APP_A, "9000000000000000", "2048");

    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(registry.find(APP_A)->progress_percent(), 100);
    EXPECT_EQ(registry.find(APP_A)->bytes_downloaded(), 9000000000000000);
}

TEST(AppRegistryTest, Downloading_IgnoredForCompletedApp) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));
    registry.update_state(APP_A, InstallState::Error);

    EXPECT_TRUE(registry.update_downloading(APP_A, "2048", "4096").empty());
}

TEST(AppRegistryTest, Win32State_UpgradeOnly) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));
    registry.update_state(APP_A, InstallState::Installing);

    EXPECT_TRUE(registry.update_from_win32_state(APP_A, "InProgress").empty());
    EXPECT_TRUE(registry.update_from_win32_state(APP_A, "7").empty());

    auto changes = registry.update_from_win32_state(APP_A, "3");
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].new_state, InstallState::Installed);
}

// ==============================================================================
// AppPackageRegistry: завершение
// ==============================================================================

TEST(AppRegistryTest, IsAllCompleted_EmptyIsFalse) {
    AppPackageRegistry registry;
    EXPECT_FALSE(registry.is_all_completed());
}

TEST(AppRegistryTest, CompletionClosure_SkipsUntouchedOptionalApps) {
    // Arrange: B обязателен и зависит от необязательного C
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Portal", 3),
        policy(APP_B, "Office", 3, "", {APP_C}),
        policy(APP_C, "VC Redist", 0),
    }));
    registry.update_state(APP_A, InstallState::Installing);
    registry.update_state(APP_A, InstallState::Installed);
    EXPECT_FALSE(registry.is_all_completed());

    // Act
    auto changes = registry.update_state(APP_B, InstallState::Error);

    // Assert
    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[1].id, APP_C);
    EXPECT_EQ(changes[1].new_state, InstallState::Skipped);
    EXPECT_TRUE(registry.is_all_completed());
    EXPECT_TRUE(registry.sort_errors_to_top());
}

TEST(AppRegistryTest, OnlyOptionalApps_CompleteWhenAllTerminal) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Optional 1", 1),
        policy(APP_B, "Optional 2", 0),
    }));

    registry.update_state(APP_A, InstallState::Skipped);
    EXPECT_FALSE(registry.is_all_completed());
    registry.update_state(APP_B, InstallState::Skipped);
    EXPECT_TRUE(registry.is_all_completed());
}

// ==============================================================================
// AppPackageRegistry: отображение и сводка
// ==============================================================================

TEST(AppRegistryTest, PresentationOrder_CompletedFirstErrorsOnTopAtEnd) {
    // Arrange
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "A", 3),
        policy(APP_B, "B", 3),
        policy(APP_C, "C", 3),
    }));
    registry.update_state(APP_C, InstallState::Installing);

    // Act
    auto order = registry.presentation_order();

    // Assert: Installing выше Unknown, среди Unknown - порядок политик
    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0]->id(), APP_C);
    EXPECT_EQ(order[1]->id(), APP_A);
    EXPECT_EQ(order[2]->id(), APP_B);

    // Все завершены: ошибки наверх
    registry.update_state(APP_C, InstallState::Installed);
    registry.update_state(APP_A, InstallState::Installing);
    registry.update_state(APP_A, InstallState::Installed);
    registry.update_state(APP_B, InstallState::Error);
    order = registry.presentation_order();
    ASSERT_TRUE(registry.sort_errors_to_top());
    EXPECT_EQ(order[2]->id(), APP_B);
}

TEST(AppRegistryTest, SummaryData) {
    // Arrange
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({
        policy(APP_A, "Portal", 3),
        policy(APP_B, "Office", 3),
    }));
    registry.add_to_ignore_list(APP_C);
    registry.update_state(APP_A, InstallState::Error);

    // Act
    Value data = registry.summary_data();

    // Assert
    EXPECT_EQ(data.get("totalApps")->as_int(), 2);
    EXPECT_EQ(data.get("completedApps")->as_int(), 1);
    EXPECT_EQ(data.get("errorCount")->as_int(), 1);
    EXPECT_TRUE(data.get("hasErrors")->as_bool());
    EXPECT_FALSE(data.get("isAllCompleted")->as_bool());
    EXPECT_EQ(data.get("ignoredCount")->as_int(), 1);
    EXPECT_EQ(data.get("apps")->array_size(), 2u);
}

TEST(AppRegistryTest, Restore_ReplacesContents) {
    AppPackageRegistry registry;
    registry.add_update_from_policies(policies({policy(APP_A, "Portal", 3)}));

    std::vector<AppPackageState> packages;
    packages.emplace_back(APP_B, 0);
    registry.restore(std::move(packages), {"33333333-3333-3333-3333-33333333333C"}, APP_B);

    EXPECT_EQ(registry.count_all(), 1u);
    EXPECT_EQ(registry.find(APP_A), nullptr);
    EXPECT_NE(registry.find(APP_B), nullptr);
    EXPECT_EQ(registry.ignore_list()[0], "33333333-3333-3333-3333-33333333333c");
    EXPECT_EQ(registry.current_id(), APP_B);
}

}  // namespace enrollwatch::tracking::test
