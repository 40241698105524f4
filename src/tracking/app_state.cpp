// ==============================================================================
// app_state.cpp - Состояние установки приложений
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <enrollwatch/app_state.hpp>
#include <enrollwatch/output.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace enrollwatch::tracking {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

/// Метка изменения; system_clock, чтобы порядок пережил перезапуск агента
std::int64_t now_ticks() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// Целое из строки; нечисловое значение - 0
std::int64_t parse_int64_or_zero(std::string_view s) {
    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return 0;
    }
    return v;
}

// ----------------------------------------------------------------------------
// Разбор полей политики
// ----------------------------------------------------------------------------

/// Целое из числа или строки с числом
std::optional<int> json_int(const rapidjson::Value& v) {
    if (v.IsInt()) {
        return v.GetInt();
    }
    if (v.IsInt64()) {
        return static_cast<int>(v.GetInt64());
    }
    if (v.IsString()) {
        std::string_view s(v.GetString(), v.GetStringLength());
        int out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec == std::errc() && ptr == s.data() + s.size()) {
            return out;
        }
    }
    return std::nullopt;
}

std::string json_string(const rapidjson::Value& v) {
    if (v.IsString()) {
        return std::string(v.GetString(), v.GetStringLength());
    }
    if (v.IsInt64()) {
        return std::to_string(v.GetInt64());
    }
    if (v.IsUint64()) {
        return std::to_string(v.GetUint64());
    }
    return {};
}

const rapidjson::Value* member(const rapidjson::Value& obj, const char* key) {
    if (!obj.IsObject()) {
        return nullptr;
    }
    auto it = obj.FindMember(key);
    return it == obj.MemberEnd() ? nullptr : &it->value;
}

std::optional<Intent> parse_intent(const rapidjson::Value& v) {
    if (auto n = json_int(v)) {
        switch (*n) {
        case -1:
            return Intent::Unknown;
        case 0:
            return Intent::NotTargeted;
        case 1:
            return Intent::Available;
        case 3:
            return Intent::Install;
        case 4:
            return Intent::Uninstall;
        default:
            return std::nullopt;
        }
    }
    if (v.IsString()) {
        std::string_view s(v.GetString(), v.GetStringLength());
        for (auto i : {Intent::Unknown, Intent::NotTargeted, Intent::Available, Intent::Install,
                       Intent::Uninstall}) {
            if (iequals(s, to_string(i))) {
                return i;
            }
        }
    }
    return std::nullopt;
}

std::optional<Targeted> parse_targeted(const rapidjson::Value& v) {
    if (auto n = json_int(v)) {
        switch (*n) {
        case 128:
            return Targeted::Unknown;
        case 0:
            return Targeted::Dependency;
        case 1:
            return Targeted::User;
        case 2:
            return Targeted::Device;
        default:
            return std::nullopt;
        }
    }
    if (v.IsString()) {
        std::string_view s(v.GetString(), v.GetStringLength());
        for (auto t : {Targeted::Unknown, Targeted::Dependency, Targeted::User, Targeted::Device}) {
            if (iequals(s, to_string(t))) {
                return t;
            }
        }
    }
    return std::nullopt;
}

RunAs run_as_from_int(int n) {
    switch (n) {
    case 0:
        return RunAs::User;
    case 1:
        return RunAs::System;
    default:
        return RunAs::Unknown;
    }
}

/// InstallEx - JSON строка или объект с полем RunAs
RunAs extract_run_as(const rapidjson::Value& install_ex) {
    if (install_ex.IsObject()) {
        if (const auto* run_as = member(install_ex, "RunAs")) {
            if (auto n = json_int(*run_as)) {
                return run_as_from_int(*n);
            }
        }
        return RunAs::Unknown;
    }

    if (install_ex.IsString() && install_ex.GetStringLength() > 0) {
        rapidjson::Document nested;
        nested.Parse(install_ex.GetString(), install_ex.GetStringLength());
        if (!nested.HasParseError() && nested.IsObject()) {
            return extract_run_as(nested);
        }
    }
    return RunAs::Unknown;
}

/// Зависимости из FlatDependencies:
/// {Action:10, AppId:<этот пакет>, ChildId:<зависимость>, Type:0, Level:0}
std::set<std::string> extract_dependencies(const rapidjson::Value& flat, const std::string& app_id) {
    std::set<std::string> result;
    if (!flat.IsArray()) {
        return result;
    }

    for (const auto& dep : flat.GetArray()) {
        const auto* action = member(dep, "Action");
        const auto* parent = member(dep, "AppId");
        const auto* child = member(dep, "ChildId");
        const auto* type = member(dep, "Type");
        const auto* level = member(dep, "Level");
        if (!action || !parent || !child || !type || !level) {
            continue;
        }
        if (json_int(*action) == 10 && iequals(json_string(*parent), app_id) &&
            json_int(*type) == 0 && json_int(*level) == 0) {
            std::string child_id = to_lower(json_string(*child));
            if (!child_id.empty()) {
                result.insert(std::move(child_id));
            }
        }
    }
    return result;
}

}  // namespace

// ============================================================================
// Enum conversions
// ============================================================================

std::string to_string(InstallState s) {
    switch (s) {
    case InstallState::Unknown:
        return "Unknown";
    case InstallState::NotInstalled:
        return "NotInstalled";
    case InstallState::InProgress:
        return "InProgress";
    case InstallState::Downloading:
        return "Downloading";
    case InstallState::Installing:
        return "Installing";
    case InstallState::Installed:
        return "Installed";
    case InstallState::Skipped:
        return "Skipped";
    case InstallState::Postponed:
        return "Postponed";
    case InstallState::Error:
        return "Error";
    }
    return "Unknown";
}

std::string to_string(RunAs r) {
    switch (r) {
    case RunAs::Unknown:
        return "Unknown";
    case RunAs::User:
        return "User";
    case RunAs::System:
        return "System";
    }
    return "Unknown";
}

std::string to_string(Intent i) {
    switch (i) {
    case Intent::Unknown:
        return "Unknown";
    case Intent::NotTargeted:
        return "NotTargeted";
    case Intent::Available:
        return "Available";
    case Intent::Install:
        return "Install";
    case Intent::Uninstall:
        return "Uninstall";
    }
    return "Unknown";
}

std::string to_string(Targeted t) {
    switch (t) {
    case Targeted::Unknown:
        return "Unknown";
    case Targeted::Dependency:
        return "Dependency";
    case Targeted::User:
        return "User";
    case Targeted::Device:
        return "Device";
    }
    return "Unknown";
}

std::string to_string(TargetFilter f) {
    switch (f) {
    case TargetFilter::All:
        return "all";
    case TargetFilter::DeviceOnly:
        return "device";
    case TargetFilter::UserOnly:
        return "user";
    }
    return "all";
}

std::optional<Win32AppState> parse_win32_state(std::string_view s) {
    static constexpr std::pair<Win32AppState, std::string_view> NAMES[] = {
        {Win32AppState::Unknown, "Unknown"},       {Win32AppState::NotInstalled, "NotInstalled"},
        {Win32AppState::InProgress, "InProgress"}, {Win32AppState::Completed, "Completed"},
        {Win32AppState::Error, "Error"},
    };

    int n = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (ec == std::errc() && ptr == s.data() + s.size()) {
        if (n >= 0 && n <= 4) {
            return static_cast<Win32AppState>(n);
        }
        return std::nullopt;
    }

    for (const auto& [state, name] : NAMES) {
        if (iequals(s, name)) {
            return state;
        }
    }
    return std::nullopt;
}

TargetFilter parse_target_filter(std::string_view s) {
    std::string v = to_lower(s);
    if (v == "all" || v.empty()) {
        return TargetFilter::All;
    }
    if (v == "device" || v == "deviceonly" || v == "device_only") {
        return TargetFilter::DeviceOnly;
    }
    if (v == "user" || v == "useronly" || v == "user_only") {
        return TargetFilter::UserOnly;
    }
    throw std::invalid_argument("unknown target filter '" + std::string(s) + "'");
}

bool is_terminal(InstallState s) {
    return s >= InstallState::Installed;
}

// ============================================================================
// AppPackageState
// ============================================================================

AppPackageState::AppPackageState(std::string id, int list_pos)
    : id_(to_lower(id)), list_pos_(list_pos) {}

AppPackageState AppPackageState::from_record(const PackageRecord& record) {
    AppPackageState pkg(record.id, record.list_pos);
    pkg.name_ = record.name;
    pkg.run_as_ = record.run_as;
    pkg.intent_ = record.intent;
    pkg.targeted_ = record.targeted;
    for (const auto& dep : record.depends_on) {
        pkg.depends_on_.insert(to_lower(dep));
    }
    pkg.state_ = record.state;
    pkg.downloading_or_installing_seen_ = record.downloading_or_installing_seen;
    pkg.progress_percent_ = record.progress_percent;
    pkg.bytes_downloaded_ = record.bytes_downloaded;
    pkg.bytes_total_ = record.bytes_total;
    pkg.last_changed_ = record.last_changed;
    return pkg;
}

PackageRecord AppPackageState::record() const {
    PackageRecord r;
    r.id = id_;
    r.list_pos = list_pos_;
    r.name = name_;
    r.run_as = run_as_;
    r.intent = intent_;
    r.targeted = targeted_;
    r.depends_on = depends_on_;
    r.state = state_;
    r.downloading_or_installing_seen = downloading_or_installing_seen_;
    r.progress_percent = progress_percent_;
    r.bytes_downloaded = bytes_downloaded_;
    r.bytes_total = bytes_total_;
    r.last_changed = last_changed_;
    return r;
}

bool AppPackageState::update_name(const std::string& name) {
    if (name.empty() || name == name_) {
        return false;
    }
    // Усечённый вывод журнала не затирает полное имя
    if (!name_.empty() && name_.compare(0, name.size(), name) == 0) {
        return false;
    }
    name_ = name;
    return true;
}

bool AppPackageState::update_run_as(RunAs run_as) {
    if (run_as_ == run_as) {
        return false;
    }
    run_as_ = run_as;
    return true;
}

bool AppPackageState::update_intent(Intent intent) {
    if (intent_ == intent) {
        return false;
    }
    intent_ = intent;
    return true;
}

bool AppPackageState::update_targeted(Targeted targeted) {
    if (targeted_ == targeted) {
        return false;
    }
    targeted_ = targeted;
    return true;
}

bool AppPackageState::update_depends_on(std::set<std::string> depends_on) {
    if (depends_on_ == depends_on) {
        return false;
    }
    depends_on_ = std::move(depends_on);
    return true;
}

bool AppPackageState::update_state(InstallState new_state, std::optional<int> progress,
                                   bool upgrade_only, std::int64_t bytes_downloaded,
                                   std::int64_t bytes_total) {
    if (is_terminal(state_)) {
        return false;
    }
    if (upgrade_only && new_state < state_) {
        return false;
    }

    // Installed без загрузки/установки: обратная логика обнаружения
    // (пакет удаления "установлен", когда старое ПО не найдено)
    if (new_state == InstallState::Installed && !downloading_or_installing_seen_) {
        new_state = InstallState::Skipped;
    }

    if (new_state == state_ && progress == progress_percent_ &&
        bytes_downloaded == bytes_downloaded_ && bytes_total == bytes_total_) {
        return false;
    }

    state_ = new_state;
    last_changed_ = now_ticks();
    if (state_ == InstallState::Downloading || state_ == InstallState::Installing) {
        downloading_or_installing_seen_ = true;
    }

    if (state_ == InstallState::Installed && !progress) {
        progress_percent_ = 100;
    } else {
        progress_percent_ = progress;
    }

    if (bytes_downloaded > 0 || bytes_total > 0) {
        bytes_downloaded_ = bytes_downloaded;
        bytes_total_ = bytes_total;
    }

    // WinGet всегда пишет "bytes 0/<total>"
    if (state_ == InstallState::Installed && bytes_total_ > 0 && bytes_downloaded_ < bytes_total_) {
        bytes_downloaded_ = bytes_total_;
    }

    return true;
}

bool AppPackageState::update_state_from_win32(Win32AppState state) {
    switch (state) {
    case Win32AppState::Unknown:
        return update_state(InstallState::Unknown, std::nullopt, true);
    case Win32AppState::InProgress:
        return update_state(InstallState::InProgress, std::nullopt, true);
    case Win32AppState::Completed:
        return update_state(InstallState::Installed, std::nullopt, true);
    case Win32AppState::Error:
        return update_state(InstallState::Error, std::nullopt, true);
    case Win32AppState::NotInstalled:
        return false;
    }
    return false;
}

int AppPackageState::sort_key(bool errors_first) const {
    if (errors_first && state_ == InstallState::Error) {
        return -1;
    }
    switch (state_) {
    case InstallState::Skipped:
    case InstallState::Postponed:
    case InstallState::Error:
        return static_cast<int>(InstallState::Installed);
    default:
        return static_cast<int>(state_);
    }
}

Value AppPackageState::to_event_data() const {
    Value data = Value::make_object();
    data.with("appId", Value(id_))
        .with("name", Value(display_name()))
        .with("appName", Value(display_name()))
        .with("state", Value(to_string(state_)))
        .with("intent", Value(to_string(intent_)))
        .with("targeted", Value(to_string(targeted_)))
        .with("runAs", Value(to_string(run_as_)))
        .with("progressPercent", Value(progress_percent_.value_or(0)))
        .with("bytesDownloaded", Value(bytes_downloaded_))
        .with("bytesTotal", Value(bytes_total_))
        .with("isError", Value(is_error()))
        .with("isCompleted", Value(is_completed()));
    return data;
}

// ============================================================================
// AppPackageRegistry
// ============================================================================

AppPackageRegistry::AppPackageRegistry(output::Writer* log, TargetFilter filter)
    : log_(log), filter_(filter) {}

const AppPackageState* AppPackageRegistry::find(std::string_view id) const {
    if (id.empty() || is_ignored(id)) {
        return nullptr;
    }
    for (const auto& pkg : packages_) {
        if (iequals(pkg.id(), id)) {
            return &pkg;
        }
    }
    return nullptr;
}

AppPackageState* AppPackageRegistry::find_mut(std::string_view id) {
    return const_cast<AppPackageState*>(std::as_const(*this).find(id));
}

bool AppPackageRegistry::is_ignored(std::string_view id) const {
    return std::any_of(ignore_list_.begin(), ignore_list_.end(),
                       [id](const std::string& ignored) { return iequals(ignored, id); });
}

void AppPackageRegistry::set_current(std::string_view id) {
    current_id_ = to_lower(id);
}

bool AppPackageRegistry::add_to_ignore_list(std::string_view id) {
    if (id.empty() || is_ignored(id)) {
        return false;
    }
    // Отслеживаемый пакет не может стать игнорируемым
    if (find(id) != nullptr) {
        return false;
    }
    ignore_list_.push_back(to_lower(id));
    return true;
}

std::size_t AppPackageRegistry::silence_all() {
    const std::size_t silenced = packages_.size();
    for (const auto& pkg : packages_) {
        if (!is_ignored(pkg.id())) {
            ignore_list_.push_back(pkg.id());
        }
    }
    packages_.clear();
    current_id_.clear();
    sort_errors_to_top_ = false;
    return silenced;
}

PolicyResult AppPackageRegistry::add_update_from_policies(std::string_view json_text) {
    PolicyResult result;

    rapidjson::Document doc;
    doc.Parse(json_text.data(), json_text.size());
    if (doc.HasParseError()) {
        result.error = std::string("policies JSON parse error at offset ") +
                       std::to_string(doc.GetErrorOffset()) + ": " +
                       rapidjson::GetParseError_En(doc.GetParseError());
        return result;
    }
    if (!doc.IsArray()) {
        result.error = "policies JSON is not an array";
        return result;
    }

    bool updated = false;
    for (const auto& policy : doc.GetArray()) {
        const auto* id_value = member(policy, "Id");
        if (id_value == nullptr) {
            continue;
        }
        std::string id = to_lower(json_string(*id_value));
        if (id.empty()) {
            continue;
        }
        ++result.discovered;

        RunAs run_as = RunAs::Unknown;
        if (const auto* install_ex = member(policy, "InstallEx")) {
            run_as = extract_run_as(*install_ex);
        }

        bool filtered = (filter_ == TargetFilter::DeviceOnly && run_as == RunAs::User) ||
                        (filter_ == TargetFilter::UserOnly && run_as == RunAs::System);
        if (filtered) {
            if (add_to_ignore_list(id)) {
                ++result.ignored;
                updated = true;
            }
            continue;
        }
        if (is_ignored(id)) {
            ++result.ignored;
            continue;
        }

        AppPackageState* pkg = find_mut(id);
        if (pkg == nullptr) {
            packages_.emplace_back(id, static_cast<int>(packages_.size()));
            pkg = &packages_.back();
            ++result.created;
            updated = true;
        }
        ++result.tracked;

        if (const auto* name = member(policy, "Name")) {
            updated |= pkg->update_name(json_string(*name));
        }
        if (const auto* intent = member(policy, "Intent")) {
            if (auto parsed = parse_intent(*intent)) {
                updated |= pkg->update_intent(*parsed);
            }
        }
        if (const auto* target = member(policy, "TargetType")) {
            if (auto parsed = parse_targeted(*target)) {
                updated |= pkg->update_targeted(*parsed);
            }
        }
        if (run_as != RunAs::Unknown) {
            updated |= pkg->update_run_as(run_as);
        }
        if (const auto* flat = member(policy, "FlatDependencies")) {
            updated |= pkg->update_depends_on(extract_dependencies(*flat, id));
        }
    }

    if (updated) {
        after_mutation(result.changes);
        log_states();
    }

    result.ok = true;
    return result;
}

bool AppPackageRegistry::update_name(std::string_view id, const std::string& name) {
    AppPackageState* pkg = find_mut(id);
    if (pkg == nullptr) {
        return false;
    }
    bool updated = pkg->update_name(name);
    if (updated) {
        log_states();
    }
    return updated;
}

std::vector<StateChange> AppPackageRegistry::update_state(std::string_view id, InstallState state,
                                                          std::optional<int> progress) {
    std::vector<StateChange> changes;

    std::vector<std::string> ids{to_lower(id)};
    if (state == InstallState::Error || state == InstallState::Postponed) {
        for (const auto& dependent : dependents_deep(id)) {
            if (dependent != ids.front()) {
                ids.push_back(dependent);
            }
        }
    }

    for (const auto& target : ids) {
        AppPackageState* pkg = find_mut(target);
        if (pkg == nullptr) {
            continue;
        }
        InstallState old_state = pkg->state();
        if (pkg->update_state(state, progress)) {
            changes.push_back({pkg->id(), old_state, pkg->state()});
        }
    }

    if (!changes.empty()) {
        after_mutation(changes);
    }
    return changes;
}

std::vector<StateChange> AppPackageRegistry::update_downloading(std::string_view id,
                                                                std::string_view bytes,
                                                                std::string_view total) {
    std::vector<StateChange> changes;

    std::int64_t bytes_downloaded = parse_int64_or_zero(bytes);
    std::int64_t bytes_total = parse_int64_or_zero(total);

    // Фантомная загрузка (0 байт, несколько байт) - шум
    if (bytes_total < 1024) {
        return changes;
    }

    AppPackageState* pkg = find_mut(id);
    if (pkg == nullptr || pkg->is_completed()) {
        return changes;
    }

    // Счётчик байт IME бывает больше итога: процент ограничен 0..100
    double ratio = static_cast<double>(bytes_downloaded) / static_cast<double>(bytes_total);
    ratio = std::clamp(ratio, 0.0, 1.0);
    auto percent = static_cast<int>(std::lround(ratio * 100.0));

    InstallState old_state = pkg->state();
    if (pkg->update_state(InstallState::Downloading, percent, false, bytes_downloaded,
                          bytes_total)) {
        changes.push_back({pkg->id(), old_state, pkg->state()});
        after_mutation(changes);
    }
    return changes;
}

std::vector<StateChange> AppPackageRegistry::update_from_win32_state(std::string_view id,
                                                                     std::string_view state) {
    std::vector<StateChange> changes;

    auto parsed = parse_win32_state(state);
    AppPackageState* pkg = find_mut(id);
    if (!parsed || pkg == nullptr) {
        return changes;
    }

    InstallState old_state = pkg->state();
    if (pkg->update_state_from_win32(*parsed)) {
        changes.push_back({pkg->id(), old_state, pkg->state()});
        after_mutation(changes);
    }
    return changes;
}

std::set<std::string> AppPackageRegistry::dependents_deep(std::string_view id) const {
    std::set<std::string> result;
    std::string root = to_lower(id);
    std::set<std::string> visited{root};
    bool too_deep = false;

    collect_dependents(root, 1, visited, result, too_deep);

    if (too_deep && log_ != nullptr) {
        log_->warn("dependency tree deeper than " + std::to_string(MAX_DEPENDENCY_DEPTH) +
                   " levels below " + root + " (possible circular dependency)");
    }
    return result;
}

void AppPackageRegistry::collect_dependents(const std::string& parent, int depth,
                                            std::set<std::string>& visited,
                                            std::set<std::string>& out, bool& too_deep) const {
    for (const auto& pkg : packages_) {
        if (pkg.depends_on().count(parent) == 0 || visited.count(pkg.id()) != 0) {
            continue;
        }
        if (depth > MAX_DEPENDENCY_DEPTH) {
            too_deep = true;
            return;
        }
        visited.insert(pkg.id());
        out.insert(pkg.id());
        collect_dependents(pkg.id(), depth + 1, visited, out, too_deep);
    }
}

bool AppPackageRegistry::is_all_completed() const {
    if (packages_.empty()) {
        return false;
    }

    bool any_required = false;
    for (const auto& pkg : packages_) {
        if (pkg.is_required()) {
            any_required = true;
            if (!pkg.is_completed()) {
                return false;
            }
        }
    }
    if (any_required) {
        return true;
    }

    return std::all_of(packages_.begin(), packages_.end(),
                       [](const AppPackageState& pkg) { return pkg.is_completed(); });
}

void AppPackageRegistry::apply_completion_closure(std::vector<StateChange>& changes) {
    bool any_required = false;
    for (const auto& pkg : packages_) {
        if (pkg.is_required()) {
            any_required = true;
            if (!pkg.is_completed()) {
                return;
            }
        }
    }
    if (!any_required) {
        return;
    }

    // Пакеты "только зависимость", которых IME не коснулся
    for (auto& pkg : packages_) {
        if (!pkg.is_required() && pkg.state() == InstallState::Unknown) {
            if (pkg.update_state(InstallState::Skipped)) {
                changes.push_back({pkg.id(), InstallState::Unknown, InstallState::Skipped});
            }
        }
    }
}

void AppPackageRegistry::after_mutation(std::vector<StateChange>& changes) {
    apply_completion_closure(changes);
    sort_errors_to_top_ = is_all_completed();
}

std::size_t AppPackageRegistry::count_completed() const {
    return static_cast<std::size_t>(
        std::count_if(packages_.begin(), packages_.end(),
                      [](const AppPackageState& pkg) { return pkg.is_completed(); }));
}

std::size_t AppPackageRegistry::error_count() const {
    return static_cast<std::size_t>(
        std::count_if(packages_.begin(), packages_.end(),
                      [](const AppPackageState& pkg) { return pkg.is_error(); }));
}

std::vector<const AppPackageState*> AppPackageRegistry::presentation_order() const {
    std::vector<const AppPackageState*> order;
    order.reserve(packages_.size());
    for (const auto& pkg : packages_) {
        order.push_back(&pkg);
    }

    bool errors_first = sort_errors_to_top_;
    std::stable_sort(order.begin(), order.end(),
                     [errors_first](const AppPackageState* a, const AppPackageState* b) {
                         int ka = a->sort_key(errors_first);
                         int kb = b->sort_key(errors_first);
                         if (ka != kb) {
                             return ka > kb;
                         }
                         if (a->last_changed() != b->last_changed()) {
                             return a->last_changed() < b->last_changed();
                         }
                         return a->list_pos() < b->list_pos();
                     });
    return order;
}

Value AppPackageRegistry::summary_data() const {
    Value apps = Value::make_array();
    for (const auto* pkg : presentation_order()) {
        apps.push_back(pkg->to_event_data());
    }

    Value data = Value::make_object();
    data.with("totalApps", Value(static_cast<std::int64_t>(count_all())))
        .with("completedApps", Value(static_cast<std::int64_t>(count_completed())))
        .with("errorCount", Value(static_cast<std::int64_t>(error_count())))
        .with("hasErrors", Value(has_error()))
        .with("isAllCompleted", Value(is_all_completed()))
        .with("ignoredCount", Value(static_cast<std::int64_t>(ignored_count())))
        .with("apps", std::move(apps));
    return data;
}

void AppPackageRegistry::restore(std::vector<AppPackageState> packages,
                                 std::vector<std::string> ignore_list, std::string current_id) {
    packages_ = std::move(packages);
    ignore_list_.clear();
    for (auto& id : ignore_list) {
        ignore_list_.push_back(to_lower(id));
    }
    current_id_ = to_lower(current_id);
    sort_errors_to_top_ = is_all_completed();
}

void AppPackageRegistry::log_states() const {
    if (log_ == nullptr) {
        return;
    }
    std::ostringstream oss;
    oss << "app states [" << packages_.size() << "]: ";
    for (size_t i = 0; i < packages_.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << packages_[i].display_name() << ":" << to_string(packages_[i].state());
    }
    log_->debug(oss.str());
}

}  // namespace enrollwatch::tracking
