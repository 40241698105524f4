// ==============================================================================
// enrollwatch/app_state.hpp - Состояние установки приложений
// ==============================================================================
//
// Назначение:
// - Жизненный цикл установки одного приложения (AppPackageState)
// - Реестр приложений сессии: порядок политик, список игнорирования,
//   текущее приложение, граф зависимостей (AppPackageRegistry)
// - Каскад Error/Postponed на зависимые приложения
// - Данные сводки и порядок отображения
//
// Автомат состояния:
//
//   Unknown -> Downloading <-> (прогресс) -> Installing -> Installed | Error | Postponed
//                                                      \-> Skipped
//
// Installed, Skipped, Postponed, Error - терминальные: после них состояние
// пакета в сессии не меняется.
//
// Реестр не потокобезопасен: его сериализует мьютекс EnrollmentTracker.
//
// ==============================================================================

#ifndef ENROLLWATCH_APP_STATE_HPP
#define ENROLLWATCH_APP_STATE_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <enrollwatch/value.hpp>

namespace enrollwatch::output {
class Writer;
}

namespace enrollwatch::tracking {

// ============================================================================
// Enums
// ============================================================================

/// Порядок значим: переходы "только вверх" сравнивают числовые значения
enum class InstallState {
    Unknown = 0,
    NotInstalled = 1,
    InProgress = 2,
    Downloading = 3,
    Installing = 4,
    Installed = 5,
    Skipped = 6,
    Postponed = 7,
    Error = 8
};

enum class RunAs { Unknown = -1, User = 0, System = 1 };

enum class Intent { Unknown = -1, NotTargeted = 0, Available = 1, Install = 3, Uninstall = 4 };

enum class Targeted { Unknown = 128, Dependency = 0, User = 1, Device = 2 };

/// Значения Win32AppState из журнала IME
enum class Win32AppState { Unknown = 0, NotInstalled = 1, InProgress = 2, Completed = 3, Error = 4 };

/// Какие приложения отслеживаются
enum class TargetFilter {
    All,
    DeviceOnly,  // приложения RunAs=User уходят в список игнорирования
    UserOnly     // приложения RunAs=System уходят в список игнорирования
};

std::string to_string(InstallState s);
std::string to_string(RunAs r);
std::string to_string(Intent i);
std::string to_string(Targeted t);
std::string to_string(TargetFilter f);

/// "0".."4" или имя (без учёта регистра)
std::optional<Win32AppState> parse_win32_state(std::string_view s);

/// "all" | "device" | "user"
/// @throws std::invalid_argument для неизвестного значения
TargetFilter parse_target_filter(std::string_view s);

/// Терминальное состояние
bool is_terminal(InstallState s);

// ============================================================================
// PackageRecord - сохраняемые поля пакета
// ============================================================================

struct PackageRecord {
    std::string id;
    int list_pos = 0;
    std::string name;
    RunAs run_as = RunAs::Unknown;
    Intent intent = Intent::Unknown;
    Targeted targeted = Targeted::Unknown;
    std::set<std::string> depends_on;
    InstallState state = InstallState::Unknown;
    bool downloading_or_installing_seen = false;
    std::optional<int> progress_percent;
    std::int64_t bytes_downloaded = 0;
    std::int64_t bytes_total = 0;
    /// Время последнего изменения состояния, нс от эпохи system_clock
    std::int64_t last_changed = 0;
};

// ============================================================================
// AppPackageState
// ============================================================================

class AppPackageState {
public:
    AppPackageState(std::string id, int list_pos);

    static AppPackageState from_record(const PackageRecord& record);

    PackageRecord record() const;

    const std::string& id() const { return id_; }
    int list_pos() const { return list_pos_; }

    /// Имя; пустое если неизвестно
    const std::string& name() const { return name_; }

    /// Имя для вывода: name или id
    const std::string& display_name() const { return name_.empty() ? id_ : name_; }

    RunAs run_as() const { return run_as_; }
    Intent intent() const { return intent_; }
    Targeted targeted() const { return targeted_; }
    const std::set<std::string>& depends_on() const { return depends_on_; }
    InstallState state() const { return state_; }
    std::optional<int> progress_percent() const { return progress_percent_; }
    std::int64_t bytes_downloaded() const { return bytes_downloaded_; }
    std::int64_t bytes_total() const { return bytes_total_; }
    bool downloading_or_installing_seen() const { return downloading_or_installing_seen_; }

    /// Метка последнего изменения состояния (steady_clock, нс)
    std::int64_t last_changed() const { return last_changed_; }

    // Обновления метаданных; возвращают true если значение изменилось
    // -------------------------------------------------------------------------

    /// Пустое имя и усечённое (строгий префикс текущего) отклоняются
    bool update_name(const std::string& name);

    bool update_run_as(RunAs run_as);
    bool update_intent(Intent intent);
    bool update_targeted(Targeted targeted);
    bool update_depends_on(std::set<std::string> depends_on);

    // Переходы состояния
    // -------------------------------------------------------------------------

    /// Перейти в new_state.
    ///
    /// - из терминального состояния переходов нет
    /// - upgrade_only: состояние ниже текущего игнорируется
    /// - Installed без замеченной загрузки/установки становится Skipped
    /// - Installed без явного прогресса даёт 100% и bytes_downloaded = bytes_total
    /// - bytes_* обновляются только ненулевыми значениями
    ///
    /// @return true если что-либо изменилось
    bool update_state(InstallState new_state, std::optional<int> progress = std::nullopt,
                      bool upgrade_only = false, std::int64_t bytes_downloaded = 0,
                      std::int64_t bytes_total = 0);

    /// Unknown->Unknown, InProgress->InProgress, Completed->Installed,
    /// Error->Error, NotInstalled - без изменений. Только вверх.
    bool update_state_from_win32(Win32AppState state);

    // Предикаты
    // -------------------------------------------------------------------------

    /// Intent Install или Uninstall
    bool is_required() const { return intent_ == Intent::Install || intent_ == Intent::Uninstall; }

    bool is_active() const {
        return state_ >= InstallState::InProgress && state_ <= InstallState::Installing;
    }

    bool is_completed() const { return is_terminal(state_); }

    bool is_error() const { return state_ == InstallState::Error; }

    /// Ключ сортировки (по убыванию). Skipped/Postponed/Error приравнены к
    /// Installed; при errors_first Error получает -1.
    int sort_key(bool errors_first) const;

    /// appId, name, appName, state, intent, targeted, runAs, progressPercent,
    /// bytesDownloaded, bytesTotal, isError, isCompleted
    Value to_event_data() const;

private:
    std::string id_;
    int list_pos_ = 0;
    std::string name_;
    RunAs run_as_ = RunAs::Unknown;
    Intent intent_ = Intent::Unknown;
    Targeted targeted_ = Targeted::Unknown;
    std::set<std::string> depends_on_;
    InstallState state_ = InstallState::Unknown;
    std::int64_t last_changed_ = 0;
    bool downloading_or_installing_seen_ = false;
    std::optional<int> progress_percent_;
    std::int64_t bytes_downloaded_ = 0;
    std::int64_t bytes_total_ = 0;
};

// ============================================================================
// Результаты операций реестра
// ============================================================================

struct StateChange {
    std::string id;
    InstallState old_state = InstallState::Unknown;
    InstallState new_state = InstallState::Unknown;
};

struct PolicyResult {
    bool ok = false;
    std::size_t discovered = 0;  // записей с Id в массиве политик
    std::size_t tracked = 0;     // созданных или обновлённых пакетов
    std::size_t created = 0;     // из них новых
    std::size_t ignored = 0;     // отправленных в список игнорирования
    std::vector<StateChange> changes;  // изменения от замыкания завершения
    std::string error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// AppPackageRegistry
// ============================================================================

class AppPackageRegistry {
public:
    /// Предел глубины обхода зависимых пакетов
    static constexpr int MAX_DEPENDENCY_DEPTH = 10;

    explicit AppPackageRegistry(output::Writer* log = nullptr,
                                TargetFilter filter = TargetFilter::All);

    // Поиск
    // -------------------------------------------------------------------------

    /// Пакет по id (без учёта регистра); nullptr если неизвестен или игнорируется
    const AppPackageState* find(std::string_view id) const;

    bool is_ignored(std::string_view id) const;

    // Текущий пакет
    // -------------------------------------------------------------------------

    void set_current(std::string_view id);

    const std::string& current_id() const { return current_id_; }

    // Список игнорирования
    // -------------------------------------------------------------------------

    /// Добавить id в список игнорирования.
    /// Пустой id, уже игнорируемый или уже отслеживаемый id - false.
    bool add_to_ignore_list(std::string_view id);

    /// Смена фазы ESP: все отслеживаемые пакеты уходят в список
    /// игнорирования, реестр очищается. Возвращает число таких пакетов.
    std::size_t silence_all();

    // Мутации
    // -------------------------------------------------------------------------

    /// Разобрать JSON массив политик IME и создать/обновить пакеты.
    /// При ошибке разбора реестр не меняется.
    PolicyResult add_update_from_policies(std::string_view json_text);

    bool update_name(std::string_view id, const std::string& name);

    /// Перевести пакет в состояние. Error и Postponed распространяются на
    /// все транзитивно зависимые пакеты.
    std::vector<StateChange> update_state(std::string_view id, InstallState state,
                                          std::optional<int> progress = std::nullopt);

    /// Загрузка с прогрессом в байтах. Нечисловые значения - 0.
    /// total < 1024 подавляется (фантомная загрузка).
    std::vector<StateChange> update_downloading(std::string_view id, std::string_view bytes,
                                                std::string_view total);

    /// Состояние Win32AppState ("2", "InProgress", ...)
    std::vector<StateChange> update_from_win32_state(std::string_view id,
                                                     std::string_view state);

    /// Все транзитивно зависимые от id пакеты (не глубже MAX_DEPENDENCY_DEPTH)
    std::set<std::string> dependents_deep(std::string_view id) const;

    // Агрегаты
    // -------------------------------------------------------------------------

    bool is_all_completed() const;

    std::size_t count_all() const { return packages_.size(); }
    std::size_t count_completed() const;
    std::size_t error_count() const;
    bool has_error() const { return error_count() > 0; }
    std::size_t ignored_count() const { return ignore_list_.size(); }

    /// Подсказка отображения: ошибки наверх (после завершения всех пакетов)
    bool sort_errors_to_top() const { return sort_errors_to_top_; }

    /// Порядок отображения: ключ сортировки по убыванию, затем время
    /// изменения, затем позиция в списке политик
    std::vector<const AppPackageState*> presentation_order() const;

    /// totalApps, completedApps, errorCount, hasErrors, isAllCompleted,
    /// ignoredCount, apps
    Value summary_data() const;

    // Сохранение
    // -------------------------------------------------------------------------

    const std::vector<AppPackageState>& packages() const { return packages_; }

    const std::vector<std::string>& ignore_list() const { return ignore_list_; }

    void restore(std::vector<AppPackageState> packages, std::vector<std::string> ignore_list,
                 std::string current_id);

    TargetFilter target_filter() const { return filter_; }

    void set_target_filter(TargetFilter filter) { filter_ = filter; }

private:
    AppPackageState* find_mut(std::string_view id);

    /// Зависимые пакеты без списка игнорирования; при превышении глубины
    /// too_deep = true
    void collect_dependents(const std::string& parent, int depth, std::set<std::string>& visited,
                            std::set<std::string>& out, bool& too_deep) const;

    /// Обязательные пакеты завершены: нетронутые необязательные -> Skipped
    void apply_completion_closure(std::vector<StateChange>& changes);

    void after_mutation(std::vector<StateChange>& changes);

    void log_states() const;

    output::Writer* log_ = nullptr;
    TargetFilter filter_ = TargetFilter::All;
    std::vector<AppPackageState> packages_;
    std::vector<std::string> ignore_list_;
    std::string current_id_;
    bool sort_errors_to_top_ = false;
};

}  // namespace enrollwatch::tracking

#endif  // ENROLLWATCH_APP_STATE_HPP
