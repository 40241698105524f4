// ==============================================================================
// enrollwatch/state_store.hpp - Снимок состояния и маркер завершения
// ==============================================================================
//
// Назначение:
// - Снимок всего изменяемого состояния: реестр приложений, позиции
//   журналов, флаги трекера IME, учёт сессии оркестратора
// - Атомарная запись снимка (temp + rename), загрузка при старте,
//   удаление после завершения регистрации
// - Маркер завершения для повторной очистки хостом после перезапуска
//
// Файлы в каталоге состояния:
//
//   ime-tracker-state.json        снимок (JSON)
//   enrollment-complete.marker    "Enrollment completed at <ISO-8601>"
//
// Ошибки ввода-вывода логируются и не пробрасываются: потеря снимка
// ухудшает возобновление, но не останавливает слежение.
//
// ==============================================================================

#ifndef ENROLLWATCH_STATE_STORE_HPP
#define ENROLLWATCH_STATE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <enrollwatch/app_state.hpp>
#include <enrollwatch/cmtrace.hpp>
#include <enrollwatch/position.hpp>

namespace enrollwatch::output {
class Writer;
}

namespace enrollwatch::tracking {

/// Состояние трекера журнала IME
struct ImeTrackerState {
    std::string last_esp_phase;
    bool all_apps_completed_fired = false;
    bool log_phase_is_current = false;
    std::vector<std::string> ignore_list;
    std::string current_package_id;
    std::vector<PackageRecord> packages;
    std::map<std::string, io::TailPosition> positions;
};

/// Учёт сессии оркестратора
struct SessionState {
    std::string session_id;
    std::string enrollment_type;  // "v1" | "v2"
    int phase = -1;               // EnrollmentPhase
    std::string last_esp_phase;
    bool auto_switched_to_apps = false;
    bool final_device_info_collected = false;
    bool waiting_for_hello = false;
    bool summary_active = false;
    std::int64_t next_sequence = 0;
};

struct Snapshot {
    static constexpr int CURRENT_VERSION = 1;

    int version = CURRENT_VERSION;
    ImeTrackerState tracker;
    SessionState session;
};

/// Снимок в JSON
std::string serialize_snapshot(const Snapshot& snapshot);

/// @throws std::runtime_error при некорректном JSON или типе поля
Snapshot deserialize_snapshot(std::string_view json);

class StateStore {
public:
    static constexpr const char* STATE_FILE_NAME = "ime-tracker-state.json";
    static constexpr const char* MARKER_FILE_NAME = "enrollment-complete.marker";

    explicit StateStore(std::filesystem::path state_dir, output::Writer* log = nullptr);

    const std::filesystem::path& state_dir() const { return state_dir_; }

    std::filesystem::path state_file() const { return state_dir_ / STATE_FILE_NAME; }

    std::filesystem::path marker_file() const { return state_dir_ / MARKER_FILE_NAME; }

    /// Загрузить снимок. Нет файла или файл повреждён - std::nullopt.
    std::optional<Snapshot> load() const;

    /// Записать снимок атомарно; false при ошибке (залогирована)
    bool save(const Snapshot& snapshot) const;

    /// Удалить снимок; true если файла больше нет
    bool remove() const;

    bool write_completion_marker(io::TimePoint completed_at) const;

    bool has_completion_marker() const;

    bool remove_completion_marker() const;

private:
    std::filesystem::path state_dir_;
    output::Writer* log_ = nullptr;
};

}  // namespace enrollwatch::tracking

#endif  // ENROLLWATCH_STATE_STORE_HPP
