// ==============================================================================
// enrollwatch/config.hpp - Конфигурация агента
// ==============================================================================
//
// Назначение:
// - Загрузка YAML конфигурации (yaml-cpp) с умолчаниями
// - Раскрытие %VAR% в путях, относительные пути - от каталога конфигурации
// - Построение TrackerOptions и OutputConfig для хоста
//
// Пример:
//
//   session_id: 7c1e...
//   log_folder: '%ProgramData%\Microsoft\IntuneManagementExtension\Logs'
//   rules_file: rules/ime_patterns.yml
//   target_filter: all
//   simulation:
//     enabled: false
//     speed_factor: 50
//
// ==============================================================================

#ifndef ENROLLWATCH_CONFIG_HPP
#define ENROLLWATCH_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <enrollwatch/app_state.hpp>
#include <enrollwatch/enrollment.hpp>
#include <enrollwatch/output.hpp>

namespace enrollwatch::config {

constexpr const char* DEFAULT_LOG_FOLDER =
    "%ProgramData%\\Microsoft\\IntuneManagementExtension\\Logs";

constexpr const char* DEFAULT_STATE_DIRECTORY = "%ProgramData%\\AutopilotMonitor\\State";

struct SimulationConfig {
    bool enabled = false;
    double speed_factor = 50.0;
};

struct Config {
    std::string session_id;
    std::string tenant_id;

    std::filesystem::path log_folder;
    std::vector<std::string> log_patterns;
    std::filesystem::path rules_file;
    std::filesystem::path state_directory;

    std::chrono::milliseconds poll_interval{100};
    std::chrono::seconds summary_interval{30};

    tracking::TargetFilter target_filter = tracking::TargetFilter::All;
    std::optional<std::filesystem::path> match_log;
    SimulationConfig simulation;

    /// Файл событий (JSONL); без него - stdout
    std::optional<std::filesystem::path> output;
    /// Лог-файл агента
    std::optional<std::filesystem::path> log_file;
    int verbose = 0;
    bool quiet = false;

    tracking::AutopilotSettings autopilot;

    /// Опции оркестратора (без правил: их загружает хост)
    tracking::TrackerOptions tracker_options() const;

    output::OutputConfig output_config() const;
};

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла
LoadResult load(const std::filesystem::path& path);

/// Загрузить конфигурацию из YAML текста; относительные пути - от base_dir
LoadResult load_string(std::string_view yaml, const std::filesystem::path& base_dir = {});

/// Случайный идентификатор сессии в форме GUID
std::string generate_session_id();

}  // namespace enrollwatch::config

#endif  // ENROLLWATCH_CONFIG_HPP
