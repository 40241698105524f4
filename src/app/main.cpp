// ==============================================================================
// main.cpp - Точка входа агента
// ==============================================================================
//
// Использование:
//
//   enrollwatch <config.yml>
//
// Точка входа:
// 1. Загрузка конфигурации, создание Writer
// 2. Маркер завершения от прошлого запуска: очистка и выход
// 3. Загрузка правил, определение типа регистрации
// 4. Запуск EnrollmentTracker, события - JSON Lines
// 5. Ожидание завершения или сигнала; перезагрузка правил при изменении файла
//
// Коды возврата: 0 - успех, 1 - ошибка запуска, 2 - ошибка аргументов
//
// ==============================================================================

#include <enrollwatch/config.hpp>
#include <enrollwatch/enrollment.hpp>
#include <enrollwatch/event.hpp>
#include <enrollwatch/output.hpp>
#include <enrollwatch/platform.hpp>
#include <enrollwatch/rule.hpp>
#include <enrollwatch/state_store.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr const char* VERSION = "enrollwatch 0.1.0";

constexpr const char* USAGE =
    "Usage: enrollwatch <config.yml>\n"
    "\n"
    "Tracks Windows Autopilot enrollment progress from Intune Management\n"
    "Extension logs and writes enrollment events as JSON Lines.\n"
    "\n"
    "Options:\n"
    "  -h, --help       Print help\n"
    "  -V, --version    Print version\n";

constexpr std::chrono::milliseconds HOST_TICK{500};

volatile std::sig_atomic_t g_running = 1;

void handle_signal(int) {
    g_running = 0;
}

std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path& p) {
    std::error_code ec;
    auto t = std::filesystem::last_write_time(p, ec);
    if (ec) {
        return std::nullopt;
    }
    return t;
}

// ----------------------------------------------------------------------------
// Горячая перезагрузка правил
// ----------------------------------------------------------------------------

class RulesWatcher {
public:
    RulesWatcher(std::filesystem::path path, enrollwatch::output::Writer& writer)
        : path_(std::move(path)), writer_(writer), mtime_(modification_time(path_)) {}

    /// Перезагрузить правила, если файл изменился. Ошибочный файл
    /// оставляет в силе прежний набор.
    void check(enrollwatch::tracking::EnrollmentTracker& tracker) {
        auto current = modification_time(path_);
        if (!current || current == mtime_) {
            return;
        }
        mtime_ = current;

        auto loaded = enrollwatch::rule::load(path_);
        if (!loaded) {
            writer_.warn("rules reload failed, keeping previous rules: " + loaded.error.format());
            return;
        }
        for (const auto& warning : loaded.warnings) {
            writer_.warn(warning);
        }
        writer_.info("rules file changed, reloading " + std::to_string(loaded.rules.size()) +
                     " rules");
        tracker.update_rules(loaded.rules);
    }

private:
    std::filesystem::path path_;
    enrollwatch::output::Writer& writer_;
    std::optional<std::filesystem::file_time_type> mtime_;
};

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace enrollwatch;

    if (argc < 2) {
        std::cerr << USAGE;
        return 2;
    }
    std::string arg = argv[1];
    if (arg == "-h" || arg == "--help") {
        std::cout << USAGE;
        return 0;
    }
    if (arg == "-V" || arg == "--version") {
        std::cout << VERSION << "\n";
        return 0;
    }
    if (argc > 2) {
        std::cerr << "[x] unexpected argument '" << argv[2] << "'\n\n" << USAGE;
        return 2;
    }

    // 1. Конфигурация
    auto loaded_config = config::load(platform::path_from_utf8(arg));
    if (!loaded_config) {
        output::Writer bootstrap(output::OutputConfig{});
        bootstrap.error(loaded_config.error.format());
        return 1;
    }
    const config::Config& cfg = loaded_config.config;

    output::Writer writer(cfg.output_config());
    writer.info(std::string(VERSION) + " (" + platform::os_name() + ")");
    writer.debug("session " + cfg.session_id + ", logs " + platform::path_to_utf8(cfg.log_folder));

    // 2. Повторная очистка после завершённой регистрации
    tracking::StateStore store(cfg.state_directory, &writer);
    if (store.has_completion_marker()) {
        writer.info("enrollment already completed, removing persisted state");
        store.remove();
        store.remove_completion_marker();
        return 0;
    }

    // 3. Правила
    if (cfg.rules_file.empty()) {
        writer.error("rules_file is not configured");
        return 1;
    }
    auto rules = rule::load(cfg.rules_file);
    if (!rules) {
        writer.error(rules.error.format());
        return 1;
    }
    for (const auto& warning : rules.warnings) {
        writer.warn(warning);
    }
    writer.info("loaded " + std::to_string(rules.rules.size()) + " rules from " +
                platform::path_to_utf8(cfg.rules_file));

    tracking::TrackerOptions options = cfg.tracker_options();
    options.rules = std::move(rules.rules);

    // 4. Оркестратор
    auto sink = [&writer](const tracking::EnrollmentEvent& event) {
        writer.write_json_line(tracking::to_json(event));
    };

    tracking::EnrollmentTracker tracker(std::move(options), sink, writer, nullptr, nullptr,
                                        tracking::detect_enrollment_type(cfg.autopilot));

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    tracker.start();

    // 5. Ожидание
    RulesWatcher watcher(cfg.rules_file, writer);
    while (g_running != 0 && !tracker.completed()) {
        std::this_thread::sleep_for(HOST_TICK);
        watcher.check(tracker);
    }

    tracker.stop();

    if (tracker.completed()) {
        writer.info("enrollment completed");
    } else {
        writer.info("interrupted, state saved");
    }
    writer.flush();
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
