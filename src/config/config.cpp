// ==============================================================================
// config.cpp - Конфигурация агента
// ==============================================================================

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <cstdio>
#include <enrollwatch/config.hpp>
#include <enrollwatch/platform.hpp>
#include <enrollwatch/tailer.hpp>
#include <random>
#include <stdexcept>

namespace enrollwatch::config {

namespace {

std::string scalar(const YAML::Node& node, const char* key) {
    const YAML::Node& value = node[key];
    if (!value || value.IsNull()) {
        return {};
    }
    if (!value.IsScalar()) {
        throw std::invalid_argument(std::string("'") + key + "' must be a scalar");
    }
    return value.as<std::string>();
}

/// Путь из конфигурации: %VAR% раскрываются, относительный - от base_dir
std::filesystem::path resolve_path(const std::string& value, const std::filesystem::path& base_dir) {
    std::filesystem::path p = platform::path_from_utf8(platform::expand_environment(value));
    if (p.is_relative() && !base_dir.empty()) {
        p = base_dir / p;
    }
    return p;
}

std::optional<std::filesystem::path> optional_path(const YAML::Node& node, const char* key,
                                                   const std::filesystem::path& base_dir) {
    std::string value = scalar(node, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return resolve_path(value, base_dir);
}

template <typename T>
T positive(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node& value = node[key];
    if (!value || value.IsNull()) {
        return fallback;
    }
    T v = value.as<T>();
    if (!(v > 0)) {
        throw std::invalid_argument(std::string("'") + key + "' must be positive");
    }
    return v;
}

Config parse_config(const YAML::Node& root, const std::filesystem::path& base_dir) {
    if (root && !root.IsNull() && !root.IsMap()) {
        throw std::invalid_argument("configuration must be a mapping");
    }

    Config cfg;

    cfg.session_id = scalar(root, "session_id");
    if (cfg.session_id.empty()) {
        cfg.session_id = generate_session_id();
    }
    cfg.tenant_id = scalar(root, "tenant_id");

    std::string folder = scalar(root, "log_folder");
    cfg.log_folder = folder.empty()
                         ? platform::path_from_utf8(platform::expand_environment(DEFAULT_LOG_FOLDER))
                         : resolve_path(folder, base_dir);

    const YAML::Node& patterns = root["log_patterns"];
    if (patterns && !patterns.IsNull()) {
        if (!patterns.IsSequence()) {
            throw std::invalid_argument("'log_patterns' must be a list");
        }
        for (const auto& p : patterns) {
            cfg.log_patterns.push_back(p.as<std::string>());
        }
    }
    if (cfg.log_patterns.empty()) {
        cfg.log_patterns = io::default_log_patterns();
    }

    std::string rules = scalar(root, "rules_file");
    if (!rules.empty()) {
        cfg.rules_file = resolve_path(rules, base_dir);
    }

    std::string state = scalar(root, "state_directory");
    cfg.state_directory =
        state.empty() ? platform::path_from_utf8(platform::expand_environment(DEFAULT_STATE_DIRECTORY))
                      : resolve_path(state, base_dir);

    cfg.poll_interval = std::chrono::milliseconds(positive<std::int64_t>(root, "poll_interval_ms", 100));
    cfg.summary_interval = std::chrono::seconds(positive<std::int64_t>(root, "summary_interval_s", 30));

    std::string filter = scalar(root, "target_filter");
    if (!filter.empty()) {
        cfg.target_filter = tracking::parse_target_filter(filter);
    }

    cfg.match_log = optional_path(root, "match_log", base_dir);

    const YAML::Node& sim = root["simulation"];
    if (sim && !sim.IsNull()) {
        if (!sim.IsMap()) {
            throw std::invalid_argument("'simulation' must be a mapping");
        }
        if (sim["enabled"]) {
            cfg.simulation.enabled = sim["enabled"].as<bool>();
        }
        cfg.simulation.speed_factor = positive<double>(sim, "speed_factor", 50.0);
    }

    cfg.output = optional_path(root, "output", base_dir);
    cfg.log_file = optional_path(root, "log_file", base_dir);

    if (root["verbose"]) {
        const YAML::Node& v = root["verbose"];
        // verbose: true | 0..2
        bool flag = false;
        if (YAML::convert<bool>::decode(v, flag)) {
            cfg.verbose = flag ? 1 : 0;
        } else {
            cfg.verbose = v.as<int>();
        }
    }
    if (root["quiet"]) {
        cfg.quiet = root["quiet"].as<bool>();
    }

    const YAML::Node& autopilot = root["autopilot"];
    if (autopilot && !autopilot.IsNull()) {
        if (!autopilot.IsMap()) {
            throw std::invalid_argument("'autopilot' must be a mapping");
        }
        std::string reg = scalar(autopilot, "CloudAssignedDeviceRegistration");
        if (!reg.empty()) {
            cfg.autopilot.cloud_assigned_device_registration = reg;
        }
        std::string esp = scalar(autopilot, "CloudAssignedEspEnabled");
        if (!esp.empty()) {
            cfg.autopilot.cloud_assigned_esp_enabled = esp;
        }
    }

    return cfg;
}

}  // namespace

// ============================================================================
// Config
// ============================================================================

tracking::TrackerOptions Config::tracker_options() const {
    tracking::TrackerOptions options;
    options.session_id = session_id;
    options.tenant_id = tenant_id;
    options.ime.tailer.folder = log_folder;
    options.ime.tailer.patterns = log_patterns;
    options.ime.target_filter = target_filter;
    options.ime.match_log_path = match_log;
    options.ime.simulation = simulation.enabled;
    options.ime.speed_factor = simulation.speed_factor;
    options.state_directory = state_directory;
    options.poll_interval = poll_interval;
    options.summary_interval = summary_interval;
    return options;
}

output::OutputConfig Config::output_config() const {
    output::OutputConfig out;
    out.quiet = quiet;
    out.verbose = verbose;
    out.output_path = output;
    out.append = true;
    out.log_path = log_file;
    return out;
}

std::string Error::format() const {
    if (path.empty()) {
        return "config error: " + message;
    }
    return "config error [" + path + "]: " + message;
}

// ============================================================================
// Загрузка
// ============================================================================

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;
    const std::string display = platform::path_to_utf8(path);

    try {
        YAML::Node root = YAML::LoadFile(display);
        result.config = parse_config(root, path.parent_path());
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), display};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), display};
    }

    return result;
}

LoadResult load_string(std::string_view yaml, const std::filesystem::path& base_dir) {
    LoadResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.config = parse_config(root, base_dir);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), ""};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), ""};
    }

    return result;
}

std::string generate_session_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t hi = dist(gen);
    std::uint64_t lo = dist(gen);
    // Версия 4, вариант RFC 4122
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF), static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

}  // namespace enrollwatch::config
