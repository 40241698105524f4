// ==============================================================================
// ime_tracker.cpp - Трекер журнала IME
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <enrollwatch/cmtrace.hpp>
#include <enrollwatch/ime_tracker.hpp>
#include <enrollwatch/output.hpp>
#include <enrollwatch/platform.hpp>
#include <stdexcept>

namespace enrollwatch::tracking {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

ImeLogTracker::ImeLogTracker(ImeTrackerOptions options, const rule::RuleEngine& rules,
                             output::Writer& log, ImeTrackerListener* listener)
    : options_(std::move(options)),
      rules_(rules),
      log_(log),
      listener_(listener),
      tailer_(options_.tailer),
      registry_(&log, options_.target_filter) {
    if (options_.match_log_path) {
        const auto& path = *options_.match_log_path;
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
        }
        match_log_.open(path, std::ios::app | std::ios::binary);
        if (match_log_) {
            log_.info("match log enabled -> " + platform::path_to_utf8(path));
        } else {
            log_.warn("cannot open match log " + platform::path_to_utf8(path));
        }
    }
}

// ============================================================================
// Обработка строк
// ============================================================================

std::size_t ImeLogTracker::process_line(const std::string& file, const std::string& raw) {
    std::size_t matched = 0;
    process_line_impl(file, raw, nullptr, matched);
    return matched;
}

bool ImeLogTracker::process_line_impl(const std::string& file, const std::string& raw,
                                      const PollControl* control, std::size_t& matched) {
    io::LogLine entry;
    bool parsed = io::parse_cmtrace_line(raw, entry);
    const std::string& message = parsed ? entry.message : raw;
    if (message.empty()) {
        return true;
    }

    if (options_.simulation && parsed) {
        if (!apply_simulation_delay(entry.timestamp, control)) {
            return false;
        }
    }

    // Строка целиком вычисляется по одному снимку набора
    auto rules = rules_.current();
    auto matches = rules->evaluate(message, log_phase_is_current_);

    for (const auto& match : matches) {
        ++matched;
        write_match_log(file, raw, match.rule->def.id);
        try {
            dispatch(match);
        } catch (const std::exception& e) {
            log_.warn("error handling match for " + match.rule->def.id + ": " + e.what());
        }
    }
    return true;
}

std::size_t ImeLogTracker::poll(const PollControl& control) {
    std::size_t processed = 0;

    for (const auto& file : tailer_.discover()) {
        if (control.cancelled && control.cancelled()) {
            break;
        }

        const std::string key = platform::path_to_utf8(file);
        std::int64_t size = io::file_size(file);
        if (size < 0) {
            continue;
        }

        std::int64_t start = positions_.get_safe_position(key, size);
        if (start >= size) {
            continue;
        }

        io::Chunk chunk;
        try {
            chunk = tailer_.read_chunk(file, start);
        } catch (const std::runtime_error& e) {
            log_.debug(std::string("IO error reading ") + platform::path_to_utf8(file.filename()) +
                       ": " + e.what());
            continue;
        }

        std::int64_t committed = start;
        const std::string name = platform::path_to_utf8(file.filename());
        for (std::size_t i = 0; i < chunk.lines.size(); ++i) {
            if (control.cancelled && control.cancelled()) {
                break;
            }
            std::size_t matched = 0;
            if (!process_line_impl(name, chunk.lines[i], &control, matched)) {
                break;
            }
            committed = chunk.line_ends[i];
            ++processed;
            if (control.line_done) {
                control.line_done();
            }
        }

        if (committed > start) {
            positions_.set_position(key, committed);
            dirty_ = true;
        }
    }

    return processed;
}

// ============================================================================
// Действия
// ============================================================================

void ImeLogTracker::dispatch(const rule::Match& match) {
    const rule::RuleDef& def = match.rule->def;
    const rule::Captures& captures = match.captures;

    std::string id = to_lower(captures.get("id"));
    if (id.empty() && def.flag("useCurrentApp")) {
        id = registry_.current_id();
    }

    dirty_ = true;

    switch (def.action) {
    case rule::Action::ImeStarted:
        handle_ime_started();
        break;

    case rule::Action::ImeSessionChange:
        log_.debug("IME session change: " + captures.get("change"));
        break;

    case rule::Action::EspPhaseDetected: {
        std::string phase = captures.get("espPhase");
        if (phase.empty()) {
            phase = def.parameter("phase");
        }
        if (!phase.empty()) {
            handle_esp_phase(phase);
        }
        break;
    }

    case rule::Action::SetCurrentApp:
        if (!id.empty()) {
            registry_.set_current(id);
        }
        break;

    case rule::Action::ImeAgentVersion: {
        std::string version = captures.get("agentVersion");
        if (!version.empty() && listener_ != nullptr) {
            listener_->on_ime_agent_version(version);
        }
        break;
    }

    case rule::Action::ImeImpersonation:
        log_.debug("IME impersonation: " + captures.get("user"));
        break;

    case rule::Action::EnrollmentCompleted:
        log_.info("user session completed detected");
        if (listener_ != nullptr) {
            listener_->on_user_session_completed();
        }
        break;

    case rule::Action::UpdateStateInstalled:
        if (!id.empty()) {
            update_state(id, InstallState::Installed);
        }
        break;

    case rule::Action::UpdateStateDownloading:
        if (!id.empty()) {
            std::string bytes = captures.get("bytes");
            std::string total = captures.get("ofbytes");
            if (!bytes.empty() && !total.empty()) {
                if (registry_.find(id) != nullptr) {
                    report(registry_.update_downloading(id, bytes, total));
                }
            } else {
                update_state(id, InstallState::Downloading);
            }
        }
        break;

    case rule::Action::UpdateStateInstalling:
        if (!id.empty()) {
            update_state(id, InstallState::Installing);
        }
        break;

    case rule::Action::UpdateStateSkipped:
        if (!id.empty()) {
            update_state(id, InstallState::Skipped);
        }
        break;

    case rule::Action::UpdateStateError:
        if (id.empty()) {
            break;
        }
        if (def.flag("checkTo")) {
            // Ошибка только при переходе "... to Error"
            if (iequals(captures.get("to"), "Error")) {
                update_state(id, InstallState::Error);
            }
        } else {
            update_state(id, InstallState::Error);
        }
        break;

    case rule::Action::UpdateStatePostponed:
        if (!id.empty()) {
            const auto* pkg = registry_.find(id);
            if (pkg != nullptr && !pkg->is_completed()) {
                update_state(id, InstallState::Postponed);
            }
        }
        break;

    case rule::Action::EspTrackStatus:
        handle_esp_track_status(captures);
        break;

    case rule::Action::PoliciesDiscovered: {
        std::string policies = captures.get("policies");
        if (!policies.empty()) {
            handle_policies(policies);
        }
        break;
    }

    case rule::Action::IgnoreCompletedApp:
        registry_.add_to_ignore_list(registry_.current_id());
        break;

    case rule::Action::UpdateName: {
        std::string name = captures.get("name");
        if (!id.empty() && !name.empty()) {
            registry_.update_name(id, name);
        }
        break;
    }

    case rule::Action::UpdateWin32AppState: {
        std::string state = captures.get("state");
        if (!id.empty() && !state.empty()) {
            report(registry_.update_from_win32_state(id, state));
        }
        break;
    }

    case rule::Action::CancelStuckAndSetCurrent:
        handle_cancel_stuck(id);
        break;
    }
}

void ImeLogTracker::handle_ime_started() {
    log_.info("IME agent started detected");

    // Активный до перезапуска IME пакет считается установленным
    const std::string current = registry_.current_id();
    if (!current.empty()) {
        const auto* pkg = registry_.find(current);
        if (pkg != nullptr && pkg->is_active()) {
            update_state(current, InstallState::Installed);
        }
    }

    if (listener_ != nullptr) {
        listener_->on_ime_started();
    }
}

void ImeLogTracker::handle_esp_phase(const std::string& phase) {
    if (!iequals(phase, "DeviceSetup") && !iequals(phase, "AccountSetup")) {
        log_.debug("ignoring ESP phase '" + phase + "'");
        return;
    }

    if (!iequals(last_esp_phase_, phase)) {
        if (!last_esp_phase_.empty()) {
            // IME заново сообщает о приложениях прошлой фазы: они замолкают
            const std::size_t silenced = registry_.silence_all();
            log_.info("ESP phase changed from " + last_esp_phase_ + " to " + phase +
                      ", silencing " + std::to_string(silenced) + " previous-phase apps");
            all_apps_completed_fired_ = false;
            dirty_ = true;
        }
        last_esp_phase_ = phase;
    }

    log_.info("ESP phase detected: " + phase);
    activate_rules(true);

    if (listener_ != nullptr) {
        listener_->on_esp_phase_detected(phase);
    }
}

void ImeLogTracker::handle_esp_track_status(const rule::Captures& captures) {
    std::string id = to_lower(captures.get("id"));
    std::string to = captures.get("to");
    if (id.empty() || to.empty()) {
        return;
    }

    if (iequals(to, "InProgress")) {
        registry_.set_current(id);
        update_state(id, InstallState::Installing);
    } else if (iequals(to, "Completed")) {
        update_state(id, InstallState::Installed);
    } else if (iequals(to, "Error")) {
        update_state(id, InstallState::Error);
    }
}

void ImeLogTracker::handle_policies(const std::string& json) {
    PolicyResult result = registry_.add_update_from_policies(json);
    if (!result) {
        log_.warn("failed to parse policies JSON: " + result.error);
        return;
    }

    log_.info("discovered " + std::to_string(result.discovered) + " policies, tracking " +
              std::to_string(registry_.count_all()) + " packages");

    // Новые пакеты после завершения всех - сигнал нужно взвести снова
    if (result.created > 0 && all_apps_completed_fired_) {
        all_apps_completed_fired_ = false;
    }

    report(result.changes);

    if (listener_ != nullptr) {
        listener_->on_policies_discovered(result.discovered);
    }
}

void ImeLogTracker::handle_cancel_stuck(const std::string& new_id) {
    if (new_id.empty()) {
        return;
    }

    const std::string current = registry_.current_id();
    const auto* pkg = registry_.find(current);
    if (pkg != nullptr && pkg->is_active()) {
        log_.debug("cancelling stuck package " + pkg->display_name());
        update_state(current, InstallState::Skipped);
    }

    registry_.set_current(new_id);
}

void ImeLogTracker::update_state(const std::string& id, InstallState state) {
    if (registry_.find(id) == nullptr) {
        return;
    }
    report(registry_.update_state(id, state));
}

void ImeLogTracker::report(const std::vector<StateChange>& changes) {
    if (changes.empty()) {
        return;
    }

    for (const auto& change : changes) {
        const auto* pkg = registry_.find(change.id);
        if (pkg == nullptr) {
            continue;
        }
        log_.debug(pkg->display_name() + " state: " + to_string(change.old_state) + " -> " +
                   to_string(change.new_state));
        if (listener_ != nullptr) {
            listener_->on_app_state_changed(*pkg, change.old_state, change.new_state);
        }
    }

    if (!all_apps_completed_fired_ && registry_.count_all() > 0 && registry_.is_all_completed()) {
        all_apps_completed_fired_ = true;
        if (listener_ != nullptr) {
            listener_->on_all_apps_completed();
        }
    }
}

void ImeLogTracker::activate_rules(bool log_phase_is_current) {
    if (log_phase_is_current_ == log_phase_is_current) {
        return;
    }
    log_phase_is_current_ = log_phase_is_current;
    registry_.set_current("");
    if (log_phase_is_current) {
        last_sim_timestamp_.reset();
    }
}

bool ImeLogTracker::apply_simulation_delay(io::TimePoint timestamp, const PollControl* control) {
    if (last_sim_timestamp_ && timestamp > *last_sim_timestamp_ && options_.speed_factor > 0 &&
        control != nullptr && control->wait) {
        auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp -
                                                                         *last_sim_timestamp_);
        auto delay = std::chrono::milliseconds(
            static_cast<std::int64_t>(static_cast<double>(gap.count()) / options_.speed_factor));
        delay = std::min(delay, MAX_SIMULATION_DELAY);
        if (delay.count() > 0 && !control->wait(delay)) {
            return false;
        }
    }
    last_sim_timestamp_ = timestamp;
    return true;
}

void ImeLogTracker::write_match_log(const std::string& file, const std::string& raw,
                                    const std::string& rule_id) {
    if (!match_log_.is_open()) {
        return;
    }
    match_log_ << '[' << file << "] [" << rule_id << "] " << raw << '\n';
    match_log_.flush();
    if (!match_log_) {
        log_.warn("match log write failed, disabling match log");
        match_log_.close();
    }
}

// ============================================================================
// Снимок
// ============================================================================

ImeTrackerState ImeLogTracker::snapshot() const {
    ImeTrackerState state;
    state.last_esp_phase = last_esp_phase_;
    state.all_apps_completed_fired = all_apps_completed_fired_;
    state.log_phase_is_current = log_phase_is_current_;
    state.ignore_list = registry_.ignore_list();
    state.current_package_id = registry_.current_id();
    for (const auto& pkg : registry_.packages()) {
        state.packages.push_back(pkg.record());
    }
    state.positions = positions_.positions();
    return state;
}

void ImeLogTracker::restore(const ImeTrackerState& state) {
    std::vector<AppPackageState> packages;
    packages.reserve(state.packages.size());
    for (const auto& record : state.packages) {
        packages.push_back(AppPackageState::from_record(record));
    }
    registry_.restore(std::move(packages), state.ignore_list, state.current_package_id);

    positions_.clear();
    for (const auto& [path, pos] : state.positions) {
        positions_.restore_position(path, pos.position, pos.last_known_size);
    }

    last_esp_phase_ = state.last_esp_phase;
    all_apps_completed_fired_ = state.all_apps_completed_fired;
    log_phase_is_current_ = state.log_phase_is_current;
    dirty_ = false;

    log_.info("restored IME tracker state: " + std::to_string(registry_.count_all()) +
              " packages, " + std::to_string(positions_.size()) + " file positions");
}

}  // namespace enrollwatch::tracking
