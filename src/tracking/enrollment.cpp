// ==============================================================================
// enrollment.cpp - Оркестратор фаз регистрации
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <enrollwatch/enrollment.hpp>
#include <enrollwatch/output.hpp>
#include <stdexcept>

namespace enrollwatch::tracking {

namespace {

constexpr const char* SOURCE_TRACKER = "EnrollmentTracker";
constexpr const char* SOURCE_IME = "ImeLogTracker";
constexpr const char* SOURCE_DEVICE = "DeviceInfoCollector";

/// Порог download_progress: меньшие загрузки не показываются
constexpr std::int64_t PROGRESS_MIN_BYTES = 1024;

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

}  // namespace

// ============================================================================
// Свободные функции
// ============================================================================

std::string to_string(FinalizingReason reason) {
    switch (reason) {
    case FinalizingReason::EspExiting:
        return "esp_exiting";
    case FinalizingReason::HelloWizardStarted:
        return "hello_wizard_started";
    }
    return "unknown";
}

std::string to_string(EnrollmentType type) {
    switch (type) {
    case EnrollmentType::V1:
        return "v1";
    case EnrollmentType::V2:
        return "v2";
    }
    return "unknown";
}

EnrollmentType detect_enrollment_type(const AutopilotSettings& settings) {
    if (settings.cloud_assigned_device_registration &&
        trim(*settings.cloud_assigned_device_registration) == "2") {
        return EnrollmentType::V2;
    }
    if (settings.cloud_assigned_esp_enabled && trim(*settings.cloud_assigned_esp_enabled) == "0") {
        return EnrollmentType::V2;
    }
    return EnrollmentType::V1;
}

// ============================================================================
// EnrollmentTracker
// ============================================================================

EnrollmentTracker::EnrollmentTracker(TrackerOptions options, EventSink sink, output::Writer& log,
                                     HelloSignal* hello, DeviceInfoCollector* collector,
                                     EnrollmentType type)
    : options_(std::move(options)),
      sink_(std::move(sink)),
      log_(log),
      hello_(hello),
      collector_(collector),
      type_(type),
      store_(options_.state_directory, &log),
      ime_(options_.ime, rules_, log, nullptr) {
    for (const auto& warning : rules_.replace(options_.rules)) {
        log_.warn(warning);
    }
    ime_.set_listener(this);
    if (hello_ != nullptr) {
        hello_->set_listener(this);
    }
}

EnrollmentTracker::~EnrollmentTracker() {
    stop();
    if (hello_ != nullptr) {
        hello_->set_listener(nullptr);
    }
}

void EnrollmentTracker::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (running_ || stopped_) {
            return;
        }

        if (auto snapshot = store_.load()) {
            restore_locked(*snapshot);
        }

        log_.info("enrollment type: " + to_string(type_));
        std::string description = type_ == EnrollmentType::V2
                                      ? "Autopilot v2 (Windows Device Preparation)"
                                      : "Autopilot v1 (Classic ESP)";
        emit("enrollment_type_detected", EventSeverity::Info, SOURCE_TRACKER,
             EnrollmentPhase::Start, "Enrollment type: " + description,
             Value::make_object().with("enrollmentType", Value(to_string(type_))));

        // Hello мог завершиться, пока агент не работал
        if (waiting_for_hello_ && hello_ != nullptr && hello_->is_hello_completed()) {
            waiting_for_hello_ = false;
            complete_locked(SOURCE_TRACKER,
                            "Autopilot enrollment completed successfully (Hello provisioning completed)");
        }
    }
    flush_events();
    collect_final_facts_if_pending();

    emit_device_facts(false);

    std::lock_guard<std::mutex> lock(state_mutex_);
    stop_requested_ = false;
    running_ = true;
    tail_thread_ = std::thread(&EnrollmentTracker::tail_loop, this);
    summary_thread_ = std::thread(&EnrollmentTracker::summary_loop, this);
    log_.info("enrollment tracker started (session " + options_.session_id + ")");
}

void EnrollmentTracker::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (tail_thread_.joinable()) {
        tail_thread_.join();
    }
    if (summary_thread_.joinable()) {
        summary_thread_.join();
    }
    if (hello_ != nullptr) {
        hello_->set_listener(nullptr);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (running_ && !completed_) {
            save_locked();
        }
        running_ = false;
    }
    flush_events();
    log_.info("enrollment tracker stopped");
}

std::size_t EnrollmentTracker::poll_once() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    if (completed_) {
        return 0;
    }

    PollControl control;
    // Вызывается под state_mutex_: завершение из другого потока обрывает чанк
    control.cancelled = [this] { return stop_requested_.load() || completed_; };
    control.wait = [this, &lock](std::chrono::milliseconds delay) {
        return !cv_.wait_for(lock, delay, [this] { return stop_requested_.load(); });
    };
    control.line_done = [this, &lock] {
        if (pending_.empty()) {
            return;
        }
        lock.unlock();
        flush_events();
        lock.lock();
    };

    std::size_t processed = 0;
    polling_ = true;
    try {
        processed = ime_.poll(control);
    } catch (const std::exception&) {
        polling_ = false;
        lock.unlock();
        flush_events();
        throw;
    }
    polling_ = false;

    if (!completed_ && (ime_.dirty() || session_dirty_)) {
        save_locked();
    }
    lock.unlock();

    flush_events();
    collect_final_facts_if_pending();
    return processed;
}

void EnrollmentTracker::summary_tick() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!summary_active_ || completed_) {
            return;
        }
        emit_summary_locked();
    }
    flush_events();
}

std::vector<std::string> EnrollmentTracker::update_rules(const std::vector<rule::RuleDef>& defs) {
    auto warnings = rules_.replace(defs);
    for (const auto& warning : warnings) {
        log_.warn(warning);
    }
    log_.info("rules updated: " + std::to_string(rules_.current()->size()) + " active (generation " +
              std::to_string(rules_.generation()) + ")");
    return warnings;
}

// ----------------------------------------------------------------------------
// Запросы состояния
// ----------------------------------------------------------------------------

EnrollmentPhase EnrollmentTracker::phase() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return phase_;
}

bool EnrollmentTracker::completed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return completed_;
}

bool EnrollmentTracker::waiting_for_hello() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return waiting_for_hello_;
}

bool EnrollmentTracker::summary_active() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return summary_active_;
}

bool EnrollmentTracker::final_device_info_collected() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return final_device_info_collected_;
}

std::int64_t EnrollmentTracker::next_sequence() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return next_sequence_;
}

Value EnrollmentTracker::app_summary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return ime_.registry().summary_data();
}

std::vector<PackageRecord> EnrollmentTracker::packages() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<PackageRecord> out;
    for (const auto& pkg : ime_.registry().packages()) {
        out.push_back(pkg.record());
    }
    return out;
}

// ============================================================================
// Потоки
// ============================================================================

void EnrollmentTracker::tail_loop() {
    log_.debug("tail loop started");
    while (!stop_requested_) {
        bool failed = false;
        try {
            poll_once();
        } catch (const std::exception& e) {
            log_.warn(std::string("error during log check: ") + e.what());
            failed = true;
        }

        std::unique_lock<std::mutex> lock(state_mutex_);
        cv_.wait_for(lock, failed ? options_.error_backoff : options_.poll_interval,
                     [this] { return stop_requested_.load(); });
    }
    log_.debug("tail loop stopped");
}

void EnrollmentTracker::summary_loop() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    while (!stop_requested_) {
        // Интервал отсчитывается заново при активации сводки
        const std::uint64_t epoch = summary_epoch_;
        if (cv_.wait_for(lock, options_.summary_interval, [this, epoch] {
                return stop_requested_.load() || summary_epoch_ != epoch;
            })) {
            continue;
        }
        lock.unlock();
        summary_tick();
        lock.lock();
    }
}

// ============================================================================
// ImeTrackerListener
// ============================================================================

void EnrollmentTracker::on_esp_phase_detected(const std::string& phase) {
    if (type_ == EnrollmentType::V2) {
        log_.debug("ESP phase " + phase + " ignored (Windows Device Preparation)");
        return;
    }
    if (iequals(phase, last_esp_phase_)) {
        log_.debug("ESP phase unchanged: " + phase);
        return;
    }

    const EnrollmentPhase detected = iequals(phase, "AccountSetup")
                                         ? EnrollmentPhase::AccountSetup
                                         : EnrollmentPhase::DeviceSetup;

    last_esp_phase_ = to_string(detected);
    auto_switched_to_apps_ = false;
    session_dirty_ = true;

    // Каноническая фаза не откатывается назад от FinalizingSetup/Complete
    if (phase_ != EnrollmentPhase::FinalizingSetup && phase_ != EnrollmentPhase::Complete) {
        phase_ = detected;
    }

    emit("esp_phase_changed", EventSeverity::Info, SOURCE_IME, detected,
         "ESP phase: " + last_esp_phase_,
         Value::make_object().with("espPhase", Value(last_esp_phase_)));

    if (!summary_active_) {
        summary_active_ = true;
        ++summary_epoch_;
        cv_.notify_all();
        log_.debug("app tracking summary activated");
    }
}

void EnrollmentTracker::on_ime_started() {
    log_.info("IME agent (re)started");
}

void EnrollmentTracker::on_ime_agent_version(const std::string& version) {
    emit("ime_agent_version", EventSeverity::Info, SOURCE_IME, EnrollmentPhase::Unknown,
         "IME Agent version: " + version,
         Value::make_object().with("agentVersion", Value(version)));
}

void EnrollmentTracker::on_app_state_changed(const AppPackageState& pkg, InstallState old_state,
                                             InstallState new_state) {
    // Первая активность приложений в фазе ESP: информационная фаза Apps*
    const bool activity = new_state == InstallState::Downloading ||
                          new_state == InstallState::Installing;
    if (!auto_switched_to_apps_ && activity && old_state < InstallState::Downloading &&
        !last_esp_phase_.empty()) {
        EnrollmentPhase overlay = iequals(last_esp_phase_, "AccountSetup")
                                      ? EnrollmentPhase::AppsUser
                                      : EnrollmentPhase::AppsDevice;
        auto_switched_to_apps_ = true;
        session_dirty_ = true;
        emit("esp_phase_changed", EventSeverity::Info, SOURCE_TRACKER, overlay,
             "ESP phase: " + to_string(overlay) + " (auto-detected from app activity)",
             Value::make_object()
                 .with("espPhase", Value(to_string(overlay)))
                 .with("autoDetected", Value(true)));
    }

    emit_app_events_locked(pkg, old_state, new_state);
}

void EnrollmentTracker::on_policies_discovered(std::size_t count) {
    log_.info("policies discovered: " + std::to_string(count) + ", tracking " +
              std::to_string(ime_.registry().count_all()) + " apps");
}

void EnrollmentTracker::on_all_apps_completed() {
    const auto& registry = ime_.registry();
    log_.info("all apps completed (" + std::to_string(registry.count_completed()) + "/" +
              std::to_string(registry.count_all()) + ", " +
              std::to_string(registry.error_count()) + " errors)");

    emit_summary_locked();
    if (summary_active_) {
        summary_active_ = false;
        session_dirty_ = true;
    }

    if (phase_ == EnrollmentPhase::AccountSetup) {
        log_.info("user apps completed, waiting for user session completion");
    }
}

void EnrollmentTracker::on_user_session_completed() {
    if (completed_) {
        return;
    }

    summary_active_ = false;
    session_dirty_ = true;

    if (hello_ != nullptr && hello_->is_policy_configured() && !hello_->is_hello_completed()) {
        if (!waiting_for_hello_) {
            waiting_for_hello_ = true;
            log_.info("user session completed, waiting for Windows Hello provisioning");
            emit("waiting_for_hello", EventSeverity::Info, SOURCE_TRACKER,
                 EnrollmentPhase::AccountSetup,
                 "User apps completed - waiting for Windows Hello provisioning to finish");
        }
        return;
    }

    complete_locked(SOURCE_IME,
                    "Autopilot enrollment completed successfully (user session completed)");
}

// ============================================================================
// HelloListener
// ============================================================================

void EnrollmentTracker::on_hello_completed() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopped_) {
            return;
        }
        if (!waiting_for_hello_ || completed_) {
            log_.debug("Windows Hello completed (not waiting, ignored)");
            return;
        }
        waiting_for_hello_ = false;
        complete_locked(SOURCE_TRACKER,
                        "Autopilot enrollment completed successfully (Hello provisioning completed)");
    }
    flush_events();
    collect_final_facts_if_pending();
}

void EnrollmentTracker::on_finalizing_setup_triggered(FinalizingReason reason) {
    bool start_timer = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stopped_) {
            return;
        }
        if (type_ == EnrollmentType::V2) {
            log_.debug("finalizing trigger " + to_string(reason) +
                       " ignored (Windows Device Preparation)");
            return;
        }
        if (completed_ || phase_ == EnrollmentPhase::FinalizingSetup) {
            return;
        }

        if (reason == FinalizingReason::EspExiting) {
            if (phase_ == EnrollmentPhase::DeviceSetup) {
                // Выход из ESP после устройства - переход к учётной записи
                last_esp_phase_ = to_string(EnrollmentPhase::AccountSetup);
                auto_switched_to_apps_ = false;
                phase_ = EnrollmentPhase::AccountSetup;
                session_dirty_ = true;
                emit("esp_phase_changed", EventSeverity::Info, SOURCE_TRACKER,
                     EnrollmentPhase::AccountSetup, "ESP phase: AccountSetup (ESP exiting)",
                     Value::make_object()
                         .with("espPhase", Value(last_esp_phase_))
                         .with("trigger", Value(to_string(reason))));
            } else if (phase_ == EnrollmentPhase::AccountSetup) {
                enter_finalizing_locked(reason);
                start_timer = true;
            } else {
                log_.debug("ESP exiting in phase " + to_string(phase_) + " ignored");
            }
        } else {
            enter_finalizing_locked(reason);
        }

        if (session_dirty_ && !completed_) {
            save_locked();
        }
    }

    if (start_timer && hello_ != nullptr) {
        hello_->start_hello_wait_timer();
    }
    flush_events();
    collect_final_facts_if_pending();
}

// ============================================================================
// Внутреннее (под state_mutex_)
// ============================================================================

void EnrollmentTracker::emit(const std::string& event_type, EventSeverity severity,
                             const std::string& source, EnrollmentPhase phase,
                             const std::string& message, Value data) {
    EnrollmentEvent event;
    event.session_id = options_.session_id;
    event.tenant_id = options_.tenant_id;
    event.timestamp = std::chrono::system_clock::now();
    event.event_type = event_type;
    event.severity = severity;
    event.source = source;
    event.phase = phase;
    event.message = message;
    event.data = std::move(data);
    event.sequence = next_sequence_++;
    session_dirty_ = true;
    pending_.push_back(std::move(event));
}

void EnrollmentTracker::emit_summary_locked() {
    const auto& registry = ime_.registry();
    if (registry.count_all() == 0) {
        return;
    }

    const std::size_t errors = registry.error_count();
    std::string message = "App tracking: " + std::to_string(registry.count_completed()) + "/" +
                          std::to_string(registry.count_all()) + " completed";
    if (errors > 0) {
        message += " (" + std::to_string(errors) + " errors)";
    }

    emit("app_tracking_summary", errors > 0 ? EventSeverity::Warning : EventSeverity::Info,
         SOURCE_TRACKER, EnrollmentPhase::Unknown, message, registry.summary_data());
}

void EnrollmentTracker::emit_app_events_locked(const AppPackageState& pkg, InstallState old_state,
                                               InstallState new_state) {
    const std::string& name = pkg.display_name();
    const std::string status = name + ": " + to_string(new_state);

    auto progress = [&](const std::string& message, const char* state) {
        Value data = pkg.to_event_data();
        if (state != nullptr) {
            data.set("status", Value(state));
        }
        emit("download_progress", EventSeverity::Debug, SOURCE_IME, EnrollmentPhase::Unknown,
             message, std::move(data));
    };

    switch (new_state) {
    case InstallState::Downloading:
        if (old_state < InstallState::Downloading) {
            emit("app_download_started", EventSeverity::Info, SOURCE_IME,
                 EnrollmentPhase::Unknown, status, pkg.to_event_data());
        }
        if (pkg.bytes_total() > PROGRESS_MIN_BYTES) {
            progress(name + ": " + std::to_string(pkg.progress_percent().value_or(0)) + "%",
                     nullptr);
        }
        break;

    case InstallState::Installing:
        emit("app_install_started", EventSeverity::Info, SOURCE_IME, EnrollmentPhase::Unknown,
             status, pkg.to_event_data());
        break;

    case InstallState::Installed:
        progress(name + ": completed", "completed");
        emit("app_install_completed", EventSeverity::Info, SOURCE_IME, EnrollmentPhase::Unknown,
             status, pkg.to_event_data());
        break;

    case InstallState::Skipped:
        emit("app_install_skipped", EventSeverity::Info, SOURCE_IME, EnrollmentPhase::Unknown,
             status, pkg.to_event_data());
        break;

    case InstallState::Error:
        progress(name + ": failed", "failed");
        emit("app_install_failed", EventSeverity::Error, SOURCE_IME, EnrollmentPhase::Unknown,
             status, pkg.to_event_data());
        break;

    case InstallState::Postponed:
        emit("app_install_failed", EventSeverity::Warning, SOURCE_IME, EnrollmentPhase::Unknown,
             status, pkg.to_event_data());
        break;

    default:
        break;
    }
}

void EnrollmentTracker::enter_finalizing_locked(FinalizingReason reason) {
    const EnrollmentPhase previous = phase_;
    phase_ = EnrollmentPhase::FinalizingSetup;
    session_dirty_ = true;
    log_.info("entering FinalizingSetup (" + to_string(reason) + ")");

    emit("esp_phase_changed", EventSeverity::Info, SOURCE_TRACKER,
         EnrollmentPhase::FinalizingSetup, "ESP phase: FinalizingSetup (" + to_string(reason) + ")",
         Value::make_object()
             .with("espPhase", Value(to_string(EnrollmentPhase::FinalizingSetup)))
             .with("trigger", Value(to_string(reason)))
             .with("previousPhase", Value(to_string(previous))));

    if (!final_device_info_collected_) {
        final_device_info_collected_ = true;
        final_facts_pending_ = true;
    }
}

void EnrollmentTracker::complete_locked(const std::string& source, const std::string& message) {
    completed_ = true;
    waiting_for_hello_ = false;
    summary_active_ = false;
    phase_ = EnrollmentPhase::Complete;
    log_.info("enrollment completed");

    emit("enrollment_complete", EventSeverity::Info, source, EnrollmentPhase::Complete, message);

    store_.write_completion_marker(std::chrono::system_clock::now());

    if (!final_device_info_collected_) {
        final_device_info_collected_ = true;
        final_facts_pending_ = true;
    }

    store_.remove();
}

void EnrollmentTracker::save_locked() {
    if (completed_) {
        return;
    }
    // Позиции чанка ещё не зафиксированы: снимок запишет poll_once
    if (polling_) {
        session_dirty_ = true;
        return;
    }
    Snapshot snapshot;
    snapshot.tracker = ime_.snapshot();
    snapshot.session = session_state_locked();
    if (store_.save(snapshot)) {
        ime_.clear_dirty();
        session_dirty_ = false;
    }
}

void EnrollmentTracker::restore_locked(const Snapshot& snapshot) {
    const SessionState& session = snapshot.session;
    if (!session.session_id.empty() && session.session_id != options_.session_id) {
        log_.warn("persisted state belongs to session " + session.session_id +
                  ", continuing as " + options_.session_id);
    }

    ime_.restore(snapshot.tracker);

    if (session.phase >= static_cast<int>(EnrollmentPhase::Start) &&
        session.phase <= static_cast<int>(EnrollmentPhase::FinalizingSetup)) {
        phase_ = static_cast<EnrollmentPhase>(session.phase);
    }
    last_esp_phase_ = session.last_esp_phase;
    auto_switched_to_apps_ = session.auto_switched_to_apps;
    final_device_info_collected_ = session.final_device_info_collected;
    waiting_for_hello_ = session.waiting_for_hello;
    summary_active_ = session.summary_active;
    next_sequence_ = std::max(next_sequence_, session.next_sequence);

    log_.info("resumed session: phase " + to_string(phase_) + ", next sequence " +
              std::to_string(next_sequence_));
}

SessionState EnrollmentTracker::session_state_locked() const {
    SessionState session;
    session.session_id = options_.session_id;
    session.enrollment_type = to_string(type_);
    session.phase = static_cast<int>(phase_);
    session.last_esp_phase = last_esp_phase_;
    session.auto_switched_to_apps = auto_switched_to_apps_;
    session.final_device_info_collected = final_device_info_collected_;
    session.waiting_for_hello = waiting_for_hello_;
    session.summary_active = summary_active_;
    session.next_sequence = next_sequence_;
    return session;
}

// ============================================================================
// Доставка (без state_mutex_)
// ============================================================================

void EnrollmentTracker::flush_events() {
    std::lock_guard<std::mutex> sink_lock(sink_mutex_);

    std::vector<EnrollmentEvent> batch;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        batch.swap(pending_);
    }

    for (const auto& event : batch) {
        if (!sink_) {
            break;
        }
        try {
            sink_(event);
        } catch (const std::exception& e) {
            log_.warn("event sink failed for " + event.event_type + " #" +
                      std::to_string(event.sequence) + ": " + e.what());
        }
    }
}

void EnrollmentTracker::emit_device_facts(bool final) {
    if (collector_ == nullptr) {
        return;
    }

    std::vector<DeviceFact> facts;
    try {
        facts = final ? collector_->collect_final() : collector_->collect_initial();
    } catch (const std::exception& e) {
        log_.warn(std::string("device info collection failed: ") + e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& fact : facts) {
            emit(fact.event_type, EventSeverity::Info, SOURCE_DEVICE, EnrollmentPhase::Unknown,
                 fact.message, std::move(fact.data));
        }
        if (!completed_ && !facts.empty()) {
            save_locked();
        }
    }
    flush_events();
}

void EnrollmentTracker::collect_final_facts_if_pending() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!final_facts_pending_) {
            return;
        }
        final_facts_pending_ = false;
    }
    emit_device_facts(true);
}

}  // namespace enrollwatch::tracking
