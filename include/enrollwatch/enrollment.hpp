// ==============================================================================
// enrollwatch/enrollment.hpp - Оркестратор фаз регистрации
// ==============================================================================
//
// Назначение:
// - Цикл чтения журналов IME (поток tail) и таймер сводки (поток summary)
// - Машина фаз: Start -> DeviceSetup -> AccountSetup -> FinalizingSetup
//   -> Complete, с информационными фазами AppsDevice/AppsUser
// - Ожидание Windows Hello перед завершением
// - Стратегические события и их доставка в EventSink
// - Снимок состояния после изменений, удаление снимка при завершении
//
// Потоки:
//
//   tail     poll_once() -> ожидание poll_interval (после ошибки 1 с)
//   summary  ожидание summary_interval -> summary_tick()
//   внешние  обратные вызовы HelloSignal
//
// Всё разделяемое состояние защищено одним мьютексом. События ставятся в
// очередь под ним и доставляются в приёмник вне его, в порядке sequence.
//
// ==============================================================================

#ifndef ENROLLWATCH_ENROLLMENT_HPP
#define ENROLLWATCH_ENROLLMENT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <enrollwatch/app_state.hpp>
#include <enrollwatch/event.hpp>
#include <enrollwatch/ime_tracker.hpp>
#include <enrollwatch/rule.hpp>
#include <enrollwatch/state_store.hpp>
#include <enrollwatch/value.hpp>

namespace enrollwatch::output {
class Writer;
}

namespace enrollwatch::tracking {

// ============================================================================
// Windows Hello
// ============================================================================

enum class FinalizingReason { EspExiting, HelloWizardStarted };

/// "esp_exiting" | "hello_wizard_started"
std::string to_string(FinalizingReason reason);

class HelloListener {
public:
    virtual ~HelloListener() = default;

    virtual void on_hello_completed() = 0;

    virtual void on_finalizing_setup_triggered(FinalizingReason reason) = 0;
};

/// Внешний детектор Windows Hello. Методы-запросы вызываются под мьютексом
/// оркестратора и не должны синхронно вызывать слушателя.
class HelloSignal {
public:
    virtual ~HelloSignal() = default;

    virtual bool is_policy_configured() const = 0;

    virtual bool is_hello_completed() const = 0;

    /// Начать ограниченное ожидание шага Hello (тайм-аут - забота детектора)
    virtual void start_hello_wait_timer() = 0;

    /// nullptr отписывает слушателя
    virtual void set_listener(HelloListener* listener) = 0;
};

// ============================================================================
// Сведения об устройстве
// ============================================================================

struct DeviceFact {
    std::string event_type;
    std::string message;
    Value data = Value::make_object();
};

/// Внешний сборщик сведений об устройстве. Может работать медленно:
/// вызывается вне мьютекса оркестратора.
class DeviceInfoCollector {
public:
    virtual ~DeviceInfoCollector() = default;

    /// При старте
    virtual std::vector<DeviceFact> collect_initial() = 0;

    /// Один раз: при входе в FinalizingSetup или при завершении
    virtual std::vector<DeviceFact> collect_final() = 0;
};

// ============================================================================
// Тип регистрации
// ============================================================================

enum class EnrollmentType {
    V1,  // Autopilot Classic / ESP
    V2   // Windows Device Preparation, без фаз ESP
};

std::string to_string(EnrollmentType type);

/// Значения HKLM\SOFTWARE\Microsoft\Provisioning\AutopilotSettings
struct AutopilotSettings {
    std::optional<std::string> cloud_assigned_device_registration;
    std::optional<std::string> cloud_assigned_esp_enabled;
};

/// CloudAssignedDeviceRegistration == "2" или CloudAssignedEspEnabled == "0"
/// -> V2, иначе V1
EnrollmentType detect_enrollment_type(const AutopilotSettings& settings);

// ============================================================================
// TrackerOptions
// ============================================================================

struct TrackerOptions {
    std::string session_id;
    std::string tenant_id;

    ImeTrackerOptions ime;
    std::vector<rule::RuleDef> rules;

    std::filesystem::path state_directory;

    std::chrono::milliseconds poll_interval{100};
    std::chrono::milliseconds error_backoff{1000};
    std::chrono::milliseconds summary_interval{30000};
};

// ============================================================================
// EnrollmentTracker
// ============================================================================

class EnrollmentTracker final : private ImeTrackerListener, private HelloListener {
public:
    EnrollmentTracker(TrackerOptions options, EventSink sink, output::Writer& log,
                      HelloSignal* hello = nullptr, DeviceInfoCollector* collector = nullptr,
                      EnrollmentType type = EnrollmentType::V1);

    ~EnrollmentTracker() override;

    EnrollmentTracker(const EnrollmentTracker&) = delete;
    EnrollmentTracker& operator=(const EnrollmentTracker&) = delete;

    /// Восстановить снимок, отправить начальные сведения, запустить потоки
    void start();

    /// Остановить потоки и сохранить снимок (если регистрация не завершена).
    /// После возврата обратные вызовы не доставляют событий.
    void stop();

    /// Один проход чтения журналов
    /// @throws std::runtime_error если папку журналов не удалось прочитать
    std::size_t poll_once();

    /// Один такт сводки (если сводка активна)
    void summary_tick();

    /// Горячая замена правил; возвращает предупреждения компиляции
    std::vector<std::string> update_rules(const std::vector<rule::RuleDef>& defs);

    // Состояние (под мьютексом)
    // -------------------------------------------------------------------------

    EnrollmentPhase phase() const;
    EnrollmentType enrollment_type() const { return type_; }
    bool completed() const;
    bool waiting_for_hello() const;
    bool summary_active() const;
    bool final_device_info_collected() const;
    std::int64_t next_sequence() const;

    /// Сводка реестра приложений
    Value app_summary() const;

    /// Записи пакетов реестра
    std::vector<PackageRecord> packages() const;

    const StateStore& store() const { return store_; }

private:
    // ImeTrackerListener (вызывается под мьютексом из poll)
    void on_esp_phase_detected(const std::string& phase) override;
    void on_ime_started() override;
    void on_ime_agent_version(const std::string& version) override;
    void on_app_state_changed(const AppPackageState& pkg, InstallState old_state,
                              InstallState new_state) override;
    void on_policies_discovered(std::size_t count) override;
    void on_all_apps_completed() override;
    void on_user_session_completed() override;

    // HelloListener (внешний поток)
    void on_hello_completed() override;
    void on_finalizing_setup_triggered(FinalizingReason reason) override;

    void tail_loop();
    void summary_loop();

    // Требуют захваченного state_mutex_
    void emit(const std::string& event_type, EventSeverity severity, const std::string& source,
              EnrollmentPhase phase, const std::string& message, Value data = Value::make_object());
    void emit_summary_locked();
    void emit_app_events_locked(const AppPackageState& pkg, InstallState old_state,
                                InstallState new_state);
    void enter_finalizing_locked(FinalizingReason reason);
    void complete_locked(const std::string& source, const std::string& message);
    void save_locked();
    void restore_locked(const Snapshot& snapshot);
    SessionState session_state_locked() const;

    // Без state_mutex_
    void flush_events();
    void emit_device_facts(bool final);
    void collect_final_facts_if_pending();

    TrackerOptions options_;
    EventSink sink_;
    output::Writer& log_;
    HelloSignal* hello_ = nullptr;
    DeviceInfoCollector* collector_ = nullptr;
    const EnrollmentType type_;

    rule::RuleEngine rules_;
    StateStore store_;
    ImeLogTracker ime_;

    mutable std::mutex state_mutex_;
    std::mutex sink_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stop_requested_{false};
    std::thread tail_thread_;
    std::thread summary_thread_;
    bool running_ = false;
    bool stopped_ = false;

    // Учёт сессии
    EnrollmentPhase phase_ = EnrollmentPhase::Start;
    std::string last_esp_phase_;
    bool auto_switched_to_apps_ = false;
    bool final_device_info_collected_ = false;
    bool final_facts_pending_ = false;
    bool waiting_for_hello_ = false;
    bool completed_ = false;
    bool summary_active_ = false;
    bool session_dirty_ = false;
    bool polling_ = false;
    std::uint64_t summary_epoch_ = 0;
    std::int64_t next_sequence_ = 0;

    std::vector<EnrollmentEvent> pending_;
};

}  // namespace enrollwatch::tracking

#endif  // ENROLLWATCH_ENROLLMENT_HPP
