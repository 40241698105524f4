// ==============================================================================
// enrollwatch/ime_tracker.hpp - Трекер журнала IME
// ==============================================================================
//
// Назначение:
// - Чтение новых строк журналов IME (поиск файлов, позиции, порции)
// - Сопоставление строк с активным набором правил
// - Выполнение действий правил над реестром приложений
// - Уведомление оркестратора через ImeTrackerListener
// - Журнал совпадений и режим воспроизведения (simulation)
// - Снимок/восстановление собственного состояния
//
// Трекер однопоточный: его вызывает EnrollmentTracker под своим мьютексом.
//
// ==============================================================================

#ifndef ENROLLWATCH_IME_TRACKER_HPP
#define ENROLLWATCH_IME_TRACKER_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

#include <enrollwatch/app_state.hpp>
#include <enrollwatch/position.hpp>
#include <enrollwatch/rule.hpp>
#include <enrollwatch/state_store.hpp>
#include <enrollwatch/tailer.hpp>

namespace enrollwatch::output {
class Writer;
}

namespace enrollwatch::tracking {

// ============================================================================
// ImeTrackerListener
// ============================================================================

/// Обратные вызовы трекера. Вызываются синхронно из process_line/poll.
class ImeTrackerListener {
public:
    virtual ~ImeTrackerListener() = default;

    /// Обнаружена фаза ESP (DeviceSetup | AccountSetup), в т.ч. повторно
    virtual void on_esp_phase_detected(const std::string& phase) = 0;

    virtual void on_ime_started() = 0;

    virtual void on_ime_agent_version(const std::string& version) = 0;

    /// Состояние пакета изменилось (для Downloading - также прогресс)
    virtual void on_app_state_changed(const AppPackageState& pkg, InstallState old_state,
                                      InstallState new_state) = 0;

    virtual void on_policies_discovered(std::size_t count) = 0;

    /// Все обязательные пакеты завершены (один раз до повторного взвода)
    virtual void on_all_apps_completed() = 0;

    virtual void on_user_session_completed() = 0;
};

// ============================================================================
// Options
// ============================================================================

struct ImeTrackerOptions {
    io::TailerOptions tailer;
    TargetFilter target_filter = TargetFilter::All;

    /// Журнал совпадений: "[<файл>] [<id правила>] <строка>"
    std::optional<std::filesystem::path> match_log_path;

    /// Воспроизведение с паузами по меткам времени строк
    bool simulation = false;
    double speed_factor = 50.0;
};

/// Управление циклом poll
struct PollControl {
    /// Проверяется между строками; true - прекратить
    std::function<bool()> cancelled;

    /// Пауза воспроизведения; false если ожидание прервано остановкой
    std::function<bool(std::chrono::milliseconds)> wait;

    /// После каждой обработанной строки
    std::function<void()> line_done;
};

/// Предельная пауза воспроизведения
constexpr std::chrono::milliseconds MAX_SIMULATION_DELAY{5000};

// ============================================================================
// ImeLogTracker
// ============================================================================

class ImeLogTracker {
public:
    ImeLogTracker(ImeTrackerOptions options, const rule::RuleEngine& rules, output::Writer& log,
                  ImeTrackerListener* listener = nullptr);

    ImeLogTracker(const ImeLogTracker&) = delete;
    ImeLogTracker& operator=(const ImeLogTracker&) = delete;

    void set_listener(ImeTrackerListener* listener) { listener_ = listener; }

    /// Обработать одну строку журнала.
    /// @return число сработавших правил
    std::size_t process_line(const std::string& file, const std::string& raw);

    /// Прочитать новые строки всех журналов.
    ///
    /// Ошибка чтения одного файла логируется, файл пропускается.
    /// Позиция фиксируется на конце последней обработанной строки.
    ///
    /// @return число обработанных строк
    /// @throws std::runtime_error если папку журналов не удалось прочитать
    std::size_t poll(const PollControl& control = {});

    // Состояние
    // -------------------------------------------------------------------------

    AppPackageRegistry& registry() { return registry_; }
    const AppPackageRegistry& registry() const { return registry_; }

    io::PositionTracker& positions() { return positions_; }
    const io::PositionTracker& positions() const { return positions_; }

    const io::LogTailer& tailer() const { return tailer_; }

    bool log_phase_is_current() const { return log_phase_is_current_; }

    const std::string& last_esp_phase() const { return last_esp_phase_; }

    bool all_apps_completed_fired() const { return all_apps_completed_fired_; }

    /// Состояние изменилось с последнего clear_dirty()
    bool dirty() const { return dirty_; }

    void clear_dirty() { dirty_ = false; }

    ImeTrackerState snapshot() const;

    void restore(const ImeTrackerState& state);

private:
    /// false если строка не обработана (ожидание прервано)
    bool process_line_impl(const std::string& file, const std::string& raw,
                           const PollControl* control, std::size_t& matched);

    void dispatch(const rule::Match& match);

    void handle_ime_started();
    void handle_esp_phase(const std::string& phase);
    void handle_esp_track_status(const rule::Captures& captures);
    void handle_policies(const std::string& json);
    void handle_cancel_stuck(const std::string& new_id);

    /// Изменить состояние пакета и сообщить об изменениях
    void update_state(const std::string& id, InstallState state);

    /// Сообщить слушателю об изменениях; проверить завершение всех пакетов
    void report(const std::vector<StateChange>& changes);

    void activate_rules(bool log_phase_is_current);

    bool apply_simulation_delay(io::TimePoint timestamp, const PollControl* control);

    void write_match_log(const std::string& file, const std::string& raw,
                         const std::string& rule_id);

    ImeTrackerOptions options_;
    const rule::RuleEngine& rules_;
    output::Writer& log_;
    ImeTrackerListener* listener_ = nullptr;

    io::LogTailer tailer_;
    io::PositionTracker positions_;
    AppPackageRegistry registry_;

    bool log_phase_is_current_ = false;
    std::string last_esp_phase_;
    bool all_apps_completed_fired_ = false;
    bool dirty_ = false;

    std::optional<io::TimePoint> last_sim_timestamp_;
    std::ofstream match_log_;
};

}  // namespace enrollwatch::tracking

#endif  // ENROLLWATCH_IME_TRACKER_HPP
