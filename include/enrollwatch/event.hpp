// ==============================================================================
// enrollwatch/event.hpp - События регистрации устройства
// ==============================================================================
//
// Назначение:
// - Фазы регистрации (EnrollmentPhase) и уровни событий (EventSeverity)
// - EnrollmentEvent - единственный артефакт, выходящий наружу
// - Сериализация события в JSON (camelCase ключи)
// - EventSink - приёмник событий (транспорт вне этого проекта)
//
// ==============================================================================

#ifndef ENROLLWATCH_EVENT_HPP
#define ENROLLWATCH_EVENT_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <enrollwatch/cmtrace.hpp>
#include <enrollwatch/value.hpp>

namespace enrollwatch::tracking {

// ============================================================================
// Enums
// ============================================================================

enum class EnrollmentPhase {
    Unknown = -1,
    Start = 0,
    DevicePreparation = 1,
    DeviceSetup = 2,
    AppsDevice = 3,
    AccountSetup = 4,
    AppsUser = 5,
    FinalizingSetup = 6,
    Complete = 7,
    Failed = 99
};

enum class EventSeverity { Debug = 0, Info = 1, Warning = 2, Error = 3, Critical = 4 };

std::string to_string(EnrollmentPhase phase);

std::string to_string(EventSeverity severity);

/// Фаза по имени (без учёта регистра); std::nullopt для неизвестного
std::optional<EnrollmentPhase> parse_phase(std::string_view s);

// ============================================================================
// EnrollmentEvent
// ============================================================================

struct EnrollmentEvent {
    std::string session_id;
    std::string tenant_id;
    io::TimePoint timestamp{};
    std::string event_type;
    EventSeverity severity = EventSeverity::Info;
    std::string source;
    EnrollmentPhase phase = EnrollmentPhase::Unknown;
    std::string message;
    Value data = Value::make_object();
    std::int64_t sequence = 0;
};

/// JSON объект события:
/// {"sessionId","tenantId","timestamp","eventType","severity","source",
///  "phase","message","data","sequence"}
rapidjson::Document to_json(const EnrollmentEvent& event);

/// Приёмник событий. Вызывается вне блокировки состояния, по порядку sequence.
using EventSink = std::function<void(const EnrollmentEvent&)>;

}  // namespace enrollwatch::tracking

#endif  // ENROLLWATCH_EVENT_HPP
