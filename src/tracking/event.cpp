// ==============================================================================
// event.cpp - События регистрации устройства
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <enrollwatch/event.hpp>

namespace enrollwatch::tracking {

std::string to_string(EnrollmentPhase phase) {
    switch (phase) {
    case EnrollmentPhase::Unknown:
        return "Unknown";
    case EnrollmentPhase::Start:
        return "Start";
    case EnrollmentPhase::DevicePreparation:
        return "DevicePreparation";
    case EnrollmentPhase::DeviceSetup:
        return "DeviceSetup";
    case EnrollmentPhase::AppsDevice:
        return "AppsDevice";
    case EnrollmentPhase::AccountSetup:
        return "AccountSetup";
    case EnrollmentPhase::AppsUser:
        return "AppsUser";
    case EnrollmentPhase::FinalizingSetup:
        return "FinalizingSetup";
    case EnrollmentPhase::Complete:
        return "Complete";
    case EnrollmentPhase::Failed:
        return "Failed";
    }
    return "Unknown";
}

std::string to_string(EventSeverity severity) {
    switch (severity) {
    case EventSeverity::Debug:
        return "Debug";
    case EventSeverity::Info:
        return "Info";
    case EventSeverity::Warning:
        return "Warning";
    case EventSeverity::Error:
        return "Error";
    case EventSeverity::Critical:
        return "Critical";
    }
    return "Info";
}

std::optional<EnrollmentPhase> parse_phase(std::string_view s) {
    static constexpr EnrollmentPhase ALL[] = {
        EnrollmentPhase::Unknown,         EnrollmentPhase::Start,
        EnrollmentPhase::DevicePreparation, EnrollmentPhase::DeviceSetup,
        EnrollmentPhase::AppsDevice,      EnrollmentPhase::AccountSetup,
        EnrollmentPhase::AppsUser,        EnrollmentPhase::FinalizingSetup,
        EnrollmentPhase::Complete,        EnrollmentPhase::Failed,
    };

    for (auto phase : ALL) {
        std::string name = to_string(phase);
        if (name.size() == s.size() &&
            std::equal(name.begin(), name.end(), s.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return phase;
        }
    }
    return std::nullopt;
}

rapidjson::Document to_json(const EnrollmentEvent& event) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    auto add_string = [&](const char* key, const std::string& value) {
        doc.AddMember(rapidjson::StringRef(key),
                      rapidjson::Value(value.c_str(),
                                       static_cast<rapidjson::SizeType>(value.size()), alloc),
                      alloc);
    };

    add_string("sessionId", event.session_id);
    add_string("tenantId", event.tenant_id);
    add_string("timestamp", io::format_iso8601(event.timestamp));
    add_string("eventType", event.event_type);
    add_string("severity", to_string(event.severity));
    add_string("source", event.source);
    add_string("phase", to_string(event.phase));
    add_string("message", event.message);

    rapidjson::Value data;
    if (event.data.is_object()) {
        event.data.to_rapidjson(data, alloc);
    } else {
        data.SetObject();
    }
    doc.AddMember("data", data, alloc);
    doc.AddMember("sequence", static_cast<int64_t>(event.sequence), alloc);

    return doc;
}

}  // namespace enrollwatch::tracking
