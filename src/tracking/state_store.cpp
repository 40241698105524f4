// ==============================================================================
// state_store.cpp - Снимок состояния и маркер завершения
// ==============================================================================

#include <enrollwatch/output.hpp>
#include <enrollwatch/platform.hpp>
#include <enrollwatch/state_store.hpp>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace enrollwatch::tracking {

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(JsonWriter& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_package(JsonWriter& w, const PackageRecord& p) {
    w.StartObject();
    write_string(w, "id", p.id);
    w.Key("listPos");
    w.Int(p.list_pos);
    write_string(w, "name", p.name);
    w.Key("runAs");
    w.Int(static_cast<int>(p.run_as));
    w.Key("intent");
    w.Int(static_cast<int>(p.intent));
    w.Key("targeted");
    w.Int(static_cast<int>(p.targeted));
    w.Key("dependsOn");
    w.StartArray();
    for (const auto& dep : p.depends_on) {
        w.String(dep.c_str(), static_cast<rapidjson::SizeType>(dep.size()));
    }
    w.EndArray();
    w.Key("installationState");
    w.Int(static_cast<int>(p.state));
    w.Key("downloadingOrInstallingSeen");
    w.Bool(p.downloading_or_installing_seen);
    w.Key("progressPercent");
    if (p.progress_percent) {
        w.Int(*p.progress_percent);
    } else {
        w.Null();
    }
    w.Key("bytesDownloaded");
    w.Int64(p.bytes_downloaded);
    w.Key("bytesTotal");
    w.Int64(p.bytes_total);
    w.Key("lastChanged");
    w.Int64(p.last_changed);
    w.EndObject();
}

// ----------------------------------------------------------------------------
// Чтение полей с проверкой типа
// ----------------------------------------------------------------------------

const rapidjson::Value* field(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

[[noreturn]] void wrong_type(const char* key, const char* expected) {
    throw std::runtime_error(std::string("snapshot field '") + key + "' must be " + expected);
}

std::string read_string(const rapidjson::Value& obj, const char* key) {
    const auto* v = field(obj, key);
    if (v == nullptr) {
        return {};
    }
    if (!v->IsString()) {
        wrong_type(key, "a string");
    }
    return std::string(v->GetString(), v->GetStringLength());
}

bool read_bool(const rapidjson::Value& obj, const char* key) {
    const auto* v = field(obj, key);
    if (v == nullptr) {
        return false;
    }
    if (!v->IsBool()) {
        wrong_type(key, "a boolean");
    }
    return v->GetBool();
}

std::int64_t read_int64(const rapidjson::Value& obj, const char* key, std::int64_t fallback) {
    const auto* v = field(obj, key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->IsInt64()) {
        wrong_type(key, "an integer");
    }
    return v->GetInt64();
}

int read_int(const rapidjson::Value& obj, const char* key, int fallback) {
    const auto* v = field(obj, key);
    if (v == nullptr) {
        return fallback;
    }
    if (!v->IsInt()) {
        wrong_type(key, "an integer");
    }
    return v->GetInt();
}

const rapidjson::Value* read_array(const rapidjson::Value& obj, const char* key) {
    const auto* v = field(obj, key);
    if (v != nullptr && !v->IsArray()) {
        wrong_type(key, "an array");
    }
    return v;
}

const rapidjson::Value* read_object(const rapidjson::Value& obj, const char* key) {
    const auto* v = field(obj, key);
    if (v != nullptr && !v->IsObject()) {
        wrong_type(key, "an object");
    }
    return v;
}

std::vector<std::string> read_string_array(const rapidjson::Value& obj, const char* key) {
    std::vector<std::string> out;
    if (const auto* arr = read_array(obj, key)) {
        for (const auto& item : arr->GetArray()) {
            if (!item.IsString()) {
                wrong_type(key, "an array of strings");
            }
            out.emplace_back(item.GetString(), item.GetStringLength());
        }
    }
    return out;
}

PackageRecord read_package(const rapidjson::Value& v) {
    if (!v.IsObject()) {
        throw std::runtime_error("snapshot package entry must be an object");
    }

    PackageRecord p;
    p.id = read_string(v, "id");
    if (p.id.empty()) {
        throw std::runtime_error("snapshot package entry without id");
    }
    p.list_pos = read_int(v, "listPos", 0);
    p.name = read_string(v, "name");
    p.run_as = static_cast<RunAs>(read_int(v, "runAs", -1));
    p.intent = static_cast<Intent>(read_int(v, "intent", -1));
    p.targeted = static_cast<Targeted>(read_int(v, "targeted", 128));
    for (auto& dep : read_string_array(v, "dependsOn")) {
        p.depends_on.insert(std::move(dep));
    }

    int state = read_int(v, "installationState", 0);
    if (state < 0 || state > static_cast<int>(InstallState::Error)) {
        throw std::runtime_error("snapshot package " + p.id + ": invalid installationState " +
                                 std::to_string(state));
    }
    p.state = static_cast<InstallState>(state);
    p.downloading_or_installing_seen = read_bool(v, "downloadingOrInstallingSeen");
    if (field(v, "progressPercent") != nullptr) {
        p.progress_percent = read_int(v, "progressPercent", 0);
    }
    p.bytes_downloaded = read_int64(v, "bytesDownloaded", 0);
    p.bytes_total = read_int64(v, "bytesTotal", 0);
    p.last_changed = read_int64(v, "lastChanged", 0);
    return p;
}

}  // namespace

// ============================================================================
// Сериализация
// ============================================================================

std::string serialize_snapshot(const Snapshot& snapshot) {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);

    const auto& t = snapshot.tracker;
    const auto& s = snapshot.session;

    w.StartObject();
    w.Key("version");
    w.Int(snapshot.version);

    write_string(w, "lastEspPhaseDetected", t.last_esp_phase);
    w.Key("allAppsCompletedFired");
    w.Bool(t.all_apps_completed_fired);
    w.Key("logPhaseIsCurrentPhase");
    w.Bool(t.log_phase_is_current);

    w.Key("ignoreList");
    w.StartArray();
    for (const auto& id : t.ignore_list) {
        w.String(id.c_str(), static_cast<rapidjson::SizeType>(id.size()));
    }
    w.EndArray();

    write_string(w, "currentPackageId", t.current_package_id);

    w.Key("packages");
    w.StartArray();
    for (const auto& p : t.packages) {
        write_package(w, p);
    }
    w.EndArray();

    w.Key("filePositions");
    w.StartObject();
    for (const auto& [path, pos] : t.positions) {
        w.Key(path.c_str(), static_cast<rapidjson::SizeType>(path.size()));
        w.StartObject();
        w.Key("position");
        w.Int64(pos.position);
        w.Key("lastKnownSize");
        w.Int64(pos.last_known_size);
        w.EndObject();
    }
    w.EndObject();

    w.Key("session");
    w.StartObject();
    write_string(w, "sessionId", s.session_id);
    write_string(w, "enrollmentType", s.enrollment_type);
    w.Key("phase");
    w.Int(s.phase);
    write_string(w, "lastEspPhase", s.last_esp_phase);
    w.Key("autoSwitchedToAppsPhase");
    w.Bool(s.auto_switched_to_apps);
    w.Key("finalDeviceInfoCollected");
    w.Bool(s.final_device_info_collected);
    w.Key("waitingForHello");
    w.Bool(s.waiting_for_hello);
    w.Key("summaryActive");
    w.Bool(s.summary_active);
    w.Key("nextSequence");
    w.Int64(s.next_sequence);
    w.EndObject();

    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

Snapshot deserialize_snapshot(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("snapshot parse error at offset ") +
                                 std::to_string(doc.GetErrorOffset()) + ": " +
                                 rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw std::runtime_error("snapshot root must be an object");
    }

    Snapshot snapshot;
    snapshot.version = read_int(doc, "version", Snapshot::CURRENT_VERSION);
    if (snapshot.version > Snapshot::CURRENT_VERSION) {
        throw std::runtime_error("unsupported snapshot version " +
                                 std::to_string(snapshot.version));
    }

    auto& t = snapshot.tracker;
    t.last_esp_phase = read_string(doc, "lastEspPhaseDetected");
    t.all_apps_completed_fired = read_bool(doc, "allAppsCompletedFired");
    t.log_phase_is_current = read_bool(doc, "logPhaseIsCurrentPhase");
    t.ignore_list = read_string_array(doc, "ignoreList");
    t.current_package_id = read_string(doc, "currentPackageId");

    if (const auto* packages = read_array(doc, "packages")) {
        for (const auto& item : packages->GetArray()) {
            t.packages.push_back(read_package(item));
        }
    }

    if (const auto* positions = read_object(doc, "filePositions")) {
        for (auto it = positions->MemberBegin(); it != positions->MemberEnd(); ++it) {
            if (!it->value.IsObject()) {
                throw std::runtime_error("snapshot file position entry must be an object");
            }
            io::TailPosition pos;
            pos.position = read_int64(it->value, "position", 0);
            pos.last_known_size = read_int64(it->value, "lastKnownSize", pos.position);
            t.positions.emplace(std::string(it->name.GetString(), it->name.GetStringLength()),
                                pos);
        }
    }

    if (const auto* session = read_object(doc, "session")) {
        auto& s = snapshot.session;
        s.session_id = read_string(*session, "sessionId");
        s.enrollment_type = read_string(*session, "enrollmentType");
        s.phase = read_int(*session, "phase", -1);
        s.last_esp_phase = read_string(*session, "lastEspPhase");
        s.auto_switched_to_apps = read_bool(*session, "autoSwitchedToAppsPhase");
        s.final_device_info_collected = read_bool(*session, "finalDeviceInfoCollected");
        s.waiting_for_hello = read_bool(*session, "waitingForHello");
        s.summary_active = read_bool(*session, "summaryActive");
        s.next_sequence = read_int64(*session, "nextSequence", 0);
    }

    return snapshot;
}

// ============================================================================
// StateStore
// ============================================================================

StateStore::StateStore(std::filesystem::path state_dir, output::Writer* log)
    : state_dir_(std::move(state_dir)), log_(log) {}

std::optional<Snapshot> StateStore::load() const {
    const auto path = state_file();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (log_ != nullptr) {
            log_->info("no persisted state found (fresh enrollment)");
        }
        return std::nullopt;
    }

    try {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw std::runtime_error("cannot open " + platform::path_to_utf8(path));
        }
        std::ostringstream content;
        content << in.rdbuf();

        Snapshot snapshot = deserialize_snapshot(content.str());
        if (log_ != nullptr) {
            log_->info("restored persisted state: " +
                       std::to_string(snapshot.tracker.packages.size()) + " packages, " +
                       std::to_string(snapshot.tracker.positions.size()) + " file positions");
        }
        return snapshot;
    } catch (const std::exception& e) {
        if (log_ != nullptr) {
            log_->warn(std::string("failed to load persisted state, starting fresh: ") + e.what());
        }
        return std::nullopt;
    }
}

bool StateStore::save(const Snapshot& snapshot) const {
    try {
        std::filesystem::create_directories(state_dir_);
        platform::write_file_atomic(state_file(), serialize_snapshot(snapshot));
        return true;
    } catch (const std::exception& e) {
        if (log_ != nullptr) {
            log_->warn(std::string("failed to save state: ") + e.what());
        }
        return false;
    }
}

bool StateStore::remove() const {
    std::error_code ec;
    bool removed = std::filesystem::remove(state_file(), ec);
    if (ec) {
        if (log_ != nullptr) {
            log_->warn("failed to delete state file: " + ec.message());
        }
        return false;
    }
    if (removed && log_ != nullptr) {
        log_->info("persisted state deleted");
    }
    return true;
}

bool StateStore::write_completion_marker(io::TimePoint completed_at) const {
    try {
        std::filesystem::create_directories(state_dir_);
        platform::write_file_atomic(marker_file(),
                                    "Enrollment completed at " + io::format_iso8601(completed_at));
        if (log_ != nullptr) {
            log_->info("enrollment complete marker written: " +
                       platform::path_to_utf8(marker_file()));
        }
        return true;
    } catch (const std::exception& e) {
        if (log_ != nullptr) {
            log_->warn(std::string("failed to write enrollment complete marker: ") + e.what());
        }
        return false;
    }
}

bool StateStore::has_completion_marker() const {
    std::error_code ec;
    return std::filesystem::exists(marker_file(), ec);
}

bool StateStore::remove_completion_marker() const {
    std::error_code ec;
    std::filesystem::remove(marker_file(), ec);
    if (ec) {
        if (log_ != nullptr) {
            log_->warn("failed to delete completion marker: " + ec.message());
        }
        return false;
    }
    return true;
}

}  // namespace enrollwatch::tracking
