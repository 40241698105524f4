// ==============================================================================
// rule.cpp - Правила сопоставления строк журнала IME
// ==============================================================================
//
// Загрузка YAML, трансляция шаблонов .NET в ECMAScript, компиляция и
// вычисление набора правил.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <enrollwatch/rule.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace enrollwatch::rule {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct ActionName {
    Action action;
    const char* name;
};

// Имена действий в файлах правил (сравнение без учёта регистра)
constexpr ActionName ACTION_NAMES[] = {
    {Action::ImeStarted, "imeStarted"},
    {Action::ImeSessionChange, "imeSessionChange"},
    {Action::EspPhaseDetected, "espPhaseDetected"},
    {Action::SetCurrentApp, "setCurrentApp"},
    {Action::ImeAgentVersion, "imeAgentVersion"},
    {Action::ImeImpersonation, "imeImpersonation"},
    {Action::EnrollmentCompleted, "enrollmentCompleted"},
    {Action::UpdateStateInstalled, "updateStateInstalled"},
    {Action::UpdateStateDownloading, "updateStateDownloading"},
    {Action::UpdateStateInstalling, "updateStateInstalling"},
    {Action::UpdateStateSkipped, "updateStateSkipped"},
    {Action::UpdateStateError, "updateStateError"},
    {Action::UpdateStatePostponed, "updateStatePostponed"},
    {Action::EspTrackStatus, "espTrackStatus"},
    {Action::PoliciesDiscovered, "policiesDiscovered"},
    {Action::IgnoreCompletedApp, "ignoreCompletedApp"},
    {Action::UpdateName, "updateName"},
    {Action::UpdateWin32AppState, "updateWin32AppState"},
    {Action::CancelStuckAndSetCurrent, "cancelStuckAndSetCurrent"},
};

bool is_yaml_extension(const std::filesystem::path& path) {
    std::string ext = to_lower(path.extension().string());
    return ext == ".yml" || ext == ".yaml";
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// ----------------------------------------------------------------------------
// Трансляция
// ----------------------------------------------------------------------------

/// Раскрыть {GUID}, не трогая экранированные последовательности
std::string expand_guid(std::string_view pattern) {
    std::string out;
    out.reserve(pattern.size() + 64);

    size_t i = 0;
    while (i < pattern.size()) {
        if (pattern[i] == '\\' && i + 1 < pattern.size()) {
            out.append(pattern.substr(i, 2));
            i += 2;
            continue;
        }
        if (pattern.substr(i, GUID_PLACEHOLDER.size()) == GUID_PLACEHOLDER) {
            out.append(GUID_GROUP);
            i += GUID_PLACEHOLDER.size();
            continue;
        }
        out.push_back(pattern[i]);
        ++i;
    }
    return out;
}

/// Есть ли '|' вне экранирования
bool has_alternation(std::string_view pattern) {
    for (size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
        } else if (pattern[i] == '|') {
            return true;
        }
    }
    return false;
}

/// Отделить хвостовую группу "(?<name>.*)", "(?<name>.*)$" или "(?<name>.*?)$".
///
/// Хвостовая группа вычисляется как суффикс сообщения после совпадения
/// остальной части: глубина рекурсии std::regex растёт с длиной участка .*
/// (строки "Get policies" бывают в сотни килобайт).
std::optional<std::string> split_rest_group(std::string& pattern) {
    static const std::regex tail(R"(\(\?<([A-Za-z_][A-Za-z0-9_]*)>\.\*(?:\?\)\$|\)\$?)$)");

    if (has_alternation(pattern)) {
        return std::nullopt;
    }

    std::smatch m;
    if (!std::regex_search(pattern, m, tail)) {
        return std::nullopt;
    }

    // '(' не должна быть экранирована
    size_t start = static_cast<size_t>(m.position(0));
    size_t backslashes = 0;
    while (start > backslashes && pattern[start - backslashes - 1] == '\\') {
        ++backslashes;
    }
    if (backslashes % 2 != 0) {
        return std::nullopt;
    }

    std::string name = m[1].str();
    pattern.erase(start);
    return name;
}

}  // namespace

// ============================================================================
// Error formatting
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "rule error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

// ============================================================================
// RuleDef
// ============================================================================

std::string RuleDef::parameter(const std::string& key) const {
    auto it = parameters.find(key);
    return it == parameters.end() ? std::string() : it->second;
}

bool RuleDef::flag(const std::string& key) const {
    return to_lower(parameter(key)) == "true";
}

// ============================================================================
// Category/Action string conversion
// ============================================================================

std::string to_string(Category c) {
    switch (c) {
    case Category::Always:
        return "always";
    case Category::CurrentPhase:
        return "currentPhase";
    case Category::OtherPhases:
        return "otherPhases";
    }
    return "unknown";
}

std::string to_string(Action a) {
    for (const auto& entry : ACTION_NAMES) {
        if (entry.action == a) {
            return entry.name;
        }
    }
    return "unknown";
}

Category parse_category(std::string_view s) {
    std::string v = to_lower(s);
    if (v == "currentphase" || v == "current_phase") {
        return Category::CurrentPhase;
    }
    if (v == "otherphases" || v == "other_phases") {
        return Category::OtherPhases;
    }
    return Category::Always;
}

Action parse_action(std::string_view s) {
    std::string v = to_lower(s);
    for (const auto& entry : ACTION_NAMES) {
        if (to_lower(entry.name) == v) {
            return entry.action;
        }
    }
    throw std::invalid_argument("unknown action '" + std::string(s) + "'");
}

bool applies(Category category, bool log_phase_is_current) {
    switch (category) {
    case Category::Always:
        return true;
    case Category::CurrentPhase:
        return log_phase_is_current;
    case Category::OtherPhases:
        return !log_phase_is_current;
    }
    return false;
}

// ============================================================================
// translate_pattern
// ============================================================================

TranslatedPattern translate_pattern(std::string_view pattern) {
    TranslatedPattern result;

    std::string expanded = expand_guid(pattern);
    result.rest_group = split_rest_group(expanded);

    std::string& out = result.source;
    out.reserve(expanded.size());

    std::size_t group_index = 0;
    bool in_class = false;
    size_t i = 0;

    while (i < expanded.size()) {
        char c = expanded[i];

        if (c == '\\' && i + 1 < expanded.size()) {
            out.append(expanded, i, 2);
            i += 2;
            continue;
        }

        if (in_class) {
            if (c == ']') {
                in_class = false;
            }
            out.push_back(c);
            ++i;
            continue;
        }

        if (c == '[') {
            in_class = true;
            out.push_back(c);
            ++i;
            // ']' сразу после '[' или '[^' - литерал
            if (i < expanded.size() && expanded[i] == '^') {
                out.push_back('^');
                ++i;
            }
            if (i < expanded.size() && expanded[i] == ']') {
                out.push_back(']');
                ++i;
            }
            continue;
        }

        if (c != '(') {
            out.push_back(c);
            ++i;
            continue;
        }

        // c == '('
        if (i + 1 >= expanded.size() || expanded[i + 1] != '?') {
            ++group_index;
            out.push_back('(');
            ++i;
            continue;
        }

        std::string_view rest = std::string_view(expanded).substr(i + 2);
        if (rest.substr(0, 1) == ":" || rest.substr(0, 1) == "=" || rest.substr(0, 1) == "!") {
            out.append(expanded, i, 3);
            i += 3;
            continue;
        }
        if (rest.substr(0, 2) == "<=" || rest.substr(0, 2) == "<!") {
            throw std::invalid_argument("lookbehind is not supported: " + std::string(pattern));
        }

        size_t name_start = 0;
        char terminator = '>';
        if (rest.substr(0, 1) == "<") {
            name_start = 1;
        } else if (rest.substr(0, 2) == "P<") {
            name_start = 2;
        } else if (rest.substr(0, 1) == "'") {
            name_start = 1;
            terminator = '\'';
        } else {
            throw std::invalid_argument("unsupported group construct '(?" +
                                        std::string(rest.substr(0, 1)) + "' in: " +
                                        std::string(pattern));
        }

        size_t name_end = name_start;
        while (name_end < rest.size() && is_name_char(rest[name_end])) {
            ++name_end;
        }
        if (name_end == name_start || name_end >= rest.size() || rest[name_end] != terminator) {
            throw std::invalid_argument("malformed named group in: " + std::string(pattern));
        }

        std::string name(rest.substr(name_start, name_end - name_start));
        ++group_index;
        if (!result.groups.emplace(name, group_index).second ||
            (result.rest_group && *result.rest_group == name)) {
            throw std::invalid_argument("duplicate group name '" + name + "' in: " +
                                        std::string(pattern));
        }

        out.push_back('(');
        i += 2 + name_end + 1;
    }

    if (in_class) {
        throw std::invalid_argument("unterminated character class in: " + std::string(pattern));
    }

    return result;
}

// ============================================================================
// Captures / CompiledRule
// ============================================================================

std::string Captures::get(const std::string& name) const {
    auto it = values_.find(name);
    return it == values_.end() ? std::string() : it->second;
}

bool Captures::has(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() && !it->second.empty();
}

bool CompiledRule::match(std::string_view message, Captures& out) const {
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(message.begin(), message.end(), m, regex)) {
        return false;
    }

    Captures captures;
    for (const auto& [name, index] : groups) {
        if (index < m.size() && m[index].matched) {
            captures.set(name, m[index].str());
        }
    }
    if (rest_group) {
        size_t end = static_cast<size_t>(m.position(0) + m.length(0));
        captures.set(*rest_group, std::string(message.substr(end)));
    }

    out = std::move(captures);
    return true;
}

CompiledRule compile(const RuleDef& def) {
    CompiledRule compiled;
    compiled.def = def;

    TranslatedPattern translated;
    try {
        translated = translate_pattern(def.pattern);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("rule " + def.id + ": " + e.what());
    }

    try {
        compiled.regex = std::regex(translated.source, std::regex::ECMAScript | std::regex::icase |
                                                           std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("rule " + def.id + ": invalid regex: " + e.what());
    }

    compiled.groups = std::move(translated.groups);
    compiled.rest_group = std::move(translated.rest_group);
    return compiled;
}

// ============================================================================
// RuleSet
// ============================================================================

std::shared_ptr<const RuleSet> RuleSet::compile(const std::vector<RuleDef>& defs,
                                                std::vector<std::string>* warnings) {
    auto set = std::make_shared<RuleSet>();
    set->rules_.reserve(defs.size());

    for (const auto& def : defs) {
        if (!def.enabled) {
            continue;
        }
        try {
            set->rules_.push_back(rule::compile(def));
        } catch (const std::invalid_argument& e) {
            if (warnings != nullptr) {
                warnings->push_back(e.what());
            }
        }
    }

    return set;
}

std::vector<Match> RuleSet::evaluate(std::string_view message, bool log_phase_is_current) const {
    std::vector<Match> matches;
    for (const auto& r : rules_) {
        if (!applies(r.def.category, log_phase_is_current)) {
            continue;
        }
        Match m;
        if (r.match(message, m.captures)) {
            m.rule = &r;
            matches.push_back(std::move(m));
        }
    }
    return matches;
}

std::size_t RuleSet::count(Category category) const {
    return static_cast<std::size_t>(
        std::count_if(rules_.begin(), rules_.end(),
                      [category](const CompiledRule& r) { return r.def.category == category; }));
}

// ============================================================================
// RuleEngine
// ============================================================================

RuleEngine::RuleEngine() : current_(std::make_shared<RuleSet>()) {}

RuleEngine::RuleEngine(std::shared_ptr<const RuleSet> rules)
    : current_(rules ? std::move(rules) : std::make_shared<RuleSet>()) {}

std::vector<std::string> RuleEngine::replace(const std::vector<RuleDef>& defs) {
    std::vector<std::string> warnings;
    // Компиляция вне блокировки: вычисление строк не ждёт
    auto compiled = RuleSet::compile(defs, &warnings);
    replace(std::move(compiled));
    return warnings;
}

void RuleEngine::replace(std::shared_ptr<const RuleSet> rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = rules ? std::move(rules) : std::make_shared<RuleSet>();
    ++generation_;
}

std::shared_ptr<const RuleSet> RuleEngine::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::uint64_t RuleEngine::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

// ============================================================================
// YAML loading
// ============================================================================

namespace {

RuleDef parse_rule_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw std::invalid_argument("pattern entry must be a mapping");
    }

    RuleDef def;
    def.id = node["id"].as<std::string>("");
    if (def.id.empty()) {
        // Совместимость с выгрузкой из портала
        def.id = node["patternId"].as<std::string>("");
    }
    if (def.id.empty()) {
        throw std::invalid_argument("pattern entry without id");
    }

    def.pattern = node["pattern"].as<std::string>("");
    if (def.pattern.empty()) {
        throw std::invalid_argument("rule " + def.id + ": missing pattern");
    }

    std::string action = node["action"].as<std::string>("");
    if (action.empty()) {
        throw std::invalid_argument("rule " + def.id + ": missing action");
    }
    try {
        def.action = parse_action(action);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument("rule " + def.id + ": " + e.what());
    }

    def.category = parse_category(node["category"].as<std::string>("always"));
    def.enabled = node["enabled"].as<bool>(true);
    def.description = node["description"].as<std::string>("");

    const YAML::Node& params = node["parameters"];
    if (params && params.IsMap()) {
        for (const auto& kv : params) {
            def.parameters[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }

    return def;
}

void parse_rules_document(const YAML::Node& root, LoadResult& result) {
    YAML::Node list;
    if (root.IsSequence()) {
        list = root;
    } else if (root.IsMap() && root["patterns"]) {
        list = root["patterns"];
    } else if (root.IsNull()) {
        return;
    } else {
        throw std::invalid_argument("rules document must contain a 'patterns' sequence");
    }

    if (!list.IsSequence()) {
        throw std::invalid_argument("'patterns' must be a sequence");
    }

    std::map<std::string, std::size_t> index_by_id;
    for (const auto& item : list) {
        RuleDef def;
        try {
            def = parse_rule_yaml(item);
        } catch (const std::invalid_argument& e) {
            result.warnings.push_back(std::string("skipped: ") + e.what());
            continue;
        }

        auto it = index_by_id.find(def.id);
        if (it != index_by_id.end()) {
            result.warnings.push_back("duplicate id " + def.id + ": later definition wins");
            result.rules[it->second] = std::move(def);
            continue;
        }
        index_by_id.emplace(def.id, result.rules.size());
        result.rules.push_back(std::move(def));
    }
}

}  // namespace

LoadResult load(const std::filesystem::path& path) {
    LoadResult result;

    if (!is_yaml_extension(path)) {
        result.error = Error{"rules file must have a yaml file extension", path.string()};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        parse_rules_document(root, result);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), path.string()};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), path.string()};
    }

    return result;
}

LoadResult load_string(std::string_view yaml) {
    LoadResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        parse_rules_document(root, result);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), ""};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), ""};
    }

    return result;
}

}  // namespace enrollwatch::rule
