// ==============================================================================
// enrollwatch/rule.hpp - Правила сопоставления строк журнала IME
// ==============================================================================
//
// Назначение:
// - Модель правила: id, категория, регулярное выражение, действие, параметры
// - Загрузка набора правил из YAML
// - Трансляция синтаксиса .NET (?<name>...) и {GUID} в ECMAScript std::regex
// - Неизменяемый скомпилированный набор (RuleSet) и его атомарная замена
//   (RuleEngine) для горячей перезагрузки
//
// Формат файла правил:
//
//   patterns:
//     - id: IME-ESP-PHASE
//       category: always            # always | currentPhase | otherPhases
//       pattern: '\[Win32App\] (?:In|The) EspPhase: (?<espPhase>\w+)'
//       action: espPhaseDetected
//       parameters: { phase: AccountSetup }
//       enabled: true
//
// ==============================================================================

#ifndef ENROLLWATCH_RULE_HPP
#define ENROLLWATCH_RULE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace enrollwatch::rule {

// ============================================================================
// Enums
// ============================================================================

/// Когда правило активно относительно фазы ESP, отображаемой в журнале
enum class Category {
    Always,        // всегда
    CurrentPhase,  // только пока журнал описывает текущую фазу
    OtherPhases    // только пока журнал описывает иную фазу
};

/// Фиксированная таблица действий
enum class Action {
    ImeStarted,
    ImeSessionChange,
    EspPhaseDetected,
    SetCurrentApp,
    ImeAgentVersion,
    ImeImpersonation,
    EnrollmentCompleted,
    UpdateStateInstalled,
    UpdateStateDownloading,
    UpdateStateInstalling,
    UpdateStateSkipped,
    UpdateStateError,
    UpdateStatePostponed,
    EspTrackStatus,
    PoliciesDiscovered,
    IgnoreCompletedApp,
    UpdateName,
    UpdateWin32AppState,
    CancelStuckAndSetCurrent,
};

// ============================================================================
// RuleDef - определение правила (до компиляции)
// ============================================================================

struct RuleDef {
    std::string id;
    Category category = Category::Always;
    std::string pattern;
    Action action = Action::ImeStarted;
    std::map<std::string, std::string> parameters;
    bool enabled = true;
    std::string description;

    /// Значение параметра или пустая строка
    std::string parameter(const std::string& key) const;

    /// Параметр равен "true" (без учёта регистра)
    bool flag(const std::string& key) const;
};

// ============================================================================
// Error handling / Load
// ============================================================================

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    std::vector<RuleDef> rules;
    std::vector<std::string> warnings;  // пропущенные/заменённые правила
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить набор правил из YAML файла (.yml/.yaml)
LoadResult load(const std::filesystem::path& path);

/// Загрузить набор правил из YAML текста
LoadResult load_string(std::string_view yaml);

// ============================================================================
// Трансляция шаблона
// ============================================================================

/// Заполнитель идентификатора приложения в шаблонах
constexpr std::string_view GUID_PLACEHOLDER = "{GUID}";

/// Группа, на которую раскрывается {GUID}
constexpr std::string_view GUID_GROUP =
    "(?<id>[a-z0-9]{8}-[a-z0-9]{4}-[a-z0-9]{4}-[a-z0-9]{4}-[a-z0-9]{12})";

struct TranslatedPattern {
    /// Шаблон ECMAScript без именованных групп
    std::string source;

    /// Имя группы -> номер группы в source
    std::map<std::string, std::size_t> groups;

    /// Хвостовая группа (?<name>.*) вынесена из source: её значение -
    /// остаток сообщения после совпадения
    std::optional<std::string> rest_group;
};

/// Транслировать шаблон .NET в ECMAScript.
///
/// - {GUID} раскрывается в именованную группу id
/// - (?<name>...), (?'name'...), (?P<name>...) -> (...) с записью номера
/// - (?:...), (?=...), (?!...) сохраняются
/// - экранирование и классы символов [...] копируются как есть
///
/// @throws std::invalid_argument для lookbehind и прочих (?...) конструкций,
///         не поддерживаемых ECMAScript, и для повторных имён групп
TranslatedPattern translate_pattern(std::string_view pattern);

// ============================================================================
// Compiled rules
// ============================================================================

/// Значения именованных групп совпадения
class Captures {
public:
    /// Значение группы; пустая строка если группы нет или она не участвовала
    std::string get(const std::string& name) const;

    bool has(const std::string& name) const;

    void set(const std::string& name, std::string value) { values_[name] = std::move(value); }

    const std::map<std::string, std::string>& values() const { return values_; }

private:
    std::map<std::string, std::string> values_;
};

struct CompiledRule {
    RuleDef def;
    std::regex regex;
    std::map<std::string, std::size_t> groups;
    std::optional<std::string> rest_group;

    /// Выполнить поиск в сообщении; при успехе заполняет out
    bool match(std::string_view message, Captures& out) const;
};

/// Скомпилировать правило (ECMAScript, без учёта регистра)
/// @throws std::invalid_argument при ошибке трансляции или компиляции
CompiledRule compile(const RuleDef& def);

/// Результат сопоставления одного правила
struct Match {
    const CompiledRule* rule = nullptr;
    Captures captures;
};

// ============================================================================
// RuleSet - неизменяемый скомпилированный набор
// ============================================================================

class RuleSet {
public:
    /// Скомпилировать набор. Отключённые правила отбрасываются, правила с
    /// ошибками компиляции пропускаются (сообщение в warnings).
    static std::shared_ptr<const RuleSet> compile(const std::vector<RuleDef>& defs,
                                                  std::vector<std::string>* warnings = nullptr);

    /// Все сработавшие правила в порядке набора
    std::vector<Match> evaluate(std::string_view message, bool log_phase_is_current) const;

    const std::vector<CompiledRule>& rules() const { return rules_; }

    std::size_t size() const { return rules_.size(); }

    std::size_t count(Category category) const;

private:
    std::vector<CompiledRule> rules_;
};

/// Активна ли категория при данном состоянии фазы журнала
bool applies(Category category, bool log_phase_is_current);

// ============================================================================
// RuleEngine - держатель активного набора
// ============================================================================

class RuleEngine {
public:
    RuleEngine();

    explicit RuleEngine(std::shared_ptr<const RuleSet> rules);

    /// Скомпилировать и атомарно заменить набор; возвращает предупреждения
    std::vector<std::string> replace(const std::vector<RuleDef>& defs);

    void replace(std::shared_ptr<const RuleSet> rules);

    /// Текущий снимок набора. Строка вычисляется целиком по одному снимку.
    std::shared_ptr<const RuleSet> current() const;

    /// Номер поколения (увеличивается при каждой замене)
    std::uint64_t generation() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RuleSet> current_;
    std::uint64_t generation_ = 0;
};

// ============================================================================
// Parse helpers
// ============================================================================

/// Неизвестная категория трактуется как Always
Category parse_category(std::string_view s);

/// @throws std::invalid_argument для неизвестного действия
Action parse_action(std::string_view s);

std::string to_string(Category c);

std::string to_string(Action a);

}  // namespace enrollwatch::rule

#endif  // ENROLLWATCH_RULE_HPP
