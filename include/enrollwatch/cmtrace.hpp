// ==============================================================================
// enrollwatch/cmtrace.hpp - Разбор строк CMTrace
// ==============================================================================
//
// Назначение:
// - Разбор одной строки формата CMTrace:
//     <![LOG[msg]LOG]!><time="H:mm:ss.fff" date="M-d-yyyy" component="c"
//     context="" type="1" thread="42" file="">
// - Быстрый отказ по префиксу до запуска регулярного выражения
// - Сборка времени с допуском к вариантам формата
// - Форматирование времени в ISO-8601 (UTC)
//
// Парсер никогда не бросает исключений на некорректном входе.
//
// ==============================================================================

#ifndef ENROLLWATCH_CMTRACE_HPP
#define ENROLLWATCH_CMTRACE_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace enrollwatch::io {

using TimePoint = std::chrono::system_clock::time_point;

/// Уровень строки CMTrace (поле type)
enum class LogSeverity { Unknown = 0, Info = 1, Warning = 2, Error = 3 };

/// Разобранная строка журнала
struct LogLine {
    TimePoint timestamp{};
    std::string message;
    std::string component;
    int severity = 0;  // 1/2/3; 0 если поле не помещается в int
    int thread = 0;

    LogSeverity level() const;
};

/// Обязательный префикс строки CMTrace
constexpr std::string_view CMTRACE_PREFIX = "<![LOG[";

/// Разобрать строку CMTrace.
///
/// @return false если строка не в формате CMTrace (out не изменяется);
///         true если разобрана. При нераспознанном времени timestamp = now().
bool parse_cmtrace_line(std::string_view line, LogLine& out);

/// Собрать время из полей date/time.
///
/// date: "M-d-yyyy" (одна или две цифры месяца/дня)
/// time: "H:mm:ss" или "HH:mm:ss" с необязательной дробной частью.
/// Дробная часть длиннее 7 цифр усекается до 7 (100 нс).
///
/// @return std::nullopt если ни один вариант не подошёл
std::optional<TimePoint> parse_cmtrace_timestamp(std::string_view date, std::string_view time);

/// "2024-01-15T10:30:00.123Z"
std::string format_iso8601(TimePoint tp);

}  // namespace enrollwatch::io

#endif  // ENROLLWATCH_CMTRACE_HPP
