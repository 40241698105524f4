// ==============================================================================
// cmtrace.cpp - Разбор строк CMTrace
// ==============================================================================
//
// Сообщение отделяется по последнему маркеру "]LOG]!>" без регулярного
// выражения (строки политик IME достигают сотен килобайт), хвост с
// атрибутами разбирается одним скомпилированным std::regex.
//
// ==============================================================================

#include "enrollwatch/cmtrace.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <regex>
#include <vector>

namespace enrollwatch::io {

namespace {

constexpr std::string_view MESSAGE_END = "]LOG]!>";

/// Максимум цифр дробной части секунды (тики .NET, 100 нс)
constexpr size_t MAX_FRACTION_DIGITS = 7;

const std::regex& trailer_regex() {
    static const std::regex re(
        R"re(<time="([\d:.]+)"\s+date="([\d-]+)"\s+component="([^"]*)"\s+context="[^"]*"\s+type="(\d+)"\s+thread="(\d+)"\s+file="[^"]*">)re",
        std::regex::ECMAScript | std::regex::optimize);
    return re;
}

/// Разобрать десятичное число; false если не цифры или переполнение
template <typename T>
bool parse_number(std::string_view s, T& out) {
    if (s.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

bool all_digits(std::string_view s) {
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return !s.empty();
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Алгоритмы Howard Hinnant для пролептического григорианского календаря
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) {
        return 29;
    }
    return days[m - 1];
}

bool try_parse_trailer(std::string_view line, size_t marker, LogLine& out) {
    std::string_view trailer = line.substr(marker + MESSAGE_END.size());

    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(trailer.begin(), trailer.end(), m, trailer_regex(),
                           std::regex_constants::match_continuous)) {
        return false;
    }

    std::string_view time(&*m[1].first, static_cast<size_t>(m[1].length()));
    std::string_view date(&*m[2].first, static_cast<size_t>(m[2].length()));

    LogLine parsed;
    parsed.message = std::string(line.substr(CMTRACE_PREFIX.size(), marker - CMTRACE_PREFIX.size()));
    parsed.component = m[3].str();

    // Время: при ошибке строка не теряется, ставим текущее время
    auto ts = parse_cmtrace_timestamp(date, time);
    parsed.timestamp = ts ? *ts : std::chrono::system_clock::now();

    if (!parse_number(std::string_view(&*m[4].first, static_cast<size_t>(m[4].length())),
                      parsed.severity)) {
        parsed.severity = 0;
    }
    if (!parse_number(std::string_view(&*m[5].first, static_cast<size_t>(m[5].length())),
                      parsed.thread)) {
        parsed.thread = 0;
    }

    out = std::move(parsed);
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// LogLine
// ----------------------------------------------------------------------------

LogSeverity LogLine::level() const {
    switch (severity) {
    case 1:
        return LogSeverity::Info;
    case 2:
        return LogSeverity::Warning;
    case 3:
        return LogSeverity::Error;
    default:
        return LogSeverity::Unknown;
    }
}

// ----------------------------------------------------------------------------
// parse_cmtrace_line
// ----------------------------------------------------------------------------

bool parse_cmtrace_line(std::string_view line, LogLine& out) {
    if (line.size() < CMTRACE_PREFIX.size() ||
        line.substr(0, CMTRACE_PREFIX.size()) != CMTRACE_PREFIX) {
        return false;
    }

    // Сообщение жадное: берём последний маркер, для которого хвост валиден
    size_t marker = line.rfind(MESSAGE_END);
    while (marker != std::string_view::npos && marker >= CMTRACE_PREFIX.size()) {
        if (try_parse_trailer(line, marker, out)) {
            return true;
        }
        if (marker == 0) {
            break;
        }
        marker = line.rfind(MESSAGE_END, marker - 1);
    }

    return false;
}

// ----------------------------------------------------------------------------
// parse_cmtrace_timestamp
// ----------------------------------------------------------------------------

std::optional<TimePoint> parse_cmtrace_timestamp(std::string_view date, std::string_view time) {
    // date: M-d-yyyy
    auto date_parts = split(date, '-');
    if (date_parts.size() != 3) {
        return std::nullopt;
    }
    const auto& mon_s = date_parts[0];
    const auto& day_s = date_parts[1];
    const auto& year_s = date_parts[2];
    if (mon_s.size() < 1 || mon_s.size() > 2 || day_s.size() < 1 || day_s.size() > 2 ||
        year_s.size() != 4) {
        return std::nullopt;
    }

    unsigned month = 0;
    unsigned day = 0;
    int year = 0;
    if (!parse_number(mon_s, month) || !parse_number(day_s, day) || !parse_number(year_s, year)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }

    // time: H:mm:ss[.fffffff] или HH:mm:ss[.fffffff]
    std::string_view hms = time;
    std::string_view fraction;
    size_t dot = time.find('.');
    if (dot != std::string_view::npos) {
        hms = time.substr(0, dot);
        fraction = time.substr(dot + 1);
        if (!all_digits(fraction)) {
            return std::nullopt;
        }
    }

    auto time_parts = split(hms, ':');
    if (time_parts.size() != 3) {
        return std::nullopt;
    }
    if (time_parts[0].size() < 1 || time_parts[0].size() > 2 || time_parts[1].size() != 2 ||
        time_parts[2].size() != 2) {
        return std::nullopt;
    }

    unsigned hour = 0;
    unsigned minute = 0;
    unsigned second = 0;
    if (!parse_number(time_parts[0], hour) || !parse_number(time_parts[1], minute) ||
        !parse_number(time_parts[2], second)) {
        return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    // Дробная часть: не более 7 цифр, лишняя точность отбрасывается
    std::int64_t ticks = 0;
    if (fraction.size() > MAX_FRACTION_DIGITS) {
        fraction = fraction.substr(0, MAX_FRACTION_DIGITS);
    }
    for (size_t i = 0; i < MAX_FRACTION_DIGITS; ++i) {
        ticks = ticks * 10 + (i < fraction.size() ? fraction[i] - '0' : 0);
    }

    std::int64_t days = days_from_civil(year, month, day);
    std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;

    auto duration = std::chrono::seconds(secs) + std::chrono::nanoseconds(ticks * 100);
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(duration));
}

// ----------------------------------------------------------------------------
// format_iso8601
// ----------------------------------------------------------------------------

std::string format_iso8601(TimePoint tp) {
    auto ms_total =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::int64_t secs = ms_total / 1000;
    std::int64_t ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::int64_t days = secs / 86400;
    std::int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    std::int64_t y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civil_from_days(days, y, m, d);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02lld:%02lld:%02lld.%03lldZ",
                  static_cast<long long>(y), m, d, static_cast<long long>(rem / 3600),
                  static_cast<long long>((rem % 3600) / 60), static_cast<long long>(rem % 60),
                  static_cast<long long>(ms));
    return buf;
}

}  // namespace enrollwatch::io
