// ==============================================================================
// output.cpp - Диагностический вывод и поток событий
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется, flush явный.
//
// ==============================================================================

#include "enrollwatch/output.hpp"

#include "enrollwatch/platform.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace enrollwatch::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

FILE* open_file(const std::filesystem::path& path, bool append) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }
#ifdef _WIN32
    return _wfopen(path.c_str(), append ? L"ab" : L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    return std::fopen(path_str.c_str(), append ? "ab" : "wb");
#endif
}

/// "2024-01-15 10:30:00 " (UTC) для строк лог-файла
std::string log_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S ", &tm);
    return std::string(buf, n);
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg), color_(supports_color(Stream::Stderr)) {
    if (config_.output_path.has_value() || config_.log_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(s, bytes);
    write_impl(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // Поток событий (stdout) уходит в файл, если он открыт
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message,
                            bool to_console) {
    if (to_console) {
        if (color_) {
            write_impl(Stream::Stderr, ansi_color_code(color));
            write_impl(Stream::Stderr, prefix);
            write_impl(Stream::Stderr, ANSI_RESET);
        } else {
            write_impl(Stream::Stderr, prefix);
        }
        write_impl(Stream::Stderr, message);
        write_impl(Stream::Stderr, "\n");
    }

    if (log_file_ != nullptr) {
        std::string line = log_timestamp();
        line.append(prefix);
        line.append(message);
        line.push_back('\n');
        std::fwrite(line.data(), 1, line.size(), log_file_);
        std::fflush(log_file_);
    }
}

void Writer::info(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_prefixed("[+] ", Color::Green, message, !config_.quiet);
}

void Writer::warn(std::string_view message) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_prefixed("[!] ", Color::Yellow, message, !config_.quiet);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при quiet
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_prefixed("[x] ", Color::Red, message, true);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_prefixed("[*] ", Color::Cyan, message, true);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_prefixed("[~] ", Color::Magenta, message, true);
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    write_impl(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write_impl(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::open_output_file() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    bool ok = true;

    if (config_.output_path.has_value() && output_file_ == nullptr) {
        output_file_ = open_file(config_.output_path.value(), config_.append);
        ok = ok && output_file_ != nullptr;
    }
    if (config_.log_path.has_value() && log_file_ == nullptr) {
        log_file_ = open_file(config_.log_path.value(), true);
        ok = ok && log_file_ != nullptr;
    }

    return ok;
}

void Writer::close_output_file() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        return "";
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace enrollwatch::output
