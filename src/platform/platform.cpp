// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Пути, TTY, переменные окружения и атомарная запись файлов.
// Windows-ветки используют Win32 API напрямую, POSIX-ветки - libc.
//
// ==============================================================================

#include "enrollwatch/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace enrollwatch::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::string expand_environment(std::string_view input) {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '%') {
            result.push_back(input[i]);
            ++i;
            continue;
        }

        size_t close = input.find('%', i + 1);
        if (close == std::string_view::npos) {
            // Незакрытый '%' - копируем хвост без изменений
            result.append(input.substr(i));
            break;
        }

        std::string name(input.substr(i + 1, close - i - 1));
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value != nullptr) {
            result.append(value);
        } else {
            result.append(input.substr(i, close - i + 1));
        }
        i = close + 1;
    }

    return result;
}

// ----------------------------------------------------------------------------
// Атомарная запись
// ----------------------------------------------------------------------------

void write_file_atomic(const std::filesystem::path& target, std::string_view content) {
    std::filesystem::path tmp = target;
    tmp += ".tmp";

#ifdef _WIN32
    FILE* f = _wfopen(tmp.c_str(), L"wb");
#else
    FILE* f = std::fopen(tmp.c_str(), "wb");
#endif
    if (f == nullptr) {
        throw std::runtime_error("cannot open temp file: " + path_to_utf8(tmp));
    }

    size_t written = std::fwrite(content.data(), 1, content.size(), f);
    bool flushed = std::fflush(f) == 0;
#ifndef _WIN32
    if (flushed) {
        flushed = fsync(fileno(f)) == 0;
    }
#endif
    bool closed = std::fclose(f) == 0;

    if (written != content.size() || !flushed || !closed) {
        std::error_code ec;
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("failed to write temp file: " + path_to_utf8(tmp));
    }

#ifdef _WIN32
    if (!MoveFileExW(tmp.c_str(), target.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileW(tmp.c_str());
        throw std::runtime_error("failed to replace " + path_to_utf8(target) +
                                 " (error " + std::to_string(GetLastError()) + ")");
    }
#else
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("failed to replace " + path_to_utf8(target) + ": " +
                                 ec.message());
    }
#endif
}

// ----------------------------------------------------------------------------
// Система
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace enrollwatch::platform
