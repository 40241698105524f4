// ==============================================================================
// tailer.cpp - Поиск и порционное чтение журналов IME
// ==============================================================================

#include "enrollwatch/tailer.hpp"

#include "enrollwatch/platform.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace enrollwatch::io {

namespace {

char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool less_ignore_case(const std::string& a, const std::string& b) {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                        [](char x, char y) { return lower(x) < lower(y); });
}

bool equal_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return lower(x) == lower(y); });
}

constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

}  // namespace

std::vector<std::string> default_log_patterns() {
    return {
        "IntuneManagementExtension.log",
        "_IntuneManagementExtension.log",
        "IntuneManagementExtension-????????-??????.log",
        "AppWorkload.log",
        "AppWorkload-????????-??????.log",
    };
}

// ----------------------------------------------------------------------------
// glob_match
// ----------------------------------------------------------------------------

bool glob_match(std::string_view pattern, std::string_view name) {
    // Итеративный алгоритм с возвратом к последней '*'
    size_t p = 0;
    size_t n = 0;
    size_t star = std::string_view::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || lower(pattern[p]) == lower(name[n]))) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            star_n = n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++star_n;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }
    return p == pattern.size();
}

std::int64_t file_size(const std::filesystem::path& file) {
    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    if (ec) {
        return -1;
    }
    return static_cast<std::int64_t>(size);
}

// ----------------------------------------------------------------------------
// LogTailer
// ----------------------------------------------------------------------------

LogTailer::LogTailer(TailerOptions options) : options_(std::move(options)) {}

std::vector<std::filesystem::path> LogTailer::discover() const {
    std::vector<std::filesystem::path> result;

    std::error_code ec;
    if (!std::filesystem::is_directory(options_.folder, ec)) {
        return result;
    }

    std::filesystem::directory_iterator dir_iter(options_.folder, ec);
    if (ec) {
        throw std::runtime_error("failed to read directory - " + ec.message());
    }

    for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw std::runtime_error("failed to read directory - " + ec.message());
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        std::string name = platform::path_to_utf8(it->path().filename());
        for (const auto& pattern : options_.patterns) {
            if (glob_match(pattern, name)) {
                result.push_back(it->path());
                break;
            }
        }
    }

    std::sort(result.begin(), result.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return less_ignore_case(platform::path_to_utf8(a), platform::path_to_utf8(b));
              });
    result.erase(std::unique(result.begin(), result.end(),
                             [](const std::filesystem::path& a, const std::filesystem::path& b) {
                                 return equal_ignore_case(platform::path_to_utf8(a),
                                                          platform::path_to_utf8(b));
                             }),
                 result.end());

    return result;
}

Chunk LogTailer::read_chunk(const std::filesystem::path& file, std::int64_t offset) const {
    Chunk chunk;
    chunk.start_offset = offset;
    chunk.end_offset = offset;

    // Писатель держит файл открытым; ifstream читает с общим доступом
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + platform::path_to_utf8(file));
    }
    in.seekg(offset, std::ios::beg);
    if (!in) {
        throw std::runtime_error("cannot seek " + platform::path_to_utf8(file) + " to " +
                                 std::to_string(offset));
    }

    std::string buffer(options_.max_chunk_bytes, '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        throw std::runtime_error("read error in " + platform::path_to_utf8(file));
    }
    buffer.resize(static_cast<size_t>(in.gcount()));
    if (buffer.empty()) {
        return chunk;
    }
    chunk.truncated = buffer.size() == options_.max_chunk_bytes;

    size_t consumed = 0;
    size_t last_newline = buffer.rfind('\n');
    if (last_newline != std::string::npos) {
        consumed = last_newline + 1;
    } else if (chunk.truncated) {
        // Строка длиннее порции: отдаём как есть, иначе чтение встанет
        consumed = buffer.size();
    } else {
        return chunk;
    }

    std::string_view data(buffer.data(), consumed);
    size_t pos = 0;
    if (offset == 0 && data.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
        pos = UTF8_BOM.size();
    }

    while (pos < data.size()) {
        size_t eol = data.find('\n', pos);
        size_t end = (eol == std::string_view::npos) ? data.size() : eol;
        std::string_view line = data.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        chunk.lines.emplace_back(line);
        pos = std::min(end + 1, data.size());
        chunk.line_ends.push_back(offset + static_cast<std::int64_t>(pos));
    }

    chunk.end_offset = offset + static_cast<std::int64_t>(consumed);
    return chunk;
}

}  // namespace enrollwatch::io
