// ==============================================================================
// position.cpp - Позиции чтения хвоста журналов
// ==============================================================================

#include "enrollwatch/position.hpp"

#include <algorithm>
#include <cctype>

namespace enrollwatch::io {

std::string PositionTracker::key(const std::string& path) {
    std::string k = path;
    std::transform(k.begin(), k.end(), k.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return k;
}

std::int64_t PositionTracker::get_safe_position(const std::string& path,
                                                std::int64_t current_size) {
    auto it = entries_.find(key(path));
    if (it == entries_.end()) {
        return 0;
    }

    TailPosition& pos = it->second.pos;
    if (current_size < pos.position) {
        // Файл стал короче сохранённого смещения: ротация или усечение
        pos.position = 0;
        pos.last_known_size = current_size;
        return 0;
    }

    return pos.position;
}

void PositionTracker::set_position(const std::string& path, std::int64_t position) {
    auto& entry = entries_[key(path)];
    if (entry.path.empty()) {
        entry.path = path;
    }
    entry.pos.position = position;
    entry.pos.last_known_size = position;
    entry.pos.last_read = std::chrono::system_clock::now();
}

std::int64_t PositionTracker::get_position(const std::string& path) const {
    auto it = entries_.find(key(path));
    return it == entries_.end() ? 0 : it->second.pos.position;
}

void PositionTracker::restore_position(const std::string& path, std::int64_t position,
                                       std::int64_t last_known_size) {
    auto& entry = entries_[key(path)];
    entry.path = path;
    entry.pos.position = position;
    entry.pos.last_known_size = last_known_size;
    entry.pos.last_read = std::chrono::system_clock::time_point{};
}

std::map<std::string, TailPosition> PositionTracker::positions() const {
    std::map<std::string, TailPosition> result;
    for (const auto& [k, entry] : entries_) {
        result.emplace(entry.path, entry.pos);
    }
    return result;
}

}  // namespace enrollwatch::io
