// ==============================================================================
// enrollwatch/position.hpp - Позиции чтения хвоста журналов
// ==============================================================================
//
// Назначение:
// - Смещение чтения по каждому файлу журнала
// - Обнаружение ротации/усечения по уменьшению размера файла
// - Экспорт/восстановление позиций для снимка состояния
//
// Ключи путей сравниваются без учёта регистра (файловая система Windows).
// Класс не потокобезопасен: им владеет ImeLogTracker под мьютексом
// EnrollmentTracker.
//
// ==============================================================================

#ifndef ENROLLWATCH_POSITION_HPP
#define ENROLLWATCH_POSITION_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace enrollwatch::io {

/// Позиция одного файла
struct TailPosition {
    std::int64_t position = 0;
    std::int64_t last_known_size = 0;
    std::chrono::system_clock::time_point last_read{};
};

class PositionTracker {
public:
    /// Безопасная позиция начала чтения.
    ///
    /// - Неизвестный файл: 0 (первое чтение)
    /// - current_size < сохранённой позиции: файл ротирован или усечён,
    ///   позиция сбрасывается в 0 и возвращается 0
    /// - иначе: сохранённая позиция без изменений
    std::int64_t get_safe_position(const std::string& path, std::int64_t current_size);

    /// Зафиксировать позицию после успешно обработанной порции
    void set_position(const std::string& path, std::int64_t position);

    /// Сохранённая позиция (0 если неизвестна)
    std::int64_t get_position(const std::string& path) const;

    /// Восстановить позицию из снимка
    void restore_position(const std::string& path, std::int64_t position,
                          std::int64_t last_known_size);

    /// Все позиции, ключ - путь в исходном регистре первой записи
    std::map<std::string, TailPosition> positions() const;

    std::size_t size() const { return entries_.size(); }

    void clear() { entries_.clear(); }

private:
    struct Entry {
        std::string path;  // исходное написание
        TailPosition pos;
    };

    static std::string key(const std::string& path);

    std::map<std::string, Entry> entries_;  // ключ - путь в нижнем регистре
};

}  // namespace enrollwatch::io

#endif  // ENROLLWATCH_POSITION_HPP
