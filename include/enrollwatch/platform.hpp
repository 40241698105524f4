// ==============================================================================
// enrollwatch/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Раскрытие переменных окружения в путях (%ProgramData%)
// - Атомарная запись файла (temp + rename/MoveFileEx)
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована в этом модуле.
//
// ==============================================================================

#ifndef ENROLLWATCH_PLATFORM_HPP
#define ENROLLWATCH_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace enrollwatch::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки (Windows: UTF-8 -> UTF-16)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (Windows: UTF-16 -> UTF-8)
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Раскрыть ссылки вида %NAME% значениями переменных окружения.
/// Неизвестные переменные остаются как есть (поведение ExpandEnvironmentStrings).
std::string expand_environment(std::string_view input);

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Атомарно заменить содержимое файла.
///
/// Данные пишутся во временный файл рядом с целью (<target>.tmp), затем
/// временный файл переименовывается поверх цели. Читатель видит либо старое,
/// либо новое содержимое целиком.
///
/// @throws std::runtime_error при ошибке записи или переименования
void write_file_atomic(const std::filesystem::path& target, std::string_view content);

/// Имя ОС ("Windows", "Linux", "macOS")
std::string os_name();

}  // namespace enrollwatch::platform

#endif  // ENROLLWATCH_PLATFORM_HPP
