// ==============================================================================
// enrollwatch/output.hpp - Диагностический вывод и поток событий
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами [+] [!] [x] [*] [~] в stderr
// - Зеркалирование диагностики в лог-файл агента (опционально)
// - Поток событий в формате JSON Lines (stdout или файл)
// - Цветной вывод (ANSI escape codes) при TTY
//
// Writer потокобезопасен: tail-цикл, таймер сводки и обратные вызовы
// Hello пишут в него конкурентно.
//
// ==============================================================================

#ifndef ENROLLWATCH_OUTPUT_HPP
#define ENROLLWATCH_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace enrollwatch::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // подавить info/warn
    int verbose = 0;     // уровень подробности (0..2+)

    /// Файл для событий (JSONL). Без него события идут в stdout.
    std::optional<std::filesystem::path> output_path;

    /// Дописывать в output_path вместо перезаписи (перезапуск агента)
    bool append = true;

    /// Лог-файл агента: диагностика дублируется сюда с меткой времени,
    /// без цветов и без учёта quiet
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    void warning(std::string_view message) { warn(message); }

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение + newline (JSONL) в поток событий
    void write_json_line(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файлы вывода (output_path, log_path)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }
    bool has_log_file() const { return log_file_ != nullptr; }

private:
    /// Записать сообщение с префиксом; mutex_ должен быть захвачен
    void write_prefixed(std::string_view prefix, Color color, std::string_view message,
                        bool to_console);

    /// Записать байты без блокировки
    void write_impl(Stream s, std::string_view bytes);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    FILE* log_file_ = nullptr;
    bool color_ = false;
    std::recursive_mutex mutex_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace enrollwatch::output

#endif  // ENROLLWATCH_OUTPUT_HPP
