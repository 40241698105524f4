// ==============================================================================
// enrollwatch/tailer.hpp - Поиск и порционное чтение журналов IME
// ==============================================================================
//
// Назначение:
// - Поиск файлов журнала в папке по маскам (* и ?, без учёта регистра)
// - Детерминированный порядок: сортировка путей без учёта регистра,
//   архивные файлы (IntuneManagementExtension-20240115-103000.log)
//   идут раньше текущего
// - Чтение порции с заданного смещения, разбиение на полные строки
//
// Незавершённая последняя строка (писатель ещё не дописал '\n') не
// потребляется: её смещение не входит в end_offset.
//
// ==============================================================================

#ifndef ENROLLWATCH_TAILER_HPP
#define ENROLLWATCH_TAILER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace enrollwatch::io {

/// Маски журналов IME по умолчанию
std::vector<std::string> default_log_patterns();

struct TailerOptions {
    std::filesystem::path folder;
    std::vector<std::string> patterns = default_log_patterns();

    /// Максимальный объём одной порции чтения
    std::size_t max_chunk_bytes = 4 * 1024 * 1024;
};

/// Результат чтения порции
struct Chunk {
    std::vector<std::string> lines;  // без '\n' и завершающего '\r'
    std::vector<std::int64_t> line_ends;  // смещение после каждой строки
    std::int64_t start_offset = 0;
    std::int64_t end_offset = 0;  // смещение после последней полной строки
    bool truncated = false;       // порция упёрлась в max_chunk_bytes
};

class LogTailer {
public:
    explicit LogTailer(TailerOptions options);

    /// Найти файлы журнала. Отсутствующая папка - пустой результат.
    /// @throws std::runtime_error если папку не удалось прочитать
    std::vector<std::filesystem::path> discover() const;

    /// Прочитать порцию начиная с offset.
    /// @throws std::runtime_error при ошибке открытия/чтения
    Chunk read_chunk(const std::filesystem::path& file, std::int64_t offset) const;

    const TailerOptions& options() const { return options_; }

private:
    TailerOptions options_;
};

/// Сопоставление имени файла с маской (* и ?), без учёта регистра ASCII
bool glob_match(std::string_view pattern, std::string_view name);

/// Размер файла; -1 если файл недоступен
std::int64_t file_size(const std::filesystem::path& file);

}  // namespace enrollwatch::io

#endif  // ENROLLWATCH_TAILER_HPP
