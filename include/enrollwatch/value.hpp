// ==============================================================================
// enrollwatch/value.hpp - Непрозрачные данные события (Value)
// ==============================================================================
//
// Назначение:
// - Представление поля data у EnrollmentEvent (ключ -> значение)
// - Представление данных пакета/сводки для сериализации
// - Конверсия в RapidJSON Value
// - Явная типизация чисел: Int64 / UInt64 / Double
//
// Object упорядочен по ключу (std::map): JSON-вывод событий детерминирован.
//
// ==============================================================================

#ifndef ENROLLWATCH_VALUE_HPP
#define ENROLLWATCH_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 выдаёт ложные -Wnull-dereference на std::get для std::variant
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace enrollwatch {

class Value;

/// Массив значений (списки приложений в сводке)
using ValueArray = std::vector<Value>;

/// Объект: ключ -> значение, упорядочен по ключу
using ValueObject = std::map<std::string, Value>;

/// Данные события или сводки; копии Array/Object разделяют хранилище
class Value {
public:
    // Альтернативы variant
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    /// Null
    Value() : data_(Null{}) {}

    /// Bool
    explicit Value(bool v) : data_(v) {}

    /// Int64 из int (счётчики и проценты)
    explicit Value(int v) : data_(static_cast<std::int64_t>(v)) {}

    /// Int64
    explicit Value(std::int64_t v) : data_(v) {}

    /// UInt64 (байты загрузки)
    explicit Value(std::uint64_t v) : data_(v) {}

    /// Double
    explicit Value(double v) : data_(v) {}

    /// String
    explicit Value(std::string v) : data_(std::move(v)) {}

    /// String из C-строки
    explicit Value(const char* v) : data_(std::string(v)) {}

    /// Array
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}

    /// Object
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    /// Пустой Array
    static Value make_array() { return Value(Array{}); }

    /// Пустой Object (data события по умолчанию)
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// Int64, UInt64 или Double
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    // -------------------------------------------------------------------------
    // Доступ к значению
    // -------------------------------------------------------------------------

    /// bool (undefined behavior если не is_bool())
    Bool as_bool() const { return std::get<Bool>(data_); }

    /// int64 (undefined behavior если не is_int())
    Int64 as_int() const { return std::get<Int64>(data_); }

    /// uint64 (undefined behavior если не is_uint())
    UInt64 as_uint() const { return std::get<UInt64>(data_); }

    /// double (undefined behavior если не is_double())
    Double as_double() const { return std::get<Double>(data_); }

    /// Строка (undefined behavior если не is_string())
    const String& as_string() const { return std::get<String>(data_); }

    /// Массив (undefined behavior если не is_array())
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }

    /// Объект (undefined behavior если не is_object())
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    /// Строка или nullptr
    const String* get_string() const {
        return std::holds_alternative<String>(data_) ? &std::get<String>(data_) : nullptr;
    }

    /// Массив или nullptr
    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Объект или nullptr
    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Массив
    // -------------------------------------------------------------------------

    /// Добавить элемент (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Объект
    // -------------------------------------------------------------------------

    /// Установить поле (только если is_object()); объекты разделяют
    /// хранилище при копировании, поэтому set выполняет copy-on-write
    void set(const std::string& key, Value v);

    /// set() с возвратом *this для построения data событий цепочкой
    Value& with(const std::string& key, Value v) {
        set(key, std::move(v));
        return *this;
    }

    /// Поле объекта по ключу (nullptr если нет или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Есть ли поле key
    bool has(const std::string& key) const { return get(key) != nullptr; }

    /// Число полей (0 если не объект)
    std::size_t object_size() const {
        if (const auto* obj = get_object()) {
            return obj->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // RapidJSON
    // -------------------------------------------------------------------------

    /// Записать в RapidJSON Value; строки копируются в alloc
    /// @throws std::runtime_error для нечисловых double (NaN/Inf)
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Новый Document с этим значением в корне
    /// @throws std::runtime_error для нечисловых double (NaN/Inf)
    rapidjson::Document to_rapidjson_document() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

}  // namespace enrollwatch

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // ENROLLWATCH_VALUE_HPP
