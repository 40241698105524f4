// ==============================================================================
// value.cpp - Реализация Value
// ==============================================================================

#include <cmath>
#include <enrollwatch/value.hpp>
#include <rapidjson/document.h>
#include <stdexcept>

namespace enrollwatch {

// ----------------------------------------------------------------------------
// Доступ
// ----------------------------------------------------------------------------

void Value::set(const std::string& key, Value v) {
    auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
    if (ptr == nullptr) {
        return;
    }
    // Копия Value разделяет объект; отделяемся перед изменением
    if (ptr->use_count() > 1) {
        *ptr = std::make_shared<Object>(**ptr);
    }
    (**ptr)[key] = std::move(v);
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    if (is_object()) {
        out.SetObject();
        for (const auto& [key, val] : as_object()) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }

    out.SetNull();
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace enrollwatch
