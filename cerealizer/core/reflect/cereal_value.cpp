#include "cereal_value.h"

CerealValue CerealValue::array(std::initializer_list<CerealValue> items) {
    return CerealValue(Array(items));
}

CerealValue CerealValue::object(std::initializer_list<std::pair<const std::string, CerealValue>> items) {
    return CerealValue(Object(items));
}

std::string_view CerealValue::kind_name(Kind kind) {
    switch (kind) {
    case Kind::Null: return "null";
    case Kind::Boolean: return "boolean";
    case Kind::Integer: return "integer";
    case Kind::Floating: return "floating";
    case Kind::String: return "string";
    case Kind::Array: return "array";
    case Kind::Object: return "object";
    }
    return "unknown";
}

CerealValue::Array& CerealValue::as_array() {
    if (!is_array()) {
        storage_ = Array{};
    }
    return std::get<Array>(storage_);
}

CerealValue::Object& CerealValue::as_object() {
    if (!is_object()) {
        storage_ = Object{};
    }
    return std::get<Object>(storage_);
}

const CerealValue* CerealValue::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    const auto& obj = std::get<Object>(storage_);
    auto it = obj.find(key);
    return it != obj.end() ? &it->second : nullptr;
}

CerealValue& CerealValue::operator[](std::string_view key) {
    auto& obj = as_object();
    auto it = obj.find(key);
    if (it == obj.end()) {
        it = obj.emplace(std::string(key), CerealValue{}).first;
    }
    return it->second;
}

size_t CerealValue::size() const {
    if (is_array()) return as_array().size();
    if (is_object()) return as_object().size();
    return 0;
}
