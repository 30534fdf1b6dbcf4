#include "serialize.h"

#include <algorithm>
#include <sstream>

#include <cereal/cereal.hpp>
#include <cereal/archives/json.hpp>

// CerealValue writes its own JSON node structure, so it opts out of the
// node the archive would otherwise open around every class type.
namespace cereal {
inline void prologue(JSONOutputArchive&, const CerealValue&) {}
inline void epilogue(JSONOutputArchive&, const CerealValue&) {}
} // namespace cereal

void save(cereal::JSONOutputArchive& ar, const CerealValue& value) {
    switch (value.kind()) {
    case CerealValue::Kind::Null:
        ar.writeName();
        ar.saveValue(nullptr);
        break;
    case CerealValue::Kind::Boolean:
        ar(value.as_bool());
        break;
    case CerealValue::Kind::Integer:
        ar(value.as_int());
        break;
    case CerealValue::Kind::Floating:
        ar(value.as_double());
        break;
    case CerealValue::Kind::String:
        ar(value.as_string());
        break;
    case CerealValue::Kind::Array:
        ar.startNode();
        ar.makeArray();
        for (const auto& item : value.as_array()) {
            ar(item);
        }
        ar.finishNode();
        break;
    case CerealValue::Kind::Object:
        ar.startNode();
        for (const auto& [key, item] : value.as_object()) {
            ar(cereal::make_nvp(key, item));
        }
        ar.finishNode();
        break;
    }
}

std::string CerealJson::dump(const CerealValue& value) {
    std::stringstream ss;
    {
        cereal::JSONOutputArchive ar(ss, cereal::JSONOutputArchive::Options::NoIndent());
        ar(cereal::make_nvp("v", value));
    }
    std::string s = ss.str();
    // Pretty writer still breaks lines; string contents are escaped, so raw
    // newlines are formatting only.
    s.erase(std::remove(s.begin(), s.end(), '\n'), s.end());

    // Unwrap {"v": ...}
    size_t colon = s.find(':');
    if (colon != std::string::npos && s.size() >= colon + 2) {
        std::string result = s.substr(colon + 1, s.size() - colon - 2);
        size_t first = result.find_first_not_of(" \t\r");
        if (first == std::string::npos) return "";
        size_t last = result.find_last_not_of(" \t\r");
        return result.substr(first, (last - first + 1));
    }
    return s;
}

std::string CerealJson::brief(const CerealValue& value, size_t max_length) {
    std::string s = dump(value);
    if (s.size() > max_length) {
        s.resize(max_length);
        s += "...";
    }
    return s;
}
