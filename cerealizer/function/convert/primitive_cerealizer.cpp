#include "primitive_cerealizer.h"

CerealValue StringCerealizer::to_cereal_typed(const std::string& object, CerealFactory&) const {
    return CerealValue(object);
}

std::string StringCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_string()) {
        throw_type_mismatch("string", cereal);
    }
    return cereal.as_string();
}

CerealValue BooleanCerealizer::to_cereal_typed(const bool& object, CerealFactory&) const {
    return CerealValue(object);
}

bool BooleanCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_bool()) {
        throw_type_mismatch("boolean", cereal);
    }
    return cereal.as_bool();
}

CerealValue CharCerealizer::to_cereal_typed(const char& object, CerealFactory&) const {
    return CerealValue(std::string(1, object));
}

char CharCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_string()) {
        throw_type_mismatch("one character string", cereal);
    }
    const auto& s = cereal.as_string();
    if (s.size() != 1) {
        throw ConversionError(ConversionError::Kind::MalformedScalar,
            "expected exactly one character, got \"" + s + "\"");
    }
    return s.front();
}
