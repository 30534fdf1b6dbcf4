#include "enum_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"

CerealValue EnumCerealizer::to_cereal(const std::any& object, CerealFactory&) const {
    if (!info_.address(object)) {
        throw_instance_mismatch(info_.type_index, object);
    }
    int64_t value = info_.enum_to_int(object);
    const EnumConstant* constant = info_.find_enum_constant(value);
    if (!constant) {
        throw ConversionError(ConversionError::Kind::MalformedScalar,
            std::format("{} has no constant declared for value {}", info_.name, value));
    }
    return CerealValue(constant->name);
}

std::any EnumCerealizer::from_cereal(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_string()) {
        throw_type_mismatch("enum constant name", cereal);
    }
    const EnumConstant* constant = info_.find_enum_constant(std::string_view(cereal.as_string()));
    if (!constant) {
        throw ConversionError(ConversionError::Kind::MalformedScalar,
            std::format("'{}' is not a constant of {}", cereal.as_string(), info_.name));
    }
    return info_.enum_from_int(constant->value);
}
