#include "cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/core/reflect/serialize.h"

CerealValue Cerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    const TypeInfo* info = ClassDB::get().get_type_info(type);
    if (!info || !info->copy) {
        throw ConversionError(ConversionError::Kind::TypeMismatch,
            std::format("no type information to read an instance of {}", ClassDB::get().name_of(type)));
    }
    return to_cereal(info->copy(object), factory);
}

void throw_type_mismatch(std::string_view expected, const CerealValue& actual) {
    throw ConversionError(ConversionError::Kind::TypeMismatch,
        std::format("expected {} but got {} {}", expected,
                    CerealValue::kind_name(actual.kind()), CerealJson::brief(actual)));
}

void throw_instance_mismatch(std::type_index expected, const std::any& actual) {
    const auto& db = ClassDB::get();
    std::string held = actual.has_value() ? db.name_of(actual.type()) : "nothing";
    throw ConversionError(ConversionError::Kind::TypeMismatch,
        std::format("expected an instance of {} but the object holds {}", db.name_of(expected), held));
}
