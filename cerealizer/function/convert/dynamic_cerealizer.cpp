#include "dynamic_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/function/factory/cereal_factory.h"

CerealValue DynamicCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    if (!object.has_value()) {
        return CerealValue{};
    }
    Cerealizer* cerealizer = factory.get_cerealizer(object.type());
    CerealValue cereal = cerealizer->to_cereal(object, factory);
    if (cereal.is_object()) {
        const TypeInfo* info = ClassDB::get().get_type_info(object.type());
        if (info && (info->kind == TypeKind::Class || info->kind == TypeKind::Cerealizable)) {
            cereal[kClassProperty] = info->name;
        }
    }
    return cereal;
}

CerealValue DynamicCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != std::type_index(typeid(std::any))) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    return to_cereal(*static_cast<const std::any*>(object), factory);
}

std::any DynamicCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    Cerealizer* runtime = factory.get_runtime_cerealizer(cereal, nullptr);
    if (runtime && runtime != this) {
        return runtime->from_cereal(cereal, factory);
    }

    switch (cereal.kind()) {
    case CerealValue::Kind::Null:
        return {};
    case CerealValue::Kind::Boolean:
        return cereal.as_bool();
    case CerealValue::Kind::Integer:
        return cereal.as_int();
    case CerealValue::Kind::Floating:
        return cereal.as_double();
    case CerealValue::Kind::String:
        return cereal.as_string();
    case CerealValue::Kind::Array:
        return factory.resolve<std::vector<std::any>>()->from_cereal(cereal, factory);
    case CerealValue::Kind::Object:
        return factory.resolve<std::map<std::string, std::any>>()->from_cereal(cereal, factory);
    }
    return {};
}
