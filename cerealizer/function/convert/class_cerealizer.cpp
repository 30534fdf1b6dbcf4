#include "class_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/function/factory/cereal_factory.h"

void ClassCerealizer::initialize(CerealFactory& factory) {
    properties_.clear();
    for (const auto& bound : ClassDB::get().get_all_fields(info_.type_index)) {
        Property prop;
        prop.field = bound.field;
        prop.adjust = bound.adjust;
        prop.dynamic = bound.field->type_index == std::type_index(typeid(std::any));
        // May come straight back to this class for self-referencing members.
        prop.cerealizer = factory.resolve(bound.field->type_index);
        properties_.push_back(std::move(prop));
    }
    initialized_ = true;
}

const ClassCerealizer::Property* ClassCerealizer::find_property(std::string_view name) const {
    for (const auto& prop : properties_) {
        if (prop.field->name == name) return &prop;
    }
    return nullptr;
}

CerealValue ClassCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    const void* p = info_.address(object);
    if (!p) {
        throw_instance_mismatch(info_.type_index, object);
    }
    return to_cereal_at(p, info_.type_index, factory);
}

CerealValue ClassCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != info_.type_index) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    CerealValue::Object out;
    for (const auto& prop : properties_) {
        // Members are only read through the adjusted pointer.
        const void* member = prop.field->address(prop.adjust(const_cast<void*>(object)));
        if (prop.dynamic && !static_cast<const std::any*>(member)->has_value()) {
            continue;
        }
        try {
            out.insert_or_assign(prop.field->name,
                                 prop.cerealizer->to_cereal_at(member, prop.field->type_index, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix(prop.field->name);
        }
    }
    return CerealValue(std::move(out));
}

std::any ClassCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    if (!cereal.is_object()) {
        throw_type_mismatch(std::format("object for {}", info_.name), cereal);
    }
    if (!info_.creator) {
        throw ConstructionError(info_.name + " is not default constructible");
    }
    if (factory.is_strict()) {
        for (const auto& [key, value] : cereal.as_object()) {
            if (key != kClassProperty && !find_property(key)) {
                throw ConversionError(ConversionError::Kind::TypeMismatch,
                    std::format("{} has no member named '{}'", info_.name, key));
            }
        }
    }

    std::any object = info_.creator();
    void* p = info_.address_mut(object);
    for (const auto& prop : properties_) {
        const CerealValue* member = cereal.find(prop.field->name);
        if (!member) {
            if (prop.field->required) {
                throw ConversionError(ConversionError::Kind::MissingField,
                    std::format("{} requires member '{}'", info_.name, prop.field->name),
                    prop.field->name);
            }
            continue;
        }
        if (member->is_null() && !prop.dynamic) {
            continue; // keeps the default
        }
        try {
            prop.field->setter_any(prop.adjust(p), prop.cerealizer->from_cereal(*member, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix(prop.field->name);
        } catch (const std::bad_any_cast&) {
            throw ConversionError(ConversionError::Kind::TypeMismatch,
                std::format("decoded value does not fit member of type {}",
                            ClassDB::get().name_of(prop.field->type_index)),
                prop.field->name);
        }
    }
    return object;
}
