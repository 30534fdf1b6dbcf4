#include "cerealizable_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"

CerealValue CerealizableCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    const void* p = info_.address(object);
    if (!p) {
        throw_instance_mismatch(info_.type_index, object);
    }
    return to_cereal_at(p, info_.type_index, factory);
}

CerealValue CerealizableCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != info_.type_index) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    // Only the const to_cereal() is reached through this pointer.
    const Cerealizable* self = info_.as_cerealizable(const_cast<void*>(object));
    return self->to_cereal(factory);
}

std::any CerealizableCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    if (!info_.creator) {
        throw ConstructionError(info_.name + " is not default constructible");
    }
    std::any object = info_.creator();
    info_.as_cerealizable(info_.address_mut(object))->from_cereal(cereal, factory);
    return object;
}
