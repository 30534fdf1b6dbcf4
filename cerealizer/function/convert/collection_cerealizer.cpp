#include "collection_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/function/factory/cereal_factory.h"

void CollectionCerealizer::attach(CerealFactory& factory) {
    if (info_.element_type != std::type_index(typeid(std::any))) {
        element_ = factory.resolve(info_.element_type);
    }
}

CerealValue CollectionCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    const void* p = info_.address(object);
    if (!p) {
        throw_instance_mismatch(info_.type_index, object);
    }
    return to_cereal_at(p, info_.type_index, factory);
}

CerealValue CollectionCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != info_.type_index) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    CerealValue::Array out;
    out.reserve(info_.sequence.size(object));
    info_.sequence.for_each(object, [&](const void* element) {
        try {
            out.push_back(element_->to_cereal_at(element, info_.element_type, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix("[" + std::to_string(out.size()) + "]");
        }
    });
    return CerealValue(std::move(out));
}

std::any CollectionCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    if (!cereal.is_array()) {
        throw_type_mismatch("array", cereal);
    }
    const auto& items = cereal.as_array();
    std::vector<std::any> elements;
    elements.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        try {
            Cerealizer* cerealizer = factory.get_runtime_cerealizer(items[i], element_);
            elements.push_back(cerealizer->from_cereal(items[i], factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix("[" + std::to_string(i) + "]");
        }
    }
    try {
        return info_.sequence.build(std::move(elements));
    } catch (const std::bad_any_cast&) {
        throw ConversionError(ConversionError::Kind::TypeMismatch,
            std::format("an element of {} decoded to a type other than {}",
                        info_.name, ClassDB::get().name_of(info_.element_type)));
    }
}
