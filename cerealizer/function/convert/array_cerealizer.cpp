#include "array_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"

CerealValue ArrayCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    const void* p = info_.address(object);
    if (!p) {
        throw_instance_mismatch(info_.type_index, object);
    }
    return to_cereal_at(p, info_.type_index, factory);
}

CerealValue ArrayCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != info_.type_index) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    CerealValue::Array out;
    out.reserve(info_.sequence.size(object));
    info_.sequence.for_each(object, [&](const void* element) {
        try {
            out.push_back(delegate_->to_cereal_at(element, element_type_, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix("[" + std::to_string(out.size()) + "]");
        }
    });
    return CerealValue(std::move(out));
}

std::any ArrayCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    if (!cereal.is_array()) {
        throw_type_mismatch("array", cereal);
    }
    const auto& items = cereal.as_array();
    if (info_.sequence.fixed_size != 0 && items.size() != info_.sequence.fixed_size) {
        throw ConversionError(ConversionError::Kind::TypeMismatch,
            std::format("expected {} elements for {}, got {}", info_.sequence.fixed_size, info_.name, items.size()));
    }
    std::vector<std::any> elements;
    elements.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        try {
            elements.push_back(delegate_->from_cereal(items[i], factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix("[" + std::to_string(i) + "]");
        }
    }
    try {
        return info_.sequence.build(std::move(elements));
    } catch (const std::bad_any_cast&) {
        throw ConversionError(ConversionError::Kind::TypeMismatch,
            std::format("element cerealizer {} produced a value that is not a {}",
                        delegate_->get_cerealizer_name(), ClassDB::get().name_of(element_type_)));
    }
}
