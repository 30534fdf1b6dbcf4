#include "map_cerealizer.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/function/factory/cereal_factory.h"

void MapCerealizer::attach(CerealFactory& factory) {
    if (info_.element_type != std::type_index(typeid(std::any))) {
        value_ = factory.resolve(info_.element_type);
    }
}

CerealValue MapCerealizer::to_cereal(const std::any& object, CerealFactory& factory) const {
    const void* p = info_.address(object);
    if (!p) {
        throw_instance_mismatch(info_.type_index, object);
    }
    return to_cereal_at(p, info_.type_index, factory);
}

CerealValue MapCerealizer::to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const {
    if (type != info_.type_index) {
        return Cerealizer::to_cereal_at(object, type, factory);
    }
    CerealValue::Object out;
    info_.map.for_each(object, [&](const std::string& key, const void* value) {
        try {
            out.insert_or_assign(key, value_->to_cereal_at(value, info_.element_type, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix(key);
        }
    });
    return CerealValue(std::move(out));
}

std::any MapCerealizer::from_cereal(const CerealValue& cereal, CerealFactory& factory) const {
    if (!cereal.is_object()) {
        throw_type_mismatch("object", cereal);
    }
    std::vector<std::pair<std::string, std::any>> entries;
    entries.reserve(cereal.size());
    for (const auto& [key, value] : cereal.as_object()) {
        if (key == kClassProperty) continue;
        try {
            Cerealizer* cerealizer = factory.get_runtime_cerealizer(value, value_);
            entries.emplace_back(key, cerealizer->from_cereal(value, factory));
        } catch (const ConversionError& e) {
            throw e.with_prefix(key);
        }
    }
    try {
        return info_.map.build(std::move(entries));
    } catch (const std::bad_any_cast&) {
        throw ConversionError(ConversionError::Kind::TypeMismatch,
            std::format("a value of {} decoded to a type other than {}",
                        info_.name, ClassDB::get().name_of(info_.element_type)));
    }
}
