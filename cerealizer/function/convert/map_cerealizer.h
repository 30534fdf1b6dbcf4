#ifndef MAP_CEREALIZER_H
#define MAP_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;

// String keyed std::map and std::unordered_map as cereal objects. Values are
// handled like collection elements; the "--class" key is reserved and skipped.
class MapCerealizer : public Cerealizer, public CerealFactoryAware {
    CEREALIZER_DEF(MapCerealizer)
public:
    MapCerealizer(Cerealizer* fallback, const TypeInfo& info) : value_(fallback), info_(info) {}

    void attach(CerealFactory& factory) override;

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

    Cerealizer* get_value_cerealizer() const { return value_; }

private:
    Cerealizer* value_;
    const TypeInfo& info_;
};

#endif
