#ifndef COLLECTION_CEREALIZER_H
#define COLLECTION_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;

// std::list, std::deque, std::set and std::vector<std::any>. Elements go
// through the element type's cerealizer, or the dynamic one when the element
// type is std::any; each cereal element may override it with a "--class" hint.
class CollectionCerealizer : public Cerealizer, public CerealFactoryAware {
    CEREALIZER_DEF(CollectionCerealizer)
public:
    CollectionCerealizer(Cerealizer* fallback, const TypeInfo& info) : element_(fallback), info_(info) {}

    void attach(CerealFactory& factory) override;

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

    Cerealizer* get_element_cerealizer() const { return element_; }

private:
    Cerealizer* element_;
    const TypeInfo& info_;
};

#endif
