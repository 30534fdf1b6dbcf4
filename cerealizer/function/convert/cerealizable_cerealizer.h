#ifndef CEREALIZABLE_CEREALIZER_H
#define CEREALIZABLE_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;

// Wraps a type deriving from Cerealizable: the instance converts itself.
class CerealizableCerealizer : public Cerealizer {
    CEREALIZER_DEF(CerealizableCerealizer)
public:
    explicit CerealizableCerealizer(const TypeInfo& info) : info_(info) {}

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

private:
    const TypeInfo& info_;
};

#endif
