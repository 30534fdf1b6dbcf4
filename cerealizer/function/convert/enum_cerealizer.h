#ifndef ENUM_CEREALIZER_H
#define ENUM_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;

// Enumerations travel as the constant name declared with Registry::add_enum.
// Bound to exactly one enumeration type.
class EnumCerealizer : public Cerealizer {
    CEREALIZER_DEF(EnumCerealizer)
public:
    explicit EnumCerealizer(const TypeInfo& info) : info_(info) {}

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

    const TypeInfo& get_type_info() const { return info_; }

private:
    const TypeInfo& info_;
};

#endif
