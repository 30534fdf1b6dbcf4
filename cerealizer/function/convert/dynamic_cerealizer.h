#ifndef DYNAMIC_CEREALIZER_H
#define DYNAMIC_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"

// Cerealizer for std::any slots, whose type is only known at run time.
//
// to_cereal() resolves the held value's type and, for registered classes,
// records it under "--class". from_cereal() follows a "--class" hint when
// there is one and otherwise picks a type from the shape of the cereal:
// bool, int64_t, double, std::string, std::vector<std::any> or
// std::map<std::string, std::any>; null gives an empty any.
class DynamicCerealizer : public Cerealizer {
    CEREALIZER_DEF(DynamicCerealizer)
public:
    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;
};

#endif
