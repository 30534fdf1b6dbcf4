#ifndef ARRAY_CEREALIZER_H
#define ARRAY_CEREALIZER_H

#include <typeindex>

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;

// std::vector<T> and std::array<T, N> with a statically typed element. The
// element cerealizer is resolved before this one is built; the element type is
// kept to rebuild the container on the way back.
class ArrayCerealizer : public Cerealizer {
    CEREALIZER_DEF(ArrayCerealizer)
public:
    ArrayCerealizer(Cerealizer* delegate, std::type_index element_type, const TypeInfo& info)
        : delegate_(delegate), element_type_(element_type), info_(info) {}

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

    Cerealizer* get_delegate() const { return delegate_; }
    std::type_index get_element_type() const { return element_type_; }

private:
    Cerealizer* delegate_;
    std::type_index element_type_;
    const TypeInfo& info_;
};

#endif
