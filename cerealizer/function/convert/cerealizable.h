#ifndef CEREALIZABLE_H
#define CEREALIZABLE_H

class CerealValue;
class CerealFactory;

// A type that converts itself. Registered types deriving from Cerealizable are
// handled by CerealizableCerealizer instead of the member-list reflection of
// ClassCerealizer; the factory is handed in for any nested conversions.
class Cerealizable {
public:
    virtual ~Cerealizable() = default;

    virtual CerealValue to_cereal(CerealFactory& factory) const = 0;
    virtual void from_cereal(const CerealValue& cereal, CerealFactory& factory) = 0;
};

#endif
