#ifndef DATE_CEREALIZER_H
#define DATE_CEREALIZER_H

#include "cerealizer/function/convert/cerealizer.h"
#include "cerealizer/core/reflect/type_traits.h"

// system_clock time points as integer milliseconds since the Unix epoch.
class DateCerealizer : public TypedCerealizer<type_traits::TimePoint> {
    CEREALIZER_DEF(DateCerealizer)
protected:
    CerealValue to_cereal_typed(const type_traits::TimePoint& object, CerealFactory& factory) const override;
    type_traits::TimePoint from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const override;
};

#endif
