#include "date_cerealizer.h"
#include "cerealizer/function/convert/primitive_cerealizer.h"

using TimePoint = type_traits::TimePoint;

namespace {
// Milliseconds representable by the clock's own duration.
constexpr int64_t kMaxMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::max()).count();
constexpr int64_t kMinMillis =
    std::chrono::duration_cast<std::chrono::milliseconds>(TimePoint::duration::min()).count();
}

CerealValue DateCerealizer::to_cereal_typed(const TimePoint& object, CerealFactory&) const {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(object.time_since_epoch());
    return CerealValue(static_cast<int64_t>(ms.count()));
}

TimePoint DateCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    std::optional<int64_t> ms = integral_cereal(cereal);
    if (!ms) {
        throw_type_mismatch("milliseconds since epoch", cereal);
    }
    if (*ms > kMaxMillis || *ms < kMinMillis) {
        throw ConversionError(ConversionError::Kind::MalformedScalar,
            std::to_string(*ms) + " milliseconds is outside the range of the system clock");
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(*ms)));
}
