#ifndef PRIMITIVE_CEREALIZER_H
#define PRIMITIVE_CEREALIZER_H

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

#include "cerealizer/function/convert/cerealizer.h"

// Leaf cerealizers for the scalar types. One instance of each is created by
// the factory and shared by every type that maps onto it.

class StringCerealizer : public TypedCerealizer<std::string> {
    CEREALIZER_DEF(StringCerealizer)
protected:
    CerealValue to_cereal_typed(const std::string& object, CerealFactory& factory) const override;
    std::string from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const override;
};

class BooleanCerealizer : public TypedCerealizer<bool> {
    CEREALIZER_DEF(BooleanCerealizer)
protected:
    CerealValue to_cereal_typed(const bool& object, CerealFactory& factory) const override;
    bool from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const override;
};

// A char travels as a one character string.
class CharCerealizer : public TypedCerealizer<char> {
    CEREALIZER_DEF(CharCerealizer)
protected:
    CerealValue to_cereal_typed(const char& object, CerealFactory& factory) const override;
    char from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const override;
};

// The integer held by an integer cereal or an integral floating one.
// std::nullopt for any other kind of cereal.
inline std::optional<int64_t> integral_cereal(const CerealValue& cereal) {
    if (cereal.is_int()) {
        return cereal.as_int();
    }
    if (!cereal.is_double()) {
        return std::nullopt;
    }
    double d = cereal.as_double();
    if (std::trunc(d) != d || d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
        throw ConversionError(ConversionError::Kind::MalformedScalar,
            std::to_string(d) + " is not a 64-bit integer");
    }
    return static_cast<int64_t>(d);
}

// Reads an integer cereal (or an integral floating one) into I, range checked.
template <typename I>
class IntegerCerealizer : public TypedCerealizer<I> {
    CEREALIZER_DEF(IntegerCerealizer)
protected:
    CerealValue to_cereal_typed(const I& object, CerealFactory&) const override {
        if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(int64_t)) {
            if (object > static_cast<I>(std::numeric_limits<int64_t>::max())) {
                throw ConversionError(ConversionError::Kind::MalformedScalar,
                    std::to_string(object) + " does not fit a 64-bit signed cereal integer");
            }
        }
        return CerealValue(static_cast<int64_t>(object));
    }

    I from_cereal_typed(const CerealValue& cereal, CerealFactory&) const override {
        std::optional<int64_t> integral = integral_cereal(cereal);
        if (!integral) {
            throw_type_mismatch("integer", cereal);
        }
        int64_t v = *integral;
        if constexpr (std::is_signed_v<I>) {
            if (v < static_cast<int64_t>(std::numeric_limits<I>::min())
                || v > static_cast<int64_t>(std::numeric_limits<I>::max())) {
                throw out_of_range(v);
            }
        } else {
            if (v < 0 || static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<I>::max())) {
                throw out_of_range(v);
            }
        }
        return static_cast<I>(v);
    }

private:
    static ConversionError out_of_range(int64_t v) {
        return ConversionError(ConversionError::Kind::MalformedScalar,
            std::to_string(v) + " is out of range for a " + std::to_string(sizeof(I) * 8) + "-bit integer");
    }
};

template <typename F>
class FloatCerealizer : public TypedCerealizer<F> {
    CEREALIZER_DEF(FloatCerealizer)
protected:
    CerealValue to_cereal_typed(const F& object, CerealFactory&) const override {
        return CerealValue(static_cast<double>(object));
    }

    F from_cereal_typed(const CerealValue& cereal, CerealFactory&) const override {
        if (cereal.is_double()) {
            double d = cereal.as_double();
            if constexpr (!std::is_same_v<F, double>) {
                if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<F>::max())) {
                    throw ConversionError(ConversionError::Kind::MalformedScalar,
                        std::to_string(d) + " is out of range for a " + std::to_string(sizeof(F) * 8) + "-bit float");
                }
            }
            return static_cast<F>(d);
        }
        if (cereal.is_int()) return static_cast<F>(cereal.as_int());
        throw_type_mismatch("number", cereal);
    }
};

#endif
