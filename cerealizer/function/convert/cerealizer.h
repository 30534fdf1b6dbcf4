#ifndef CEREALIZER_H
#define CEREALIZER_H

#include <any>
#include <format>
#include <string_view>
#include <typeindex>

#include "cerealizer/core/reflect/cereal_value.h"
#include "cerealizer/core/error/cereal_exception.h"

class CerealFactory;

// Reserved object key naming the concrete type a cereal was produced from.
inline constexpr std::string_view kClassProperty = "--class";

#define CEREALIZER_DEF(Type) \
public: \
    std::string_view get_cerealizer_name() const override { return #Type; }

/**
 * @brief Converts instances of one C++ type to and from CerealValue.
 *
 * Instances travel as std::any holding the exact type the cerealizer was
 * resolved for. The factory is passed to both directions so nested values can
 * be resolved; cerealizers keep no reference to it.
 */
class Cerealizer {
public:
    virtual ~Cerealizer() = default;

    virtual CerealValue to_cereal(const std::any& object, CerealFactory& factory) const = 0;

    // Converts the object of the given type found at an address. Containers and
    // classes walk it in place; the default copies it into a std::any first.
    virtual CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const;

    // throws ConversionError when the cereal has the wrong shape
    virtual std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const = 0;

    virtual std::string_view get_cerealizer_name() const { return "Cerealizer"; }
};

// Optional capability: the factory calls attach() whenever it constructs or
// caches the cerealizer, after registering it and before handing it out.
class CerealFactoryAware {
public:
    virtual ~CerealFactoryAware() = default;
    virtual void attach(CerealFactory& factory) = 0;
};

[[noreturn]] void throw_type_mismatch(std::string_view expected, const CerealValue& actual);
[[noreturn]] void throw_instance_mismatch(std::type_index expected, const std::any& actual);

// Base for cerealizers bound to a single statically known type.
template <typename T>
class TypedCerealizer : public Cerealizer {
public:
    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const final {
        const T* typed = std::any_cast<T>(&object);
        if (!typed) {
            throw_instance_mismatch(typeid(T), object);
        }
        return to_cereal_typed(*typed, factory);
    }

    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const final {
        if (type != std::type_index(typeid(T))) {
            return Cerealizer::to_cereal_at(object, type, factory);
        }
        return to_cereal_typed(*static_cast<const T*>(object), factory);
    }

    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const final {
        return from_cereal_typed(cereal, factory);
    }

protected:
    virtual CerealValue to_cereal_typed(const T& object, CerealFactory& factory) const = 0;
    virtual T from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const = 0;
};

#endif
