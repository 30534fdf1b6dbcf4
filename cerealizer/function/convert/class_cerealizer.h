#ifndef CLASS_CEREALIZER_H
#define CLASS_CEREALIZER_H

#include <functional>
#include <string>
#include <vector>

#include "cerealizer/function/convert/cerealizer.h"

struct TypeInfo;
struct FieldInfo;

/**
 * @brief Converts a class declared with Registry::add<T>() through its member list.
 *
 * The cereal is an object with one key per member, base class members first.
 * initialize() resolves the cerealizer of every member and must run after the
 * factory has registered this instance, since a member may refer back to the
 * class itself.
 */
class ClassCerealizer : public Cerealizer {
    CEREALIZER_DEF(ClassCerealizer)
public:
    explicit ClassCerealizer(const TypeInfo& info) : info_(info) {}

    void initialize(CerealFactory& factory);
    bool is_initialized() const { return initialized_; }

    CerealValue to_cereal(const std::any& object, CerealFactory& factory) const override;
    CerealValue to_cereal_at(const void* object, std::type_index type, CerealFactory& factory) const override;
    std::any from_cereal(const CerealValue& cereal, CerealFactory& factory) const override;

    const TypeInfo& get_type_info() const { return info_; }

private:
    struct Property {
        const FieldInfo* field;
        std::function<void*(void*)> adjust; // to the declaring class
        Cerealizer* cerealizer;
        bool dynamic;
    };

    const Property* find_property(std::string_view name) const;

    const TypeInfo& info_;
    std::vector<Property> properties_;
    bool initialized_ = false;
};

#endif
