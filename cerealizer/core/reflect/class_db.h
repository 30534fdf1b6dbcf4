#pragma once
#include <any>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cerealizer/core/reflect/type_traits.h"
#include "cerealizer/core/error/cereal_exception.h"
#include "cerealizer/function/convert/cerealizable.h"

class Cerealizer;

// --- Type descriptions ---

// How the factory classifies a type. Decided once, when the type is registered.
enum class TypeKind : uint8_t {
    Unknown,
    Scalar,
    Temporal,
    ByteArray,
    Enum,
    Array,
    Collection,
    Map,
    Cerealizable,
    Class,
    Dynamic,
};

std::string_view type_kind_name(TypeKind kind);

enum class FieldFlags : uint8_t {
    None = 0,
    Required = 1, // absent key is a MissingField error instead of keeping the default
};

struct FieldInfo {
    std::string name;
    std::type_index type_index; // Identifies the C++ type of the member
    bool required = false;

    // obj points at the declaring class, see TypeInfo::upcast for base members
    std::function<const void*(const void* obj)> address; // of the member itself
    std::function<void(void* obj, std::any value)> setter_any; // throws std::bad_any_cast

    FieldInfo() : type_index(typeid(void)) {}
};

struct EnumConstant {
    std::string name;
    int64_t value;
};

// Declared with Registry::add<T>(...).cerealizer<C>(): T is converted by C.
struct CerealizerTag {
    std::type_index cerealizer_type;
    std::string cerealizer_name;
    std::function<std::shared_ptr<Cerealizer>()> creator; // empty when C has no default constructor

    CerealizerTag() : cerealizer_type(typeid(void)) {}
};

// Type-erased element access for Array and Collection kinds. The container is
// passed by address and each element is visited in place.
struct SequenceOps {
    std::function<size_t(const void*)> size;
    std::function<void(const void*, const std::function<void(const void*)>&)> for_each;
    // throws std::bad_any_cast when an element has the wrong type
    std::function<std::any(std::vector<std::any>&&)> build;
    size_t fixed_size = 0; // std::array<T, N>: N, otherwise 0
};

// Type-erased entry access for the Map kind.
struct MapOps {
    std::function<size_t(const void*)> size;
    std::function<void(const void*, const std::function<void(const std::string&, const void*)>&)> for_each;
    std::function<std::any(std::vector<std::pair<std::string, std::any>>&&)> build;
};

struct TypeInfo {
    std::string name;
    std::type_index type_index;
    TypeKind kind = TypeKind::Unknown;

    // Array/Collection: element type. Map: mapped type.
    std::type_index element_type;

    // Class: registered base, typeid(void) when none
    std::type_index parent_type;
    std::function<void*(void*)> upcast; // this type -> parent_type

    std::vector<FieldInfo> fields;
    std::unordered_map<std::string, size_t> field_map;

    std::vector<EnumConstant> enum_constants;
    std::function<std::any(int64_t)> enum_from_int;
    std::function<int64_t(const std::any&)> enum_to_int; // throws std::bad_any_cast

    std::optional<CerealizerTag> cerealizer_tag;

    std::function<std::any()> creator; // default instance; empty if not default constructible
    // Address of the held object, nullptr when the any holds another type.
    std::function<const void*(const std::any&)> address;
    std::function<void*(std::any&)> address_mut;
    std::function<std::any(const void*)> copy; // the object at an address, copied into an any
    std::function<Cerealizable*(void*)> as_cerealizable;

    SequenceOps sequence;
    MapOps map;

    TypeInfo() : type_index(typeid(void)), element_type(typeid(void)), parent_type(typeid(void)) {}

    bool has_parent() const { return parent_type != std::type_index(typeid(void)); }
    const EnumConstant* find_enum_constant(std::string_view constant_name) const;
    const EnumConstant* find_enum_constant(int64_t value) const;
};

// --- ClassDB ---
// The host type facility: every type the cerealizers can handle is described
// here, keyed by std::type_index and by its registered name. Builtin scalars
// and the dynamic containers are registered on first use; classes and enums
// are declared through Registry, containers through Registry::ensure<T>().
//
// Lookups are thread-safe. Declarations that add members to an existing type
// are expected to finish before that type is first converted.
class ClassDB {
public:
    static ClassDB& get();

    // Inserts info unless the type is already known; returns the stored entry.
    const TypeInfo* register_type(std::unique_ptr<TypeInfo> info);

    // Applies fn to the stored entry (creating an empty one first if needed).
    void modify_type(std::type_index type, const std::function<void(TypeInfo&)>& fn);

    // Renames a type; the old name no longer resolves.
    void rename_type(std::type_index type, std::string_view name);

    const TypeInfo* get_type_info(std::type_index type) const;

    // By registered name, as used by the "--class" discriminator
    const TypeInfo* find_type(std::string_view name) const;

    // Fields of the class and its registered bases, root first. Each entry
    // carries the adjustment from a pointer to `type` to the declaring class.
    struct BoundField {
        const FieldInfo* field;
        std::function<void*(void*)> adjust;
    };
    std::vector<BoundField> get_all_fields(std::type_index type) const;

    // Name of a registered type, or the implementation name of typeid for others.
    std::string name_of(std::type_index type) const;

    // Walks child to parent; visitor returns true to stop
    template <typename Visitor>
    void visit_class_chain(std::type_index start, Visitor visitor) const {
        const TypeInfo* info = get_type_info(start);
        while (info) {
            if (visitor(info)) return;
            if (!info->has_parent()) break;
            info = get_type_info(info->parent_type);
        }
    }

private:
    ClassDB();
    void register_builtins();

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<TypeInfo>> types_;
    std::unordered_map<std::string, std::type_index> names_;
};

// --- Registration helpers ---

namespace class_db_detail {

template <typename T>
void fill_common(TypeInfo& info) {
    info.type_index = std::type_index(typeid(T));
    info.address = [](const std::any& a) -> const void* { return std::any_cast<T>(&a); };
    info.address_mut = [](std::any& a) -> void* { return std::any_cast<T>(&a); };
    info.copy = [](const void* p) -> std::any { return *static_cast<const T*>(p); };
    if constexpr (std::is_default_constructible_v<T>) {
        info.creator = []() -> std::any { return T{}; };
    }
}

template <typename Element>
Element take_element(std::any&& value) {
    if constexpr (std::is_same_v<Element, std::any>) {
        return std::move(value);
    } else {
        return std::any_cast<Element>(std::move(value));
    }
}

} // namespace class_db_detail

class Registry;

template <typename T>
class ClassDefinitionHelper {
public:
    explicit ClassDefinitionHelper(const std::string& name) : class_name_(name) {
        auto info = std::make_unique<TypeInfo>();
        class_db_detail::fill_common<T>(*info);
        info->name = name;
        info->kind = std::is_base_of_v<Cerealizable, T> ? TypeKind::Cerealizable : TypeKind::Class;
        if constexpr (std::is_base_of_v<Cerealizable, T>) {
            info->as_cerealizable = [](void* p) -> Cerealizable* { return static_cast<T*>(p); };
        }
        ClassDB::get().register_type(std::move(info));
        // An earlier Registry::ensure<T>() may have stored it under its typeid name.
        ClassDB::get().rename_type(typeid(T), name);
    }

    template <typename Base>
    ClassDefinitionHelper& base() {
        ClassDB::get().modify_type(typeid(T), [](TypeInfo& info) {
            info.parent_type = std::type_index(typeid(Base));
            info.upcast = [](void* p) -> void* { return static_cast<Base*>(static_cast<T*>(p)); };
        });
        return *this;
    }

    template <typename PropertyType>
    ClassDefinitionHelper& member(const std::string& property_name, PropertyType T::* member_ptr,
                                  FieldFlags flags = FieldFlags::None);

    // T is converted by C rather than by structural classification.
    template <typename C>
    ClassDefinitionHelper& cerealizer() {
        CerealizerTag tag;
        tag.cerealizer_type = std::type_index(typeid(C));
        tag.cerealizer_name = typeid(C).name();
        if constexpr (std::is_default_constructible_v<C>) {
            tag.creator = []() -> std::shared_ptr<Cerealizer> { return std::make_shared<C>(); };
        }
        ClassDB::get().modify_type(typeid(T), [tag](TypeInfo& info) { info.cerealizer_tag = tag; });
        return *this;
    }

    operator bool() const { return true; }

private:
    std::string class_name_;
};

template <typename E>
class EnumDefinitionHelper {
public:
    explicit EnumDefinitionHelper(const std::string& name);

    EnumDefinitionHelper& value(const std::string& constant_name, E constant) {
        EnumConstant c{constant_name, static_cast<int64_t>(constant)};
        ClassDB::get().modify_type(typeid(E), [c](TypeInfo& info) { info.enum_constants.push_back(c); });
        return *this;
    }

    operator bool() const { return true; }
};

class Registry {
public:
    template <typename T>
    static ClassDefinitionHelper<T> add(const std::string& name) {
        return ClassDefinitionHelper<T>(name);
    }

    template <typename E>
    static EnumDefinitionHelper<E> add_enum(const std::string& name) {
        static_assert(std::is_enum_v<E>, "add_enum needs an enumeration type");
        return EnumDefinitionHelper<E>(name);
    }

    // Makes sure T has a TypeInfo. Containers and enums get one derived from
    // their C++ type; classes must be declared with add<T>() instead.
    // Instances travel as std::any, so every registered type must be copyable.
    template <typename T>
    static void ensure() { ensure<T>(ClassDB::get()); }

    template <typename T>
    static void ensure(ClassDB& db);
};

template <typename T>
template <typename PropertyType>
ClassDefinitionHelper<T>& ClassDefinitionHelper<T>::member(const std::string& property_name,
                                                           PropertyType T::* member_ptr,
                                                           FieldFlags flags) {
    Registry::ensure<PropertyType>();

    FieldInfo prop;
    prop.name = property_name;
    prop.type_index = std::type_index(typeid(PropertyType));
    prop.required = flags == FieldFlags::Required;

    prop.address = [member_ptr](const void* obj) -> const void* {
        return &(static_cast<const T*>(obj)->*member_ptr);
    };
    prop.setter_any = [member_ptr](void* obj, std::any value) {
        static_cast<T*>(obj)->*member_ptr = class_db_detail::take_element<PropertyType>(std::move(value));
    };

    ClassDB::get().modify_type(typeid(T), [prop = std::move(prop)](TypeInfo& info) {
        auto it = info.field_map.find(prop.name);
        if (it != info.field_map.end()) {
            info.fields[it->second] = prop;
            return;
        }
        info.field_map[prop.name] = info.fields.size();
        info.fields.push_back(prop);
    });
    return *this;
}

template <typename E>
EnumDefinitionHelper<E>::EnumDefinitionHelper(const std::string& name) {
    Registry::ensure<E>();
    ClassDB::get().rename_type(typeid(E), name);
}

template <typename T>
void Registry::ensure(ClassDB& db) {
    namespace tt = type_traits;
    if (db.get_type_info(typeid(T))) return;

    auto info = std::make_unique<TypeInfo>();
    class_db_detail::fill_common<T>(*info);

    if constexpr (tt::is_byte_array_v<T>) {
        info->kind = TypeKind::ByteArray;
        info->name = "bytes";
    } else if constexpr (tt::is_array_v<T> || tt::is_collection_v<T>) {
        using Element = typename T::value_type;
        ensure<Element>(db);
        info->kind = tt::is_array_v<T> ? TypeKind::Array : TypeKind::Collection;
        info->element_type = std::type_index(typeid(Element));
        const char* container = tt::is_std_array<T>::value ? "array"
            : tt::is_vector<T>::value ? "vector"
            : tt::is_set<T>::value ? "set"
            : std::is_same_v<T, std::list<Element>> ? "list" : "deque";
        info->name = std::string(container) + "<" + db.name_of(typeid(Element)) + ">";

        info->sequence.size = [](const void* p) -> size_t { return static_cast<const T*>(p)->size(); };
        info->sequence.for_each = [](const void* p, const std::function<void(const void*)>& fn) {
            for (const auto& e : *static_cast<const T*>(p)) {
                fn(&e);
            }
        };
        if constexpr (tt::is_std_array<T>::value) {
            info->sequence.fixed_size = std::tuple_size_v<T>;
            info->sequence.build = [](std::vector<std::any>&& items) -> std::any {
                T out{};
                if (items.size() != out.size()) {
                    throw ConversionError(ConversionError::Kind::TypeMismatch,
                        "expected " + std::to_string(out.size()) + " elements, got " + std::to_string(items.size()));
                }
                for (size_t i = 0; i < items.size(); ++i) {
                    out[i] = class_db_detail::take_element<Element>(std::move(items[i]));
                }
                return out;
            };
        } else {
            info->sequence.build = [](std::vector<std::any>&& items) -> std::any {
                T out;
                for (auto& item : items) {
                    if constexpr (tt::is_set<T>::value) {
                        out.insert(class_db_detail::take_element<Element>(std::move(item)));
                    } else {
                        out.push_back(class_db_detail::take_element<Element>(std::move(item)));
                    }
                }
                return out;
            };
        }
    } else if constexpr (tt::is_map_v<T>) {
        using Mapped = typename T::mapped_type;
        ensure<Mapped>(db);
        info->kind = TypeKind::Map;
        info->element_type = std::type_index(typeid(Mapped));
        const char* container = std::is_same_v<T, std::map<std::string, Mapped>> ? "map" : "unordered_map";
        info->name = std::string(container) + "<string," + db.name_of(typeid(Mapped)) + ">";
        info->map.size = [](const void* p) -> size_t { return static_cast<const T*>(p)->size(); };
        info->map.for_each = [](const void* p, const std::function<void(const std::string&, const void*)>& fn) {
            for (const auto& [k, v] : *static_cast<const T*>(p)) {
                fn(k, &v);
            }
        };
        info->map.build = [](std::vector<std::pair<std::string, std::any>>&& entries) -> std::any {
            T out;
            for (auto& [k, v] : entries) {
                out.insert_or_assign(std::move(k), class_db_detail::take_element<Mapped>(std::move(v)));
            }
            return out;
        };
    } else if constexpr (std::is_enum_v<T>) {
        info->kind = TypeKind::Enum;
        info->name = typeid(T).name();
        info->enum_from_int = [](int64_t v) -> std::any { return static_cast<T>(v); };
        info->enum_to_int = [](const std::any& a) -> int64_t { return static_cast<int64_t>(std::any_cast<T>(a)); };
    } else if constexpr (std::is_base_of_v<Cerealizable, T>) {
        info->kind = TypeKind::Cerealizable;
        info->name = typeid(T).name();
        info->as_cerealizable = [](void* p) -> Cerealizable* { return static_cast<T*>(p); };
    } else {
        // Scalars are builtin; plain classes need Registry::add<T>().
        return;
    }
    db.register_type(std::move(info));
}

#define REGISTER_CLASS_IMPL(Class) \
    static bool Class##_registered = [](){ Class::register_class(); return true; }();
