#include "class_db.h"
#include "cerealizer/core/log/Log.h"
#include <mutex>

std::string_view type_kind_name(TypeKind kind) {
    switch (kind) {
    case TypeKind::Unknown: return "unknown";
    case TypeKind::Scalar: return "scalar";
    case TypeKind::Temporal: return "temporal";
    case TypeKind::ByteArray: return "byte array";
    case TypeKind::Enum: return "enum";
    case TypeKind::Array: return "array";
    case TypeKind::Collection: return "collection";
    case TypeKind::Map: return "map";
    case TypeKind::Cerealizable: return "cerealizable";
    case TypeKind::Class: return "class";
    case TypeKind::Dynamic: return "dynamic";
    }
    return "unknown";
}

const EnumConstant* TypeInfo::find_enum_constant(std::string_view constant_name) const {
    for (const auto& c : enum_constants) {
        if (c.name == constant_name) return &c;
    }
    return nullptr;
}

const EnumConstant* TypeInfo::find_enum_constant(int64_t value) const {
    for (const auto& c : enum_constants) {
        if (c.value == value) return &c;
    }
    return nullptr;
}

ClassDB& ClassDB::get() {
    static ClassDB instance;
    return instance;
}

ClassDB::ClassDB() {
    register_builtins();
}

namespace {
template <typename T>
std::unique_ptr<TypeInfo> make_builtin(const char* name, TypeKind kind) {
    auto info = std::make_unique<TypeInfo>();
    class_db_detail::fill_common<T>(*info);
    info->name = name;
    info->kind = kind;
    return info;
}
}

void ClassDB::register_builtins() {
    register_type(make_builtin<std::string>("string", TypeKind::Scalar));
    register_type(make_builtin<bool>("bool", TypeKind::Scalar));
    register_type(make_builtin<char>("char", TypeKind::Scalar));
    register_type(make_builtin<signed char>("int8", TypeKind::Scalar));
    register_type(make_builtin<unsigned char>("uint8", TypeKind::Scalar));
    register_type(make_builtin<short>("int16", TypeKind::Scalar));
    register_type(make_builtin<unsigned short>("uint16", TypeKind::Scalar));
    register_type(make_builtin<int>("int32", TypeKind::Scalar));
    register_type(make_builtin<unsigned int>("uint32", TypeKind::Scalar));
    register_type(make_builtin<int64_t>("int64", TypeKind::Scalar));
    register_type(make_builtin<uint64_t>("uint64", TypeKind::Scalar));
    // Whichever of these is not int64_t on this platform.
    register_type(make_builtin<long>("long", TypeKind::Scalar));
    register_type(make_builtin<unsigned long>("unsigned long", TypeKind::Scalar));
    register_type(make_builtin<long long>("long long", TypeKind::Scalar));
    register_type(make_builtin<unsigned long long>("unsigned long long", TypeKind::Scalar));
    register_type(make_builtin<float>("float", TypeKind::Scalar));
    register_type(make_builtin<double>("double", TypeKind::Scalar));
    register_type(make_builtin<type_traits::TimePoint>("time_point", TypeKind::Temporal));

    auto any = make_builtin<std::any>("any", TypeKind::Dynamic);
    // An any never holds another any; the dynamic slot is the value itself.
    any->address = [](const std::any& a) -> const void* { return &a; };
    any->address_mut = [](std::any& a) -> void* { return &a; };
    register_type(std::move(any));

    // Shapes the dynamic cerealizer falls back to when a cereal has no class hint.
    Registry::ensure<std::vector<std::uint8_t>>(*this);
    Registry::ensure<std::vector<std::any>>(*this);
    Registry::ensure<std::list<std::any>>(*this);
    Registry::ensure<std::map<std::string, std::any>>(*this);
}

const TypeInfo* ClassDB::register_type(std::unique_ptr<TypeInfo> info) {
    std::unique_lock lock(mutex_);
    auto it = types_.find(info->type_index);
    if (it != types_.end()) {
        return it->second.get();
    }
    std::type_index type = info->type_index;
    if (!info->name.empty()) {
        auto [name_it, inserted] = names_.emplace(info->name, type);
        if (!inserted && name_it->second != type) {
            WARN("Type name '{}' already registered for another type, keeping the first", info->name);
        }
    }
    return types_.emplace(type, std::move(info)).first->second.get();
}

void ClassDB::modify_type(std::type_index type, const std::function<void(TypeInfo&)>& fn) {
    std::unique_lock lock(mutex_);
    auto& slot = types_[type];
    if (!slot) {
        slot = std::make_unique<TypeInfo>();
        slot->type_index = type;
    }
    fn(*slot);
}

void ClassDB::rename_type(std::type_index type, std::string_view name) {
    std::unique_lock lock(mutex_);
    auto it = types_.find(type);
    if (it == types_.end()) {
        return;
    }
    auto& info = *it->second;
    if (info.name == name) {
        names_.insert_or_assign(info.name, type);
        return;
    }
    auto old = names_.find(info.name);
    if (old != names_.end() && old->second == type) {
        names_.erase(old);
    }
    info.name = std::string(name);
    names_.insert_or_assign(info.name, type);
}

const TypeInfo* ClassDB::get_type_info(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = types_.find(type);
    return it != types_.end() ? it->second.get() : nullptr;
}

const TypeInfo* ClassDB::find_type(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = names_.find(std::string(name));
    if (it == names_.end()) {
        return nullptr;
    }
    auto type_it = types_.find(it->second);
    return type_it != types_.end() ? type_it->second.get() : nullptr;
}

std::vector<ClassDB::BoundField> ClassDB::get_all_fields(std::type_index type) const {
    struct Level {
        const TypeInfo* info;
        std::function<void*(void*)> adjust;
    };
    std::vector<Level> inheritance_chain;
    std::function<void*(void*)> adjust = [](void* p) { return p; };
    visit_class_chain(type, [&](const TypeInfo* info) {
        inheritance_chain.push_back({info, adjust});
        if (info->has_parent() && info->upcast) {
            adjust = [outer = adjust, up = info->upcast](void* p) { return up(outer(p)); };
        }
        return false;
    });

    // Reverse order: Root -> Parent -> Child
    std::vector<BoundField> out;
    for (auto it = inheritance_chain.rbegin(); it != inheritance_chain.rend(); ++it) {
        for (const auto& field : it->info->fields) {
            out.push_back({&field, it->adjust});
        }
    }
    return out;
}

std::string ClassDB::name_of(std::type_index type) const {
    const TypeInfo* info = get_type_info(type);
    if (info && !info->name.empty()) {
        return info->name;
    }
    return type.name();
}
