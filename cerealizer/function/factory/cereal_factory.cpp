#include "cereal_factory.h"

#include <exception>
#include <format>

#include "cerealizer/core/log/Log.h"
#include "cerealizer/function/convert/array_cerealizer.h"
#include "cerealizer/function/convert/byte_array_cerealizer.h"
#include "cerealizer/function/convert/cerealizable_cerealizer.h"
#include "cerealizer/function/convert/class_cerealizer.h"
#include "cerealizer/function/convert/collection_cerealizer.h"
#include "cerealizer/function/convert/date_cerealizer.h"
#include "cerealizer/function/convert/dynamic_cerealizer.h"
#include "cerealizer/function/convert/enum_cerealizer.h"
#include "cerealizer/function/convert/map_cerealizer.h"
#include "cerealizer/function/convert/primitive_cerealizer.h"

// Holds build_mutex_ for the duration of one (possibly nested) build. The
// outermost scope publishes everything built on success; any scope that
// unwinds with an exception drops what was built since it opened.
class CerealFactory::BuildScope {
public:
    explicit BuildScope(CerealFactory& factory)
        : factory_(factory), lock_(factory.build_mutex_),
          mark_(factory.journal_.size()), exceptions_(std::uncaught_exceptions()) {
        if (factory_.build_depth_++ == 0) {
            factory_.build_owner_ = std::this_thread::get_id();
        }
    }

    ~BuildScope() {
        bool failed = std::uncaught_exceptions() > exceptions_;
        if (failed) {
            factory_.rollback(mark_);
        }
        if (--factory_.build_depth_ == 0) {
            if (!failed) {
                factory_.commit();
            }
            factory_.build_owner_ = std::thread::id();
        }
    }

    BuildScope(const BuildScope&) = delete;
    BuildScope& operator=(const BuildScope&) = delete;

private:
    CerealFactory& factory_;
    std::unique_lock<std::recursive_mutex> lock_;
    size_t mark_;
    int exceptions_;
};

CerealFactory::CerealFactory() : CerealFactory(Options{}) {}

CerealFactory::CerealFactory(Options options) : options_(options) {
    /* Insert the scalar cerealizers */
    auto sc = std::make_shared<StringCerealizer>();
    register_builtin(typeid(std::string), sc);
    auto bc = std::make_shared<BooleanCerealizer>();
    register_builtin(typeid(bool), bc);
    auto cc = std::make_shared<CharCerealizer>();
    register_builtin(typeid(char), cc);

    register_builtin(typeid(signed char), std::make_shared<IntegerCerealizer<signed char>>());
    register_builtin(typeid(unsigned char), std::make_shared<IntegerCerealizer<unsigned char>>());
    register_builtin(typeid(short), std::make_shared<IntegerCerealizer<short>>());
    register_builtin(typeid(unsigned short), std::make_shared<IntegerCerealizer<unsigned short>>());
    register_builtin(typeid(int), std::make_shared<IntegerCerealizer<int>>());
    register_builtin(typeid(unsigned int), std::make_shared<IntegerCerealizer<unsigned int>>());
    register_builtin(typeid(long), std::make_shared<IntegerCerealizer<long>>());
    register_builtin(typeid(unsigned long), std::make_shared<IntegerCerealizer<unsigned long>>());
    register_builtin(typeid(long long), std::make_shared<IntegerCerealizer<long long>>());
    register_builtin(typeid(unsigned long long), std::make_shared<IntegerCerealizer<unsigned long long>>());
    register_builtin(typeid(float), std::make_shared<FloatCerealizer<float>>());
    register_builtin(typeid(double), std::make_shared<FloatCerealizer<double>>());

    register_builtin(typeid(type_traits::TimePoint), std::make_shared<DateCerealizer>());

    /* A std::any slot goes through the DynamicCerealizer */
    auto dc = std::make_shared<DynamicCerealizer>();
    dynamic_ = dc.get();
    register_builtin(typeid(std::any), dc);

    /* Byte arrays are served from the instance cache only */
    auto bac = std::make_shared<ByteArrayCerealizer>();
    cache_.emplace(std::type_index(typeid(*bac)), bac);
}

CerealFactory::~CerealFactory() = default;

void CerealFactory::register_builtin(std::type_index type, const CerealizerPtr& cerealizer) {
    map_.emplace(type, cerealizer);
    cache_.emplace(std::type_index(typeid(*cerealizer)), cerealizer);
}

Cerealizer* CerealFactory::resolve(std::type_index type) {
    if (Cerealizer* cerealizer = find_published(type)) {
        return cerealizer;
    }

    // Neither of these is ever in the type map; serve them without building.
    const TypeInfo* info = ClassDB::get().get_type_info(type);
    if (info && info->cerealizer_tag) {
        std::shared_lock lock(map_mutex_);
        auto it = cache_.find(info->cerealizer_tag->cerealizer_type);
        if (it != cache_.end()) {
            return it->second.get();
        }
    } else if (info && info->kind == TypeKind::Enum) {
        // Not memoized: every request gets its own instance.
        auto cerealizer = std::make_shared<EnumCerealizer>(*info);
        Cerealizer* raw = cerealizer.get();
        std::unique_lock lock(map_mutex_);
        owned_.push_back(std::move(cerealizer));
        return raw;
    }

    BuildScope scope(*this);
    // Another thread may have published it while this one waited.
    if (Cerealizer* cerealizer = find_published(type)) {
        return cerealizer;
    }
    // Registered earlier in this same build: a self reference.
    if (Cerealizer* cerealizer = find_pending(type)) {
        return cerealizer;
    }
    return build(type);
}

Cerealizer* CerealFactory::build(std::type_index type) {
    const TypeInfo* info = ClassDB::get().get_type_info(type);
    if (!info || info->kind == TypeKind::Unknown) {
        ERR("No type information for {}", type.name());
        throw ConstructionError(std::format(
            "No type information registered for {}; declare it with Registry::add", type.name()));
    }

    /* Handle use case where the type declares its own cerealizer */
    if (info->cerealizer_tag) {
        return build_tagged(*info);
    }

    switch (info->kind) {
    case TypeKind::ByteArray:
        return find_cached(typeid(ByteArrayCerealizer));

    case TypeKind::Array: {
        Cerealizer* delegate = resolve(info->element_type);
        // Building the element may have built this array already (a class
        // holding a vector of itself); keep that one, others point to it.
        if (Cerealizer* existing = find_pending(type)) {
            return existing;
        }
        auto cerealizer = std::make_shared<ArrayCerealizer>(delegate, info->element_type, *info);
        INFO("Created ArrayCerealizer for {}", info->name);
        return put_pending(type, std::move(cerealizer));
    }

    case TypeKind::Collection: {
        Cerealizer* cerealizer = put_pending(type, std::make_shared<CollectionCerealizer>(dynamic_, *info));
        attach_if_aware(cerealizer);
        INFO("Created CollectionCerealizer for {}", info->name);
        return cerealizer;
    }

    case TypeKind::Map: {
        Cerealizer* cerealizer = put_pending(type, std::make_shared<MapCerealizer>(dynamic_, *info));
        attach_if_aware(cerealizer);
        INFO("Created MapCerealizer for {}", info->name);
        return cerealizer;
    }

    case TypeKind::Cerealizable: {
        Cerealizer* cerealizer = put_pending(type, std::make_shared<CerealizableCerealizer>(*info));
        attach_if_aware(cerealizer);
        INFO("Created CerealizableCerealizer for {}", info->name);
        return cerealizer;
    }

    case TypeKind::Class: {
        auto cerealizer = std::make_shared<ClassCerealizer>(*info);
        ClassCerealizer* raw = cerealizer.get();

        /*
         * Need to insert the Cerealizer into the map before initializing because
         * self-referencing classes would otherwise infinitely recurse
         */
        put_pending(type, std::move(cerealizer));

        attach_if_aware(raw);
        raw->initialize(*this);
        INFO("Created ClassCerealizer for {} with {} members", info->name, info->fields.size());
        return raw;
    }

    case TypeKind::Enum: // handled by resolve()
    case TypeKind::Scalar:
    case TypeKind::Temporal:
    case TypeKind::Dynamic:
    case TypeKind::Unknown:
        break;
    }
    throw ConstructionError(std::format("No cerealizer available for {} ({})", info->name, type_kind_name(info->kind)));
}

Cerealizer* CerealFactory::build_tagged(const TypeInfo& info) {
    const CerealizerTag& tag = *info.cerealizer_tag;
    if (Cerealizer* cached = find_cached(tag.cerealizer_type)) {
        return cached;
    }
    if (!tag.creator) {
        ERR("Cerealizer {} declared for {} has no default constructor", tag.cerealizer_name, info.name);
        throw ConstructionError(std::format(
            "Failed to create new cerealizer {} for {}: no default constructor", tag.cerealizer_name, info.name));
    }

    CerealizerPtr cerealizer;
    try {
        cerealizer = tag.creator();
    } catch (const std::exception& e) {
        ERR("Constructing cerealizer {} for {} threw: {}", tag.cerealizer_name, info.name, e.what());
        throw ConstructionError(std::format(
            "Failed to create new cerealizer {} for {}: {}", tag.cerealizer_name, info.name, e.what()));
    } catch (...) {
        ERR("Constructing cerealizer {} for {} threw a non-standard exception", tag.cerealizer_name, info.name);
        throw ConstructionError(std::format(
            "Failed to create new cerealizer {} for {}", tag.cerealizer_name, info.name));
    }
    if (!cerealizer) {
        throw ConstructionError(std::format("Creator of {} returned no cerealizer", tag.cerealizer_name));
    }

    Cerealizer* raw = cache_pending(std::move(cerealizer));
    attach_if_aware(raw);
    INFO("Created tagged cerealizer {} for {}", tag.cerealizer_name, info.name);
    return raw;
}

void CerealFactory::attach_if_aware(Cerealizer* cerealizer) {
    if (auto* aware = dynamic_cast<CerealFactoryAware*>(cerealizer)) {
        aware->attach(*this);
    }
}

std::optional<std::type_index> CerealFactory::resolve_runtime_class(const CerealValue& cereal) const {
    const CerealValue* class_name = cereal.find(kClassProperty);
    if (!class_name || !class_name->is_string()) {
        return std::nullopt;
    }
    const TypeInfo* info = ClassDB::get().find_type(class_name->as_string());
    if (!info) {
        WARN("Cereal names unknown class '{}'", class_name->as_string());
        throw ClassNotFound(class_name->as_string());
    }
    return info->type_index;
}

Cerealizer* CerealFactory::get_cerealizer(std::type_index type) {
    if (Cerealizer* cerealizer = find_published(type)) {
        return cerealizer;
    }
    const TypeInfo* info = ClassDB::get().get_type_info(type);
    if (!info || info->kind != TypeKind::Enum || info->cerealizer_tag) {
        return resolve(type);
    }

    {
        std::shared_lock lock(map_mutex_);
        auto it = enum_cerealizers_.find(type);
        if (it != enum_cerealizers_.end()) {
            return it->second.get();
        }
    }
    std::unique_lock lock(map_mutex_);
    auto [it, inserted] = enum_cerealizers_.try_emplace(type);
    if (inserted) {
        it->second = std::make_shared<EnumCerealizer>(*info);
        INFO("Created shared EnumCerealizer for {}", info->name);
    }
    return it->second.get();
}

Cerealizer* CerealFactory::get_runtime_cerealizer(const CerealValue& cereal, Cerealizer* default_cerealizer) {
    std::optional<std::type_index> runtime_class = resolve_runtime_class(cereal);
    return runtime_class ? get_cerealizer(*runtime_class) : default_cerealizer;
}

void CerealFactory::register_cerealizer(std::type_index type, CerealizerPtr cerealizer) {
    std::unique_lock lock(map_mutex_);
    auto it = map_.find(type);
    if (it != map_.end()) {
        // Other cerealizers may still point at the one being replaced.
        owned_.push_back(std::move(it->second));
        it->second = std::move(cerealizer);
    } else {
        map_.emplace(type, std::move(cerealizer));
    }
}

void CerealFactory::cache_cerealizer(CerealizerPtr cerealizer) {
    if (!cerealizer) {
        return;
    }
    BuildScope scope(*this);
    Cerealizer* raw = cache_pending(std::move(cerealizer));
    attach_if_aware(raw);
}

Cerealizer* CerealFactory::get_cached_cerealizer(std::type_index cerealizer_type) const {
    {
        std::shared_lock lock(map_mutex_);
        auto it = cache_.find(cerealizer_type);
        if (it != cache_.end()) {
            return it->second.get();
        }
    }
    if (is_building_thread()) {
        auto it = pending_cache_.find(cerealizer_type);
        if (it != pending_cache_.end()) {
            return it->second.get();
        }
    }
    return nullptr;
}

Cerealizer* CerealFactory::find_published(std::type_index type) const {
    std::shared_lock lock(map_mutex_);
    auto it = map_.find(type);
    return it != map_.end() ? it->second.get() : nullptr;
}

Cerealizer* CerealFactory::find_pending(std::type_index type) const {
    auto it = pending_map_.find(type);
    return it != pending_map_.end() ? it->second.get() : nullptr;
}

Cerealizer* CerealFactory::find_cached(std::type_index cerealizer_type) const {
    auto it = pending_cache_.find(cerealizer_type);
    if (it != pending_cache_.end()) {
        return it->second.get();
    }
    std::shared_lock lock(map_mutex_);
    auto published = cache_.find(cerealizer_type);
    return published != cache_.end() ? published->second.get() : nullptr;
}

bool CerealFactory::is_building_thread() const {
    return build_owner_.load() == std::this_thread::get_id();
}

Cerealizer* CerealFactory::put_pending(std::type_index type, CerealizerPtr cerealizer) {
    Cerealizer* raw = cerealizer.get();
    pending_map_.emplace(type, std::move(cerealizer));
    journal_.push_back({JournalTarget::TypeMap, type});
    return raw;
}

Cerealizer* CerealFactory::cache_pending(CerealizerPtr cerealizer) {
    Cerealizer* raw = cerealizer.get();
    std::type_index key(typeid(*raw));
    auto it = pending_cache_.find(key);
    if (it != pending_cache_.end()) {
        pending_owned_.push_back(std::move(it->second));
        journal_.push_back({JournalTarget::Owned, key});
        it->second = std::move(cerealizer);
    } else {
        pending_cache_.emplace(key, std::move(cerealizer));
    }
    journal_.push_back({JournalTarget::Cache, key});
    return raw;
}

size_t CerealFactory::owned_count() const {
    std::shared_lock lock(map_mutex_);
    return owned_.size();
}

void CerealFactory::commit() {
    if (journal_.empty()) {
        return;
    }
    std::unique_lock lock(map_mutex_);
    for (auto& [type, cerealizer] : pending_map_) {
        auto [it, inserted] = map_.try_emplace(type, cerealizer);
        if (!inserted) {
            // register_cerealizer() won while this was being built
            owned_.push_back(std::move(cerealizer));
        }
    }
    for (auto& [type, cerealizer] : pending_cache_) {
        auto it = cache_.find(type);
        if (it != cache_.end()) {
            owned_.push_back(std::move(it->second));
            it->second = std::move(cerealizer);
        } else {
            cache_.emplace(type, std::move(cerealizer));
        }
    }
    for (auto& cerealizer : pending_owned_) {
        owned_.push_back(std::move(cerealizer));
    }
    pending_map_.clear();
    pending_cache_.clear();
    pending_owned_.clear();
    journal_.clear();
}

void CerealFactory::rollback(size_t journal_mark) {
    size_t discarded = journal_.size() - journal_mark;
    while (journal_.size() > journal_mark) {
        const JournalEntry& entry = journal_.back();
        switch (entry.target) {
        case JournalTarget::TypeMap:
            pending_map_.erase(entry.key);
            break;
        case JournalTarget::Cache:
            pending_cache_.erase(entry.key);
            break;
        case JournalTarget::Owned:
            pending_owned_.pop_back();
            break;
        }
        journal_.pop_back();
    }
    if (discarded > 0) {
        ERR("Build failed, discarded {} pending cerealizer entries", discarded);
    }
}
