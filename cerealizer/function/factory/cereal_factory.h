#ifndef CEREAL_FACTORY_H
#define CEREAL_FACTORY_H

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "cerealizer/core/reflect/cereal_value.h"
#include "cerealizer/core/reflect/class_db.h"
#include "cerealizer/function/convert/cerealizer.h"

class DynamicCerealizer;
struct TypeInfo;

using CerealizerPtr = std::shared_ptr<Cerealizer>;

/**
 * @brief Central repository of the cerealizers used by one CerealEngine.
 *
 * Holds two independent caches: the type map (C++ type -> cerealizer) and the
 * instance cache (cerealizer class -> shared instance). The scalar, temporal
 * and dynamic cerealizers are registered on construction; everything else is
 * built on first request and kept for the lifetime of the factory.
 *
 * Resolution is safe from many threads. Building is serialized: whatever a
 * build registers stays private to the building thread until the outermost
 * build returns, and is dropped if it throws.
 */
class CerealFactory {
public:
    struct Options {
        bool strict = false; // reject unknown object keys in ClassCerealizer
    };

    CerealFactory();
    explicit CerealFactory(Options options);
    ~CerealFactory();

    CerealFactory(const CerealFactory&) = delete;
    CerealFactory& operator=(const CerealFactory&) = delete;

    /**
     * @brief Cerealizer for the given type, built and cached on first use.
     *
     * The pointer stays valid as long as the factory. Repeated calls return the
     * same instance, except for enumerations, which get a new EnumCerealizer on
     * every call unless one was registered with register_cerealizer(). The
     * factory keeps each of those until it is destroyed; code that converts
     * repeatedly uses get_cerealizer() instead.
     *
     * @throws ConstructionError if the type is not described in ClassDB, or its
     *         tagged cerealizer class cannot be instantiated
     */
    Cerealizer* resolve(std::type_index type);

    // Registers T (and the containers it is made of) with ClassDB first.
    template <typename T>
    Cerealizer* resolve() {
        Registry::ensure<T>();
        return resolve(std::type_index(typeid(T)));
    }

    /**
     * @brief Cerealizer to convert one value with.
     *
     * Same as resolve(), except that an enumeration without a registered
     * cerealizer shares one EnumCerealizer per type. That instance is kept
     * outside the type map, so resolve() keeps handing out new ones.
     */
    Cerealizer* get_cerealizer(std::type_index type);

    template <typename T>
    Cerealizer* get_cerealizer() {
        Registry::ensure<T>();
        return get_cerealizer(std::type_index(typeid(T)));
    }

    /**
     * @brief Type named by the "--class" member of an object cereal.
     *
     * @return std::nullopt when the cereal is not an object, has no "--class"
     *         member, or that member is not a string
     * @throws ClassNotFound when the name is not registered
     */
    std::optional<std::type_index> resolve_runtime_class(const CerealValue& cereal) const;

    // resolve(runtime class) when the cereal names one, default_cerealizer otherwise.
    Cerealizer* get_runtime_cerealizer(const CerealValue& cereal, Cerealizer* default_cerealizer);

    // Use cerealizer for type from now on, whatever the type's classification.
    void register_cerealizer(std::type_index type, CerealizerPtr cerealizer);

    template <typename T>
    void register_cerealizer(CerealizerPtr cerealizer) {
        register_cerealizer(std::type_index(typeid(T)), std::move(cerealizer));
    }

    // Stores an instance under its own class, attaching the factory first when
    // it is CerealFactoryAware. Replaces any earlier instance of that class.
    void cache_cerealizer(CerealizerPtr cerealizer);

    // nullptr when no instance of that class has been cached
    Cerealizer* get_cached_cerealizer(std::type_index cerealizer_type) const;

    template <typename C>
    C* get_cached_cerealizer() const {
        return static_cast<C*>(get_cached_cerealizer(std::type_index(typeid(C))));
    }

    DynamicCerealizer* get_dynamic_cerealizer() const { return dynamic_; }

    bool is_strict() const { return options_.strict; }

    // Cerealizers kept alive outside both caches: replaced ones and enumerations
    // handed out by resolve().
    size_t owned_count() const;

private:
    class BuildScope;
    friend class BuildScope;

    enum class JournalTarget { TypeMap, Cache, Owned };
    struct JournalEntry {
        JournalTarget target;
        std::type_index key;
    };

    Cerealizer* find_published(std::type_index type) const;
    Cerealizer* find_pending(std::type_index type) const;
    Cerealizer* find_cached(std::type_index cerealizer_type) const;
    bool is_building_thread() const;

    Cerealizer* build(std::type_index type);
    Cerealizer* build_tagged(const TypeInfo& info);

    // Pending-state mutators; build_mutex_ must be held.
    Cerealizer* put_pending(std::type_index type, CerealizerPtr cerealizer);
    Cerealizer* cache_pending(CerealizerPtr cerealizer);
    void commit();
    void rollback(size_t journal_mark);

    void attach_if_aware(Cerealizer* cerealizer);
    void register_builtin(std::type_index type, const CerealizerPtr& cerealizer);

    Options options_;

    // Published state, read under a shared lock.
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::type_index, CerealizerPtr> map_;
    std::unordered_map<std::type_index, CerealizerPtr> cache_;
    std::vector<CerealizerPtr> owned_; // handed out but never cached (enums)
    std::unordered_map<std::type_index, CerealizerPtr> enum_cerealizers_; // one per enum, for get_cerealizer()

    // Build state, only touched with build_mutex_ held.
    mutable std::recursive_mutex build_mutex_;
    std::atomic<std::thread::id> build_owner_{};
    int build_depth_ = 0;
    std::unordered_map<std::type_index, CerealizerPtr> pending_map_;
    std::unordered_map<std::type_index, CerealizerPtr> pending_cache_;
    std::vector<CerealizerPtr> pending_owned_;
    std::vector<JournalEntry> journal_;

    DynamicCerealizer* dynamic_ = nullptr;
};

#endif
