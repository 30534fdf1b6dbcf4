#ifndef CEREAL_ENGINE_H
#define CEREAL_ENGINE_H

#include <any>
#include <bitset>
#include <memory>
#include <vector>

#include "cerealizer/core/reflect/cereal_value.h"
#include "cerealizer/function/factory/cereal_factory.h"

class ThreadPool;

/**
 * @brief Entry point for converting values: one factory plus the start mode.
 *
 * Types must be declared with Registry (classes, enums) before they are
 * converted; containers of declared types are registered on demand.
 */
class CerealEngine {
public:
    enum StartMode {
        Log_ = 0,          // initialize glog
        Class_Hints_ = 1,  // top-level class objects carry "--class"
        Strict_ = 2,       // unknown object keys are an error
        Single_Thread_ = 3 // no worker pool; cerealize_all runs inline
    };

    explicit CerealEngine(std::bitset<8> mode = {});
    ~CerealEngine();

    CerealEngine(const CerealEngine&) = delete;
    CerealEngine& operator=(const CerealEngine&) = delete;

    template <typename T>
    CerealValue cerealize(const T& value) {
        Registry::ensure<T>();
        return cerealize(std::any(value));
    }

    // Converts by the runtime type of the held value.
    CerealValue cerealize(const std::any& object);

    template <typename T>
    T decerealize(const CerealValue& cereal) {
        std::any object = factory_.get_cerealizer<T>()->from_cereal(cereal, factory_);
        return std::any_cast<T>(std::move(object));
    }

    // Follows "--class" when present, otherwise decodes by the cereal's shape.
    std::any decerealize(const CerealValue& cereal);

    // Converts every object on the worker pool; results keep the input order.
    // Rethrows the first failure once all conversions have finished.
    std::vector<CerealValue> cerealize_all(const std::vector<std::any>& objects);

    CerealFactory& get_cereal_factory() { return factory_; }
    ThreadPool* thread_pool() const { return thread_pool_.get(); }
    const std::bitset<8>& mode() const { return mode_; }

private:
    std::bitset<8> mode_;
    CerealFactory factory_;
    std::unique_ptr<ThreadPool> thread_pool_;
};

#endif
