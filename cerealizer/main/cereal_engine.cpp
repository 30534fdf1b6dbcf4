#include "cereal_engine.h"

#include <future>

#include "cerealizer/core/log/Log.h"
#include "cerealizer/core/os/thread_pool.h"
#include "cerealizer/function/convert/dynamic_cerealizer.h"

namespace {
CerealFactory::Options options_from(const std::bitset<8>& mode) {
    CerealFactory::Options options;
    options.strict = mode.test(CerealEngine::StartMode::Strict_);
    return options;
}
}

CerealEngine::CerealEngine(std::bitset<8> mode)
    : mode_(mode), factory_(options_from(mode)) {
    if (mode.test(StartMode::Log_)) {
        Log::init();
    }
    if (!mode.test(StartMode::Single_Thread_)) {
        thread_pool_ = std::make_unique<ThreadPool>();
    }
}

CerealEngine::~CerealEngine() = default;

CerealValue CerealEngine::cerealize(const std::any& object) {
    if (!object.has_value()) {
        return CerealValue{};
    }
    // The dynamic cerealizer is what adds "--class" to class objects.
    if (mode_.test(StartMode::Class_Hints_)) {
        return factory_.get_dynamic_cerealizer()->to_cereal(object, factory_);
    }
    return factory_.get_cerealizer(object.type())->to_cereal(object, factory_);
}

std::any CerealEngine::decerealize(const CerealValue& cereal) {
    return factory_.get_dynamic_cerealizer()->from_cereal(cereal, factory_);
}

std::vector<CerealValue> CerealEngine::cerealize_all(const std::vector<std::any>& objects) {
    std::vector<CerealValue> out;
    out.reserve(objects.size());
    if (!thread_pool_) {
        for (const auto& object : objects) {
            out.push_back(cerealize(object));
        }
        return out;
    }

    std::vector<std::future<CerealValue>> results;
    results.reserve(objects.size());
    for (const auto& object : objects) {
        auto p = thread_pool_->enqueue([this, &object]() { return cerealize(object); });
        if (!p) {
            // Pool is shutting down; convert the rest here.
            std::promise<CerealValue> inline_result;
            try {
                inline_result.set_value(cerealize(object));
            } catch (const std::exception&) {
                inline_result.set_exception(std::current_exception());
            }
            results.push_back(inline_result.get_future());
            continue;
        }
        results.push_back(std::move(*p));
    }

    // Every task refers to objects, so all of them finish before any rethrow.
    for (auto& res : results) {
        res.wait();
    }
    for (auto& res : results) {
        out.push_back(res.get());
    }
    INFO("Cerealized {} objects on {} workers", out.size(), thread_pool_->size());
    return out;
}
