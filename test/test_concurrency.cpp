#include <catch2/catch_test_macros.hpp>
#include "cerealizer/core/os/thread_pool.h"
#include "cerealizer/function/factory/cereal_factory.h"
#include "cerealizer/main/cereal_engine.h"
#include "test_types.h"

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include <vector>

using namespace test_types;

TEST_CASE("Thread Pool Integration", "[concurrency]") {
    ThreadPool pool(4);
    REQUIRE(pool.size() == 4);

    SECTION("Enqueue Basic Tasks") {
        std::atomic<int> counter = 0;
        int num_tasks = 50;
        std::vector<std::future<void>> results;

        for (int i = 0; i < num_tasks; ++i) {
            auto p = pool.enqueue([&counter]() {
                counter++;
            });
            REQUIRE(p.has_value());
            results.emplace_back(std::move(*p));
        }

        for (auto& res : results) {
            res.wait();
        }

        REQUIRE(counter == num_tasks);
    }

    SECTION("Enqueue Task with Return Value") {
        auto future_res = pool.enqueue([](int a, int b) {
            return a * b;
        }, 6, 7);

        REQUIRE(future_res.has_value());
        REQUIRE(future_res->get() == 42);
    }

    SECTION("Exceptions reach the future") {
        auto future_res = pool.enqueue([]() -> int {
            throw std::runtime_error("task failed");
        });
        REQUIRE(future_res.has_value());
        CHECK_THROWS_AS(future_res->get(), std::runtime_error);
    }
}

TEST_CASE("Thread pool drains its queue before it is destroyed", "[concurrency]") {
    std::atomic<int> done = 0;
    {
        ThreadPool pool(2);
        for (int i = 0; i < 32; ++i) {
            auto p = pool.enqueue([&done](int pause_us) {
                std::this_thread::sleep_for(std::chrono::microseconds(pause_us));
                done++;
            }, 100);
            REQUIRE(p.has_value());
        }
    }
    CHECK(done == 32);
}

TEST_CASE("Concurrent first resolution yields one instance", "[concurrency]") {
    CerealFactory factory;
    constexpr int kThreads = 16;

    // Start every thread at once so they race on the first resolution.
    std::promise<void> go;
    std::shared_future<void> start = go.get_future().share();
    std::vector<std::future<std::vector<Cerealizer*>>> results;
    for (int i = 0; i < kThreads; ++i) {
        results.push_back(std::async(std::launch::async, [&factory, start]() {
            start.wait();
            return std::vector<Cerealizer*>{
                factory.resolve<Contended>(),
                factory.resolve<std::vector<Contended>>(),
                factory.resolve<std::map<std::string, Color>>(),
                factory.resolve<Team>(),
            };
        }));
    }
    go.set_value();

    std::vector<std::vector<Cerealizer*>> seen;
    for (auto& res : results) {
        seen.push_back(res.get());
    }

    for (size_t kind = 0; kind < seen[0].size(); ++kind) {
        std::set<Cerealizer*> distinct;
        for (const auto& s : seen) {
            REQUIRE(s[kind] != nullptr);
            distinct.insert(s[kind]);
        }
        CHECK(distinct.size() == 1);
    }
    CHECK(factory.resolve<Contended>() == seen[0][0]);
}

TEST_CASE("Converters resolved on one thread are fully built on all others", "[concurrency]") {
    CerealFactory factory;
    ThreadPool pool(8);

    Node tree{"root", {Node{"a", {}}, Node{"b", {Node{"c", {}}}}}};
    std::atomic<int> mismatches = 0;
    std::vector<std::future<void>> results;

    for (int i = 0; i < 64; ++i) {
        auto p = pool.enqueue([&factory, &tree, &mismatches]() {
            Cerealizer* cerealizer = factory.resolve<Node>();
            CerealValue cereal = cerealizer->to_cereal(tree, factory);
            Node back = std::any_cast<Node>(cerealizer->from_cereal(cereal, factory));
            if (!(back == tree)) {
                mismatches++;
            }
        });
        REQUIRE(p.has_value());
        results.emplace_back(std::move(*p));
    }
    for (auto& res : results) {
        res.get();
    }
    CHECK(mismatches == 0);
}

TEST_CASE("Concurrent failures leave nothing behind", "[concurrency]") {
    CerealFactory factory;
    ThreadPool pool(4);
    std::atomic<int> failures = 0;
    std::vector<std::future<void>> results;

    for (int i = 0; i < 16; ++i) {
        auto p = pool.enqueue([&factory, &failures]() {
            try {
                factory.resolve<Broken>();
            } catch (const ConstructionError&) {
                failures++;
            }
            factory.resolve<Person>();
        });
        REQUIRE(p.has_value());
        results.emplace_back(std::move(*p));
    }
    for (auto& res : results) {
        res.get();
    }
    CHECK(failures == 16);
    CHECK(factory.resolve<Person>() != nullptr);
}

TEST_CASE("cerealize_all keeps the input order", "[concurrency]") {
    CerealEngine engine;
    REQUIRE(engine.thread_pool() != nullptr);

    std::vector<std::any> objects;
    for (int i = 0; i < 100; ++i) {
        if (i % 3 == 0) {
            objects.emplace_back(Node{std::to_string(i), {}});
        } else if (i % 3 == 1) {
            objects.emplace_back(i);
        } else {
            objects.emplace_back(std::list<Color>{Color::Green});
        }
    }

    std::vector<CerealValue> out = engine.cerealize_all(objects);
    REQUIRE(out.size() == objects.size());
    CHECK(out[0].find("name")->as_string() == "0");
    CHECK(out[1] == CerealValue(1));
    CHECK(out[2] == CerealValue::array({"Green"}));
    CHECK(out[99].find("name")->as_string() == "99");

    // The single threaded engine gives the same answer
    CerealEngine inline_engine(inline_mode());
    CHECK(inline_engine.thread_pool() == nullptr);
    CHECK(inline_engine.cerealize_all(objects) == out);

    // One bad object fails the batch
    objects[50] = Unregistered{};
    CHECK_THROWS_AS(engine.cerealize_all(objects), ConstructionError);
}
