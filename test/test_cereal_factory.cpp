#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "cerealizer/function/factory/cereal_factory.h"
#include "cerealizer/function/convert/array_cerealizer.h"
#include "cerealizer/function/convert/byte_array_cerealizer.h"
#include "cerealizer/function/convert/class_cerealizer.h"
#include "cerealizer/function/convert/dynamic_cerealizer.h"
#include "cerealizer/function/convert/enum_cerealizer.h"
#include "cerealizer/function/convert/primitive_cerealizer.h"
#include "cerealizer/main/cereal_engine.h"
#include "test_types.h"

#include <memory>

using namespace test_types;
using Catch::Matchers::ContainsSubstring;

namespace {
// Encodes every Node as its name only.
class NameOnlyCerealizer : public TypedCerealizer<Node> {
    CEREALIZER_DEF(NameOnlyCerealizer)
protected:
    CerealValue to_cereal_typed(const Node& object, CerealFactory&) const override {
        return CerealValue(object.name);
    }
    Node from_cereal_typed(const CerealValue& cereal, CerealFactory&) const override {
        return Node{cereal.as_string(), {}};
    }
};
}

TEST_CASE("Factory resolves scalar types to shared leaf cerealizers", "[factory]") {
    CerealFactory factory;

    Cerealizer* i32 = factory.resolve<int32_t>();
    REQUIRE(i32 != nullptr);
    CHECK(i32 == factory.resolve(typeid(int32_t)));
    CHECK(i32->get_cerealizer_name() == "IntegerCerealizer");
    CHECK(dynamic_cast<StringCerealizer*>(factory.resolve<std::string>()) != nullptr);
    CHECK(factory.resolve<std::any>() == factory.get_dynamic_cerealizer());

    // Leaf instances are also in the instance cache under their own class
    CHECK(factory.get_cached_cerealizer<StringCerealizer>() == factory.resolve<std::string>());
    CHECK(factory.resolve<std::vector<std::uint8_t>>() == factory.get_cached_cerealizer<ByteArrayCerealizer>());
    CHECK(factory.get_cached_cerealizer<NameOnlyCerealizer>() == nullptr);
}

TEST_CASE("Factory resolution is idempotent", "[factory]") {
    CerealFactory factory;

    Cerealizer* node = factory.resolve<Node>();
    REQUIRE(node != nullptr);
    CHECK(dynamic_cast<ClassCerealizer*>(node) != nullptr);
    CHECK(factory.resolve<Node>() == node);

    auto* children = dynamic_cast<ArrayCerealizer*>(factory.resolve<std::vector<Node>>());
    REQUIRE(children != nullptr);
    CHECK(children->get_delegate() == node);
    CHECK(children->get_element_type() == std::type_index(typeid(Node)));
    CHECK(factory.resolve<std::vector<Node>>() == children);

    Cerealizer* team = factory.resolve<Team>();
    CHECK(factory.resolve<Team>() == team);
    CHECK(factory.resolve<std::list<Color>>() == factory.resolve<std::list<Color>>());
    CHECK(factory.resolve<std::unordered_map<std::string, Node>>() == factory.resolve<std::unordered_map<std::string, Node>>());

    // Each factory keeps its own converters
    CerealFactory other;
    CHECK(other.resolve<Node>() != node);
}

TEST_CASE("Factory does not memoize enumeration cerealizers", "[factory]") {
    CerealFactory factory;

    Cerealizer* first = factory.resolve<Color>();
    Cerealizer* second = factory.resolve<Color>();
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);
    CHECK(first != second);
    CHECK(dynamic_cast<EnumCerealizer*>(first) != nullptr);

    // Both stay usable for the lifetime of the factory
    CHECK(first->to_cereal(Color::Blue, factory) == CerealValue("Blue"));
    CHECK(std::any_cast<Color>(second->from_cereal(CerealValue("Green"), factory)) == Color::Green);

    // An explicit registration is memoized like any other override
    auto registered = std::make_shared<EnumCerealizer>(*ClassDB::get().get_type_info(typeid(Color)));
    factory.register_cerealizer<Color>(registered);
    CHECK(factory.resolve<Color>() == registered.get());
    CHECK(factory.resolve<Color>() == registered.get());
}

TEST_CASE("Converting enumerations reuses one cerealizer per type", "[factory]") {
    CerealEngine engine(inline_mode());
    CerealFactory& factory = engine.get_cereal_factory();
    DynamicCerealizer* dynamic = factory.get_dynamic_cerealizer();

    Cerealizer* shared = factory.get_cerealizer<Color>();
    REQUIRE(dynamic_cast<EnumCerealizer*>(shared) != nullptr);
    CHECK(factory.get_cerealizer<Color>() == shared);
    // Still kept out of the type map
    CHECK(factory.resolve<Color>() != shared);

    Holder holder;
    holder.slot = Color::Green;
    holder.items = {Color::Red, Color::Blue};
    engine.cerealize(holder);

    size_t owned = factory.owned_count();
    for (int i = 0; i < 2000; ++i) {
        CHECK(dynamic->to_cereal(std::any(Color::Green), factory) == CerealValue("Green"));
        engine.cerealize(holder);
        engine.cerealize(Color::Blue);
        CHECK(engine.decerealize<Color>(CerealValue("Red")) == Color::Red);
    }
    CHECK(factory.owned_count() == owned);
    CHECK(factory.get_cerealizer<Color>() == shared);

    // A registered cerealizer wins over the shared one
    auto registered = std::make_shared<EnumCerealizer>(*ClassDB::get().get_type_info(typeid(Color)));
    factory.register_cerealizer<Color>(registered);
    CHECK(factory.get_cerealizer<Color>() == registered.get());
    CHECK(dynamic->to_cereal(std::any(Color::Red), factory) == CerealValue("Red"));
}

TEST_CASE("Explicit registration takes precedence", "[factory]") {
    CerealFactory factory;

    // 1. Before first resolution
    {
        auto name_only = std::make_shared<NameOnlyCerealizer>();
        factory.register_cerealizer<Node>(name_only);
        CHECK(factory.resolve<Node>() == name_only.get());

        Node n{"solo", {}};
        CHECK(factory.resolve<Node>()->to_cereal(n, factory) == CerealValue("solo"));
    }

    // 2. Replacing a converter that was already built
    {
        Cerealizer* built = factory.resolve<Shape>();
        REQUIRE(built != nullptr);
        auto replacement = std::make_shared<NameOnlyCerealizer>();
        factory.register_cerealizer(typeid(Shape), replacement);
        CHECK(factory.resolve<Shape>() == replacement.get());
    }
}

TEST_CASE("Factory builds tagged cerealizers through the instance cache", "[factory]") {
    // 1. One construction per factory, found under its own class
    {
        CerealFactory factory;
        int before = MoneyCerealizer::constructed.load();
        Cerealizer* money = factory.resolve<Money>();
        REQUIRE(money != nullptr);
        CHECK(factory.resolve<Money>() == money);
        CHECK(MoneyCerealizer::constructed.load() == before + 1);
        CHECK(factory.get_cached_cerealizer<MoneyCerealizer>() == money);

        CHECK(money->to_cereal(Money{1234}, factory) == CerealValue("12.34"));
        CHECK(std::any_cast<Money>(money->from_cereal(CerealValue("5.07"), factory)).cents == 507);
    }

    // 2. A cached instance is reused by resolution
    {
        CerealFactory factory;
        auto cached = std::make_shared<MoneyCerealizer>();
        factory.cache_cerealizer(cached);
        CHECK(factory.get_cached_cerealizer<MoneyCerealizer>() == cached.get());
        CHECK(factory.resolve<Money>() == cached.get());
    }

    // 3. Aware cerealizers are attached exactly once
    {
        CerealFactory factory;
        Cerealizer* temperature = factory.resolve<Temperature>();
        auto* aware = factory.get_cached_cerealizer<TemperatureCerealizer>();
        REQUIRE(aware == temperature);
        CHECK(aware->attach_count() == 1);
        factory.resolve<Temperature>();
        CHECK(aware->attach_count() == 1);

        CerealValue cereal = temperature->to_cereal(Temperature{21.5}, factory);
        CHECK(cereal == CerealValue::object({{"celsius", 21.5}}));
    }

    // 4. cache_cerealizer() attaches and replaces the earlier instance
    {
        CerealFactory factory;
        auto first = std::make_shared<TemperatureCerealizer>();
        auto second = std::make_shared<TemperatureCerealizer>();
        factory.cache_cerealizer(first);
        factory.cache_cerealizer(second);
        CHECK(first->attach_count() == 1);
        CHECK(second->attach_count() == 1);
        CHECK(factory.get_cached_cerealizer<TemperatureCerealizer>() == second.get());
    }
}

TEST_CASE("Tagged cerealizer construction failures", "[factory]") {
    CerealFactory factory;

    SECTION("No default constructor") {
        REQUIRE_THROWS_AS(factory.resolve<Opaque>(), ConstructionError);
        CHECK_THROWS_WITH(factory.resolve<Opaque>(), ContainsSubstring("no default constructor"));
        CHECK(factory.get_cached_cerealizer<NoDefaultCerealizer>() == nullptr);
    }

    SECTION("Constructor throws") {
        REQUIRE_THROWS_AS(factory.resolve<Fragile>(), ConstructionError);
        CHECK_THROWS_WITH(factory.resolve<Fragile>(), ContainsSubstring("out of coffee"));
        CHECK(factory.get_cached_cerealizer<ThrowingCerealizer>() == nullptr);
    }
}

TEST_CASE("Unregistered types cannot be resolved", "[factory]") {
    CerealFactory factory;
    CHECK_THROWS_AS(factory.resolve<Unregistered>(), ConstructionError);
    // Nothing was cached by the first attempt
    CHECK_THROWS_AS(factory.resolve<Unregistered>(), ConstructionError);
    CHECK_THROWS_AS(factory.resolve<std::vector<Unregistered>>(), ConstructionError);
}

TEST_CASE("Failed resolution leaves nothing cached", "[factory]") {
    CerealFactory factory;
    factory.resolve<Node>();

    // Broken is registered before its Fragile member fails; the whole
    // resolution is discarded, including the vector<Broken> built on the way.
    REQUIRE_THROWS_AS(factory.resolve<Broken>(), ConstructionError);
    CHECK_THROWS_AS(factory.resolve<Broken>(), ConstructionError);
    CHECK_THROWS_AS(factory.resolve<std::vector<Broken>>(), ConstructionError);

    // Earlier and unrelated resolutions are unaffected
    CHECK(factory.resolve<Node>() == factory.resolve<Node>());
    CHECK(factory.resolve<Person>() != nullptr);
}
