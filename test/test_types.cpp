#include "test_types.h"

#include <stdexcept>

#include "cerealizer/function/factory/cereal_factory.h"

namespace test_types {

std::atomic<int> MoneyCerealizer::constructed{0};
std::atomic<int> Tally::copies{0};

CerealValue Vector2::to_cereal(CerealFactory&) const {
    return CerealValue::array({x_, y_});
}

void Vector2::from_cereal(const CerealValue& cereal, CerealFactory&) {
    if (!cereal.is_array() || cereal.size() != 2) {
        throw_type_mismatch("[x, y]", cereal);
    }
    const auto& xy = cereal.as_array();
    if (!xy[0].is_number() || !xy[1].is_number()) {
        throw_type_mismatch("[x, y]", cereal);
    }
    x_ = xy[0].is_int() ? static_cast<double>(xy[0].as_int()) : xy[0].as_double();
    y_ = xy[1].is_int() ? static_cast<double>(xy[1].as_int()) : xy[1].as_double();
}

CerealValue MoneyCerealizer::to_cereal_typed(const Money& object, CerealFactory&) const {
    std::string cents = std::to_string(object.cents % 100);
    if (cents.size() < 2) cents.insert(0, "0");
    return CerealValue(std::to_string(object.cents / 100) + "." + cents);
}

Money MoneyCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    if (!cereal.is_string()) {
        throw_type_mismatch("amount string", cereal);
    }
    const std::string& text = cereal.as_string();
    size_t dot = text.find('.');
    if (dot == std::string::npos || text.size() - dot != 3) {
        throw ConversionError(ConversionError::Kind::MalformedScalar, "not an amount: " + text);
    }
    Money m;
    m.cents = std::stoll(text.substr(0, dot)) * 100 + std::stoll(text.substr(dot + 1));
    return m;
}

void TemperatureCerealizer::attach(CerealFactory& factory) {
    number_ = factory.resolve<double>();
    ++attach_count_;
}

CerealValue TemperatureCerealizer::to_cereal_typed(const Temperature& object, CerealFactory& factory) const {
    return CerealValue::object({{"celsius", number_->to_cereal(object.celsius, factory)}});
}

Temperature TemperatureCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory& factory) const {
    const CerealValue* celsius = cereal.find("celsius");
    if (!celsius) {
        throw ConversionError(ConversionError::Kind::MissingField, "no celsius", "celsius");
    }
    Temperature t;
    t.celsius = std::any_cast<double>(number_->from_cereal(*celsius, factory));
    return t;
}

CerealValue NoDefaultCerealizer::to_cereal_typed(const Opaque& object, CerealFactory&) const {
    return CerealValue(object.value * scale_);
}

Opaque NoDefaultCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    return Opaque{static_cast<int>(cereal.as_int() / scale_)};
}

ThrowingCerealizer::ThrowingCerealizer() {
    throw std::runtime_error("out of coffee");
}

CerealValue ThrowingCerealizer::to_cereal_typed(const Fragile& object, CerealFactory&) const {
    return CerealValue(object.value);
}

Fragile ThrowingCerealizer::from_cereal_typed(const CerealValue& cereal, CerealFactory&) const {
    return Fragile{static_cast<int>(cereal.as_int())};
}

void register_types() {
    Registry::add_enum<Color>("Color")
        .value("Red", Color::Red)
        .value("Green", Color::Green)
        .value("Blue", Color::Blue);

    Registry::add<Node>("Node")
        .member("name", &Node::name)
        .member("children", &Node::children);

    Registry::add<Shape>("Shape")
        .member("label", &Shape::label);
    Registry::add<Circle>("Circle")
        .base<Shape>()
        .member("radius", &Circle::radius);
    Registry::add<Square>("Square")
        .base<Shape>()
        .member("side", &Square::side);

    Registry::add<Person>("Person")
        .member("name", &Person::name, FieldFlags::Required)
        .member("age", &Person::age)
        .member("email", &Person::email)
        .member("favorite", &Person::favorite)
        .member("tags", &Person::tags)
        .member("scores", &Person::scores)
        .member("avatar", &Person::avatar)
        .member("born", &Person::born)
        .member("lucky", &Person::lucky)
        .member("history", &Person::history);

    Registry::add<Team>("Team")
        .member("title", &Team::title)
        .member("members", &Team::members)
        .member("palette", &Team::palette)
        .member("trees", &Team::trees);

    Registry::add<Holder>("Holder")
        .member("slot", &Holder::slot)
        .member("items", &Holder::items)
        .member("props", &Holder::props);

    Registry::add<Vector2>("Vector2");

    Registry::add<Money>("Money").cerealizer<MoneyCerealizer>();
    Registry::add<Temperature>("Temperature").cerealizer<TemperatureCerealizer>();
    Registry::add<Opaque>("Opaque").cerealizer<NoDefaultCerealizer>();
    Registry::add<Fragile>("Fragile").cerealizer<ThrowingCerealizer>();

    Registry::add<Broken>("Broken")
        .member("ok", &Broken::ok)
        .member("again", &Broken::again)
        .member("fragile", &Broken::fragile);

    Registry::add<Contended>("Contended")
        .member("id", &Contended::id)
        .member("next", &Contended::next)
        .member("colors", &Contended::colors);

    Registry::add<Tally>("Tally")
        .member("name", &Tally::name)
        .member("parts", &Tally::parts);
    Registry::add<Ledger>("Ledger")
        .member("rows", &Ledger::rows)
        .member("named", &Ledger::named)
        .member("loose", &Ledger::loose);
}

} // namespace test_types
