#ifndef CEREAL_VALUE_H
#define CEREAL_VALUE_H

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/**
 * @brief Generic, format-neutral value tree produced and consumed by cerealizers.
 *
 * A CerealValue is one of: null, boolean, integer, floating, string, array or
 * object. Objects are string keyed; key order carries no meaning.
 */
class CerealValue {
public:
    enum class Kind : uint8_t {
        Null,
        Boolean,
        Integer,
        Floating,
        String,
        Array,
        Object,
    };

    using Array = std::vector<CerealValue>;
    using Object = std::map<std::string, CerealValue, std::less<>>;

    CerealValue() = default;
    CerealValue(std::nullptr_t) {}
    CerealValue(bool b) : storage_(b) {}
    CerealValue(double d) : storage_(d) {}
    CerealValue(float f) : storage_(static_cast<double>(f)) {}
    template <typename I>
    requires (std::is_integral_v<I> && !std::is_same_v<I, bool>)
    CerealValue(I i) : storage_(static_cast<int64_t>(i)) {}
    CerealValue(const char* s) : storage_(std::string(s)) {}
    CerealValue(std::string_view s) : storage_(std::string(s)) {}
    CerealValue(std::string s) : storage_(std::move(s)) {}
    CerealValue(Array a) : storage_(std::move(a)) {}
    CerealValue(Object o) : storage_(std::move(o)) {}

    static CerealValue array(std::initializer_list<CerealValue> items = {});
    static CerealValue object(std::initializer_list<std::pair<const std::string, CerealValue>> items = {});

    Kind kind() const { return static_cast<Kind>(storage_.index()); }
    static std::string_view kind_name(Kind kind);

    bool is_null() const { return kind() == Kind::Null; }
    bool is_bool() const { return kind() == Kind::Boolean; }
    bool is_int() const { return kind() == Kind::Integer; }
    bool is_double() const { return kind() == Kind::Floating; }
    bool is_number() const { return is_int() || is_double(); }
    bool is_string() const { return kind() == Kind::String; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_object() const { return kind() == Kind::Object; }

    // Accessors require the matching kind; see is_*().
    bool as_bool() const { return std::get<bool>(storage_); }
    int64_t as_int() const { return std::get<int64_t>(storage_); }
    double as_double() const { return std::get<double>(storage_); }
    const std::string& as_string() const { return std::get<std::string>(storage_); }
    const Array& as_array() const { return std::get<Array>(storage_); }
    const Object& as_object() const { return std::get<Object>(storage_); }

    // Non-const container accessors turn the value into an empty container
    // of that kind first when it holds something else.
    Array& as_array();
    Object& as_object();

    // Object member lookup; nullptr when not an object or key absent.
    const CerealValue* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }

    CerealValue& operator[](std::string_view key);
    void push_back(CerealValue v) { as_array().push_back(std::move(v)); }

    // Elements of an array or members of an object; 0 for scalars.
    size_t size() const;

    bool operator==(const CerealValue& other) const = default;

private:
    std::variant<std::monostate, bool, int64_t, double, std::string, Array, Object> storage_;
};

#endif
