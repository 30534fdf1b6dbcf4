#pragma once
#include <any>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

// Compile-time classification of the standard containers the cerealizers
// understand. Used by Registry::ensure<T>() to build TypeInfo for them.
namespace type_traits {

template <typename T> struct is_vector : std::false_type {};
template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T> struct is_std_array : std::false_type {};
template <typename T, size_t N> struct is_std_array<std::array<T, N>> : std::true_type {};

template <typename T> struct is_list_like : std::false_type {};
template <typename T, typename A> struct is_list_like<std::list<T, A>> : std::true_type {};
template <typename T, typename A> struct is_list_like<std::deque<T, A>> : std::true_type {};

template <typename T> struct is_set : std::false_type {};
template <typename T, typename C, typename A> struct is_set<std::set<T, C, A>> : std::true_type {};

template <typename T> struct is_string_map : std::false_type {};
template <typename V, typename C, typename A>
struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};
template <typename V, typename H, typename E, typename A>
struct is_string_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};

template <typename T, typename = void> struct value_type_of { using type = void; };
template <typename T> struct value_type_of<T, std::void_t<typename T::value_type>> { using type = typename T::value_type; };

template <typename T>
constexpr bool holds_any_v = std::is_same_v<typename value_type_of<T>::type, std::any>;

template <typename T>
constexpr bool is_byte_array_v = std::is_same_v<T, std::vector<std::uint8_t>>;

template <typename T>
constexpr bool is_array_v = (is_vector<T>::value || is_std_array<T>::value)
    && !is_byte_array_v<T>
    && !holds_any_v<T>;

// A std::vector<std::any> holds elements of any type, which makes it a
// collection rather than a typed array.
template <typename T>
constexpr bool is_collection_v = is_list_like<T>::value || is_set<T>::value
    || (is_vector<T>::value && holds_any_v<T>);

template <typename T>
constexpr bool is_map_v = is_string_map<T>::value;

using TimePoint = std::chrono::system_clock::time_point;

} // namespace type_traits
