#pragma once

#include <reflect>

#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ReflectSerializerAdl {

struct JsonAdapter {
    nlohmann::json& json;
    operator nlohmann::json&() const { return json; }
};

struct ConstJsonAdapter {
    const nlohmann::json& json;
    operator const nlohmann::json&() const { return json; }
};

template <typename T>
auto test_to_json(int)
    -> decltype(to_json(JsonAdapter{ std::declval<nlohmann::json&>() }, std::declval<const T&>()), std::true_type{});

template <typename T>
std::false_type test_to_json(...);

template <typename T>
inline constexpr bool has_adl_to_json_v = decltype(test_to_json<T>(0))::value;

template <typename T>
auto test_from_json(int)
    -> decltype(from_json(ConstJsonAdapter{ std::declval<const nlohmann::json&>() }, std::declval<T&>()), std::true_type{});

template <typename T>
std::false_type test_from_json(...);

template <typename T>
inline constexpr bool has_adl_from_json_v = decltype(test_from_json<T>(0))::value;

template <typename T>
void call_to_json(nlohmann::json& j, const T& value)
{
    to_json(JsonAdapter{ j }, value);
}

template <typename T>
void call_from_json(const nlohmann::json& j, T& value)
{
    from_json(ConstJsonAdapter{ j }, value);
}

} // namespace ReflectSerializerAdl

/**
 * Generic reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json for JSON
 * generation. Nested aggregates, std::vector, std::optional and enums are
 * handled recursively; a type with its own ADL to_json/from_json keeps it.
 *
 * Example:
 *   struct ChatPayload { std::string text; std::optional<std::string> room; };
 *   struct ChatMessage { ChatPayload payload; };
 *   auto j = ReflectSerializer::to_json(ChatMessage{ { "hi", std::nullopt } });
 *   // j == {"payload": {"text": "hi"}}
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};
template <typename T>
inline constexpr bool is_vector_v = is_vector<T>::value;

// Aggregates that are walked member by member.
template <typename T>
inline constexpr bool is_reflectable_v = std::is_class_v<T> && std::is_aggregate_v<T>
    && !std::is_same_v<T, nlohmann::json> && !is_vector_v<T>
    && !ReflectSerializerAdl::has_adl_to_json_v<T>;

template <typename T>
nlohmann::json to_json(const T& obj);

template <typename T>
T from_json(const nlohmann::json& j);

template <typename E>
std::string enumToString(E value)
{
    return std::string(reflect::enum_name(value));
}

template <typename E>
E enumFromString(const std::string& str)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
        if (enumName == str) {
            return static_cast<E>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

// Reads an integer, throwing std::out_of_range instead of wrapping.
template <typename T>
T integerFromJson(const nlohmann::json& j)
{
    using Limits = std::numeric_limits<T>;

    bool fits = true;
    if (j.is_number_unsigned()) {
        fits = j.get<uint64_t>() <= static_cast<uint64_t>(Limits::max());
    }
    else if (j.is_number_integer()) {
        const int64_t v = j.get<int64_t>();
        fits = v >= static_cast<int64_t>(Limits::min())
            && (v < 0 || static_cast<uint64_t>(v) <= static_cast<uint64_t>(Limits::max()));
    }
    else if (j.is_number_float()) {
        const double d = j.get<double>();
        fits = std::isfinite(d) && std::floor(d) == d && d >= static_cast<double>(Limits::min())
            && d < static_cast<double>(Limits::max()) + 1.0;
    }
    if (!fits) {
        throw std::out_of_range("Integer out of range: " + j.dump());
    }
    return j.get<T>();
}

template <typename T>
nlohmann::json valueToJson(const T& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_to_json_v<T>) {
        nlohmann::json j;
        ReflectSerializerAdl::call_to_json(j, value);
        return j;
    }
    else if constexpr (is_optional_v<T>) {
        if (!value.has_value()) {
            return nullptr;
        }
        return valueToJson(*value);
    }
    else if constexpr (is_vector_v<T>) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : value) {
            array.push_back(valueToJson(item));
        }
        return array;
    }
    else if constexpr (std::is_enum_v<T>) {
        return enumToString(value);
    }
    else if constexpr (is_reflectable_v<T>) {
        return to_json(value);
    }
    else {
        return nlohmann::json(value);
    }
}

template <typename T>
void valueFromJson(const nlohmann::json& j, T& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_from_json_v<T>) {
        ReflectSerializerAdl::call_from_json(j, value);
    }
    else if constexpr (is_optional_v<T>) {
        if (j.is_null()) {
            value.reset();
            return;
        }
        typename T::value_type inner{};
        valueFromJson(j, inner);
        value = std::move(inner);
    }
    else if constexpr (is_vector_v<T>) {
        value.clear();
        for (const auto& item : j) {
            typename T::value_type element{};
            valueFromJson(item, element);
            value.push_back(std::move(element));
        }
    }
    else if constexpr (std::is_enum_v<T>) {
        value = enumFromString<T>(j.get<std::string>());
    }
    else if constexpr (is_reflectable_v<T>) {
        value = from_json<T>(j);
    }
    else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        value = integerFromJson<T>(j);
    }
    else {
        value = j.get<T>();
    }
}

/**
 * Serialize any aggregate type to nlohmann::json. Empty optionals are omitted.
 */
template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    j[name] = valueToJson(*value);
                }
            }
            else {
                j[name] = valueToJson(value);
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json to any aggregate type. Absent members keep their
 * default values.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    return;
                }
            }
            valueFromJson(j[name], reflect::get<I>(obj));
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
