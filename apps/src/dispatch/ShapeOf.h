#pragma once

#include "Shape.h"
#include "core/ReflectSerializer.h"

#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <reflect>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace Switchboard {

/**
 * @brief Types may publish their own shape with `static Shape shape();`.
 */
template <typename T>
concept HasShapeOverride = requires {
    { T::shape() } -> std::convertible_to<Shape>;
};

template <typename T>
struct is_string_map : std::false_type {};
template <typename V, typename C, typename A>
struct is_string_map<std::map<std::string, V, C, A>> : std::true_type {};
template <typename V, typename H, typename E, typename A>
struct is_string_map<std::unordered_map<std::string, V, H, E, A>> : std::true_type {};

template <typename T>
inline constexpr bool always_false_v = false;

/**
 * @brief Derives the payload Shape of a C++ type.
 *
 * Aggregates become objects with one field per member (std::optional members
 * are nullable and not required); vectors become arrays; enums become string
 * enums of their enumerator names; nlohmann::json accepts anything.
 */
template <typename T>
Shape shapeOf()
{
    using U = std::remove_cvref_t<T>;

    if constexpr (HasShapeOverride<U>) {
        return U::shape();
    }
    else if constexpr (std::is_same_v<U, nlohmann::json>) {
        return Shape::any();
    }
    else if constexpr (std::is_same_v<U, bool>) {
        return Shape::boolean();
    }
    else if constexpr (std::is_integral_v<U>) {
        return Shape::integer(
            static_cast<std::int64_t>(std::numeric_limits<U>::min()),
            static_cast<std::uint64_t>(std::numeric_limits<U>::max()));
    }
    else if constexpr (std::is_floating_point_v<U>) {
        return Shape::number();
    }
    else if constexpr (std::is_same_v<U, std::string>) {
        return Shape::string();
    }
    else if constexpr (ReflectSerializer::is_optional_v<U>) {
        return Shape::nullable(shapeOf<typename U::value_type>());
    }
    else if constexpr (ReflectSerializer::is_vector_v<U>) {
        return Shape::array(shapeOf<typename U::value_type>());
    }
    else if constexpr (is_string_map<U>::value) {
        return Shape::object({});
    }
    else if constexpr (std::is_enum_v<U>) {
        std::vector<std::string> names;
        for (const auto& [value, name] : reflect::enumerators<U>) {
            names.emplace_back(name);
        }
        return Shape::enumOf(std::move(names));
    }
    else if constexpr (std::is_class_v<U> && std::is_aggregate_v<U>) {
        std::vector<ShapeField> fields;
        const U sample{};
        reflect::for_each(
            [&](auto I) {
                using MemberType = std::remove_cvref_t<decltype(reflect::get<I>(sample))>;
                fields.push_back(ShapeField{
                    std::string(reflect::member_name<I>(sample)),
                    shapeOf<MemberType>(),
                    !ReflectSerializer::is_optional_v<MemberType>,
                });
            },
            sample);
        return Shape::object(std::move(fields));
    }
    else {
        static_assert(always_false_v<U>, "No shape derivation for this type");
    }
}

} // namespace Switchboard
