#pragma once

#include "MessageType.h"
#include "ShapeOf.h"
#include "core/ReflectSerializer.h"
#include "core/StringCase.h"

#include <concepts>
#include <nlohmann/json.hpp>
#include <optional>
#include <reflect>
#include <string>
#include <string_view>

/**
 * @brief Pin the wire discriminator of a message struct.
 *
 * Usage:
 *   struct ChatMessage {
 *       SWITCHBOARD_ACTION("chat");
 *       ChatPayload payload;
 *   };
 * Without it the discriminator is the snake_case form of the type name.
 */
#define SWITCHBOARD_ACTION(Name) static constexpr std::string_view action = Name

/**
 * @brief Attach a human-readable description to a message type.
 */
#define SWITCHBOARD_DESCRIPTION(Text) static constexpr std::string_view description = Text

namespace Switchboard {

template <typename T>
concept HasAction = requires {
    { T::action } -> std::convertible_to<std::string_view>;
};

template <typename T>
concept HasDescription = requires {
    { T::description } -> std::convertible_to<std::string_view>;
};

template <typename T>
std::string typeNameOf()
{
    return std::string(reflect::type_name<T>());
}

template <typename T>
std::optional<std::string> declaredActionOf()
{
    if constexpr (HasAction<T>) {
        return std::string(T::action);
    }
    else {
        return std::nullopt;
    }
}

template <typename T>
std::string discriminatorOf()
{
    if constexpr (HasAction<T>) {
        return std::string(T::action);
    }
    else {
        return toSnakeCase(typeNameOf<T>());
    }
}

template <typename T>
std::string descriptionOf()
{
    if constexpr (HasDescription<T>) {
        return std::string(T::description);
    }
    else {
        return "";
    }
}

template <typename T>
MessageType messageTypeOf()
{
    return MessageType{ discriminatorOf<T>(), shapeOf<T>(), typeNameOf<T>(), descriptionOf<T>() };
}

/**
 * @brief Message struct to wire JSON: its members plus the discriminator field.
 */
template <typename T>
nlohmann::json encodeMessage(const T& message, const std::string& discriminatorField)
{
    nlohmann::json j = ReflectSerializer::to_json(message);
    j[discriminatorField] = discriminatorOf<T>();
    return j;
}

/**
 * @brief Wire JSON to message struct. Expects input that already passed validation.
 */
template <typename T>
T decodeMessage(const nlohmann::json& j)
{
    return ReflectSerializer::from_json<T>(j);
}

} // namespace Switchboard
