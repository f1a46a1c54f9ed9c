#pragma once

#include "Errors.h"
#include "HandlerBinding.h"
#include "HandlerContext.h"
#include "HandlerTable.h"
#include "MessageTraits.h"
#include "core/ReflectSerializer.h"
#include "core/Result.h"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace Switchboard {

struct HandlerOptions {
    // Overrides the discriminator derived from the input type.
    std::optional<std::string> discriminator;
    // Handler name metadata; defaults to handle_<discriminator>.
    std::optional<std::string> name;
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    // Documented outputs, for handlers that send or broadcast explicitly.
    std::vector<MessageType> outputs;
};

/**
 * @brief One handler as declared, before discriminators are resolved.
 *
 * onMessage/onEvent fill this from C++ types. Code that only knows its message
 * types at run time fills it directly: leave inputTypeName empty and the
 * discriminator falls back to the snake_case form of handlerName.
 */
struct HandlerDeclaration {
    Direction direction = Direction::Client;
    std::string handlerName;
    std::optional<std::string> discriminator;
    // Discriminator pinned by the input type itself (SWITCHBOARD_ACTION).
    std::optional<std::string> declaredAction;
    std::string inputTypeName;
    Shape inputShape;
    std::string inputDescription;
    // Output inferred from the handler's return type.
    std::optional<MessageType> inferredOutput;
    std::vector<MessageType> declaredOutputs;
    std::string summary;
    std::string description;
    std::vector<std::string> tags;
    Invoker invoker;
};

template <typename R>
struct HandlerReturn {
    static constexpr bool isVoid = false;
    static constexpr bool isOptional = false;
    static constexpr bool isRawJson = std::is_same_v<R, nlohmann::json>;
    using Message = R;
};

template <>
struct HandlerReturn<void> {
    static constexpr bool isVoid = true;
    static constexpr bool isOptional = false;
    static constexpr bool isRawJson = false;
    using Message = void;
};

template <typename R>
struct HandlerReturn<std::optional<R>> {
    static constexpr bool isVoid = false;
    static constexpr bool isOptional = true;
    static constexpr bool isRawJson = std::is_same_v<R, nlohmann::json>;
    using Message = R;
};

/**
 * @brief Startup-time builder of a consumer's HandlerTable.
 *
 * Declarations only accumulate; all checks happen in build(), which either
 * returns the immutable table or the first ConstructionError.
 *
 * Usage:
 *   SchemaRegistry registry;
 *   registry.onMessage<PingMessage>([](HandlerContext&, const PingMessage&) {
 *       return PongMessage{};
 *   });
 *   auto table = registry.build();
 */
class SchemaRegistry {
public:
    using BuildResult = Result<std::shared_ptr<const HandlerTable>, ConstructionError>;

    template <typename In, typename Fn>
    SchemaRegistry& onMessage(Fn handler, HandlerOptions options = {})
    {
        return declare(makeDeclaration<In>(Direction::Client, std::move(handler), std::move(options)));
    }

    template <typename In, typename Fn>
    SchemaRegistry& onEvent(Fn handler, HandlerOptions options = {})
    {
        return declare(makeDeclaration<In>(Direction::Event, std::move(handler), std::move(options)));
    }

    SchemaRegistry& declare(HandlerDeclaration declaration);

    const std::vector<HandlerDeclaration>& declarations() const { return declarations_; }

    BuildResult build() const;

private:
    template <typename In, typename Fn>
    static HandlerDeclaration makeDeclaration(Direction direction, Fn handler, HandlerOptions options);

    std::vector<HandlerDeclaration> declarations_;
};

template <typename In, typename Fn>
HandlerDeclaration SchemaRegistry::makeDeclaration(
    Direction direction, Fn handler, HandlerOptions options)
{
    static_assert(
        std::is_invocable_v<const Fn&, HandlerContext&, const In&>,
        "Handler must be callable as (HandlerContext&, const In&)");

    using R = std::invoke_result_t<const Fn&, HandlerContext&, const In&>;
    using Traits = HandlerReturn<R>;

    HandlerDeclaration declaration;
    declaration.direction = direction;
    declaration.handlerName = options.name.value_or("");
    declaration.discriminator = std::move(options.discriminator);
    declaration.declaredAction = declaredActionOf<In>();
    declaration.inputTypeName = typeNameOf<In>();
    declaration.inputShape = shapeOf<In>();
    declaration.inputDescription = descriptionOf<In>();
    declaration.declaredOutputs = std::move(options.outputs);
    declaration.summary = std::move(options.summary);
    declaration.description = std::move(options.description);
    declaration.tags = std::move(options.tags);

    if constexpr (!Traits::isVoid && !Traits::isRawJson) {
        declaration.inferredOutput = messageTypeOf<typename Traits::Message>();
    }

    declaration.invoker = [handler = std::move(handler)](
                              HandlerContext& context,
                              const nlohmann::json& message) -> std::optional<nlohmann::json> {
        const In input = decodeMessage<In>(message);

        if constexpr (Traits::isVoid) {
            handler(context, input);
            return std::nullopt;
        }
        else if constexpr (Traits::isOptional) {
            auto output = handler(context, input);
            if (!output.has_value()) {
                return std::nullopt;
            }
            if constexpr (Traits::isRawJson) {
                return std::move(output.value());
            }
            else {
                return encodeMessage(output.value(), context.discriminatorField());
            }
        }
        else if constexpr (Traits::isRawJson) {
            return handler(context, input);
        }
        else {
            return encodeMessage(handler(context, input), context.discriminatorField());
        }
    };

    return declaration;
}

} // namespace Switchboard
