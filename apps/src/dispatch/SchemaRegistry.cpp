#include "SchemaRegistry.h"
#include "core/LoggingChannels.h"
#include "core/StringCase.h"

namespace Switchboard {

namespace {

SchemaRegistry::BuildResult fail(
    ConstructionError::Kind kind, const std::string& discriminator, std::string message)
{
    LOG_ERROR(Registry, "{} for '{}': {}", toString(kind), discriminator, message);
    return SchemaRegistry::BuildResult::error(
        ConstructionError{ kind, discriminator, std::move(message) });
}

std::string displayName(const HandlerDeclaration& declaration)
{
    if (!declaration.handlerName.empty()) {
        return declaration.handlerName;
    }
    if (!declaration.inputTypeName.empty()) {
        return "handler for " + declaration.inputTypeName;
    }
    return "unnamed handler";
}

} // namespace

SchemaRegistry& SchemaRegistry::declare(HandlerDeclaration declaration)
{
    declarations_.push_back(std::move(declaration));
    return *this;
}

SchemaRegistry::BuildResult SchemaRegistry::build() const
{
    std::vector<HandlerBinding> bindings;
    bindings.reserve(declarations_.size());
    DiscriminatedUnion clientUnion("ClientMessage");
    DiscriminatedUnion eventUnion("EventMessage");

    for (const auto& declaration : declarations_) {
        const std::string name = displayName(declaration);

        std::string discriminator;
        if (declaration.discriminator.has_value()) {
            discriminator = declaration.discriminator.value();
            if (declaration.declaredAction.has_value()
                && declaration.declaredAction.value() != discriminator) {
                return fail(
                    ConstructionError::Kind::InputTypeMismatch,
                    discriminator,
                    name + " overrides the discriminator of " + declaration.inputTypeName
                        + ", which is fixed to '" + declaration.declaredAction.value() + "'");
            }
        }
        else if (declaration.declaredAction.has_value()) {
            discriminator = declaration.declaredAction.value();
        }
        else if (!declaration.inputTypeName.empty()) {
            discriminator = toSnakeCase(declaration.inputTypeName);
        }
        else {
            discriminator = toSnakeCase(declaration.handlerName);
        }

        if (discriminator.empty()) {
            return fail(
                ConstructionError::Kind::InvalidDiscriminator,
                discriminator,
                name + " resolves to an empty discriminator");
        }

        if (!declaration.invoker) {
            return fail(
                ConstructionError::Kind::InvalidDiscriminator,
                discriminator,
                name + " has no handler function");
        }

        std::vector<MessageType> outputs = declaration.declaredOutputs;
        if (declaration.inferredOutput.has_value()) {
            const MessageType& inferred = declaration.inferredOutput.value();
            if (outputs.empty()) {
                outputs.push_back(inferred);
            }
            else {
                bool found = false;
                for (const auto& output : outputs) {
                    if (output.discriminator == inferred.discriminator) {
                        if (output.shape != inferred.shape) {
                            return fail(
                                ConstructionError::Kind::OutputTypeMismatch,
                                discriminator,
                                name + " declares output '" + output.discriminator
                                    + "' with a shape different from its return type "
                                    + inferred.typeName);
                        }
                        found = true;
                    }
                }
                if (!found) {
                    return fail(
                        ConstructionError::Kind::OutputTypeMismatch,
                        discriminator,
                        name + " returns " + inferred.typeName + " ('" + inferred.discriminator
                            + "') which its declared outputs do not include");
                }
            }
        }

        MessageType input{
            discriminator,
            declaration.inputShape,
            declaration.inputTypeName,
            declaration.inputDescription,
        };

        auto& targetUnion =
            declaration.direction == Direction::Client ? clientUnion : eventUnion;
        if (!targetUnion.add(input)) {
            return fail(
                ConstructionError::Kind::DuplicateDiscriminator,
                discriminator,
                std::string("'") + discriminator + "' is already handled in the "
                    + toString(declaration.direction) + " direction");
        }

        HandlerBinding binding;
        binding.discriminator = discriminator;
        binding.direction = declaration.direction;
        binding.invoker = declaration.invoker;
        binding.input = std::move(input);
        binding.outputs = std::move(outputs);
        binding.metadata = HandlerMetadata{
            declaration.handlerName.empty() ? "handle_" + discriminator : declaration.handlerName,
            declaration.summary,
            declaration.description,
            declaration.tags,
        };
        bindings.push_back(std::move(binding));
    }

    LOG_DEBUG(
        Registry,
        "Handler table built: {} client, {} event handlers",
        clientUnion.size(),
        eventUnion.size());

    return BuildResult::okay(std::shared_ptr<const HandlerTable>(
        new HandlerTable(std::move(bindings), std::move(clientUnion), std::move(eventUnion))));
}

} // namespace Switchboard
