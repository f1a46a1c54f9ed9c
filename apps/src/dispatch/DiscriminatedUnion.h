#pragma once

#include "MessageType.h"
#include "ValidationIssue.h"
#include "core/Result.h"
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Switchboard {

/**
 * @brief Validator over a set of message types keyed by discriminator value.
 *
 * Built once by the SchemaRegistry and shared read-only afterwards.
 */
class DiscriminatedUnion {
public:
    explicit DiscriminatedUnion(std::string name = "message");

    // Returns false when the discriminator is already taken.
    bool add(MessageType type);

    const MessageType* find(const std::string& discriminator) const;
    bool contains(const std::string& discriminator) const;

    std::vector<std::string> discriminators() const;
    size_t size() const { return types_.size(); }
    bool empty() const { return types_.empty(); }

    const std::string& name() const { return name_; }

    /**
     * @brief Resolves and structurally validates one wire message.
     *
     * The discriminator field itself is excluded from the structural check.
     * On failure every issue found is returned.
     */
    Result<const MessageType*, std::vector<ValidationIssue>> validate(
        const nlohmann::json& message, const std::string& discriminatorField) const;

private:
    std::string name_;
    std::map<std::string, MessageType> types_;
};

} // namespace Switchboard
