#pragma once

#include "DiscriminatedUnion.h"
#include "HandlerBinding.h"
#include <map>
#include <string>
#include <vector>

namespace Switchboard {

class SchemaRegistry;

/**
 * @brief Immutable discriminator -> binding lookup for one consumer.
 *
 * Only SchemaRegistry::build() creates tables. Once built a table is shared by
 * every connection of the consumer and read without locking.
 */
class HandlerTable {
public:
    const HandlerBinding* find(Direction direction, const std::string& discriminator) const;

    const DiscriminatedUnion& unionFor(Direction direction) const;
    const DiscriminatedUnion& clientUnion() const { return clientUnion_; }
    const DiscriminatedUnion& eventUnion() const { return eventUnion_; }

    const std::vector<HandlerBinding>& bindings() const { return bindings_; }
    size_t size() const { return bindings_.size(); }

private:
    friend class SchemaRegistry;

    HandlerTable(
        std::vector<HandlerBinding> bindings,
        DiscriminatedUnion clientUnion,
        DiscriminatedUnion eventUnion);

    std::vector<HandlerBinding> bindings_;
    DiscriminatedUnion clientUnion_;
    DiscriminatedUnion eventUnion_;
    std::map<std::string, size_t> clientIndex_;
    std::map<std::string, size_t> eventIndex_;
};

} // namespace Switchboard
