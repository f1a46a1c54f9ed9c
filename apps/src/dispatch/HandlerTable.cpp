#include "HandlerTable.h"

namespace Switchboard {

const char* toString(Direction direction)
{
    switch (direction) {
        case Direction::Client:
            return "client";
        case Direction::Event:
            return "event";
    }
    return "unknown";
}

HandlerTable::HandlerTable(
    std::vector<HandlerBinding> bindings,
    DiscriminatedUnion clientUnion,
    DiscriminatedUnion eventUnion)
    : bindings_(std::move(bindings)),
      clientUnion_(std::move(clientUnion)),
      eventUnion_(std::move(eventUnion))
{
    for (size_t i = 0; i < bindings_.size(); ++i) {
        auto& index = bindings_[i].direction == Direction::Client ? clientIndex_ : eventIndex_;
        index.emplace(bindings_[i].discriminator, i);
    }
}

const HandlerBinding* HandlerTable::find(Direction direction, const std::string& discriminator) const
{
    const auto& index = direction == Direction::Client ? clientIndex_ : eventIndex_;
    auto it = index.find(discriminator);
    if (it == index.end()) {
        return nullptr;
    }
    return &bindings_[it->second];
}

const DiscriminatedUnion& HandlerTable::unionFor(Direction direction) const
{
    return direction == Direction::Client ? clientUnion_ : eventUnion_;
}

} // namespace Switchboard
