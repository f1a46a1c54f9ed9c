#include "ConsumerConfig.h"
#include "core/ReflectSerializer.h"

namespace Switchboard {

bool ConsumerConfig::shouldLogReceived(const std::string& discriminator) const
{
    return logReceivedMessages && ignoredDiscriminatorsForLogging.count(discriminator) == 0;
}

bool ConsumerConfig::shouldLogSent(const std::string& discriminator) const
{
    return logSentMessages && ignoredDiscriminatorsForLogging.count(discriminator) == 0;
}

void from_json(const nlohmann::json& j, ConsumerConfig& cfg)
{
    cfg = ReflectSerializer::from_json<ConsumerConfig>(j);
    if (cfg.discriminatorField.empty()) {
        throw std::invalid_argument("discriminatorField must not be empty");
    }
}

void to_json(nlohmann::json& j, const ConsumerConfig& cfg)
{
    j = ReflectSerializer::to_json(cfg);
}

} // namespace Switchboard
