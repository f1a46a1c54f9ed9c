#pragma once

#include <nlohmann/json.hpp>
#include <set>
#include <string>

namespace Switchboard {

/**
 * @brief Per connection-class options. One instance per Consumer, fixed at startup.
 */
struct ConsumerConfig {
    // Emit complete / group_complete markers after each unit of work.
    bool completionSignalsEnabled = false;
    std::string discriminatorField = "action";
    std::set<std::string> ignoredDiscriminatorsForLogging;
    // Send an "authentication" message with the auth outcome on connect.
    bool sendAuthenticationMessage = false;
    bool logReceivedMessages = true;
    bool logSentMessages = true;
    // Deliver an error message to the connection when a unicast event fails to route.
    bool reportEventRoutingErrors = false;

    bool shouldLogReceived(const std::string& discriminator) const;
    bool shouldLogSent(const std::string& discriminator) const;
};

void from_json(const nlohmann::json& j, ConsumerConfig& cfg);
void to_json(nlohmann::json& j, const ConsumerConfig& cfg);

} // namespace Switchboard
