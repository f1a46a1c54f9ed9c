#pragma once

#include "dispatch/ConsumerConfig.h"
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace Switchboard {
namespace Sandbox {

struct SandboxConfig {
    uint16_t port = 8080;
    std::string bindAddress = "0.0.0.0";
    // Accepted ?token= values. Empty accepts any non-empty token.
    std::vector<std::string> tokens;
    std::vector<std::string> defaultRooms = { "lobby" };
    int jobStepMs = 250;
    ConsumerConfig chat;
    ConsumerConfig jobs;
};

void from_json(const nlohmann::json& j, SandboxConfig& cfg);
void to_json(nlohmann::json& j, const SandboxConfig& cfg);

} // namespace Sandbox
} // namespace Switchboard
