#include "SandboxConfig.h"
#include "core/ReflectSerializer.h"
#include <stdexcept>

namespace Switchboard {
namespace Sandbox {

void from_json(const nlohmann::json& j, SandboxConfig& cfg)
{
    cfg = ReflectSerializer::from_json<SandboxConfig>(j);
    if (cfg.jobStepMs < 0) {
        throw std::invalid_argument("jobStepMs must not be negative");
    }
}

void to_json(nlohmann::json& j, const SandboxConfig& cfg)
{
    j = ReflectSerializer::to_json(cfg);
}

} // namespace Sandbox
} // namespace Switchboard
