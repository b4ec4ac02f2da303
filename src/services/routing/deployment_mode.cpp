/// @file deployment_mode.cpp
/// @brief Deployment mode parsing and provider priority.

#include "pgw/service/deployment_mode.hpp"

#include <algorithm>
#include <cctype>

#include "pgw/foundation/gateway_logger.hpp"

namespace pgw::service {

DeploymentMode parseDeploymentMode(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto mode : {DeploymentMode::Cloud, DeploymentMode::Local, DeploymentMode::Hybrid}) {
        if (toString(mode) == lowered) {
            return mode;
        }
    }
    PGW_LOG_WARN(foundation::LogCategory::Config,
                 "unknown deployment mode '" + std::string(name) + "', using cloud");
    return DeploymentMode::Cloud;
}

std::vector<std::string> providerPriority(DeploymentMode mode) {
    std::vector<std::string> cloud = {"groq", "together", "openrouter", "huggingface"};
    switch (mode) {
        case DeploymentMode::Cloud:
            return cloud;
        case DeploymentMode::Local:
            return {"ollama"};
        case DeploymentMode::Hybrid:
            cloud.emplace_back("ollama");
            return cloud;
    }
    return cloud;
}

} // namespace pgw::service
