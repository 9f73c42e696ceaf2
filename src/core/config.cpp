#include "daicgate/core/config.hpp"
#include "daicgate/core/logger.hpp"

#include <algorithm>
#include <fstream>

namespace daicgate {

auto BlockedActions::is_tool_blocked(std::string_view tool) const -> bool {
    return std::find(implementation_only_tools.begin(), implementation_only_tools.end(), tool)
        != implementation_only_tools.end();
}

auto PolicyConfig::implementation_phrases(std::size_t count) const -> std::string {
    std::string joined;
    const auto& phrases = trigger_phrases.implementation_mode;
    for (std::size_t i = 0; i < phrases.size() && i < count; ++i) {
        if (i > 0) joined += ", ";
        joined += phrases[i];
    }
    return joined;
}

auto load_policy_config(const std::filesystem::path& path) -> Result<PolicyConfig> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG("Config file not found: {}, using defaults", path.string());
        return default_policy_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Cannot open config file", path.string()));
    }

    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Config root must be a JSON object", path.string()));
        }

        auto config = j.get<PolicyConfig>();
        if (config.features.git_timeout_ms <= 0) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "features.git_timeout_ms must be positive",
                std::to_string(config.features.git_timeout_ms)));
        }
        return config;
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Failed to parse config " + path.string(), e.what()));
    }
}

auto default_policy_config() -> PolicyConfig {
    return PolicyConfig{};
}

} // namespace daicgate
