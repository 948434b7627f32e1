#pragma once

#include <cstdlib>
#include <filesystem>

namespace ms::paths {

constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/mediascope/config.yaml";
constexpr const auto* CONFIG_ENV_VAR = "MEDIASCOPE_CONFIG";

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv(CONFIG_ENV_VAR); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

}
