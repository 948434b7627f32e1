#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ms::config {

std::map<std::string, std::string> defaultDownloadUrls() {
    static const std::string base = "https://github.com/eugeneware/ffmpeg-static/releases/download/b6.0/";
    return {
        {"linux_x86_64",  base + "ffprobe-linux-x64"},
        {"linux_arm64",   base + "ffprobe-linux-arm64"},
        {"darwin_x86_64", base + "ffprobe-darwin-x64"},
        {"darwin_arm64",  base + "ffprobe-darwin-arm64"}
    };
}

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["media_info"]) YAML::convert<MediaInfoConfig>::decode(node, cfg.media_info);
    if (auto node = root["provisioning"]) YAML::convert<ProvisioningConfig>::decode(node, cfg.provisioning);
    if (auto node = root["probe"]) YAML::convert<ProbeConfig>::decode(node, cfg.probe);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"media_info", c.media_info},
        {"provisioning", c.provisioning},
        {"probe", c.probe}
    };
}

void to_json(nlohmann::json& j, const MediaInfoConfig& c) {
    j = {
        {"enabled", c.enabled},
        {"head_bytes", c.head_bytes},
        {"min_head_bytes", c.min_head_bytes},
        {"temp_dir", c.temp_dir.string()},
        {"fetch_timeout_seconds", c.fetch_timeout.count()},
        {"cache_ttl_seconds", c.cache_ttl.count()},
        {"reply_ttl_seconds", c.reply_ttl.count()},
        {"failure_reply_ttl_seconds", c.failure_reply_ttl.count()}
    };
}

void to_json(nlohmann::json& j, const ProvisioningConfig& c) {
    j = {
        {"system_command", c.system_command},
        {"binary_dir", c.binary_dir.string()},
        {"version_timeout_seconds", c.version_timeout.count()},
        {"download_timeout_seconds", c.download_timeout.count()},
        {"download_retry_interval_seconds", c.download_retry_interval.count()},
        {"download_urls", c.download_urls}
    };
}

void to_json(nlohmann::json& j, const ProbeConfig& c) {
    j = {
        {"timeout_seconds", c.timeout.count()},
        {"max_output_bytes", c.max_output_bytes}
    };
}

} // namespace ms::config
