#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ms::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<MediaInfoConfig> {
    static Node encode(const MediaInfoConfig& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["head_bytes_mb"] = rhs.head_bytes / (1024 * 1024);
        node["min_head_bytes"] = rhs.min_head_bytes;
        node["temp_dir"] = rhs.temp_dir.string();
        node["fetch_timeout_seconds"] = rhs.fetch_timeout.count();
        node["cache_ttl_seconds"] = rhs.cache_ttl.count();
        node["reply_ttl_seconds"] = rhs.reply_ttl.count();
        node["failure_reply_ttl_seconds"] = rhs.failure_reply_ttl.count();
        return node;
    }

    static bool decode(const Node& node, MediaInfoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.enabled = node["enabled"].as<bool>(true);
        rhs.head_bytes = node["head_bytes_mb"].as<uintmax_t>(2) * 1024 * 1024; // Default 2MB
        rhs.min_head_bytes = node["min_head_bytes"].as<uintmax_t>(MIN_HEAD_BYTES);
        rhs.temp_dir = node["temp_dir"].as<std::string>(std::filesystem::temp_directory_path().string());
        rhs.fetch_timeout = std::chrono::seconds(node["fetch_timeout_seconds"].as<unsigned int>(30));
        rhs.cache_ttl = std::chrono::seconds(node["cache_ttl_seconds"].as<unsigned int>(300));
        rhs.reply_ttl = std::chrono::seconds(node["reply_ttl_seconds"].as<unsigned int>(120));
        rhs.failure_reply_ttl = std::chrono::seconds(node["failure_reply_ttl_seconds"].as<unsigned int>(30));
        return true;
    }
};

template<>
struct convert<ProvisioningConfig> {
    static Node encode(const ProvisioningConfig& rhs) {
        Node node;
        node["system_command"] = rhs.system_command;
        node["binary_dir"] = rhs.binary_dir.string();
        node["version_timeout_seconds"] = rhs.version_timeout.count();
        node["download_timeout_seconds"] = rhs.download_timeout.count();
        node["download_retry_interval_seconds"] = rhs.download_retry_interval.count();
        node["download_urls"] = rhs.download_urls;
        return node;
    }

    static bool decode(const Node& node, ProvisioningConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.system_command = node["system_command"].as<std::string>("ffprobe");
        rhs.binary_dir = node["binary_dir"].as<std::string>("bin");
        rhs.version_timeout = std::chrono::seconds(node["version_timeout_seconds"].as<unsigned int>(5));
        rhs.download_timeout = std::chrono::seconds(node["download_timeout_seconds"].as<unsigned int>(120));
        rhs.download_retry_interval = std::chrono::seconds(node["download_retry_interval_seconds"].as<unsigned int>(600));
        // Entries given in the file override the built-in table per platform key
        if (const auto urls = node["download_urls"]; urls && urls.IsMap())
            for (const auto& kv : urls) rhs.download_urls[kv.first.as<std::string>()] = kv.second.as<std::string>();
        return true;
    }
};

template<>
struct convert<ProbeConfig> {
    static Node encode(const ProbeConfig& rhs) {
        Node node;
        node["timeout_seconds"] = rhs.timeout.count();
        node["max_output_mb"] = rhs.max_output_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, ProbeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.timeout = std::chrono::seconds(node["timeout_seconds"].as<unsigned int>(15));
        rhs.max_output_bytes = node["max_output_mb"].as<uintmax_t>(8) * 1024 * 1024; // Default 8MB
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mediascope"] = to_std_string(spdlog::level::to_string_view(rhs.mediascope));
        node["provision"]  = to_std_string(spdlog::level::to_string_view(rhs.provision));
        node["fetch"]      = to_std_string(spdlog::level::to_string_view(rhs.fetch));
        node["probe"]      = to_std_string(spdlog::level::to_string_view(rhs.probe));
        node["cache"]      = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["http"]       = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["service"]    = to_std_string(spdlog::level::to_string_view(rhs.service));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mediascope = spdlog::level::from_str(node["mediascope"].as<std::string>("info"));
        rhs.provision = spdlog::level::from_str(node["provision"].as<std::string>("info"));
        rhs.fetch = spdlog::level::from_str(node["fetch"].as<std::string>("warn"));
        rhs.probe = spdlog::level::from_str(node["probe"].as<std::string>("warn"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.service = spdlog::level::from_str(node["service"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["file_logging"] = rhs.file_logging;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/mediascope");
        rhs.file_logging = node["file_logging"].as<bool>(false);
        if (const auto levels = node["log_levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
