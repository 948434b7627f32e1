#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ms::config {

constexpr static uintmax_t DEFAULT_HEAD_BYTES = 2 * 1024 * 1024;     // 2MB
constexpr static uintmax_t MIN_HEAD_BYTES = 1024;                    // 1KB
constexpr static uintmax_t DEFAULT_PROBE_OUTPUT_BYTES = 8 * 1024 * 1024; // 8MB

struct MediaInfoConfig {
    bool enabled = true;
    uintmax_t head_bytes = DEFAULT_HEAD_BYTES;
    uintmax_t min_head_bytes = MIN_HEAD_BYTES;
    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();
    std::chrono::seconds fetch_timeout = std::chrono::seconds(30);
    std::chrono::seconds cache_ttl = std::chrono::minutes(5);
    std::chrono::seconds reply_ttl = std::chrono::seconds(120);
    std::chrono::seconds failure_reply_ttl = std::chrono::seconds(30);
};

std::map<std::string, std::string> defaultDownloadUrls();

struct ProvisioningConfig {
    std::string system_command = "ffprobe";
    std::filesystem::path binary_dir = "bin";
    std::chrono::seconds version_timeout = std::chrono::seconds(5);
    std::chrono::seconds download_timeout = std::chrono::seconds(120);
    std::chrono::seconds download_retry_interval = std::chrono::minutes(10);
    std::map<std::string, std::string> download_urls = defaultDownloadUrls();
};

struct ProbeConfig {
    std::chrono::seconds timeout = std::chrono::seconds(15);
    uintmax_t max_output_bytes = DEFAULT_PROBE_OUTPUT_BYTES;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mediascope = spdlog::level::info;   // Startup, shutdown, request boundary
    spdlog::level::level_enum provision  = spdlog::level::info;   // Binary discovery and downloads
    spdlog::level::level_enum fetch      = spdlog::level::warn;   // Partial fetch failures
    spdlog::level::level_enum probe      = spdlog::level::warn;   // ffprobe failures and malformed output
    spdlog::level::level_enum cache      = spdlog::level::warn;
    spdlog::level::level_enum http       = spdlog::level::warn;   // Transport errors, non-2xx
    spdlog::level::level_enum service    = spdlog::level::info;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/mediascope";
    bool file_logging = false;
    LogLevelsConfig levels;
};

struct Config {
    MediaInfoConfig media_info;
    ProvisioningConfig provisioning;
    ProbeConfig probe;
    LoggingConfig logging;
};

Config loadConfig(const std::string& path);
void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const MediaInfoConfig& c);
void to_json(nlohmann::json& j, const ProvisioningConfig& c);
void to_json(nlohmann::json& j, const ProbeConfig& c);

} // namespace ms::config
