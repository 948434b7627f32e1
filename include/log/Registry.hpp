#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace ms::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> mediascope() { return get("mediascope"); }
    static std::shared_ptr<spdlog::logger> provision()  { return get("provision"); }
    static std::shared_ptr<spdlog::logger> fetch()      { return get("fetch"); }
    static std::shared_ptr<spdlog::logger> probe()      { return get("probe"); }
    static std::shared_ptr<spdlog::logger> cache()      { return get("cache"); }
    static std::shared_ptr<spdlog::logger> http()       { return get("http"); }
    static std::shared_ptr<spdlog::logger> service()    { return get("service"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    // stderr, so report output on stdout stays clean
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
