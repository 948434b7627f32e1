#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace ms::util {

inline std::string humanBytes(const uintmax_t bytes) {
    static constexpr std::array units = {"B", "KB", "MB", "GB", "TB"};
    auto value = static_cast<double>(bytes);
    for (const auto* unit : units) {
        if (value < 1024.0) return fmt::format("{:.1f} {}", value, unit);
        value /= 1024.0;
    }
    return fmt::format("{:.1f} PB", value);
}

// "1h 2m 3s", "4m 5s", "6s"
inline std::string humanDuration(const std::chrono::milliseconds d) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    const auto hours = total / 3600, minutes = (total % 3600) / 60, secs = total % 60;
    if (hours > 0) return fmt::format("{}h {}m {}s", hours, minutes, secs);
    if (minutes > 0) return fmt::format("{}m {}s", minutes, secs);
    return fmt::format("{}s", secs);
}

// "01:02:03"
inline std::string clockTime(const std::chrono::milliseconds d) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    return fmt::format("{:02}:{:02}:{:02}", total / 3600, (total % 3600) / 60, total % 60);
}

}
