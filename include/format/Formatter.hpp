#pragma once

#include "types/MediaInfo.hpp"

#include <string>
#include <string_view>

namespace ms::format {

inline constexpr std::string_view NOT_AVAILABLE = "Not Available - richer analysis requires ffprobe";
inline constexpr std::string_view UNKNOWN = "Unknown";
inline constexpr std::string_view HEURISTIC_NOTE =
    "Note: ffprobe could not analyse this file, details were inferred from its name.";

// Plain-text report for one file. Heuristic results say what is missing instead of
// dropping the line, probed results print Unknown for anything ffprobe left out.
class Formatter {
public:
    static std::string render(const types::MediaInfo& info, std::string_view displayName);
};

}
