#pragma once

#include "types/MediaInfo.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ms::heuristic {

struct Resolution {
    unsigned int width, height;
};

// Best-effort MediaInfo from the file name alone. Only what the name actually says
// is filled in; duration, bitrate, codecs and frame rate stay unavailable.
class HeuristicEngine {
public:
    static types::MediaInfo infer(std::string_view fileName, uintmax_t sizeBytes,
                                  std::optional<std::string_view> mimeHint = std::nullopt);

    // Lowercased alphanumeric runs: "The.Avengers.720p" -> {"the", "avengers", "720p"}
    static std::vector<std::string> tokenize(std::string_view fileName);

    static std::string containerFromExtension(std::string_view fileName);
    static std::string containerFromMime(std::string_view mime);
    static std::optional<Resolution> resolutionFrom(const std::vector<std::string>& tokens);
    // Language tokens after the first year, resolution or SxxEyy token; bare three-letter
    // codes are ignored when no such marker exists
    static std::vector<std::string> languagesFrom(const std::vector<std::string>& tokens);
};

}
