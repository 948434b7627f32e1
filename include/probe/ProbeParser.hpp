#pragma once

#include "types/Error.hpp"
#include "types/MediaInfo.hpp"

#include <string_view>

namespace ms::probe {

// Turns `ffprobe -print_format json -show_format -show_streams -show_chapters`
// output into a Probed MediaInfo. Anything structurally unexpected is a ProbeError.
class ProbeParser {
public:
    static types::Result<types::MediaInfo> parse(std::string_view json);

    // "MATROSKA/WEBM" from "matroska,webm"
    static std::string containerName(std::string_view formatName);

    // "24000/1001" -> 23.98; nullopt for "0/0" or garbage
    static std::optional<double> frameRate(std::string_view rational);
};

}
