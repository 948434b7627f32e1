#include "probe/ProbeParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ms::probe;
using namespace ms::types;
using json = nlohmann::json;

namespace {

// ffprobe prints most numbers as strings ("1234.560000", "N/A")
std::optional<double> numberField(const json& obj, const char* key) {
    if (!obj.contains(key)) return std::nullopt;
    const auto& v = obj.at(key);
    if (v.is_number()) return v.get<double>();
    if (!v.is_string()) throw std::runtime_error(fmt::format("field '{}' is neither number nor string", key));

    const auto s = v.get<std::string>();
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    const double d = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(d)) return std::nullopt;
    return d;
}

std::optional<unsigned int> positiveInt(const json& obj, const char* key) {
    if (!obj.contains(key) || obj.at(key).is_null()) return std::nullopt;
    const auto v = obj.at(key).get<long long>();
    if (v <= 0) return std::nullopt;
    return static_cast<unsigned int>(v);
}

// Tags are free-form; a missing or odd tags block is treated as empty
std::optional<std::string> tag(const json& stream, const char* key) {
    const auto it = stream.find("tags");
    if (it == stream.end() || !it->is_object()) return std::nullopt;
    const auto t = it->find(key);
    if (t == it->end() || !t->is_string()) return std::nullopt;
    auto value = t->get<std::string>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::string codecName(const json& stream) {
    if (!stream.contains("codec_name")) return std::string(UNKNOWN_CODEC);
    return stream.at("codec_name").get<std::string>();
}

const json* arrayField(const json& root, const char* key) {
    if (!root.contains(key)) return nullptr;
    const auto& v = root.at(key);
    if (!v.is_array()) throw std::runtime_error(fmt::format("'{}' is not an array", key));
    return &v;
}

std::chrono::milliseconds fromSeconds(const double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

}

std::string ProbeParser::containerName(const std::string_view formatName) {
    if (formatName.empty()) return std::string(UNKNOWN_FORMAT);
    std::string out(formatName);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) {
        return c == ',' ? '/' : static_cast<char>(std::toupper(c));
    });
    return out;
}

std::optional<double> ProbeParser::frameRate(const std::string_view rational) {
    const auto slash = rational.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    const std::string num(rational.substr(0, slash)), den(rational.substr(slash + 1));
    char* end = nullptr;
    const double n = std::strtod(num.c_str(), &end);
    if (end == num.c_str()) return std::nullopt;
    const double d = std::strtod(den.c_str(), &end);
    if (end == den.c_str() || d == 0.0 || n <= 0.0) return std::nullopt;

    return std::round(n / d * 100.0) / 100.0;
}

Result<MediaInfo> ProbeParser::parse(const std::string_view text) {
    const auto root = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (root.is_discarded()) return Error{ErrorKind::ProbeError, "ffprobe output is not valid JSON"};
    if (!root.is_object()) return Error{ErrorKind::ProbeError, "ffprobe output is not a JSON object"};

    const auto fmtIt = root.find("format");
    if (fmtIt == root.end() || !fmtIt->is_object())
        return Error{ErrorKind::ProbeError, "ffprobe output has no format section"};

    try {
        MediaInfo info;
        info.provenance = Provenance::Probed;

        const auto& format = *fmtIt;
        if (format.contains("format_name"))
            info.container_format = containerName(format.at("format_name").get<std::string>());

        // Absent when the container keeps its index at the tail of the file
        if (const auto secs = numberField(format, "duration"); secs && *secs > 0)
            info.duration = fromSeconds(*secs);

        if (const auto bps = numberField(format, "bit_rate"); bps && *bps > 0)
            info.bitrate_kbps = static_cast<uint64_t>(*bps) / 1000;

        if (const auto* streams = arrayField(root, "streams")) {
            for (const auto& stream : *streams) {
                if (!stream.is_object()) return Error{ErrorKind::ProbeError, "stream entry is not an object"};
                if (!stream.contains("codec_type")) continue;

                const auto type = stream.at("codec_type").get<std::string>();
                if (type == "video" && !info.video) {
                    VideoInfo v;
                    v.codec = codecName(stream);
                    v.width = positiveInt(stream, "width");
                    v.height = positiveInt(stream, "height");
                    for (const auto* key : {"r_frame_rate", "avg_frame_rate"}) {
                        if (!stream.contains(key)) continue;
                        if ((v.frame_rate = frameRate(stream.at(key).get<std::string>()))) break;
                    }
                    info.video = std::move(v);
                } else if (type == "audio") {
                    AudioTrack a;
                    a.language = tag(stream, "language").value_or(std::string(UNKNOWN_LANGUAGE));
                    a.codec = codecName(stream);
                    a.channels = positiveInt(stream, "channels");
                    if (const auto hz = numberField(stream, "sample_rate"); hz && *hz > 0)
                        a.sample_rate_hz = static_cast<unsigned int>(*hz);
                    a.title = tag(stream, "title");
                    info.audio_tracks.push_back(std::move(a));
                } else if (type == "subtitle") {
                    SubtitleTrack s;
                    s.language = tag(stream, "language").value_or(std::string(UNKNOWN_LANGUAGE));
                    s.codec = codecName(stream);
                    s.title = tag(stream, "title");
                    info.subtitle_tracks.push_back(std::move(s));
                }
            }
        }

        if (const auto* chapters = arrayField(root, "chapters")) {
            info.chapter_count = chapters->size();
            for (size_t i = 0; i < chapters->size() && info.chapters.size() < MAX_DISPLAY_CHAPTERS; ++i) {
                const auto& c = chapters->at(i);
                if (!c.is_object()) return Error{ErrorKind::ProbeError, "chapter entry is not an object"};
                Chapter ch;
                ch.title = tag(c, "title").value_or(fmt::format("Chapter {}", i + 1));
                if (const auto start = numberField(c, "start_time"); start && *start > 0) ch.start = fromSeconds(*start);
                info.chapters.push_back(std::move(ch));
            }
        }

        return info;
    } catch (const std::exception& e) {
        return Error{ErrorKind::ProbeError, fmt::format("unexpected ffprobe output: {}", e.what())};
    }
}
