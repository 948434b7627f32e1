#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace ms::types {

// Marker for streams the tool (or the filename) gives no language for.
inline constexpr std::string_view UNKNOWN_LANGUAGE = "und";
inline constexpr std::string_view UNKNOWN_CODEC = "Unknown";
inline constexpr std::string_view UNKNOWN_FORMAT = "Unknown";

// Chapters kept for display; the true count lives in MediaInfo::chapter_count.
inline constexpr size_t MAX_DISPLAY_CHAPTERS = 5;

enum class Provenance { Probed, Heuristic };

struct VideoInfo {
    std::optional<std::string> codec;
    std::optional<unsigned int> width, height;
    std::optional<double> frame_rate;
};

struct AudioTrack {
    std::string language{UNKNOWN_LANGUAGE};
    std::string codec{UNKNOWN_CODEC};
    std::optional<unsigned int> channels;
    std::optional<unsigned int> sample_rate_hz;
    std::optional<std::string> title;
};

struct SubtitleTrack {
    std::string language{UNKNOWN_LANGUAGE};
    std::string codec{UNKNOWN_CODEC};
    std::optional<std::string> title;
};

struct Chapter {
    std::string title;
    std::chrono::milliseconds start{0};
};

struct MediaInfo {
    Provenance provenance = Provenance::Heuristic;
    std::string container_format{UNKNOWN_FORMAT};
    std::optional<std::chrono::milliseconds> duration;
    uintmax_t size_bytes = 0;
    std::optional<uint64_t> bitrate_kbps;
    std::optional<VideoInfo> video;
    std::vector<AudioTrack> audio_tracks;
    std::vector<SubtitleTrack> subtitle_tracks;
    std::vector<Chapter> chapters;
    size_t chapter_count = 0;
    std::optional<std::string> mime_type;

    [[nodiscard]] bool probed() const { return provenance == Provenance::Probed; }
    [[nodiscard]] size_t hiddenChapters() const {
        return chapter_count > chapters.size() ? chapter_count - chapters.size() : 0;
    }
};

std::string_view to_string(Provenance p);

void to_json(nlohmann::json& j, const VideoInfo& v);
void to_json(nlohmann::json& j, const AudioTrack& a);
void to_json(nlohmann::json& j, const SubtitleTrack& s);
void to_json(nlohmann::json& j, const Chapter& c);
void to_json(nlohmann::json& j, const MediaInfo& m);

}
