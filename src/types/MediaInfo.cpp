#include "types/MediaInfo.hpp"

#include <nlohmann/json.hpp>

namespace ms::types {

std::string_view to_string(const Provenance p) {
    return p == Provenance::Probed ? "probed" : "heuristic";
}

template <typename T>
static nlohmann::json optionalToJson(const std::optional<T>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

void to_json(nlohmann::json& j, const VideoInfo& v) {
    j = {
        {"codec", optionalToJson(v.codec)},
        {"width", optionalToJson(v.width)},
        {"height", optionalToJson(v.height)},
        {"frame_rate", optionalToJson(v.frame_rate)}
    };
}

void to_json(nlohmann::json& j, const AudioTrack& a) {
    j = {
        {"language", a.language},
        {"codec", a.codec},
        {"channels", optionalToJson(a.channels)},
        {"sample_rate_hz", optionalToJson(a.sample_rate_hz)},
        {"title", optionalToJson(a.title)}
    };
}

void to_json(nlohmann::json& j, const SubtitleTrack& s) {
    j = {
        {"language", s.language},
        {"codec", s.codec},
        {"title", optionalToJson(s.title)}
    };
}

void to_json(nlohmann::json& j, const Chapter& c) {
    j = {
        {"title", c.title},
        {"start_ms", c.start.count()}
    };
}

void to_json(nlohmann::json& j, const MediaInfo& m) {
    j = {
        {"provenance", std::string(to_string(m.provenance))},
        {"container_format", m.container_format},
        {"duration_ms", m.duration ? nlohmann::json(m.duration->count()) : nlohmann::json(nullptr)},
        {"size_bytes", m.size_bytes},
        {"bitrate_kbps", optionalToJson(m.bitrate_kbps)},
        {"video", m.video ? nlohmann::json(*m.video) : nlohmann::json(nullptr)},
        {"audio_tracks", m.audio_tracks},
        {"subtitle_tracks", m.subtitle_tracks},
        {"chapters", m.chapters},
        {"chapter_count", m.chapter_count},
        {"mime_type", optionalToJson(m.mime_type)}
    };
}

}
