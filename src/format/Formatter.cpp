#include "format/Formatter.hpp"
#include "util/humanize.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <iterator>
#include <vector>

using namespace ms::format;
using namespace ms::types;
using ms::util::humanBytes;
using ms::util::humanDuration;
using ms::util::clockTime;

namespace {

std::string_view missing(const MediaInfo& info) { return info.probed() ? UNKNOWN : NOT_AVAILABLE; }

void line(std::string& out, const std::string_view label, const std::string_view value) {
    fmt::format_to(std::back_inserter(out), "{}: {}\n", label, value);
}

void renderVideo(std::string& out, const MediaInfo& info) {
    if (!info.video) {
        line(out, "Video", info.probed() ? "None" : NOT_AVAILABLE);
        return;
    }

    const auto& v = *info.video;
    const auto dims = v.width && v.height ? fmt::format("{}x{}", *v.width, *v.height) : std::string(missing(info));

    if (info.probed()) {
        line(out, "Video", fmt::format("{} {} @ {}", v.codec.value_or(std::string(UNKNOWN)), dims,
                                       v.frame_rate ? fmt::format("{:.2f} fps", *v.frame_rate) : std::string(UNKNOWN)));
        return;
    }

    line(out, "Video", dims);
    line(out, "Video Codec", v.codec ? std::string_view(*v.codec) : NOT_AVAILABLE);
    line(out, "Frame Rate", v.frame_rate ? fmt::format("{:.2f} fps", *v.frame_rate) : std::string(NOT_AVAILABLE));
}

void renderAudio(std::string& out, const MediaInfo& info) {
    if (info.audio_tracks.empty()) {
        line(out, "Audio Tracks", info.probed() ? "None" : NOT_AVAILABLE);
        return;
    }

    line(out, "Audio Tracks", std::to_string(info.audio_tracks.size()));
    for (size_t i = 0; i < info.audio_tracks.size(); ++i) {
        const auto& a = info.audio_tracks[i];
        fmt::format_to(std::back_inserter(out), "  {}. {} ({}) - {}", i + 1,
                       a.title.value_or(fmt::format("Track {}", i + 1)), a.language, a.codec);

        std::vector<std::string_view> unavailable;
        if (a.channels) fmt::format_to(std::back_inserter(out), " - {}ch", *a.channels);
        else if (!info.probed()) unavailable.emplace_back("channels");
        if (a.sample_rate_hz) fmt::format_to(std::back_inserter(out), " - {} Hz", *a.sample_rate_hz);
        else if (!info.probed()) unavailable.emplace_back("sample rate");

        if (!unavailable.empty())
            fmt::format_to(std::back_inserter(out), " - {}: {}", fmt::join(unavailable, ", "), NOT_AVAILABLE);
        out += '\n';
    }
}

void renderSubtitles(std::string& out, const MediaInfo& info) {
    if (info.subtitle_tracks.empty()) {
        line(out, "Subtitles", info.probed() ? "None" : NOT_AVAILABLE);
        return;
    }

    line(out, "Subtitles", std::to_string(info.subtitle_tracks.size()));
    for (size_t i = 0; i < info.subtitle_tracks.size(); ++i) {
        const auto& s = info.subtitle_tracks[i];
        fmt::format_to(std::back_inserter(out), "  {}. {} ({}) - {}\n", i + 1,
                       s.title.value_or(fmt::format("Subtitle {}", i + 1)), s.language, s.codec);
    }
}

void renderChapters(std::string& out, const MediaInfo& info) {
    if (info.chapter_count == 0) {
        line(out, "Chapters", info.probed() ? "None" : NOT_AVAILABLE);
        return;
    }

    line(out, "Chapters", std::to_string(info.chapter_count));
    for (size_t i = 0; i < info.chapters.size() && i < MAX_DISPLAY_CHAPTERS; ++i)
        fmt::format_to(std::back_inserter(out), "  {}. {} - {}\n", i + 1, clockTime(info.chapters[i].start),
                       info.chapters[i].title);

    const auto shown = std::min(info.chapters.size(), MAX_DISPLAY_CHAPTERS);
    if (info.chapter_count > shown)
        fmt::format_to(std::back_inserter(out), "  ...and {} more\n", info.chapter_count - shown);
}

}

std::string Formatter::render(const MediaInfo& info, const std::string_view displayName) {
    std::string out = "Media Information\n\n";

    line(out, "File", displayName.empty() ? UNKNOWN : displayName);
    line(out, "Source", info.probed() ? "ffprobe analysis" : "file name heuristics");
    line(out, "Format", info.container_format.empty() ? UNKNOWN : std::string_view(info.container_format));
    if (info.mime_type) line(out, "Type", *info.mime_type);
    line(out, "Duration", info.duration ? humanDuration(*info.duration) : std::string(missing(info)));
    line(out, "Size", humanBytes(info.size_bytes));
    line(out, "Bitrate", info.bitrate_kbps ? fmt::format("{} kbps", *info.bitrate_kbps) : std::string(missing(info)));
    out += '\n';

    renderVideo(out, info);
    renderAudio(out, info);
    renderSubtitles(out, info);
    renderChapters(out, info);

    if (!info.probed()) {
        out += '\n';
        out += HEURISTIC_NOTE;
        out += '\n';
    }

    return out;
}
