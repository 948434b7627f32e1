#include "heuristic/HeuristicEngine.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_map>

using namespace ms::heuristic;
using namespace ms::types;

namespace {

const std::unordered_map<std::string_view, std::string_view>& extensionTable() {
    static const std::unordered_map<std::string_view, std::string_view> table{
        {"mkv", "MATROSKA/MKV"},  {"mka", "MATROSKA/MKA"},  {"webm", "WEBM"},
        {"mp4", "MP4"},           {"m4v", "MP4/M4V"},       {"m4a", "MP4/M4A"},
        {"mov", "QUICKTIME/MOV"}, {"avi", "AVI"},           {"wmv", "ASF/WMV"},
        {"wma", "ASF/WMA"},       {"flv", "FLV"},           {"3gp", "3GP"},
        {"ts", "MPEG-TS"},        {"m2ts", "MPEG-TS"},      {"mpg", "MPEG-PS"},
        {"mpeg", "MPEG-PS"},      {"mp3", "MP3"},           {"flac", "FLAC"},
        {"aac", "AAC"},           {"ogg", "OGG"},           {"opus", "OGG/OPUS"},
        {"wav", "WAV"},
    };
    return table;
}

const std::unordered_map<std::string_view, std::string_view>& mimeTable() {
    static const std::unordered_map<std::string_view, std::string_view> table{
        {"video/x-matroska", "MATROSKA/MKV"}, {"audio/x-matroska", "MATROSKA/MKA"},
        {"video/webm", "WEBM"},              {"audio/webm", "WEBM"},
        {"video/mp4", "MP4"},                {"video/x-m4v", "MP4/M4V"},
        {"audio/mp4", "MP4/M4A"},            {"audio/x-m4a", "MP4/M4A"},
        {"video/quicktime", "QUICKTIME/MOV"}, {"video/x-msvideo", "AVI"},
        {"video/x-ms-wmv", "ASF/WMV"},       {"video/x-ms-asf", "ASF"},
        {"audio/x-ms-wma", "ASF/WMA"},       {"video/x-flv", "FLV"},
        {"video/3gpp", "3GP"},               {"video/mp2t", "MPEG-TS"},
        {"video/mpeg", "MPEG-PS"},           {"audio/mpeg", "MP3"},
        {"audio/flac", "FLAC"},              {"audio/x-flac", "FLAC"},
        {"audio/aac", "AAC"},                {"audio/x-hx-aac-adts", "AAC"},
        {"audio/ogg", "OGG"},                {"video/ogg", "OGG"},
        {"audio/opus", "OGG/OPUS"},          {"audio/x-wav", "WAV"},
        {"audio/wav", "WAV"},
    };
    return table;
}

// Tokens are matched whole, so "4k" never fires inside "4kids" and "eng" never inside "engine"
const std::unordered_map<std::string_view, Resolution>& resolutionTable() {
    static const std::unordered_map<std::string_view, Resolution> table{
        {"2160p", {3840, 2160}}, {"4k", {3840, 2160}}, {"uhd", {3840, 2160}},
        {"1440p", {2560, 1440}}, {"1080p", {1920, 1080}}, {"720p", {1280, 720}},
        {"576p", {720, 576}},    {"480p", {854, 480}},   {"360p", {640, 360}},
    };
    return table;
}

// Full names are recognised anywhere after the title; ISO 639-2 codes only once a
// release marker has been seen, since "ben", "pan" or "mar" are also ordinary words.
const std::unordered_map<std::string_view, std::string_view>& languageNameTable() {
    static const std::unordered_map<std::string_view, std::string_view> table{
        {"english", "English"},       {"hindi", "Hindi"},           {"tamil", "Tamil"},
        {"telugu", "Telugu"},         {"malayalam", "Malayalam"},   {"kannada", "Kannada"},
        {"bengali", "Bengali"},       {"marathi", "Marathi"},       {"gujarati", "Gujarati"},
        {"punjabi", "Punjabi"},       {"urdu", "Urdu"},             {"spanish", "Spanish"},
        {"french", "French"},         {"german", "German"},         {"italian", "Italian"},
        {"portuguese", "Portuguese"}, {"russian", "Russian"},       {"japanese", "Japanese"},
        {"korean", "Korean"},         {"chinese", "Chinese"},       {"mandarin", "Chinese"},
        {"arabic", "Arabic"},         {"turkish", "Turkish"},       {"thai", "Thai"},
        {"indonesian", "Indonesian"}, {"vietnamese", "Vietnamese"},
    };
    return table;
}

const std::unordered_map<std::string_view, std::string_view>& languageCodeTable() {
    static const std::unordered_map<std::string_view, std::string_view> table{
        {"eng", "English"},    {"hin", "Hindi"},      {"tam", "Tamil"},
        {"tel", "Telugu"},     {"mal", "Malayalam"},  {"kan", "Kannada"},
        {"ben", "Bengali"},    {"mar", "Marathi"},    {"guj", "Gujarati"},
        {"pan", "Punjabi"},    {"urd", "Urdu"},       {"spa", "Spanish"},
        {"fre", "French"},     {"fra", "French"},     {"ger", "German"},
        {"deu", "German"},     {"ita", "Italian"},    {"por", "Portuguese"},
        {"rus", "Russian"},    {"jpn", "Japanese"},   {"kor", "Korean"},
        {"chi", "Chinese"},    {"zho", "Chinese"},    {"ara", "Arabic"},
        {"tur", "Turkish"},    {"tha", "Thai"},       {"vie", "Vietnamese"},
    };
    return table;
}

bool allDigits(const std::string_view s) {
    return !s.empty() && std::ranges::all_of(s, [](const unsigned char c) { return std::isdigit(c) != 0; });
}

// "1959", "1080p", "s01e01" or "s01": where the title ends and release tags begin
bool isReleaseMarker(const std::string_view t) {
    if (resolutionTable().contains(t)) return true;
    if (t.size() == 4 && allDigits(t)) return t.starts_with("19") || t.starts_with("20");
    if (t.size() < 3 || t[0] != 's') return false;

    const auto e = t.find('e');
    if (e == std::string_view::npos) return allDigits(t.substr(1));
    return allDigits(t.substr(1, e - 1)) && allDigits(t.substr(e + 1));
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}

std::vector<std::string> HeuristicEngine::tokenize(const std::string_view fileName) {
    std::vector<std::string> tokens;
    std::string cur;
    for (const unsigned char c : fileName) {
        if (std::isalnum(c)) cur.push_back(static_cast<char>(std::tolower(c)));
        else if (!cur.empty()) {
            tokens.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!cur.empty()) tokens.push_back(std::move(cur));
    return tokens;
}

std::string HeuristicEngine::containerFromExtension(const std::string_view fileName) {
    const auto dot = fileName.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == fileName.size()) return std::string(UNKNOWN_FORMAT);

    const auto ext = lower(fileName.substr(dot + 1));
    const auto& table = extensionTable();
    if (const auto it = table.find(ext); it != table.end()) return std::string(it->second);
    return std::string(UNKNOWN_FORMAT);
}

std::string HeuristicEngine::containerFromMime(const std::string_view mime) {
    // "video/mp4; charset=binary" -> "video/mp4"
    const auto base = lower(mime.substr(0, mime.find(';')));
    const auto& table = mimeTable();
    if (const auto it = table.find(base); it != table.end()) return std::string(it->second);
    return std::string(UNKNOWN_FORMAT);
}

std::optional<Resolution> HeuristicEngine::resolutionFrom(const std::vector<std::string>& tokens) {
    const auto& table = resolutionTable();
    for (const auto& t : tokens)
        if (const auto it = table.find(t); it != table.end()) return it->second;
    return std::nullopt;
}

std::vector<std::string> HeuristicEngine::languagesFrom(const std::vector<std::string>& tokens) {
    const auto marker = std::ranges::find_if(tokens, isReleaseMarker);
    const bool haveMarker = marker != tokens.end();
    const auto& names = languageNameTable();
    const auto& codes = languageCodeTable();

    std::vector<std::string> langs;
    for (auto it = haveMarker ? std::next(marker) : tokens.begin(); it != tokens.end(); ++it) {
        std::string_view lang;
        if (const auto n = names.find(*it); n != names.end()) lang = n->second;
        else if (const auto c = codes.find(*it); haveMarker && c != codes.end()) lang = c->second;
        else continue;

        if (std::find(langs.begin(), langs.end(), lang) == langs.end()) langs.emplace_back(lang);
    }
    return langs;
}

MediaInfo HeuristicEngine::infer(const std::string_view fileName, const uintmax_t sizeBytes,
                                 const std::optional<std::string_view> mimeHint) {
    MediaInfo info;
    info.provenance = Provenance::Heuristic;
    info.size_bytes = sizeBytes;
    if (mimeHint && !mimeHint->empty()) info.mime_type = std::string(*mimeHint);

    info.container_format = containerFromExtension(fileName);
    if (info.container_format == UNKNOWN_FORMAT && mimeHint) info.container_format = containerFromMime(*mimeHint);

    const auto tokens = tokenize(fileName);

    if (const auto res = resolutionFrom(tokens)) {
        VideoInfo v;
        v.width = res->width;
        v.height = res->height;
        info.video = std::move(v);
    }

    for (auto& lang : languagesFrom(tokens)) {
        AudioTrack a;
        a.language = std::move(lang);
        info.audio_tracks.push_back(std::move(a));
    }

    return info;
}
