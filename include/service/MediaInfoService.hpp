#pragma once

#include "cache/TtlCache.hpp"
#include "config/Config.hpp"
#include "types/MediaInfo.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace ms::pipeline { class Extractor; }
namespace ms::provision { class Provisioner; }

namespace ms::service {

class FileRecordStore;

inline constexpr std::string_view FILE_NOT_FOUND_TEXT = "File not found.";
inline constexpr std::string_view EXTRACTION_FAILED_TEXT = "Could not extract media information.";
inline constexpr std::string_view DISABLED_TEXT = "Media information is disabled.";

enum class Status { Ok, NotFound, Disabled, Failed };

std::string_view to_string(Status s);

// What the transport shows the user. auto_delete_after of zero means keep it.
struct Reply {
    Status status = Status::Failed;
    std::string text;
    std::chrono::seconds auto_delete_after{0};
    bool closable = false;
    std::optional<types::MediaInfo> info;
};

class MediaInfoService {
public:
    MediaInfoService(config::MediaInfoConfig cfg,
                     std::shared_ptr<FileRecordStore> records,
                     std::shared_ptr<pipeline::Extractor> extractor,
                     std::shared_ptr<provision::Provisioner> provisioner,
                     cache::ResultCache::TimeSource now = &cache::ResultCache::Clock::now);

    // Never throws; every outcome is a Reply.
    Reply describe(const std::string& key);

    // Provisions ffprobe ahead of the first request.
    void warmUp() const;

    [[nodiscard]] cache::CacheStatsSnapshot cacheStats() const { return cache_.stats(); }
    [[nodiscard]] bool enabled() const { return cfg_.enabled; }

private:
    config::MediaInfoConfig cfg_;
    std::shared_ptr<FileRecordStore> records_;
    std::shared_ptr<pipeline::Extractor> extractor_;
    std::shared_ptr<provision::Provisioner> provisioner_;
    cache::ResultCache cache_;

    [[nodiscard]] Reply failure(Status status, std::string_view text) const;
};

}
