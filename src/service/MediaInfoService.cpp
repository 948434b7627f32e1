#include "service/MediaInfoService.hpp"
#include "service/FileRecordStore.hpp"
#include "format/Formatter.hpp"
#include "pipeline/Extractor.hpp"
#include "provision/Provisioner.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

using namespace ms::service;
using namespace ms::types;
using ms::log::Registry;

std::string_view ms::service::to_string(const Status s) {
    switch (s) {
        case Status::Ok: return "ok";
        case Status::NotFound: return "not_found";
        case Status::Disabled: return "disabled";
        case Status::Failed: return "failed";
    }
    return "unknown";
}

MediaInfoService::MediaInfoService(config::MediaInfoConfig cfg,
                                   std::shared_ptr<FileRecordStore> records,
                                   std::shared_ptr<pipeline::Extractor> extractor,
                                   std::shared_ptr<provision::Provisioner> provisioner,
                                   cache::ResultCache::TimeSource now)
    : cfg_(std::move(cfg)),
      records_(std::move(records)),
      extractor_(std::move(extractor)),
      provisioner_(std::move(provisioner)),
      cache_(cfg_.cache_ttl, std::move(now)) {
    if (!records_ || !extractor_) throw std::invalid_argument("MediaInfoService requires a record store and an extractor");
}

Reply MediaInfoService::describe(const std::string& key) {
    if (!cfg_.enabled) return failure(Status::Disabled, DISABLED_TEXT);

    try {
        const auto record = records_->lookup(key);
        if (!record) {
            Registry::service()->info("[MediaInfoService] No record for key '{}'", key);
            return failure(Status::NotFound, FILE_NOT_FOUND_TEXT);
        }

        auto info = cache_.getOrCompute(key, [&] { return extractor_->extract(*record); });

        Reply reply;
        reply.status = Status::Ok;
        reply.text = format::Formatter::render(info, record->file_name);
        reply.auto_delete_after = cfg_.reply_ttl;
        reply.closable = true;
        reply.info = std::move(info);

        Registry::service()->debug("[MediaInfoService] Described '{}' ({})", key, to_string(reply.info->provenance));
        if (Registry::cache()->should_log(spdlog::level::debug)) {
            const auto s = cache_.stats();
            Registry::cache()->debug("[ResultCache] {} entries, {} hits, {} misses, {} coalesced, {} evictions, "
                                     "hit rate {:.2f}, avg extraction {:.1f} ms",
                                     s.entries, s.hits, s.misses, s.coalesced, s.evictions,
                                     cache::CacheStats::hit_rate(s), cache::CacheStats::avg_op_ms(s));
        }
        return reply;
    } catch (const std::exception& e) {
        Registry::service()->error("[MediaInfoService] Failed to describe '{}': {}", key, e.what());
        return failure(Status::Failed, EXTRACTION_FAILED_TEXT);
    }
}

void MediaInfoService::warmUp() const {
    if (!cfg_.enabled || !provisioner_) return;
    const auto state = provisioner_->ensure();
    Registry::service()->info("[MediaInfoService] ffprobe state after warm-up: {}", provision::to_string(state));
}

Reply MediaInfoService::failure(const Status status, const std::string_view text) const {
    Reply reply;
    reply.status = status;
    reply.text = std::string(text);
    reply.auto_delete_after = cfg_.failure_reply_ttl;
    reply.closable = true;
    return reply;
}
