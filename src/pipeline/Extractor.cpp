#include "pipeline/Extractor.hpp"
#include "fetch/PartialFetcher.hpp"
#include "heuristic/HeuristicEngine.hpp"
#include "probe/ProbeInvoker.hpp"
#include "provision/Provisioner.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace ms::pipeline;
using namespace ms::types;
using ms::log::Registry;

Extractor::Extractor(std::shared_ptr<fetch::PartialFetcher> fetcher,
                     std::shared_ptr<provision::Provisioner> provisioner,
                     std::shared_ptr<probe::ProbeInvoker> prober)
    : fetcher_(std::move(fetcher)), provisioner_(std::move(provisioner)), prober_(std::move(prober)) {
    if (!fetcher_ || !provisioner_ || !prober_)
        throw std::invalid_argument("Extractor requires a fetcher, a provisioner and a prober");
}

MediaInfo Extractor::extract(const FileRecord& record) const {
    auto head = fetcher_->fetchHead(record.storage_reference);
    if (const auto* err = std::get_if<Error>(&head)) return fallback(record, *err, record.mime_type);

    const auto& fetched = std::get<fetch::FetchedHead>(head);
    const auto mime = record.mime_type ? record.mime_type : fetched.mime_type;

    provisioner_->ensure();
    const auto command = provisioner_->commandPath();
    if (!command) {
        const auto cause = provisioner_->lastError().value_or(
            Error{ErrorKind::DownloadFailed, "ffprobe is not available"});
        return fallback(record, cause, mime);
    }

    auto probed = prober_->probe(*command, fetched.file.path());
    if (const auto* err = std::get_if<Error>(&probed)) return fallback(record, *err, mime);

    auto info = std::get<MediaInfo>(std::move(probed));
    info.size_bytes = record.size_bytes;
    info.mime_type = mime;

    Registry::mediascope()->debug("[Extractor] Probed {} ({}, {} audio, {} subtitle, {} chapters)",
                                  record.key, info.container_format, info.audio_tracks.size(),
                                  info.subtitle_tracks.size(), info.chapter_count);
    return info;
}

MediaInfo Extractor::fallback(const FileRecord& record, const Error& cause, const std::optional<std::string>& mime) {
    if (dispositionFor(cause.kind) == Disposition::Surface)
        throw std::runtime_error(fmt::format("{}: {}", to_string(cause.kind), cause.message));

    Registry::mediascope()->info("[Extractor] Falling back to heuristics for {} ({}: {})",
                                 record.key, to_string(cause.kind), cause.message);

    return heuristic::HeuristicEngine::infer(record.file_name, record.size_bytes,
                                             mime ? std::optional<std::string_view>(*mime) : std::nullopt);
}
