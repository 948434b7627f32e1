#pragma once

#include "types/Error.hpp"
#include "types/FileRecord.hpp"
#include "types/MediaInfo.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ms::fetch { class PartialFetcher; }
namespace ms::provision { class Provisioner; }
namespace ms::probe { class ProbeInvoker; }

namespace ms::pipeline {

// fetch head -> make sure ffprobe is there -> probe; any stage error whose disposition
// is Fallback ends in a heuristic result, so extract() always has an answer.
class Extractor {
public:
    Extractor(std::shared_ptr<fetch::PartialFetcher> fetcher,
              std::shared_ptr<provision::Provisioner> provisioner,
              std::shared_ptr<probe::ProbeInvoker> prober);

    [[nodiscard]] types::MediaInfo extract(const types::FileRecord& record) const;

private:
    std::shared_ptr<fetch::PartialFetcher> fetcher_;
    std::shared_ptr<provision::Provisioner> provisioner_;
    std::shared_ptr<probe::ProbeInvoker> prober_;

    [[nodiscard]] static types::MediaInfo fallback(const types::FileRecord& record, const types::Error& cause,
                                                   const std::optional<std::string>& mime);
};

}
