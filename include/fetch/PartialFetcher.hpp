#pragma once

#include "config/Config.hpp"
#include "fetch/TempFile.hpp"
#include "types/Error.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ms::http { class HttpClient; }

namespace ms::fetch {

struct FetchedHead {
    TempFile file;
    uintmax_t bytes = 0;
    std::optional<std::string> mime_type;   // sniffed from the fetched bytes
};

class PartialFetcher {
public:
    PartialFetcher(config::MediaInfoConfig cfg, std::shared_ptr<http::HttpClient> http);

    // Fetches at most maxBytes from the start of the referenced content. Accepts
    // http(s) URLs, file:// URLs and plain local paths.
    types::Result<FetchedHead> fetchHead(const std::string& storageReference, uintmax_t maxBytes) const;
    types::Result<FetchedHead> fetchHead(const std::string& storageReference) const;

private:
    config::MediaInfoConfig cfg_;
    std::shared_ptr<http::HttpClient> http_;

    [[nodiscard]] std::optional<types::Error> fetchRemote(const std::string& url, const TempFile& into,
                                                         uintmax_t maxBytes, uintmax_t& bytes) const;
    [[nodiscard]] static std::optional<types::Error> copyLocal(const std::string& path, const TempFile& into,
                                                               uintmax_t maxBytes, uintmax_t& bytes);
};

}
