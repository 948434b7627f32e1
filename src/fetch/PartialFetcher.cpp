#include "fetch/PartialFetcher.hpp"
#include "http/HttpClient.hpp"
#include "util/Magic.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <fmt/core.h>

using namespace ms::fetch;
using namespace ms::types;
using ms::log::Registry;

namespace fs = std::filesystem;

namespace {

bool isRemote(const std::string& ref) {
    return ref.starts_with("http://") || ref.starts_with("https://");
}

std::string localPath(const std::string& ref) {
    constexpr std::string_view scheme = "file://";
    return ref.starts_with(scheme) ? ref.substr(scheme.size()) : ref;
}

}

PartialFetcher::PartialFetcher(config::MediaInfoConfig cfg, std::shared_ptr<http::HttpClient> http)
    : cfg_(std::move(cfg)), http_(std::move(http)) {}

Result<FetchedHead> PartialFetcher::fetchHead(const std::string& storageReference) const {
    return fetchHead(storageReference, cfg_.head_bytes);
}

Result<FetchedHead> PartialFetcher::fetchHead(const std::string& storageReference, const uintmax_t maxBytes) const {
    if (storageReference.empty()) return Error{ErrorKind::FetchFailed, "file has no storage reference"};
    if (maxBytes == 0) return Error{ErrorKind::FetchFailed, "head size limit is zero"};

    try {
        TempFile tmp(cfg_.temp_dir);
        uintmax_t bytes = 0;

        const auto err = isRemote(storageReference)
                             ? fetchRemote(storageReference, tmp, maxBytes, bytes)
                             : copyLocal(localPath(storageReference), tmp, maxBytes, bytes);
        if (err) {
            Registry::fetch()->warn("[PartialFetcher] {}: {}", storageReference, err->message);
            return *err;
        }

        if (bytes < std::min(cfg_.min_head_bytes, maxBytes)) {
            Registry::fetch()->warn("[PartialFetcher] Only {} bytes fetched from {}, too small for analysis",
                                    bytes, storageReference);
            return Error{ErrorKind::FetchFailed, fmt::format("only {} bytes available", bytes)};
        }

        FetchedHead head{std::move(tmp), bytes, std::nullopt};
        try {
            head.mime_type = util::Magic::get_mime_type(head.file.path());
        } catch (const std::exception& e) {
            Registry::fetch()->debug("[PartialFetcher] MIME sniffing failed: {}", e.what());
        }

        Registry::fetch()->debug("[PartialFetcher] Fetched {} bytes of {} ({})", bytes, storageReference,
                                 head.mime_type.value_or("unknown type"));
        return Result<FetchedHead>{std::move(head)};
    } catch (const std::exception& e) {
        Registry::fetch()->error("[PartialFetcher] Failed to fetch {}: {}", storageReference, e.what());
        return Error{ErrorKind::FetchFailed, e.what()};
    }
}

std::optional<Error> PartialFetcher::fetchRemote(const std::string& url, const TempFile& into,
                                                 const uintmax_t maxBytes, uintmax_t& bytes) const {
    if (!http_) return Error{ErrorKind::FetchFailed, "no HTTP client configured"};

    const auto r = http_->fetchRange(url, into.path(), maxBytes, cfg_.fetch_timeout);
    bytes = r.bytes;
    if (r.ok) return std::nullopt;

    if (r.status == 404 || r.status == 410)
        return Error{ErrorKind::FetchFailed, fmt::format("content no longer resolvable (HTTP {})", r.status)};
    return Error{ErrorKind::FetchFailed, r.error.empty() ? "ranged fetch failed" : r.error};
}

std::optional<Error> PartialFetcher::copyLocal(const std::string& path, const TempFile& into,
                                               const uintmax_t maxBytes, uintmax_t& bytes) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Error{ErrorKind::FetchFailed, "content no longer resolvable: " + path};

    std::ifstream in(path, std::ios::binary);
    if (!in) return Error{ErrorKind::FetchFailed, "failed to open " + path};

    std::ofstream out(into.path(), std::ios::binary | std::ios::trunc);
    if (!out) return Error{ErrorKind::FetchFailed, "failed to open temporary file " + into.path().string()};

    std::array<char, 64 * 1024> buf{};
    bytes = 0;
    while (bytes < maxBytes && in) {
        const auto want = static_cast<std::streamsize>(std::min<uintmax_t>(buf.size(), maxBytes - bytes));
        in.read(buf.data(), want);
        const auto got = in.gcount();
        if (got <= 0) break;
        out.write(buf.data(), got);
        if (!out) return Error{ErrorKind::FetchFailed, "failed to write temporary file " + into.path().string()};
        bytes += static_cast<uintmax_t>(got);
    }

    if (in.bad()) return Error{ErrorKind::FetchFailed, "read error on " + path};
    return std::nullopt;
}
