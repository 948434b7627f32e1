#include "http/HttpClient.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <fmt/core.h>

using namespace ms::http;
using namespace ms::util;
using ms::log::Registry;

namespace {

struct RangeSink {
    std::ofstream* out;
    uintmax_t limit;
    uintmax_t written = 0;
    bool capped = false;
};

size_t writeToStream(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* fout = static_cast<std::ofstream*>(userdata);
    fout->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return fout->good() ? size * nmemb : 0;
}

size_t writeCapped(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* sink = static_cast<RangeSink*>(userdata);
    const uintmax_t incoming = size * nmemb;
    const uintmax_t room = sink->limit - sink->written;
    const uintmax_t take = std::min(incoming, room);

    sink->out->write(ptr, static_cast<std::streamsize>(take));
    if (!sink->out->good()) return 0;
    sink->written += take;

    // Returning short makes curl abort with CURLE_WRITE_ERROR
    if (sink->written >= sink->limit) {
        sink->capped = true;
        return take < incoming ? take : incoming;
    }
    return incoming;
}

void applyTimeouts(CURL* h, const std::chrono::seconds timeout) {
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, std::min(15L, static_cast<long>(timeout.count())));
}

}

CurlHttpClient::CurlHttpClient() { ensureCurlGlobalInit(); }

TransferResult CurlHttpClient::downloadToFile(const std::string& url,
                                              const std::filesystem::path& outputPath,
                                              const std::chrono::seconds timeout) {
    TransferResult r;

    std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        r.error = "Failed to open output file for download: " + outputPath.string();
        return r;
    }

    CurlEasy h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToStream);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &file);
    applyTimeouts(h, timeout);

    const CURLcode res = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.status);
    file.close();

    std::error_code ec;
    const auto size = std::filesystem::file_size(outputPath, ec);
    r.bytes = ec ? 0 : size;

    if (res != CURLE_OK) {
        r.error = fmt::format("CURL error {}: {}", static_cast<int>(res), curl_easy_strerror(res));
        Registry::http()->warn("[HttpClient] GET {} failed: {}", url, r.error);
        return r;
    }
    if (r.status / 100 != 2) {
        r.error = fmt::format("HTTP {}", r.status);
        Registry::http()->warn("[HttpClient] GET {} returned HTTP {}", url, r.status);
        return r;
    }

    r.ok = true;
    Registry::http()->debug("[HttpClient] Downloaded {} bytes from {}", r.bytes, url);
    return r;
}

TransferResult CurlHttpClient::fetchRange(const std::string& url,
                                          const std::filesystem::path& outputPath,
                                          const uintmax_t maxBytes,
                                          const std::chrono::seconds timeout) {
    TransferResult r;
    if (maxBytes == 0) {
        r.error = "Refusing to fetch an empty range";
        return r;
    }

    std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        r.error = "Failed to open output file for ranged fetch: " + outputPath.string();
        return r;
    }

    RangeSink sink{&file, maxBytes};
    const std::string range = fmt::format("0-{}", maxBytes - 1);

    CurlEasy h;
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeCapped);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);
    applyTimeouts(h, timeout);

    const CURLcode res = curl_easy_perform(h);
    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &r.status);
    file.close();
    r.bytes = sink.written;

    const bool stoppedByCap = res == CURLE_WRITE_ERROR && sink.capped;
    if (res != CURLE_OK && !stoppedByCap) {
        r.error = fmt::format("CURL error {}: {}", static_cast<int>(res), curl_easy_strerror(res));
        Registry::http()->warn("[HttpClient] Ranged GET {} failed: {}", url, r.error);
        return r;
    }
    if (r.status != 200 && r.status != 206) {
        r.error = fmt::format("HTTP {}", r.status);
        Registry::http()->warn("[HttpClient] Ranged GET {} returned HTTP {}", url, r.status);
        return r;
    }

    r.ok = true;
    Registry::http()->debug("[HttpClient] Fetched {} of at most {} bytes from {}", r.bytes, maxBytes, url);
    return r;
}
