#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace ms::http {

struct TransferResult {
    bool ok = false;
    long status = 0;        // HTTP status, 0 when no response was received
    uintmax_t bytes = 0;    // bytes written to disk
    std::string error;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Streams the whole response body of a GET into outputPath.
    virtual TransferResult downloadToFile(const std::string& url,
                                          const std::filesystem::path& outputPath,
                                          std::chrono::seconds timeout) = 0;

    // Writes at most maxBytes from the start of the resource into outputPath.
    // Asks for a byte range, and stops the transfer itself if the server ignores it.
    virtual TransferResult fetchRange(const std::string& url,
                                      const std::filesystem::path& outputPath,
                                      uintmax_t maxBytes,
                                      std::chrono::seconds timeout) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();

    TransferResult downloadToFile(const std::string& url,
                                  const std::filesystem::path& outputPath,
                                  std::chrono::seconds timeout) override;

    TransferResult fetchRange(const std::string& url,
                              const std::filesystem::path& outputPath,
                              uintmax_t maxBytes,
                              std::chrono::seconds timeout) override;
};

}
