#pragma once

#include "config/Config.hpp"
#include "platform/PlatformKey.hpp"
#include "types/Error.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ms::http { class HttpClient; }
namespace ms::process { class ProcessRunner; }

namespace ms::provision {

enum class ProvisionState { Unavailable, SystemInstalled, Downloaded };

std::string_view to_string(ProvisionState s);

class Provisioner {
public:
    virtual ~Provisioner() = default;

    // Never throws. Unavailable means callers proceed in fallback mode.
    virtual ProvisionState ensure() = 0;
    [[nodiscard]] virtual std::optional<std::string> commandPath() const = 0;
    [[nodiscard]] virtual ProvisionState state() const = 0;

    // Why the last ensure() left the tool unavailable
    [[nodiscard]] virtual std::optional<types::Error> lastError() const = 0;
};

class FFprobeProvisioner final : public Provisioner {
public:
    FFprobeProvisioner(config::ProvisioningConfig cfg,
                       std::shared_ptr<http::HttpClient> http,
                       std::shared_ptr<process::ProcessRunner> runner,
                       platform::PlatformKey platform = platform::PlatformKey::host());

    ProvisionState ensure() override;
    [[nodiscard]] std::optional<std::string> commandPath() const override;
    [[nodiscard]] ProvisionState state() const override;
    [[nodiscard]] std::optional<types::Error> lastError() const override;

    [[nodiscard]] std::filesystem::path downloadedBinaryPath() const;
    [[nodiscard]] unsigned int downloadAttempts() const;

private:
    config::ProvisioningConfig cfg_;
    std::shared_ptr<http::HttpClient> http_;
    std::shared_ptr<process::ProcessRunner> runner_;
    platform::PlatformKey platform_;

    mutable std::mutex mutex_;
    ProvisionState state_ = ProvisionState::Unavailable;
    std::optional<std::string> command_;
    std::optional<types::Error> lastError_;
    bool platformUnsupported_ = false;
    unsigned int downloadAttempts_ = 0;
    std::optional<std::chrono::steady_clock::time_point> lastFailedDownload_;

    ProvisionState acquire();
    [[nodiscard]] bool versionQuerySucceeds(const std::string& command) const;
    [[nodiscard]] bool downloadedBinaryUsable() const;
    [[nodiscard]] std::optional<types::Error> download();
    void promote(ProvisionState to, std::string command);
};

}
