#include "provision/Provisioner.hpp"
#include "http/HttpClient.hpp"
#include "process/ProcessRunner.hpp"
#include "log/Registry.hpp"

#include <unistd.h>
#include <fmt/core.h>

using namespace ms::provision;
using namespace ms::types;
using ms::log::Registry;

namespace fs = std::filesystem;

namespace {
constexpr size_t VERSION_OUTPUT_CAP = 64 * 1024;
constexpr auto BINARY_NAME = "ffprobe";

// Registry::provision() throws when the registry is not up; ensure() may not
std::shared_ptr<spdlog::logger> logger() {
    if (Registry::isInitialized())
        if (auto l = spdlog::get("provision")) return l;
    return spdlog::default_logger();
}

std::string absolutePath(const fs::path& p) {
    std::error_code ec;
    const auto abs = fs::absolute(p, ec);
    return ec ? p.string() : abs.string();
}
}

std::string_view ms::provision::to_string(const ProvisionState s) {
    switch (s) {
        case ProvisionState::Unavailable: return "unavailable";
        case ProvisionState::SystemInstalled: return "system";
        case ProvisionState::Downloaded: return "downloaded";
    }
    return "unknown";
}

FFprobeProvisioner::FFprobeProvisioner(config::ProvisioningConfig cfg,
                                       std::shared_ptr<http::HttpClient> http,
                                       std::shared_ptr<process::ProcessRunner> runner,
                                       platform::PlatformKey platform)
    : cfg_(std::move(cfg)), http_(std::move(http)), runner_(std::move(runner)), platform_(std::move(platform)) {
    if (!runner_) throw std::invalid_argument("FFprobeProvisioner requires a process runner");
}

ProvisionState FFprobeProvisioner::ensure() {
    std::scoped_lock lock(mutex_);
    try {
        return acquire();
    } catch (const std::exception& e) {
        lastFailedDownload_ = std::chrono::steady_clock::now();
        lastError_ = Error{ErrorKind::DownloadFailed, fmt::format("provisioning aborted: {}", e.what())};
        logger()->error("[Provisioner] {}", lastError_->message);
        return state_;
    }
}

// Caller holds mutex_
ProvisionState FFprobeProvisioner::acquire() {
    if (state_ != ProvisionState::Unavailable) return state_;

    if (versionQuerySucceeds(cfg_.system_command)) {
        promote(ProvisionState::SystemInstalled, cfg_.system_command);
        return state_;
    }

    if (downloadedBinaryUsable()) {
        promote(ProvisionState::Downloaded, absolutePath(downloadedBinaryPath()));
        return state_;
    }

    if (platformUnsupported_) return state_;

    if (lastFailedDownload_ &&
        std::chrono::steady_clock::now() - *lastFailedDownload_ < cfg_.download_retry_interval) {
        logger()->debug("[Provisioner] Skipping download, last attempt failed recently");
        return state_;
    }

    logger()->info("[Provisioner] {} not found, attempting to download...", BINARY_NAME);

    if (auto err = download()) {
        if (err->kind == ErrorKind::UnsupportedPlatform) platformUnsupported_ = true;
        else lastFailedDownload_ = std::chrono::steady_clock::now();
        logger()->error("[Provisioner] {}: {}", types::to_string(err->kind), err->message);
        lastError_ = std::move(err);
        return state_;
    }

    // Mandatory verification of the artifact we just wrote
    if (!downloadedBinaryUsable()) {
        lastFailedDownload_ = std::chrono::steady_clock::now();
        logger()->error("[Provisioner] {}: downloaded binary failed verification",
                                     types::to_string(ErrorKind::DownloadFailed));
        std::error_code ec;
        fs::remove(downloadedBinaryPath(), ec);
        lastError_ = Error{ErrorKind::DownloadFailed, "downloaded binary failed verification"};
        return state_;
    }

    promote(ProvisionState::Downloaded, absolutePath(downloadedBinaryPath()));
    logger()->info("[Provisioner] {} successfully installed to {}", BINARY_NAME, *command_);
    return state_;
}

std::optional<std::string> FFprobeProvisioner::commandPath() const {
    std::scoped_lock lock(mutex_);
    return command_;
}

ProvisionState FFprobeProvisioner::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

std::optional<Error> FFprobeProvisioner::lastError() const {
    std::scoped_lock lock(mutex_);
    return lastError_;
}

fs::path FFprobeProvisioner::downloadedBinaryPath() const {
    return cfg_.binary_dir / BINARY_NAME;
}

unsigned int FFprobeProvisioner::downloadAttempts() const {
    std::scoped_lock lock(mutex_);
    return downloadAttempts_;
}

bool FFprobeProvisioner::versionQuerySucceeds(const std::string& command) const {
    if (command.empty()) return false;
    try {
        const auto result = runner_->run({command, "-version"},
                                         std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.version_timeout),
                                         VERSION_OUTPUT_CAP);
        if (result.timed_out)
            logger()->warn("[Provisioner] '{} -version' timed out", command);
        return result.exit_code == 0 && !result.timed_out;
    } catch (const std::exception& e) {
        logger()->warn("[Provisioner] Failed to run '{} -version': {}", command, e.what());
        return false;
    }
}

bool FFprobeProvisioner::downloadedBinaryUsable() const {
    const auto path = downloadedBinaryPath();
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    if (access(path.c_str(), X_OK) != 0) return false;
    return versionQuerySucceeds(absolutePath(path));
}

std::optional<Error> FFprobeProvisioner::download() {
    const auto key = platform_.str();
    const auto it = cfg_.download_urls.find(key);
    if (it == cfg_.download_urls.end())
        return Error{ErrorKind::UnsupportedPlatform, fmt::format("no {} download for platform {}", BINARY_NAME, key)};

    if (!http_) return Error{ErrorKind::DownloadFailed, "no HTTP client configured"};

    std::error_code ec;
    fs::create_directories(cfg_.binary_dir, ec);
    if (ec) return Error{ErrorKind::DownloadFailed,
                         fmt::format("cannot create {}: {}", cfg_.binary_dir.string(), ec.message())};

    const auto target = downloadedBinaryPath();
    auto partial = target;
    partial += ".part";

    logger()->info("[Provisioner] Downloading {} for {} from {}", BINARY_NAME, key, it->second);
    ++downloadAttempts_;

    const auto transfer = http_->downloadToFile(it->second, partial, cfg_.download_timeout);
    if (!transfer.ok) {
        fs::remove(partial, ec);
        return Error{ErrorKind::DownloadFailed, transfer.error.empty() ? "download failed" : transfer.error};
    }

    fs::rename(partial, target, ec);
    if (ec) {
        const auto reason = ec.message();
        fs::remove(partial, ec);
        return Error{ErrorKind::DownloadFailed, "cannot move download into place: " + reason};
    }

    // rwxr--r--
    fs::permissions(target,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read,
                    fs::perm_options::replace, ec);
    if (ec) return Error{ErrorKind::DownloadFailed, "cannot mark binary executable: " + ec.message()};

    return std::nullopt;
}

void FFprobeProvisioner::promote(const ProvisionState to, std::string command) {
    state_ = to;
    command_ = std::move(command);
    lastError_.reset();
    logger()->info("[Provisioner] {} is available ({})", BINARY_NAME, to_string(to));
}
