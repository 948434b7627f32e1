#include <gtest/gtest.h>
#include "provision/Provisioner.hpp"
#include "process/ProcessRunner.hpp"
#include "support/Fakes.hpp"

#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

using namespace ms;
using namespace ms::provision;
using ms::test::FakeHttpClient;
using ms::test::ScratchDir;

namespace fs = std::filesystem;

class ProvisionerTest : public ::testing::Test {
protected:
    ScratchDir scratch{"mediascope-provision"};
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<process::PosixProcessRunner> runner = std::make_shared<process::PosixProcessRunner>();
    config::ProvisioningConfig cfg;
    platform::PlatformKey platform{"linux", "x86_64"};

    void SetUp() override {
        cfg.system_command = "/nonexistent/mediascope-ffprobe";
        cfg.binary_dir = scratch.path / "bin";
        cfg.download_urls = {{"linux_x86_64", "https://downloads.invalid/ffprobe-linux-x64"}};
        http->body = "#!/bin/sh\nexit 0\n";
    }

    [[nodiscard]] FFprobeProvisioner make() const { return {cfg, http, runner, platform}; }
};

TEST_F(ProvisionerTest, UsesSystemCommandWhenItAnswers) {
    cfg.system_command = "/bin/true";
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::SystemInstalled);
    EXPECT_EQ(p.commandPath(), "/bin/true");
    EXPECT_EQ(http->downloads.load(), 0);
}

TEST_F(ProvisionerTest, DownloadsOnceThenStaysDownloaded) {
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::Downloaded);
    EXPECT_EQ(p.ensure(), ProvisionState::Downloaded);
    EXPECT_EQ(http->downloads.load(), 1);
    EXPECT_EQ(p.downloadAttempts(), 1u);

    ASSERT_TRUE(p.commandPath());
    EXPECT_EQ(fs::path(*p.commandPath()), fs::absolute(cfg.binary_dir / "ffprobe"));
    EXPECT_FALSE(p.lastError());

    const auto perms = fs::status(cfg.binary_dir / "ffprobe").permissions();
    EXPECT_NE(perms & fs::perms::owner_exec, fs::perms::none);
    EXPECT_FALSE(fs::exists(cfg.binary_dir / "ffprobe.part"));
}

TEST_F(ProvisionerTest, ReusesBinaryFromEarlierRun) {
    fs::create_directories(cfg.binary_dir);
    const auto existing = cfg.binary_dir / "ffprobe";
    {
        std::ofstream out(existing);
        out << "#!/bin/sh\nexit 0\n";
    }
    fs::permissions(existing, fs::perms::owner_all);

    auto p = make();
    EXPECT_EQ(p.ensure(), ProvisionState::Downloaded);
    EXPECT_EQ(http->downloads.load(), 0);
}

TEST_F(ProvisionerTest, UnsupportedPlatformNeverDownloads) {
    platform = {"linux", "riscv64"};
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    EXPECT_EQ(http->downloads.load(), 0);
    EXPECT_FALSE(p.commandPath());

    ASSERT_TRUE(p.lastError());
    EXPECT_EQ(p.lastError()->kind, types::ErrorKind::UnsupportedPlatform);
}

TEST_F(ProvisionerTest, BinaryFailingVerificationIsRemoved) {
    http->body = "#!/bin/sh\nexit 1\n";
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    EXPECT_FALSE(fs::exists(cfg.binary_dir / "ffprobe"));
    ASSERT_TRUE(p.lastError());
    EXPECT_EQ(p.lastError()->kind, types::ErrorKind::DownloadFailed);
}

TEST_F(ProvisionerTest, FailedDownloadWaitsForRetryInterval) {
    http->fail = true;
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    EXPECT_EQ(http->downloads.load(), 1);
    ASSERT_TRUE(p.lastError());
    EXPECT_EQ(p.lastError()->kind, types::ErrorKind::DownloadFailed);
}

TEST_F(ProvisionerTest, RetriesOnceIntervalElapsed) {
    http->fail = true;
    cfg.download_retry_interval = std::chrono::seconds(0);
    auto p = make();

    EXPECT_EQ(p.ensure(), ProvisionState::Unavailable);
    http->fail = false;
    EXPECT_EQ(p.ensure(), ProvisionState::Downloaded);
    EXPECT_EQ(http->downloads.load(), 2);
}

TEST_F(ProvisionerTest, TransportExceptionLeavesToolUnavailable) {
    http->throws = true;
    auto p = make();

    ProvisionState state{};
    EXPECT_NO_THROW(state = p.ensure());
    EXPECT_EQ(state, ProvisionState::Unavailable);
    ASSERT_TRUE(p.lastError());
    EXPECT_EQ(p.lastError()->kind, types::ErrorKind::DownloadFailed);
    EXPECT_NE(p.lastError()->message.find("curl_easy_init failed"), std::string::npos);
    EXPECT_FALSE(fs::exists(cfg.binary_dir / "ffprobe"));
}

TEST_F(ProvisionerTest, WorksWithoutRegisteredLogger) {
    struct RestoreLogger {
        std::shared_ptr<spdlog::logger> saved = spdlog::get("provision");
        RestoreLogger() { spdlog::drop("provision"); }
        ~RestoreLogger() { if (saved) spdlog::register_logger(saved); }
    } restore;

    auto p = make();
    ProvisionState state{};
    EXPECT_NO_THROW(state = p.ensure());
    EXPECT_EQ(state, ProvisionState::Downloaded);

    http->fail = true;
    std::error_code ec;
    fs::remove_all(cfg.binary_dir, ec);
    auto q = make();
    EXPECT_NO_THROW(state = q.ensure());
    EXPECT_EQ(state, ProvisionState::Unavailable);
    EXPECT_TRUE(q.lastError());
}

TEST_F(ProvisionerTest, RequiresProcessRunner) {
    EXPECT_THROW({ FFprobeProvisioner p(cfg, http, nullptr, platform); }, std::invalid_argument);
}
