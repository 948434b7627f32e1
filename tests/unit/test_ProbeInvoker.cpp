#include <gtest/gtest.h>
#include "probe/ProbeInvoker.hpp"
#include "support/Fakes.hpp"
#include "support/ProbeFixtures.hpp"

using namespace ms;
using namespace ms::types;
using ms::test::FakeProcessRunner;
using ms::test::exited;

class ProbeInvokerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();
    probe::ProbeInvoker invoker{config::ProbeConfig{}, runner};
};

TEST_F(ProbeInvokerTest, BuildsFfprobeCommandLine) {
    runner->handler = [](const auto&) { return exited(0, ms::test::ffprobeReport(0).dump()); };
    (void)invoker.probe("/opt/bin/ffprobe", "/tmp/head.bin");

    const auto calls = runner->calls();
    ASSERT_EQ(calls.size(), 1u);
    const std::vector<std::string> expected{"/opt/bin/ffprobe", "-v", "quiet", "-print_format", "json",
                                            "-show_format", "-show_streams", "-show_chapters", "/tmp/head.bin"};
    EXPECT_EQ(calls[0], expected);
}

TEST_F(ProbeInvokerTest, ParsesSuccessfulRun) {
    runner->handler = [](const auto&) { return exited(0, ms::test::ffprobeReport(3).dump()); };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");

    ASSERT_TRUE(ok(r));
    const auto& info = std::get<MediaInfo>(r);
    EXPECT_TRUE(info.probed());
    EXPECT_EQ(info.chapter_count, 3u);
}

TEST_F(ProbeInvokerTest, TimeoutIsProbeError) {
    runner->handler = [](const auto&) {
        process::ProcessResult res;
        res.timed_out = true;
        res.exit_code = 137;
        return res;
    };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).kind, ErrorKind::ProbeError);
}

TEST_F(ProbeInvokerTest, NonZeroExitIsProbeError) {
    runner->handler = [](const auto&) { return exited(1, "{}"); };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).kind, ErrorKind::ProbeError);
}

TEST_F(ProbeInvokerTest, OversizeOutputIsProbeError) {
    runner->handler = [](const auto&) {
        auto res = exited(0, "{");
        res.output_truncated = true;
        return res;
    };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).kind, ErrorKind::ProbeError);
}

TEST_F(ProbeInvokerTest, GarbageOutputIsProbeError) {
    runner->handler = [](const auto&) { return exited(0, "ffprobe version 6.0"); };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).kind, ErrorKind::ProbeError);
}

TEST_F(ProbeInvokerTest, LaunchFailureIsProbeError) {
    runner->handler = [](const auto&) -> process::ProcessResult { throw std::runtime_error("fork failed"); };
    const auto r = invoker.probe("ffprobe", "/tmp/head.bin");
    ASSERT_FALSE(ok(r));
    EXPECT_EQ(std::get<Error>(r).kind, ErrorKind::ProbeError);
}
