#include <gtest/gtest.h>
#include "fetch/PartialFetcher.hpp"
#include "format/Formatter.hpp"
#include "pipeline/Extractor.hpp"
#include "probe/ProbeInvoker.hpp"
#include "service/FileRecordStore.hpp"
#include "service/MediaInfoService.hpp"
#include "support/Fakes.hpp"
#include "support/ProbeFixtures.hpp"

#include <atomic>

using namespace ms;
using namespace ms::service;
using namespace ms::types;
using namespace std::chrono_literals;
using ms::test::FakeHttpClient;
using ms::test::FakeProcessRunner;
using ms::test::FakeProvisioner;
using ms::test::ScratchDir;
using ms::test::exited;

class MediaInfoServiceTest : public ::testing::Test {
protected:
    ScratchDir scratch{"mediascope-service"};
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();
    std::shared_ptr<FakeProvisioner> provisioner = std::make_shared<FakeProvisioner>();
    std::shared_ptr<pipeline::Extractor> extractor;
    std::shared_ptr<FileRecordStore> records;
    config::MediaInfoConfig cfg;

    std::shared_ptr<std::atomic<cache::ResultCache::Clock::rep>> ticks =
        std::make_shared<std::atomic<cache::ResultCache::Clock::rep>>(0);

    void SetUp() override {
        cfg.temp_dir = scratch.path / "tmp";
        extractor = std::make_shared<pipeline::Extractor>(
            std::make_shared<fetch::PartialFetcher>(cfg, std::make_shared<FakeHttpClient>()), provisioner,
            std::make_shared<probe::ProbeInvoker>(config::ProbeConfig{}, runner));

        scratch.write("avengers.mkv", std::string(4096, 'a'));
        scratch.write("manifest.json", R"({"files": [
            {"key": "AgADavengers", "file_name": "The.Avengers.2012.720p.Hindi.English.mkv",
             "size_bytes": 1503238554, "storage_reference": "avengers.mkv", "mime_type": "video/x-matroska"},
            {"key": "AgADgone", "file_name": "Gone.2012.1080p.mkv", "size_bytes": 10,
             "storage_reference": "https://cdn.invalid/gone"}
        ]})");
        records = std::make_shared<ManifestRecordStore>(scratch.path / "manifest.json");
    }

    [[nodiscard]] MediaInfoService make() const {
        return {cfg, records, extractor, provisioner,
                [t = ticks] { return cache::ResultCache::Clock::time_point(cache::ResultCache::Clock::duration(t->load())); }};
    }

    void advance(const std::chrono::nanoseconds d) const {
        ticks->fetch_add(std::chrono::duration_cast<cache::ResultCache::Clock::duration>(d).count());
    }
};

TEST_F(MediaInfoServiceTest, DescribesKnownFile) {
    provisioner->command = "ffprobe";
    runner->handler = [](const auto&) { return exited(0, ms::test::ffprobeReport().dump()); };
    auto svc = make();

    const auto reply = svc.describe("AgADavengers");
    EXPECT_EQ(reply.status, Status::Ok);
    EXPECT_TRUE(reply.closable);
    EXPECT_EQ(reply.auto_delete_after, 120s);
    ASSERT_TRUE(reply.info);
    EXPECT_TRUE(reply.info->probed());
    EXPECT_EQ(reply.info->size_bytes, 1503238554u);
    EXPECT_NE(reply.text.find("File: The.Avengers.2012.720p.Hindi.English.mkv"), std::string::npos);
    EXPECT_NE(reply.text.find("...and 15 more"), std::string::npos);
}

TEST_F(MediaInfoServiceTest, UnknownKeyIsNotFoundAndNotCached) {
    auto svc = make();

    const auto reply = svc.describe("AgADmissing");
    EXPECT_EQ(reply.status, Status::NotFound);
    EXPECT_EQ(reply.text, FILE_NOT_FOUND_TEXT);
    EXPECT_EQ(reply.auto_delete_after, 30s);
    EXPECT_FALSE(reply.info);

    svc.describe("AgADmissing");
    EXPECT_EQ(svc.cacheStats().entries, 0u);
    EXPECT_EQ(svc.cacheStats().misses, 0u);
}

TEST_F(MediaInfoServiceTest, HeuristicResultIsCachedToo) {
    auto svc = make();

    const auto first = svc.describe("AgADgone");
    EXPECT_EQ(first.status, Status::Ok);
    ASSERT_TRUE(first.info);
    EXPECT_FALSE(first.info->probed());
    EXPECT_NE(first.text.find(format::NOT_AVAILABLE), std::string::npos);

    const auto second = svc.describe("AgADgone");
    EXPECT_EQ(second.text, first.text);
    EXPECT_EQ(svc.cacheStats().misses, 1u);
    EXPECT_EQ(svc.cacheStats().hits, 1u);
}

TEST_F(MediaInfoServiceTest, CacheExpiresAfterTtl) {
    provisioner->command = "ffprobe";
    runner->handler = [](const auto&) { return exited(0, ms::test::ffprobeReport().dump()); };
    auto svc = make();

    svc.describe("AgADavengers");
    advance(4min + 59s);
    svc.describe("AgADavengers");
    EXPECT_EQ(runner->calls().size(), 1u);

    advance(2s);
    svc.describe("AgADavengers");
    EXPECT_EQ(runner->calls().size(), 2u);
}

TEST_F(MediaInfoServiceTest, DisabledFeature) {
    cfg.enabled = false;
    auto svc = make();

    const auto reply = svc.describe("AgADavengers");
    EXPECT_EQ(reply.status, Status::Disabled);
    EXPECT_FALSE(reply.info);
    EXPECT_TRUE(runner->calls().empty());
}

TEST_F(MediaInfoServiceTest, PipelineExceptionBecomesFailedReply) {
    class ThrowingStore final : public FileRecordStore {
    public:
        [[nodiscard]] std::optional<FileRecord> lookup(const std::string&) const override {
            throw std::runtime_error("database unavailable");
        }
    };
    records = std::make_shared<ThrowingStore>();
    auto svc = make();

    const auto reply = svc.describe("AgADavengers");
    EXPECT_EQ(reply.status, Status::Failed);
    EXPECT_EQ(reply.text, EXTRACTION_FAILED_TEXT);
    EXPECT_EQ(reply.auto_delete_after, 30s);
    EXPECT_TRUE(reply.closable);
}

TEST_F(MediaInfoServiceTest, WarmUpProvisionsOnce) {
    const auto svc = make();
    svc.warmUp();
    EXPECT_EQ(provisioner->ensureCalls.load(), 1);
}

TEST_F(MediaInfoServiceTest, ManifestResolvesRelativeReferences) {
    const auto rec = records->lookup("AgADavengers");
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->storage_reference, (scratch.path / "avengers.mkv").string());
    EXPECT_EQ(rec->mime_type, "video/x-matroska");

    const auto remote = records->lookup("AgADgone");
    ASSERT_TRUE(remote);
    EXPECT_EQ(remote->storage_reference, "https://cdn.invalid/gone");
    EXPECT_FALSE(records->lookup("nope"));
}

TEST_F(MediaInfoServiceTest, ManifestRejectsBadDocuments) {
    const auto bad = scratch.write("bad.json", R"({"files": 3})");
    EXPECT_THROW(ManifestRecordStore{bad}, std::runtime_error);
    EXPECT_THROW(ManifestRecordStore{scratch.path / "absent.json"}, std::runtime_error);
}

TEST(LocalRecordStoreTest, KeyIsAPath) {
    const ScratchDir scratch{"mediascope-local"};
    const auto file = scratch.write("Song.Tamil.flac", std::string(1500, 's'));

    const LocalRecordStore store;
    const auto rec = store.lookup(file.string());
    ASSERT_TRUE(rec);
    EXPECT_EQ(rec->file_name, "Song.Tamil.flac");
    EXPECT_EQ(rec->size_bytes, 1500u);
    EXPECT_FALSE(store.lookup((scratch.path / "missing.flac").string()));
    EXPECT_FALSE(store.lookup(scratch.path.string()));
}
