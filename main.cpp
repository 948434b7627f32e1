#include "config/ConfigRegistry.hpp"
#include "fetch/PartialFetcher.hpp"
#include "http/HttpClient.hpp"
#include "log/Registry.hpp"
#include "pipeline/Extractor.hpp"
#include "probe/ProbeInvoker.hpp"
#include "process/ProcessRunner.hpp"
#include "provision/Provisioner.hpp"
#include "service/FileRecordStore.hpp"
#include "service/MediaInfoService.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ms;
using ms::config::ConfigRegistry;
using ms::log::Registry;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> manifest;
    bool json = false;
    bool dump_config = false;
    bool warm_up = true;
    std::vector<std::string> keys;
};

void usage() {
    fmt::print(stderr,
               "usage: mediascope [--config <path>] [--manifest <file.json>] [--json] [--no-warmup] <key>...\n"
               "       mediascope [--config <path>] --dump-config\n"
               "\n"
               "Without --manifest each key is a path to a local file.\n");
}

std::optional<Options> parseArgs(const int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                fmt::print(stderr, "mediascope: {} requires a value\n", arg);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") return std::nullopt;
        if (arg == "--json") opts.json = true;
        else if (arg == "--dump-config") opts.dump_config = true;
        else if (arg == "--no-warmup") opts.warm_up = false;
        else if (arg == "--config") {
            if (!(opts.config_path = value())) return std::nullopt;
        } else if (arg == "--manifest") {
            if (!(opts.manifest = value())) return std::nullopt;
        } else if (arg.starts_with("--")) {
            fmt::print(stderr, "mediascope: unknown option {}\n", arg);
            return std::nullopt;
        } else opts.keys.emplace_back(arg);
    }

    if (!opts.dump_config && opts.keys.empty()) return std::nullopt;
    return opts;
}

int exitCodeFor(const service::Status s) {
    switch (s) {
        case service::Status::Ok: return EXIT_SUCCESS;
        case service::Status::NotFound: return 3;
        case service::Status::Disabled: return 4;
        case service::Status::Failed: return EXIT_FAILURE;
    }
    return EXIT_FAILURE;
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        usage();
        return 2;
    }

    try {
        if (opts->config_path) ConfigRegistry::init(std::filesystem::path(*opts->config_path));
        else ConfigRegistry::init();

        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging);

        if (opts->dump_config) {
            fmt::print("{}\n", nlohmann::json(cfg).dump(2));
            return EXIT_SUCCESS;
        }

        const auto runner = std::make_shared<process::PosixProcessRunner>();
        const auto httpClient = std::make_shared<http::CurlHttpClient>();
        const auto provisioner = std::make_shared<provision::FFprobeProvisioner>(cfg.provisioning, httpClient, runner);
        const auto fetcher = std::make_shared<fetch::PartialFetcher>(cfg.media_info, httpClient);
        const auto prober = std::make_shared<probe::ProbeInvoker>(cfg.probe, runner);
        const auto extractor = std::make_shared<pipeline::Extractor>(fetcher, provisioner, prober);

        std::shared_ptr<service::FileRecordStore> records;
        if (opts->manifest) records = std::make_shared<service::ManifestRecordStore>(*opts->manifest);
        else records = std::make_shared<service::LocalRecordStore>();

        service::MediaInfoService svc(cfg.media_info, records, extractor, provisioner);
        if (opts->warm_up) svc.warmUp();

        int rc = EXIT_SUCCESS;
        for (const auto& key : opts->keys) {
            const auto reply = svc.describe(key);
            if (reply.status != service::Status::Ok) rc = exitCodeFor(reply.status);

            if (opts->json) {
                nlohmann::json j = {
                    {"key", key},
                    {"status", std::string(service::to_string(reply.status))},
                    {"text", reply.text},
                    {"auto_delete_after_seconds", reply.auto_delete_after.count()},
                    {"closable", reply.closable},
                };
                if (reply.info) j["media_info"] = *reply.info;
                j["cache_stats"] = svc.cacheStats();
                fmt::print("{}\n", j.dump(2));
            } else {
                fmt::print("{}\n", reply.text);
            }
        }

        return rc;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::mediascope()->error("[-] mediascope failed: {}", e.what());
        else fmt::print(stderr, "mediascope: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
