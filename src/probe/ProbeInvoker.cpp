#include "probe/ProbeInvoker.hpp"
#include "probe/ProbeParser.hpp"
#include "process/ProcessRunner.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <stdexcept>

using namespace ms::probe;
using namespace ms::types;
using ms::log::Registry;

ProbeInvoker::ProbeInvoker(config::ProbeConfig cfg, std::shared_ptr<process::ProcessRunner> runner)
    : cfg_(std::move(cfg)), runner_(std::move(runner)) {
    if (!runner_) throw std::invalid_argument("ProbeInvoker requires a process runner");
}

std::vector<std::string> ProbeInvoker::commandLine(const std::string& command, const std::filesystem::path& input) {
    return {command, "-v", "quiet", "-print_format", "json",
            "-show_format", "-show_streams", "-show_chapters", input.string()};
}

Result<MediaInfo> ProbeInvoker::probe(const std::string& command, const std::filesystem::path& input) const {
    process::ProcessResult res;
    try {
        res = runner_->run(commandLine(command, input),
                           std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.timeout),
                           static_cast<size_t>(cfg_.max_output_bytes));
    } catch (const std::exception& e) {
        Registry::probe()->error("[ProbeInvoker] Failed to launch {}: {}", command, e.what());
        return Error{ErrorKind::ProbeError, fmt::format("failed to launch {}: {}", command, e.what())};
    }

    if (res.timed_out) {
        Registry::probe()->warn("[ProbeInvoker] {} timed out after {}s on {}", command, cfg_.timeout.count(),
                                input.string());
        return Error{ErrorKind::ProbeError, "probe timed out"};
    }

    if (res.output_truncated) {
        Registry::probe()->warn("[ProbeInvoker] {} produced more than {} bytes, output discarded", command,
                                cfg_.max_output_bytes);
        return Error{ErrorKind::ProbeError, "probe output too large"};
    }

    if (res.exit_code != 0) {
        Registry::probe()->warn("[ProbeInvoker] {} exited with code {} on {}", command, res.exit_code,
                                input.string());
        return Error{ErrorKind::ProbeError, fmt::format("probe exited with code {}", res.exit_code)};
    }

    auto parsed = ProbeParser::parse(res.out);
    if (const auto* err = std::get_if<Error>(&parsed))
        Registry::probe()->warn("[ProbeInvoker] Unusable output for {}: {}", input.string(), err->message);
    return parsed;
}
