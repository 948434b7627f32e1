#pragma once

#include "config/Config.hpp"
#include "types/Error.hpp"
#include "types/MediaInfo.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ms::process { class ProcessRunner; }

namespace ms::probe {

class ProbeInvoker {
public:
    ProbeInvoker(config::ProbeConfig cfg, std::shared_ptr<process::ProcessRunner> runner);

    // Runs the probe tool against a local file and parses its report. Timeouts,
    // non-zero exits and unparseable output all come back as ProbeError.
    [[nodiscard]] types::Result<types::MediaInfo> probe(const std::string& command,
                                                        const std::filesystem::path& input) const;

    static std::vector<std::string> commandLine(const std::string& command, const std::filesystem::path& input);

private:
    config::ProbeConfig cfg_;
    std::shared_ptr<process::ProcessRunner> runner_;
};

}
