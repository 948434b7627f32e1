#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ms::process {

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool output_truncated = false;
    std::string out;

    [[nodiscard]] bool ok() const { return !timed_out && !output_truncated && exit_code == 0; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Runs argv[0] (PATH lookup applies) with stdout captured and stderr discarded.
    // The child is killed once the timeout expires or stdout grows past maxOutput.
    virtual ProcessResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout,
                              size_t maxOutput) = 0;
};

class PosixProcessRunner final : public ProcessRunner {
public:
    ProcessResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout,
                      size_t maxOutput) override;
};

}
