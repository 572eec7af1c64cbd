#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "cancellation.hpp"

namespace fixbench {

/**
 * \brief Describes one child process invocation.
 *
 * `argv[0]` is resolved through PATH (execvp); no shell is involved, so arguments need
 * no quoting. The parent environment is inherited unchanged.
 */
struct ProcessSpec {
    std::vector<std::string> argv;
    std::string stdin_text{};               ///< Written to the child's stdin, then closed.
    std::filesystem::path cwd{};            ///< Optional working directory.
    std::chrono::milliseconds timeout{0};   ///< 0 = no own timeout (token may still apply).
    std::size_t max_output_bytes{1u << 20}; ///< Per-stream capture cap.
};

struct ProcessResult {
    bool started{false};     ///< fork succeeded; false means `error` explains why
    bool timed_out{false};   ///< own timeout expired, child killed
    bool cancelled{false};   ///< caller token expired, child killed
    bool exited{false};      ///< child exited normally (exit_code is meaningful)
    int exit_code{-1};
    int term_signal{0};
    std::string stdout_text;
    std::string stderr_text;
    std::string error;       ///< Spawn or I/O failure description
};

/**
 * Run a child process to completion, its own timeout, or token expiry, whichever comes
 * first. On timeout or cancellation the whole process group is SIGKILLed and reaped, so no
 * orphan survives the call. Never throws for process-level failures; those are reported
 * through ProcessResult::error.
 */
ProcessResult run_process(const ProcessSpec& spec, const CancellationToken* token = nullptr);

}  // namespace fixbench
