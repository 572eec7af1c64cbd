#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cancellation.hpp"

namespace fixbench {

/// Sentinels printed by the generated guard around `check(<entry_point>)`.
inline constexpr std::string_view kPassMarker = "__TEST_PASSED__";
inline constexpr std::string_view kFailMarker = "__TEST_FAILED__";
inline constexpr std::string_view kErrorMarker = "__EXECUTION_ERROR__";

/// Child exit codes for the two failure markers.
inline constexpr int kFailExitCode = 1;
inline constexpr int kErrorExitCode = 2;

/**
 * \brief Classified result of one sandbox invocation.
 *
 * Invariant: `succeeded` implies `!diagnostic`.
 */
struct ExecutionOutcome {
    bool succeeded{false};
    std::optional<std::string> diagnostic{};  ///< Human readable cause, present iff failed
    std::string raw_output{};                 ///< Captured stdout
    bool timed_out{false};                    ///< Own timeout or caller deadline expired
    std::optional<int> exit_code{};           ///< Set when the child exited normally
};

/**
 * \brief Runs candidate code plus its test harness in a separate interpreter process.
 *
 * Each invocation writes the combined program to a fresh, uniquely named temporary file
 * which is removed on every exit path. The child is bounded by `Config::timeout` and, when
 * given, by the caller's cancellation token; either expiry kills it.
 *
 * `run()` never throws: infrastructure problems (temp file, spawn) are reported as a
 * failed outcome with an "Execution error: ..." diagnostic.
 */
class SandboxExecutor {
public:
    struct Config {
        // Interpreter used to execute candidates.
#ifdef FIXBENCH_PYTHON_EXE
        std::string python_exe{FIXBENCH_PYTHON_EXE};
#else
        std::string python_exe{"python3"};
#endif

        // Directory for temporary programs (empty = system temp directory).
        std::filesystem::path work_dir{};

        // Wall-clock limit of the child process.
        std::chrono::milliseconds timeout{std::chrono::seconds(5)};

        // Per-stream capture cap.
        std::size_t max_output_bytes{1u << 20};
    };

    SandboxExecutor() = default;
    explicit SandboxExecutor(Config cfg);

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

    /**
     * Execute `source` followed by `harness` and classify the result.
     *
     * Parameters:
     *  - source:      Candidate function definition(s); may be invalid.
     *  - harness:     Test code defining `check(candidate)`; empty = standalone run.
     *  - entry_point: Symbol passed to `check`; empty = standalone run.
     *  - token:       Optional outer deadline; expiry kills the child.
     */
    [[nodiscard]] ExecutionOutcome run(std::string_view source,
                                       std::string_view harness,
                                       std::string_view entry_point,
                                       const CancellationToken* token = nullptr) const;

    /// Program text actually handed to the interpreter.
    [[nodiscard]] static std::string compose_program(std::string_view source,
                                                     std::string_view harness,
                                                     std::string_view entry_point);

    /**
     * Apply the marker precedence to captured process output.
     *
     * PASS marker, then FAIL marker, then ERROR marker (with the undefined entry point
     * rewrite), then non-zero exit (stderr as diagnostic), otherwise success.
     */
    [[nodiscard]] static ExecutionOutcome classify(const std::string& stdout_text,
                                                   const std::string& stderr_text,
                                                   int exit_code,
                                                   std::string_view entry_point);

private:
    Config cfg_{};
};

}  // namespace fixbench
