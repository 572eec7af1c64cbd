#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "fixbench/cancellation.hpp"
#include "fixbench/fix_producer.hpp"
#include "fixbench/sandbox.hpp"
#include "fixbench/task.hpp"
#include "orchestrator.hpp"

namespace fixbench {

struct PipelineResult {
    bool success{false};
    std::string fixed_code;
    std::string strategy;            ///< "failed" when the returned code does not pass
    std::optional<int> confidence{};
    double elapsed{0.0};             ///< Seconds
};

/**
 * \brief Single-task driver: diagnose, escalate, then re-validate the returned code.
 *
 * Unlike the batch evaluator, the verdict always comes from re-running the candidate,
 * whatever confidence the orchestrator reported.
 */
class FixPipeline {
public:
    struct Config {
        SandboxExecutor::Config diagnosis{default_diagnosis()};
        SandboxExecutor::Config validation{};

        static SandboxExecutor::Config default_diagnosis() {
            SandboxExecutor::Config cfg;
            cfg.timeout = std::chrono::seconds(10);
            return cfg;
        }
    };

    FixPipeline(EscalationOrchestrator& orchestrator, StrategyStats& stats);
    FixPipeline(EscalationOrchestrator& orchestrator, StrategyStats& stats, Config cfg);

    [[nodiscard]] PipelineResult run(const Task& task, const CancellationToken* token = nullptr);

    [[nodiscard]] std::size_t total() const noexcept { return total_; }
    [[nodiscard]] std::size_t fixed() const noexcept { return fixed_; }
    [[nodiscard]] std::size_t failed() const noexcept { return failed_; }

private:
    EscalationOrchestrator& orchestrator_;
    StrategyStats& stats_;
    Config cfg_;
    SandboxExecutor diagnosis_;
    SandboxExecutor validation_;
    std::size_t total_{0};
    std::size_t fixed_{0};
    std::size_t failed_{0};
};

}  // namespace fixbench
