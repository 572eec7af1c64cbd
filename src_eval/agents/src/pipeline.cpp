#include "fixbench/pipeline.hpp"

#include <chrono>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace fixbench {

FixPipeline::FixPipeline(EscalationOrchestrator& orchestrator, StrategyStats& stats)
    : FixPipeline(orchestrator, stats, Config{}) {}

FixPipeline::FixPipeline(EscalationOrchestrator& orchestrator, StrategyStats& stats, Config cfg)
    : orchestrator_{orchestrator},
      stats_{stats},
      cfg_{std::move(cfg)},
      diagnosis_{cfg_.diagnosis},
      validation_{cfg_.validation} {}

PipelineResult FixPipeline::run(const Task& task, const CancellationToken* token) {
    const auto start = Clock::now();
    ++total_;

    FixRequest request;
    request.buggy_code = task.buggy_code;
    request.test = task.test;
    request.entry_point = task.entry_point;
    if (task.has_harness()) {
        const auto initial = diagnosis_.run(task.buggy_code, task.test, task.entry_point, token);
        request.diagnostic = initial.diagnostic.value_or("Tests failed");
    } else {
        request.diagnostic = "Code contains bugs";
    }

    auto attempt = orchestrator_.escalate(request, token);
    const auto verdict = validation_.run(attempt.code, task.test, task.entry_point, token);

    PipelineResult result;
    result.success = verdict.succeeded;
    result.fixed_code = std::move(attempt.code);
    result.confidence = attempt.confidence;
    if (result.success) {
        ++fixed_;
        stats_.record_success(attempt.strategy);
        result.strategy = std::move(attempt.strategy);
    } else {
        ++failed_;
        result.strategy = "failed";
        spdlog::debug("  {} still failing: {}", task.task_id, verdict.diagnostic.value_or(""));
    }
    result.elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    return result;
}

}  // namespace fixbench
