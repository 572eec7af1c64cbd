#include "fixbench/evaluator.hpp"
#include "fixbench/cancellation.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

double seconds_since(fixbench::Clock::time_point start) {
    return std::chrono::duration<double>(fixbench::Clock::now() - start).count();
}

}  // namespace

namespace fixbench {

BatchMetrics BatchMetrics::fold(const std::vector<TaskResult>& results) {
    BatchMetrics m;
    double total_time = 0.0;
    for (const auto& r : results) {
        ++m.total;
        if (r.success) {
            ++m.fixed;
        } else {
            ++m.failed;
        }
        if (r.timed_out) {
            ++m.timeouts;
        }
        total_time += r.elapsed;
    }
    if (m.total > 0) {
        m.pass_rate = static_cast<double>(m.fixed) / static_cast<double>(m.total);
        m.avg_time = total_time / static_cast<double>(m.total);
    }
    return m;
}

HeadToHead compare(const BatchReport& first, const BatchReport& second) {
    if (first.results.size() != second.results.size()) {
        throw std::invalid_argument("A/B runs differ in length: " + std::to_string(first.results.size()) +
                                    " vs " + std::to_string(second.results.size()));
    }

    HeadToHead h;
    for (std::size_t i = 0; i < first.results.size(); ++i) {
        const auto& a = first.results[i];
        const auto& b = second.results[i];
        if (a.task_id != b.task_id) {
            throw std::invalid_argument("A/B runs differ at index " + std::to_string(i) + ": " + a.task_id +
                                        " vs " + b.task_id);
        }
        if (a.success && b.success) {
            ++h.both_correct;
        } else if (a.success) {
            ++h.only_first;
        } else if (b.success) {
            ++h.only_second;
        } else {
            ++h.both_failed;
        }
    }
    return h;
}

std::string winner(const AbReport& ab) {
    const double a = ab.first.metrics.pass_rate;
    const double b = ab.second.metrics.pass_rate;
    if (a > b) return ab.first.agent;
    if (b > a) return ab.second.agent;
    return "TIE";
}

BatchEvaluator::BatchEvaluator() : BatchEvaluator(Config{}) {}

BatchEvaluator::BatchEvaluator(Config config)
    : config_{std::move(config)}, diagnosis_{config_.diagnosis}, validation_{config_.validation} {}

TaskResult BatchEvaluator::evaluate_one(const Task& task, FixProducer& agent, StrategyStats* stats) const {
    TaskResult result;
    result.task_id = task.task_id;

    // Seeds the fix request only; not scored.
    const auto initial = diagnosis_.run(task.buggy_code, task.test, task.entry_point);
    result.diagnostic = initial.diagnostic.value_or(task.has_harness() ? "Tests failed" : "Code contains bugs");

    FixRequest request;
    request.buggy_code = task.buggy_code;
    request.diagnostic = result.diagnostic;
    request.test = task.test;
    request.entry_point = task.entry_point;

    const auto start = Clock::now();
    CancellationToken token(start + config_.task_timeout);

    try {
        const Watchdog watchdog(token, config_.task_timeout);

        const FixAttempt attempt = agent.fix(request, &token);
        result.strategy = attempt.strategy;

        bool success = false;
        if (attempt.confidence) {
            success = *attempt.confidence >= config_.confidence_threshold;
        } else {
            const auto verdict = validation_.run(attempt.code, task.test, task.entry_point, &token);
            success = verdict.succeeded;
            if (!success) {
                spdlog::debug("  validation: {}", verdict.diagnostic.value_or(""));
            }
        }

        // A verdict reached after the ceiling still counts as a timeout.
        token.throw_if_expired("task deadline");

        result.success = success;
        result.elapsed = seconds_since(start);
        if (success && stats != nullptr) {
            stats->record_success(result.strategy);
        }
    } catch (const OperationCancelled&) {
        result.success = false;
        result.timed_out = true;
        result.elapsed = std::chrono::duration<double>(config_.task_timeout).count();
        spdlog::warn("  {} timed out after {}s", task.task_id, result.elapsed);
    } catch (const std::exception& ex) {
        result.success = false;
        result.elapsed = seconds_since(start);
        spdlog::error("  {} error: {}", task.task_id, std::string(ex.what()).substr(0, 50));
    }
    return result;
}

BatchReport BatchEvaluator::run(const std::vector<Task>& tasks, FixProducer& agent, StrategyStats* stats) const {
    BatchReport report;
    report.agent = agent.name();
    report.results.reserve(tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        const auto& task = tasks[i];
        spdlog::info("[{}/{}] {}", i + 1, tasks.size(), task.task_id);

        auto result = evaluate_one(task, agent, stats);
        spdlog::info("  {} {} ({:.2f}s)", result.success ? "PASS" : "FAIL", report.agent, result.elapsed);
        report.results.push_back(std::move(result));
    }

    report.metrics = BatchMetrics::fold(report.results);
    return report;
}

AbReport BatchEvaluator::run_ab(const std::vector<Task>& tasks, FixProducer& first, FixProducer& second) const {
    spdlog::info("Round 1: {} ({} tasks)", first.name(), tasks.size());
    AbReport ab;
    ab.first = run(tasks, first);

    spdlog::info("Round 2: {} ({} tasks)", second.name(), tasks.size());
    ab.second = run(tasks, second);

    ab.head_to_head = compare(ab.first, ab.second);
    return ab;
}

}  // namespace fixbench
