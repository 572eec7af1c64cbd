#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "fix_producer.hpp"
#include "sandbox.hpp"
#include "task.hpp"

namespace fixbench {

/**
 * \brief Verdict for one task within a batch run.
 */
struct TaskResult {
    std::string task_id;
    bool success{false};
    double elapsed{0.0};      ///< Seconds; equals the ceiling for timed-out tasks
    bool timed_out{false};
    std::string strategy{};   ///< Strategy of the returned attempt; empty if none returned
    std::string diagnostic{}; ///< Initial diagnostic seeded into the fix request
};

/**
 * \brief Aggregate over a sequence of TaskResults.
 *
 * Always derived with fold(); `fixed + failed == total` holds by construction.
 */
struct BatchMetrics {
    std::size_t total{0};
    std::size_t fixed{0};
    std::size_t failed{0};
    double pass_rate{0.0};  ///< fixed / total, 0 for an empty batch
    double avg_time{0.0};   ///< Mean elapsed seconds
    std::size_t timeouts{0};

    [[nodiscard]] static BatchMetrics fold(const std::vector<TaskResult>& results);
};

struct BatchReport {
    std::string agent;
    BatchMetrics metrics;
    std::vector<TaskResult> results;  ///< Same order as the input tasks
};

/**
 * \brief Four-way partition of two runs over the same task sequence.
 */
struct HeadToHead {
    std::size_t both_correct{0};
    std::size_t only_first{0};
    std::size_t only_second{0};
    std::size_t both_failed{0};

    [[nodiscard]] std::size_t total() const noexcept {
        return both_correct + only_first + only_second + both_failed;
    }
};

struct AbReport {
    BatchReport first;
    BatchReport second;
    HeadToHead head_to_head;
};

/**
 * Pairwise comparison of same-index results.
 * Throws std::invalid_argument when the runs differ in length or task order.
 */
[[nodiscard]] HeadToHead compare(const BatchReport& first, const BatchReport& second);

/// Agent with the strictly higher pass rate, or "TIE".
[[nodiscard]] std::string winner(const AbReport& ab);

/**
 * \brief Drives tasks through an agent, one at a time, under a per-task watchdog.
 *
 * Per task: the buggy code is run once to obtain a diagnostic, then the agent is called
 * under a watchdog bounding the whole pipeline (generation round-trips included). A returned
 * confidence decides success directly against the threshold; otherwise the candidate is
 * re-executed and the sandbox verdict decides. Watchdog expiry kills any in-flight child
 * and records a timed-out failure; other exceptions record a failure. Neither stops the batch.
 */
class BatchEvaluator {
public:
    struct Config {
        SandboxExecutor::Config diagnosis{};   ///< Initial run of the buggy code
        SandboxExecutor::Config validation{};  ///< Re-execution of unvalidated candidates
        std::chrono::milliseconds task_timeout{std::chrono::seconds(30)};
        int confidence_threshold{80};
    };

    BatchEvaluator();
    explicit BatchEvaluator(Config config);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    /**
     * Evaluate `agent` on `tasks` in order.
     *
     * Parameters:
     *  - tasks: Ordered task sequence; the report preserves this order.
     *  - agent: Orchestrator or bare producer under test.
     *  - stats: Optional accumulator; successful verdicts bump the attempt's strategy count.
     */
    [[nodiscard]] BatchReport run(const std::vector<Task>& tasks,
                                  FixProducer& agent,
                                  StrategyStats* stats = nullptr) const;

    /// Run both agents over the identical task sequence and partition the outcomes.
    [[nodiscard]] AbReport run_ab(const std::vector<Task>& tasks,
                                  FixProducer& first,
                                  FixProducer& second) const;

private:
    [[nodiscard]] TaskResult evaluate_one(const Task& task, FixProducer& agent, StrategyStats* stats) const;

    Config config_;
    SandboxExecutor diagnosis_;
    SandboxExecutor validation_;
};

}  // namespace fixbench
