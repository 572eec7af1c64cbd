#pragma once

#include "evaluator.hpp"
#include "fix_producer.hpp"

#include <filesystem>
#include <vector>

namespace fixbench {

/**
 * \brief Emits machine-readable and human-friendly reports for evaluation runs.
 *
 * - write_summary(): JSON document with metrics, per-task results and, for A/B runs,
 *   the head-to-head partition.
 * - write_detailed(): HTML report with one table per agent.
 */
class MetricsWriter {
public:
    MetricsWriter() = default;

    void write_summary(const std::filesystem::path& destination,
                       const BatchReport& report,
                       const StrategyStats* stats = nullptr) const;

    void write_summary(const std::filesystem::path& destination, const AbReport& report) const;

    void write_detailed(const std::filesystem::path& destination,
                        const std::vector<BatchReport>& reports) const;
};

}  // namespace fixbench
