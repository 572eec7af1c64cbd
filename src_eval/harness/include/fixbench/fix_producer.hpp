#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "cancellation.hpp"

namespace fixbench {

/// Strategy labels reported by the escalation orchestrator.
inline constexpr std::string_view kPrimaryStrategy = "primary";
inline constexpr std::string_view kSecondaryStrategy = "secondary";

/**
 * \brief Input to a fix producer.
 *
 * `test` and `entry_point` may be empty; self-validating producers then skip validation.
 * `context` is an optional note from an earlier strategy (e.g. why it failed).
 */
struct FixRequest {
    std::string buggy_code;
    std::string diagnostic;
    std::string test{};
    std::string entry_point{};
    std::string context{};
};

/**
 * \brief Candidate produced by one fix producer invocation.
 *
 * `confidence` is only present for producers that validate their own candidate; its
 * values are discrete tiers, not a calibrated probability.
 */
struct FixAttempt {
    std::string code;
    std::optional<int> confidence{};
    std::string reasoning{};
    std::string strategy{};  ///< primary / secondary, or the producer name when used bare
};

/**
 * \brief Polymorphic "buggy code + diagnostic -> candidate" capability.
 *
 * Implementations honour `token`: blocking work selects against it, and an expired token
 * surfaces as OperationCancelled. Other failures are the implementation's to handle
 * according to its own contract.
 */
class FixProducer {
public:
    virtual ~FixProducer() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual FixAttempt fix(const FixRequest& request, const CancellationToken* token) = 0;
};

/**
 * \brief Strategy usage and success tallies for one batch run.
 *
 * Owned by whoever drives the run and passed by reference to the orchestrator and the
 * evaluator; nothing keeps it beyond that run.
 */
struct StrategyStats {
    // Tasks whose returned candidate came from each strategy.
    std::size_t primary_used{0};
    std::size_t secondary_used{0};
    std::size_t primary_success{0};
    std::size_t secondary_success{0};

    void record_success(std::string_view strategy) noexcept {
        if (strategy == kPrimaryStrategy) {
            ++primary_success;
        } else if (strategy == kSecondaryStrategy) {
            ++secondary_success;
        }
    }
};

}  // namespace fixbench
