#pragma once

#include <functional>
#include <memory>
#include <string>

#include "fixbench/fix_producer.hpp"

namespace fixbench {

/**
 * \brief Confidence-gated escalation from a primary to a secondary fix producer.
 *
 * The primary producer is always tried first. Its candidate is kept when the reported
 * confidence reaches the threshold; anything less (a missing confidence or an exception
 * counts as 0) escalates to the secondary producer, whose candidate is accepted as is.
 *
 * The secondary producer is built by `SecondaryFactory` on first escalation and reused
 * afterwards. Producer exceptions never escape escalate(), except OperationCancelled,
 * which the batch evaluator needs to record a timeout.
 *
 * Usage counters go to the StrategyStats passed in and count the strategy that supplied
 * the returned candidate, so `primary_used + secondary_used` equals the number of calls.
 * Success counters are bumped by whoever knows the verdict.
 */
class EscalationOrchestrator : public FixProducer {
public:
    using SecondaryFactory = std::function<std::unique_ptr<FixProducer>()>;

    static constexpr int kDefaultThreshold = 80;

    EscalationOrchestrator(FixProducer& primary,
                           SecondaryFactory secondary_factory,
                           StrategyStats& stats,
                           int confidence_threshold = kDefaultThreshold);

    [[nodiscard]] std::string name() const override { return "orchestrated"; }

    [[nodiscard]] FixAttempt fix(const FixRequest& request, const CancellationToken* token) override {
        return escalate(request, token);
    }

    /// Primary first, secondary on low confidence. `strategy` is set to primary or secondary.
    [[nodiscard]] FixAttempt escalate(const FixRequest& request, const CancellationToken* token);

    [[nodiscard]] int threshold() const noexcept { return threshold_; }

    /// True once the secondary producer has been built.
    [[nodiscard]] bool secondary_ready() const noexcept { return secondary_ != nullptr; }

private:
    [[nodiscard]] FixAttempt run_secondary(const FixRequest& request,
                                           const std::string& primary_reasoning,
                                           const CancellationToken* token);

    FixProducer& primary_;
    SecondaryFactory factory_;
    std::unique_ptr<FixProducer> secondary_;
    StrategyStats& stats_;
    int threshold_;
};

}  // namespace fixbench
