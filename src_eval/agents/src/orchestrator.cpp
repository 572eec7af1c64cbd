#include "fixbench/orchestrator.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace fixbench {

EscalationOrchestrator::EscalationOrchestrator(FixProducer& primary,
                                               SecondaryFactory secondary_factory,
                                               StrategyStats& stats,
                                               int confidence_threshold)
    : primary_{primary}, factory_{std::move(secondary_factory)}, stats_{stats}, threshold_{confidence_threshold} {}

FixAttempt EscalationOrchestrator::escalate(const FixRequest& request, const CancellationToken* token) {
    int confidence = 0;
    std::string reasoning;
    FixAttempt attempt;
    try {
        attempt = primary_.fix(request, token);
        confidence = attempt.confidence.value_or(0);
        reasoning = attempt.reasoning;
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::warn("  primary producer '{}' failed: {}", primary_.name(), ex.what());
        reasoning = std::string("Error: ") + ex.what();
    }

    if (confidence >= threshold_) {
        ++stats_.primary_used;
        spdlog::debug("  primary accepted (confidence {})", confidence);
        attempt.strategy = std::string{kPrimaryStrategy};
        return attempt;
    }

    spdlog::warn("  escalating: primary confidence {} < {}", confidence, threshold_);
    return run_secondary(request, reasoning, token);
}

FixAttempt EscalationOrchestrator::run_secondary(const FixRequest& request,
                                                 const std::string& primary_reasoning,
                                                 const CancellationToken* token) {
    ++stats_.secondary_used;

    FixRequest escalated = request;
    escalated.context = "Primary strategy attempted fix but failed: " + primary_reasoning;

    FixAttempt result;
    try {
        if (!secondary_) {
            secondary_ = factory_ ? factory_() : nullptr;
            if (!secondary_) {
                throw std::runtime_error("secondary producer factory returned nothing");
            }
        }
        result.code = secondary_->fix(escalated, token).code;
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::warn("  secondary producer failed, keeping original code: {}", ex.what());
        result.code = request.buggy_code;
    }

    result.confidence = std::nullopt;
    result.reasoning = "Escalated. " + primary_reasoning;
    result.strategy = std::string{kSecondaryStrategy};
    return result;
}

}  // namespace fixbench
