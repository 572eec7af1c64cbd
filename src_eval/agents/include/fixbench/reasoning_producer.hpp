#pragma once

#include <string>

#include "fixbench/fix_producer.hpp"
#include "fixbench/text_generator.hpp"

namespace fixbench {

/**
 * \brief Chain-of-thought fix producer.
 *
 * Asks the generator to reason about the failure before writing the fix and extracts the
 * function with the secondary grammar. It does not validate its candidate, so attempts carry
 * no confidence. Generation failures yield the original code with the error as reasoning.
 */
class ReasoningProducer : public FixProducer {
public:
    struct Config {
        double temperature{0.1};
    };

    explicit ReasoningProducer(TextGenerator& generator);
    ReasoningProducer(TextGenerator& generator, Config cfg);

    [[nodiscard]] std::string name() const override { return "reasoning"; }

    [[nodiscard]] FixAttempt fix(const FixRequest& request, const CancellationToken* token) override;

private:
    TextGenerator& generator_;
    Config cfg_;
};

}  // namespace fixbench
