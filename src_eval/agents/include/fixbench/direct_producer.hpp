#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "fixbench/fix_producer.hpp"
#include "fixbench/sandbox.hpp"
#include "fixbench/text_generator.hpp"

namespace fixbench {

/**
 * \brief Fast, self-validating fix producer.
 *
 * Asks the generator for a minimal fix, extracts the function, and runs it against the
 * task harness in its own sandbox. A failed validation is retried once with the new
 * diagnostic and a "try something else" note. The returned confidence is one of four tiers:
 *
 *  - 95: candidate passed validation
 *  - 50: no harness available, candidate unvalidated
 *  - 25: candidate failed validation on both attempts
 *  -  0: generation failed on both attempts; the original code is returned
 */
class DirectProducer : public FixProducer {
public:
    static constexpr int kValidatedConfidence = 95;
    static constexpr int kUnvalidatedConfidence = 50;
    static constexpr int kFailedConfidence = 25;
    static constexpr int kErrorConfidence = 0;

    struct Config {
        SandboxExecutor::Config validation{default_validation()};
        double temperature{0.0};

        static SandboxExecutor::Config default_validation() {
            SandboxExecutor::Config cfg;
            cfg.timeout = std::chrono::seconds(6);
            return cfg;
        }
    };

    explicit DirectProducer(TextGenerator& generator);
    DirectProducer(TextGenerator& generator, Config cfg);

    [[nodiscard]] std::string name() const override { return "direct"; }

    [[nodiscard]] FixAttempt fix(const FixRequest& request, const CancellationToken* token) override;

    /// Heuristic hints derived from the diagnostic and the code, rendered as one line.
    [[nodiscard]] static std::string analyze_error(std::string_view diagnostic, std::string_view code);

private:
    TextGenerator& generator_;
    Config cfg_;
    SandboxExecutor executor_;
};

}  // namespace fixbench
