#include "fixbench/direct_producer.hpp"
#include "fixbench/code_extract.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kReasonPreview = 60;
constexpr int kAttempts = 2;

constexpr const char* kSystemPrompt =
    "You are an expert Python debugger who fixes logic bugs with minimal edits.\n"
    "\n"
    "Check these first:\n"
    "1. Off-by-one errors in range() bounds and loop counters\n"
    "2. Boundary comparisons: < against <=, > against >=\n"
    "3. Edge cases: empty inputs, single elements, None\n"
    "4. Every branch returns the right value\n"
    "5. Swapped or wrong operators (+/-, *, //, %, **, min/max)\n"
    "6. Index access that can run past the end of a sequence\n"
    "\n"
    "Rules:\n"
    "- Reply with the complete fixed function and nothing else\n"
    "- Keep the exact signature and indentation style\n"
    "- No explanations, comments or markdown\n"
    "- Start with 'def' and stop after the function body";

constexpr const char* kRetryNote = "Previous attempt failed. Try different approach.";

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

bool contains(std::string_view haystack, std::string_view needle) {
    return haystack.find(needle) != std::string_view::npos;
}

std::string render_user(const std::string& code, const std::string& error, const std::string& context) {
    std::ostringstream os;
    os << "Buggy code:\n```python\n"
       << code << "\n```\n\n"
       << "Test failure: " << error << "\n\n"
       << context << "\n\n"
       << "Return ONLY the fixed function code, nothing else.";
    return os.str();
}

}  // namespace

namespace fixbench {

DirectProducer::DirectProducer(TextGenerator& generator) : DirectProducer(generator, Config{}) {}

DirectProducer::DirectProducer(TextGenerator& generator, Config cfg)
    : generator_{generator}, cfg_{std::move(cfg)}, executor_{cfg_.validation} {}

std::string DirectProducer::analyze_error(std::string_view diagnostic, std::string_view code) {
    const auto error = to_lower_copy(diagnostic);
    std::vector<std::string> hints;

    if (contains(error, "assert")) {
        hints.emplace_back("Test assertion failed - output doesn't match expected.");
    }
    if (contains(error, "index") && contains(error, "out of range")) {
        hints.emplace_back("Index out of range - check loop bounds and list access.");
    }
    if (contains(error, "key") && contains(error, "error")) {
        hints.emplace_back("KeyError - missing dictionary key check.");
    }
    if (contains(error, "none") && contains(error, "type")) {
        hints.emplace_back("NoneType error - missing None check or wrong return.");
    }
    if (contains(error, "recursion")) {
        hints.emplace_back("RecursionError - check base case and termination.");
    }
    if (contains(error, "expected") || contains(diagnostic, "!=")) {
        hints.emplace_back("Output mismatch - trace logic with failing test case.");
    }
    if (contains(code, "range(") && (contains(error, "expected") || contains(error, "assert"))) {
        hints.emplace_back("LIKELY: Off-by-one error in range() - check inclusive/exclusive bounds.");
    }
    const bool has_comparison = std::any_of(code.begin(), code.end(), [](char c) { return c == '<' || c == '>'; });
    if (has_comparison) {
        hints.emplace_back("Check comparison operators for boundary conditions.");
    }

    if (hints.empty()) {
        return "Analyze the test failure carefully.";
    }
    std::string out = "HINTS:";
    for (const auto& h : hints) {
        out += " " + h;
    }
    return out;
}

FixAttempt DirectProducer::fix(const FixRequest& request, const CancellationToken* token) {
    const bool validate = !request.test.empty() && !request.entry_point.empty();

    std::string context = analyze_error(request.diagnostic, request.buggy_code);
    if (!request.context.empty()) {
        context = request.context + "\n" + context;
    }
    std::string error = request.diagnostic;

    for (int attempt = 0; attempt < kAttempts; ++attempt) {
        try {
            if (token != nullptr) token->throw_if_expired("direct producer");

            Prompt prompt;
            prompt.system = kSystemPrompt;
            prompt.user = render_user(request.buggy_code, error, attempt == 0 ? context : kRetryNote);
            prompt.temperature = cfg_.temperature;

            const auto text = generator_.complete(prompt, token);
            auto fixed = extract::primary(text, request.buggy_code);

            if (!validate) {
                return FixAttempt{std::move(fixed), kUnvalidatedConfidence, "No tests to validate", name()};
            }

            const auto outcome = executor_.run(fixed, request.test, request.entry_point, token);
            if (token != nullptr) token->throw_if_expired("direct producer validation");

            if (outcome.succeeded) {
                spdlog::debug("  [direct] attempt {} validated", attempt + 1);
                return FixAttempt{std::move(fixed), kValidatedConfidence,
                                  "Validated (attempt " + std::to_string(attempt + 1) + ")", name()};
            }

            const auto diag = outcome.diagnostic.value_or("Tests failed");
            spdlog::debug("  [direct] attempt {} failed: {}", attempt + 1, diag);
            if (attempt + 1 < kAttempts) {
                error = diag;
                continue;
            }
            return FixAttempt{std::move(fixed), kFailedConfidence,
                              "Failed after " + std::to_string(kAttempts) + " attempts: " +
                                  diag.substr(0, kReasonPreview),
                              name()};
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& ex) {
            spdlog::debug("  [direct] attempt {} error: {}", attempt + 1, ex.what());
            if (attempt + 1 == kAttempts) {
                return FixAttempt{request.buggy_code, kErrorConfidence,
                                  "Error: " + std::string(ex.what()).substr(0, kReasonPreview), name()};
            }
        }
    }

    return FixAttempt{request.buggy_code, kErrorConfidence, "All attempts exhausted", name()};
}

}  // namespace fixbench
