#include "fixbench/reasoning_producer.hpp"
#include "fixbench/code_extract.hpp"

#include <exception>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kSystemPrompt =
    "You are a senior Python engineer fixing a failing function.\n"
    "\n"
    "Work through it step by step:\n"
    "1. State what the function is supposed to do\n"
    "2. Explain why the current code produces the reported failure\n"
    "3. Identify the smallest change that fixes it\n"
    "4. Check the change against edge cases\n"
    "\n"
    "Then give the complete fixed function in a ```python block.";

std::string render_user(const fixbench::FixRequest& request) {
    std::ostringstream os;
    os << "Fix this function:\n\n```python\n"
       << request.buggy_code << "\n```\n\n"
       << "Error:\n"
       << request.diagnostic << "\n";
    if (!request.context.empty()) {
        os << "\nPREVIOUS ATTEMPT:\n" << request.context << "\n";
    }
    return os.str();
}

}  // namespace

namespace fixbench {

ReasoningProducer::ReasoningProducer(TextGenerator& generator) : ReasoningProducer(generator, Config{}) {}

ReasoningProducer::ReasoningProducer(TextGenerator& generator, Config cfg) : generator_{generator}, cfg_{cfg} {}

FixAttempt ReasoningProducer::fix(const FixRequest& request, const CancellationToken* token) {
    if (token != nullptr) token->throw_if_expired("reasoning producer");

    Prompt prompt;
    prompt.system = kSystemPrompt;
    prompt.user = render_user(request);
    prompt.temperature = cfg_.temperature;

    try {
        const auto text = generator_.complete(prompt, token);
        auto code = extract::secondary(text, request.buggy_code);
        spdlog::debug("  [reasoning] extracted {} bytes", code.size());
        return FixAttempt{std::move(code), std::nullopt, "Chain-of-thought fix", name()};
    } catch (const OperationCancelled&) {
        throw;
    } catch (const std::exception& ex) {
        spdlog::warn("  [reasoning] generation failed: {}", ex.what());
        return FixAttempt{request.buggy_code, std::nullopt, std::string("Error: ") + ex.what(), name()};
    }
}

}  // namespace fixbench
