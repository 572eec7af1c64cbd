#include "../include/fixbench/command_generator.hpp"
#include "fixbench/process.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fixbench::command_bridge {

namespace {

constexpr std::size_t kStderrPreview = 200;

std::string trim_copy(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string with_stderr(std::string message, const std::string& stderr_text) {
    const auto err = trim_copy(stderr_text);
    if (!err.empty()) {
        message += ": " + err.substr(0, kStderrPreview);
    }
    return message;
}

} // namespace

CommandTextGenerator::CommandTextGenerator(Config cfg) : cfg_(std::move(cfg)) {
    if (cfg_.argv.empty()) {
        throw std::invalid_argument("CommandTextGenerator: empty command");
    }
}

std::string CommandTextGenerator::encode_request(const Prompt& prompt) {
    nlohmann::json j;
    j["system"] = prompt.system;
    j["user"] = prompt.user;
    j["temperature"] = prompt.temperature;
    return j.dump();
}

std::string CommandTextGenerator::complete(const Prompt& prompt, const CancellationToken* token) {
    ProcessSpec spec;
    spec.argv = cfg_.argv;
    spec.stdin_text = encode_request(prompt);
    spec.cwd = cfg_.work_dir;
    spec.timeout = cfg_.timeout;
    spec.max_output_bytes = cfg_.max_output_bytes;

    spdlog::debug("  [generator] {} ({} bytes in)", cfg_.argv.front(), spec.stdin_text.size());
    auto result = run_process(spec, token);

    if (result.cancelled) {
        throw OperationCancelled("cancelled: text generation");
    }
    if (!result.started || !result.error.empty()) {
        throw GenerationError("Generator failed: " + result.error);
    }
    if (result.timed_out) {
        throw GenerationError(with_stderr(
            "Generator timed out after " + std::to_string(cfg_.timeout.count()) + "ms", result.stderr_text));
    }
    if (!result.exited) {
        throw GenerationError(with_stderr(
            "Generator killed by signal " + std::to_string(result.term_signal), result.stderr_text));
    }
    if (result.exit_code != 0) {
        throw GenerationError(with_stderr(
            "Generator exited with status " + std::to_string(result.exit_code), result.stderr_text));
    }
    if (trim_copy(result.stdout_text).empty()) {
        throw GenerationError(with_stderr("Generator produced no output", result.stderr_text));
    }
    return std::move(result.stdout_text);
}

} // namespace fixbench::command_bridge
