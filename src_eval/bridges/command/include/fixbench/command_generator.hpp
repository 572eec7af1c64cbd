#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "fixbench/text_generator.hpp"

namespace fixbench::command_bridge
{

/**
 * Text generator backed by an external command.
 *
 * Each completion spawns the configured command (argv form, no shell), writes the prompt as
 * one JSON object to its stdin and takes everything it prints on stdout as the completion:
 *
 *     {"system": "...", "user": "...", "temperature": 0.1}
 *
 * This keeps model access (HTTP clients, API keys, local runtimes) out of the evaluator; any
 * script that honours the contract can serve as the model.
 */
class CommandTextGenerator : public TextGenerator
{
public:
    struct Config
    {
        // Command and arguments, argv[0] resolved through PATH.
        std::vector<std::string> argv;

        // Optional working directory for the command.
        std::filesystem::path work_dir;

        // Per-completion timeout, independent of the caller's token.
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};

        // Cap on captured stdout/stderr.
        std::size_t max_output_bytes{1u << 20};
    };

    explicit CommandTextGenerator(Config cfg);

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

    /**
     * Run the command once for `prompt`.
     *
     * Throws:
     *  - GenerationError on spawn failure, own timeout, non-zero exit or empty output
     *    (the message carries the command's stderr)
     *  - OperationCancelled when `token` expired while the command was running
     */
    [[nodiscard]] std::string complete(const Prompt& prompt, const CancellationToken* token) override;

    /// Request document written to the command's stdin.
    [[nodiscard]] static std::string encode_request(const Prompt& prompt);

private:
    Config cfg_;
};

} // namespace fixbench::command_bridge
