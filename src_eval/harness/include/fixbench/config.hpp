#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace fixbench {

/**
 * \brief Run-wide settings for a fixbench evaluation.
 *
 * Defaults match the values the components use on their own; a config file and then
 * the command line override them.
 */
struct EvalConfig {
#ifdef FIXBENCH_PYTHON_EXE
    std::string python_exe{FIXBENCH_PYTHON_EXE};
#else
    std::string python_exe{"python3"};
#endif
    std::filesystem::path work_dir{};

    std::chrono::seconds sandbox_timeout{5};
    std::chrono::seconds validation_timeout{6};
    std::chrono::seconds diagnosis_timeout{10};
    std::chrono::seconds task_timeout{30};
    std::chrono::seconds generator_timeout{30};

    int confidence_threshold{80};
    std::size_t limit{0};

    double primary_temperature{0.0};
    double secondary_temperature{0.1};

    // External completion command, argv form.
    std::vector<std::string> generator_command{};
};

/**
 * \brief Reads `key=value` settings into an EvalConfig.
 *
 * Lines starting with `#` and blank lines are ignored; keys and values are trimmed.
 * Recognised keys are the EvalConfig field names, timeouts suffixed with `_sec`
 * (e.g. `task_timeout_sec=45`). `generator` is split on whitespace into argv;
 * `generator_arg` appends one argument verbatim and may repeat.
 *
 * Unknown keys and malformed values raise std::runtime_error naming `file:line`.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /// Applies the file on top of `base` and returns the result.
    [[nodiscard]] EvalConfig load(const std::filesystem::path& file, EvalConfig base = {}) const;
};

}  // namespace fixbench
