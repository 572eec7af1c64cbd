#pragma once

#include "task.hpp"

#include <cstddef>
#include <filesystem>

namespace fixbench {

/**
 * \brief Loads bug-fixing tasks from a JSON Lines dataset.
 *
 * Each non-blank line is one JSON object:
 *
 * \code{.json}
 * {"task_id": "HumanEvalFix/0", "buggy_code": "def add(a, b):\n    return a - b\n",
 *  "test": "def check(f):\n    assert f(2, 3) == 5\n", "entry_point": "add"}
 * \endcode
 *
 * Recognised keys:
 *   - `task_id`: Optional. Falls back to `Problem_<n>` (1-based line order).
 *   - `buggy_code`: Source handed to the fix strategies.
 *   - `test`: Harness defining `check(candidate)`.
 *   - `entry_point`: Name of the function under test.
 *   - `canonical_solution`: Optional reference, carried but not used for grading.
 *
 * Missing or non-string values become empty strings. Other keys are ignored.
 * A line that is not a JSON object raises std::runtime_error naming `file:line`.
 */
class TaskLoader {
public:
    TaskLoader() = default;

    /// `limit` > 0 keeps only the first `limit` tasks.
    [[nodiscard]] TaskSet load(const std::filesystem::path& file, std::size_t limit = 0) const;
};

}  // namespace fixbench
