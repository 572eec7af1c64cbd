#pragma once

#include <string>
#include <vector>

namespace fixbench {

/**
 * \brief One bug-fixing problem as loaded from the dataset.
 *
 * Created at load time and treated as read-only afterwards. An empty `test` or
 * `entry_point` puts the sandbox into standalone mode for this task.
 */
struct Task {
    std::string task_id;
    std::string buggy_code;
    std::string test;
    std::string entry_point;
    std::string canonical_solution;  ///< Reference fix, carried but not graded or reported

    [[nodiscard]] bool has_harness() const noexcept { return !test.empty() && !entry_point.empty(); }
};

/**
 * \brief Tasks read from one dataset file, in file order.
 */
struct TaskSet {
    std::string source_file;
    std::vector<Task> tasks;
};

}  // namespace fixbench
