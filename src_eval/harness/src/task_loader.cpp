#include "fixbench/task_loader.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

using nlohmann::json;

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

bool is_blank(std::string_view line) {
    return line.find_first_not_of(kWhitespace) == std::string_view::npos;
}

std::string string_field(const json& obj, const char* key) {
    const auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

}  // namespace

namespace fixbench {

TaskSet TaskLoader::load(const std::filesystem::path& file, std::size_t limit) const {
    if (!std::filesystem::exists(file)) {
        throw std::runtime_error("Dataset file does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw std::runtime_error("Dataset path is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open dataset file: " + file.string());
    }

    TaskSet set;
    set.source_file = file.string();

    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        if (is_blank(raw_line)) {
            continue;
        }
        if (limit > 0 && set.tasks.size() >= limit) {
            break;
        }

        json record;
        try {
            record = json::parse(raw_line);
        } catch (const json::parse_error& ex) {
            throw std::runtime_error("Invalid JSON at " + file.string() + ":" + std::to_string(line_no) +
                                     ": " + ex.what());
        }
        if (!record.is_object()) {
            throw std::runtime_error("Expected a JSON object at " + file.string() + ":" +
                                     std::to_string(line_no));
        }

        Task task;
        task.task_id = string_field(record, "task_id");
        task.buggy_code = string_field(record, "buggy_code");
        task.test = string_field(record, "test");
        task.entry_point = string_field(record, "entry_point");
        task.canonical_solution = string_field(record, "canonical_solution");
        if (task.task_id.empty()) {
            task.task_id = "Problem_" + std::to_string(set.tasks.size() + 1);
        }
        set.tasks.emplace_back(std::move(task));
    }

    spdlog::info("Loaded {} tasks from {}", set.tasks.size(), set.source_file);
    return set;
}

}  // namespace fixbench
