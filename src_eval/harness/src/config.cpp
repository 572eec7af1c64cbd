#include "fixbench/config.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
// Keeps deadlines representable as steady_clock time points and millisecond counts.
constexpr long long kMaxTimeoutSec = 86400;

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string where(const std::filesystem::path& file, std::size_t line_no) {
    return file.string() + ":" + std::to_string(line_no);
}

long long parse_integer(const std::string& raw, const std::filesystem::path& file, std::size_t line_no) {
    std::size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(raw, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != raw.size() || value < 0) {
        throw std::runtime_error("Invalid non-negative integer '" + raw + "' at " + where(file, line_no));
    }
    return value;
}

double parse_real(const std::string& raw, const std::filesystem::path& file, std::size_t line_no) {
    std::size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(raw, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != raw.size()) {
        throw std::runtime_error("Invalid number '" + raw + "' at " + where(file, line_no));
    }
    return value;
}

std::chrono::seconds parse_seconds(const std::string& raw, const std::filesystem::path& file, std::size_t line_no) {
    const auto v = parse_integer(raw, file, line_no);
    if (v == 0) {
        throw std::runtime_error("Timeout must be positive at " + where(file, line_no));
    }
    if (v > kMaxTimeoutSec) {
        throw std::runtime_error("Timeout exceeds " + std::to_string(kMaxTimeoutSec) + " seconds at " +
                                 where(file, line_no));
    }
    return std::chrono::seconds(v);
}

void apply_key(fixbench::EvalConfig& cfg,
               const std::string& key,
               std::string value,
               const std::filesystem::path& file,
               std::size_t line_no) {
    if (key == "python_exe") {
        cfg.python_exe = std::move(value);
    } else if (key == "work_dir") {
        cfg.work_dir = std::filesystem::path(value);
    } else if (key == "sandbox_timeout_sec") {
        cfg.sandbox_timeout = parse_seconds(value, file, line_no);
    } else if (key == "validation_timeout_sec") {
        cfg.validation_timeout = parse_seconds(value, file, line_no);
    } else if (key == "diagnosis_timeout_sec") {
        cfg.diagnosis_timeout = parse_seconds(value, file, line_no);
    } else if (key == "task_timeout_sec") {
        cfg.task_timeout = parse_seconds(value, file, line_no);
    } else if (key == "generator_timeout_sec") {
        cfg.generator_timeout = parse_seconds(value, file, line_no);
    } else if (key == "confidence_threshold") {
        const auto v = parse_integer(value, file, line_no);
        if (v > 100) {
            throw std::runtime_error("confidence_threshold must be within 0..100 at " + where(file, line_no));
        }
        cfg.confidence_threshold = static_cast<int>(v);
    } else if (key == "limit") {
        cfg.limit = static_cast<std::size_t>(parse_integer(value, file, line_no));
    } else if (key == "primary_temperature") {
        cfg.primary_temperature = parse_real(value, file, line_no);
    } else if (key == "secondary_temperature") {
        cfg.secondary_temperature = parse_real(value, file, line_no);
    } else if (key == "generator") {
        cfg.generator_command.clear();
        std::istringstream words(value);
        std::string word;
        while (words >> word) {
            cfg.generator_command.push_back(word);
        }
    } else if (key == "generator_arg") {
        cfg.generator_command.push_back(std::move(value));
    } else {
        throw std::runtime_error("Unknown config key '" + key + "' at " + where(file, line_no));
    }
}

}  // namespace

namespace fixbench {

EvalConfig ConfigLoader::load(const std::filesystem::path& file, EvalConfig base) const {
    std::ifstream input(file);
    if (!input.is_open()) {
        throw std::runtime_error("Unable to open config file: " + file.string());
    }

    EvalConfig cfg = std::move(base);
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw std::runtime_error("Expected 'key=value' entry at " + where(file, line_no));
        }

        auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            throw std::runtime_error("Empty key at " + where(file, line_no));
        }

        apply_key(cfg, key, std::move(value), file, line_no);
    }
    return cfg;
}

}  // namespace fixbench
