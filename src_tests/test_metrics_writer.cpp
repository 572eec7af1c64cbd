/**
 * @file test_metrics_writer.cpp
 * @brief Unit Tests for JSON and HTML report emission
 *
 * @author fixbench contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 fixbench contributors

#include <catch2/catch_test_macros.hpp>
// fixbench
#include "fixbench/metrics_writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

using namespace fixbench;
using nlohmann::json;

namespace {

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
}

BatchReport sample_report(const std::string& agent) {
    BatchReport report;
    report.agent = agent;

    TaskResult pass;
    pass.task_id = "T/0";
    pass.success = true;
    pass.elapsed = 1.5;
    pass.strategy = "primary";

    TaskResult hang;
    hang.task_id = "T/<1>";
    hang.timed_out = true;
    hang.elapsed = 30.0;
    hang.diagnostic = "Test failed: a & b";

    report.results = {pass, hang};
    report.metrics = BatchMetrics::fold(report.results);
    return report;
}

}  // namespace

TEST_CASE("Single agent summary", "[metrics_writer]") {
    const auto dir = std::filesystem::temp_directory_path() / "fixbench_writer_single";
    std::filesystem::remove_all(dir);
    const auto path = dir / "nested" / "results.json";

    StrategyStats stats;
    stats.primary_used = 2;
    stats.secondary_used = 1;
    stats.primary_success = 1;

    MetricsWriter{}.write_summary(path, sample_report("orchestrated"), &stats);
    const auto doc = json::parse(slurp(path));

    REQUIRE(doc["agent"] == "orchestrated");
    REQUIRE(doc["metrics"]["total"] == 2);
    REQUIRE(doc["metrics"]["fixed"] == 1);
    REQUIRE(doc["metrics"]["failed"] == 1);
    REQUIRE(doc["metrics"]["pass_at_1"] == 0.5);
    REQUIRE(doc["metrics"]["timeouts"] == 1);
    REQUIRE(doc["results"].size() == 2);
    REQUIRE(doc["results"][0]["task_id"] == "T/0");
    REQUIRE(doc["results"][0]["success"] == true);
    REQUIRE(doc["results"][0]["time"] == 1.5);
    REQUIRE(doc["results"][0]["strategy"] == "primary");
    REQUIRE(doc["results"][1]["timed_out"] == true);
    REQUIRE(doc["strategy_stats"]["primary_used"] == 2);
    REQUIRE(doc["strategy_stats"]["secondary_success"] == 0);

    SECTION("Stats block is optional") {
        MetricsWriter{}.write_summary(path, sample_report("direct"));
        REQUIRE_FALSE(json::parse(slurp(path)).contains("strategy_stats"));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("A/B summary", "[metrics_writer][ab]") {
    const auto path = std::filesystem::temp_directory_path() / "fixbench_writer_ab.json";

    AbReport ab;
    ab.first = sample_report("direct");
    ab.second = sample_report("reasoning");
    ab.head_to_head.both_correct = 1;
    ab.head_to_head.both_failed = 1;

    MetricsWriter{}.write_summary(path, ab);
    const auto doc = json::parse(slurp(path));

    REQUIRE(doc["first_agent"] == "direct");
    REQUIRE(doc["second_agent"] == "reasoning");
    REQUIRE(doc["first_metrics"]["total"] == 2);
    REQUIRE(doc["second_results"].size() == 2);
    REQUIRE(doc["both_correct"] == 1);
    REQUIRE(doc["only_first"] == 0);
    REQUIRE(doc["only_second"] == 0);
    REQUIRE(doc["both_failed"] == 1);

    std::filesystem::remove(path);
}

TEST_CASE("HTML report", "[metrics_writer][html]") {
    const auto path = std::filesystem::temp_directory_path() / "fixbench_writer_report.html";
    MetricsWriter{}.write_detailed(path, {sample_report("direct"), sample_report("reasoning")});
    const auto html = slurp(path);

    REQUIRE(html.find("<h2>direct</h2>") != std::string::npos);
    REQUIRE(html.find("<h2>reasoning</h2>") != std::string::npos);
    REQUIRE(html.find("status-PASS") != std::string::npos);
    REQUIRE(html.find("status-TIMEOUT") != std::string::npos);
    REQUIRE(html.find("T/&lt;1&gt;") != std::string::npos);
    REQUIRE(html.find("a &amp; b") != std::string::npos);

    std::filesystem::remove(path);
}
