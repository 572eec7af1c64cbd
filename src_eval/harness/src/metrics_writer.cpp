#include "fixbench/metrics_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

using nlohmann::json;

json metrics_to_json(const fixbench::BatchMetrics& m) {
    return json{
        {"total", m.total},
        {"fixed", m.fixed},
        {"failed", m.failed},
        {"pass_at_1", m.pass_rate},
        {"avg_time", m.avg_time},
        {"timeouts", m.timeouts},
    };
}

json results_to_json(const std::vector<fixbench::TaskResult>& results) {
    json arr = json::array();
    for (const auto& r : results) {
        arr.push_back(json{
            {"task_id", r.task_id},
            {"success", r.success},
            {"time", r.elapsed},
            {"timed_out", r.timed_out},
            {"strategy", r.strategy},
        });
    }
    return arr;
}

json stats_to_json(const fixbench::StrategyStats& s) {
    return json{
        {"primary_used", s.primary_used},
        {"secondary_used", s.secondary_used},
        {"primary_success", s.primary_success},
        {"secondary_success", s.secondary_success},
    };
}

std::string escape_html(const std::string& input) {
    std::ostringstream oss;
    for (char ch : input) {
        switch (ch) {
            case '&':
                oss << "&amp;";
                break;
            case '<':
                oss << "&lt;";
                break;
            case '>':
                oss << "&gt;";
                break;
            case '"':
                oss << "&quot;";
                break;
            case '\'':
                oss << "&#39;";
                break;
            default:
                oss << ch;
        }
    }
    return oss.str();
}

std::string render_html(const std::vector<fixbench::BatchReport>& reports) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "<!DOCTYPE html><html><head><meta charset=\"utf-8\"/>"
        << "<title>fixbench Report</title>"
        << "<style>"
        << "body{font-family:system-ui, sans-serif;margin:2rem;}"
        << "table{border-collapse:collapse;width:100%;margin-bottom:2rem;}"
        << "th,td{border:1px solid #ccc;padding:0.5rem;vertical-align:top;}"
        << "th{background:#f5f5f5;text-align:left;}"
        << ".status-PASS{color:#0a7c2f;font-weight:bold;}"
        << ".status-FAIL{color:#c1121f;font-weight:bold;}"
        << ".status-TIMEOUT{color:#ff8800;font-weight:bold;}"
        << "</style></head><body>";

    oss << "<h1>fixbench Report</h1>";

    for (const auto& report : reports) {
        const auto& m = report.metrics;
        oss << "<section><h2>" << escape_html(report.agent) << "</h2><ul>";
        oss << "<li>Pass@1: " << (m.pass_rate * 100.0) << "%</li>";
        oss << "<li>Fixed: " << m.fixed << "/" << m.total << "</li>";
        oss << "<li>Avg time: " << m.avg_time << "s</li>";
        oss << "<li>Timeouts: " << m.timeouts << "</li>";
        oss << "</ul>";

        oss << "<table><thead><tr>"
            << "<th>#</th>"
            << "<th>Task</th>"
            << "<th>Status</th>"
            << "<th>Strategy</th>"
            << "<th>Time (s)</th>"
            << "<th>Initial diagnostic</th>"
            << "</tr></thead><tbody>";

        for (std::size_t index = 0; index < report.results.size(); ++index) {
            const auto& r = report.results[index];
            const std::string status = r.timed_out ? "TIMEOUT" : (r.success ? "PASS" : "FAIL");
            oss << "<tr>";
            oss << "<td>" << (index + 1) << "</td>";
            oss << "<td>" << escape_html(r.task_id) << "</td>";
            oss << "<td class=\"status-" << status << "\">" << status << "</td>";
            oss << "<td>" << escape_html(r.strategy) << "</td>";
            oss << "<td>" << r.elapsed << "</td>";
            oss << "<td>" << escape_html(r.diagnostic) << "</td>";
            oss << "</tr>";
        }
        oss << "</tbody></table></section>";
    }

    oss << "</body></html>";
    return oss.str();
}

void ensure_parent(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void write_file(const std::filesystem::path& destination, const std::string& content) {
    ensure_parent(destination);
    std::ofstream output(destination, std::ios::binary);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open output file: " + destination.string());
    }
    output << content;
}

}  // namespace

namespace fixbench {

void MetricsWriter::write_summary(const std::filesystem::path& destination,
                                  const BatchReport& report,
                                  const StrategyStats* stats) const {
    json doc = {
        {"agent", report.agent},
        {"metrics", metrics_to_json(report.metrics)},
        {"results", results_to_json(report.results)},
    };
    if (stats != nullptr) {
        doc["strategy_stats"] = stats_to_json(*stats);
    }
    write_file(destination, doc.dump(2));
}

void MetricsWriter::write_summary(const std::filesystem::path& destination, const AbReport& report) const {
    const json doc = {
        {"first_agent", report.first.agent},
        {"second_agent", report.second.agent},
        {"first_metrics", metrics_to_json(report.first.metrics)},
        {"second_metrics", metrics_to_json(report.second.metrics)},
        {"first_results", results_to_json(report.first.results)},
        {"second_results", results_to_json(report.second.results)},
        {"both_correct", report.head_to_head.both_correct},
        {"only_first", report.head_to_head.only_first},
        {"only_second", report.head_to_head.only_second},
        {"both_failed", report.head_to_head.both_failed},
    };
    write_file(destination, doc.dump(2));
}

void MetricsWriter::write_detailed(const std::filesystem::path& destination,
                                   const std::vector<BatchReport>& reports) const {
    write_file(destination, render_html(reports));
}

}  // namespace fixbench
