#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "fixbench/command_generator.hpp"
#include "fixbench/config.hpp"
#include "fixbench/direct_producer.hpp"
#include "fixbench/evaluator.hpp"
#include "fixbench/metrics_writer.hpp"
#include "fixbench/orchestrator.hpp"
#include "fixbench/reasoning_producer.hpp"
#include "fixbench/task_loader.hpp"

using fixbench::AbReport;
using fixbench::BatchEvaluator;
using fixbench::BatchMetrics;
using fixbench::BatchReport;
using fixbench::ConfigLoader;
using fixbench::DirectProducer;
using fixbench::EscalationOrchestrator;
using fixbench::EvalConfig;
using fixbench::FixProducer;
using fixbench::MetricsWriter;
using fixbench::ReasoningProducer;
using fixbench::SandboxExecutor;
using fixbench::StrategyStats;
using fixbench::TaskLoader;
using fixbench::winner;
using fixbench::command_bridge::CommandTextGenerator;

namespace {

struct Args {
    std::filesystem::path dataset{};
    std::string generator{};
    std::vector<std::string> generator_args{};
    std::string mode{"ab"};
    std::size_t limit{0};
    bool limit_set{false};
    std::filesystem::path config_path{};
    std::filesystem::path output_path{"results.json"};
    std::filesystem::path html_path{};
    bool emit_html{true};
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "fixbench: bug-fix evaluation harness\n"
        << "Usage:\n"
        << "  " << argv0 << " --dataset <jsonl> --generator <cmd> [--generator-arg <arg> ...]\n"
        << "                 [--mode ab|orchestrated|direct|reasoning] [--limit N] [--config <file>]\n"
        << "                 [--output <json>] [--html <path>] [--no-html] [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --dataset        JSON Lines file, one task per line.\n"
        << "  --generator      Completion command; split on whitespace into argv.\n"
        << "  --generator-arg  Extra argument appended verbatim (repeatable).\n"
        << "  --mode           ab (direct vs reasoning, default), orchestrated, direct or reasoning.\n"
        << "  --limit          Evaluate only the first N tasks.\n"
        << "  --config         key=value settings file; command line options win.\n"
        << "  --output         JSON results path (default: results.json).\n"
        << "  --html           HTML report path (default: <output> with .html extension).\n"
        << "  --no-html        Skip the HTML report.\n"
        << "  --verbose        Debug logging.\n"
        << "  -h, --help       Show this help message.\n"
        << std::endl;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream is(text);
    std::vector<std::string> words;
    for (std::string w; is >> w;) {
        words.push_back(w);
    }
    return words;
}

std::size_t parse_limit(const std::string& text) {
    std::size_t pos = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("--limit expects a non-negative integer, got '" + text + "'");
    }
    if (pos != text.size() || v < 0) {
        throw std::runtime_error("--limit expects a non-negative integer, got '" + text + "'");
    }
    return static_cast<std::size_t>(v);
}

Args parse_args(int argc, char** argv) {
    Args args;
    auto value = [&](int& i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(std::string(flag) + " expects a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (tok == "-h" || tok == "--help") {
            args.help = true;
            break;
        } else if (tok == "--dataset") {
            args.dataset = value(i, tok);
        } else if (tok == "--generator") {
            args.generator = value(i, tok);
        } else if (tok == "--generator-arg") {
            args.generator_args.push_back(value(i, tok));
        } else if (tok == "--mode") {
            args.mode = value(i, tok);
        } else if (tok == "--limit") {
            args.limit = parse_limit(value(i, tok));
            args.limit_set = true;
        } else if (tok == "--config") {
            args.config_path = value(i, tok);
        } else if (tok == "--output") {
            args.output_path = value(i, tok);
        } else if (tok == "--html") {
            args.html_path = value(i, tok);
        } else if (tok == "--no-html") {
            args.emit_html = false;
        } else if (tok == "--verbose") {
            args.verbose = true;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(tok));
        }
    }
    if (args.help) {
        return args;
    }

    if (args.dataset.empty()) {
        throw std::runtime_error("--dataset is required");
    }
    if (args.mode != "ab" && args.mode != "orchestrated" && args.mode != "direct" && args.mode != "reasoning") {
        throw std::runtime_error("Unknown --mode '" + args.mode + "'");
    }
    if (args.html_path.empty()) {
        args.html_path = args.output_path;
        args.html_path.replace_extension(".html");
    }
    return args;
}

EvalConfig resolve_config(const Args& args) {
    EvalConfig cfg;
    if (!args.config_path.empty()) {
        cfg = ConfigLoader{}.load(args.config_path, cfg);
    }
    if (args.limit_set) {
        cfg.limit = args.limit;
    }
    if (!args.generator.empty()) {
        cfg.generator_command = split_words(args.generator);
    }
    cfg.generator_command.insert(cfg.generator_command.end(), args.generator_args.begin(), args.generator_args.end());
    if (cfg.generator_command.empty()) {
        throw std::runtime_error("No generator command given (--generator or 'generator' in the config file)");
    }
    return cfg;
}

SandboxExecutor::Config sandbox_config(const EvalConfig& cfg, std::chrono::seconds timeout) {
    SandboxExecutor::Config out;
    out.python_exe = cfg.python_exe;
    out.work_dir = cfg.work_dir;
    out.timeout = timeout;
    return out;
}

void print_metrics(const BatchReport& report) {
    const BatchMetrics& m = report.metrics;
    std::cout << "  " << report.agent << ": pass@1 " << std::fixed << std::setprecision(1) << m.pass_rate * 100.0
              << "% (" << m.fixed << "/" << m.total << ")"
              << "  avg " << std::setprecision(2) << m.avg_time << "s"
              << "  timeouts " << m.timeouts << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }
        spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::info);

        const auto cfg = resolve_config(args);
        const auto set = TaskLoader{}.load(args.dataset, cfg.limit);
        if (set.tasks.empty()) {
            throw std::runtime_error("No tasks in " + args.dataset.string());
        }

        CommandTextGenerator generator(CommandTextGenerator::Config{
            .argv = cfg.generator_command,
            .work_dir = cfg.work_dir,
            .timeout = cfg.generator_timeout,
        });

        DirectProducer direct(generator, DirectProducer::Config{
            .validation = sandbox_config(cfg, cfg.validation_timeout),
            .temperature = cfg.primary_temperature,
        });
        ReasoningProducer reasoning(generator, ReasoningProducer::Config{.temperature = cfg.secondary_temperature});

        const BatchEvaluator evaluator(BatchEvaluator::Config{
            .diagnosis = sandbox_config(cfg, cfg.diagnosis_timeout),
            .validation = sandbox_config(cfg, cfg.sandbox_timeout),
            .task_timeout = cfg.task_timeout,
            .confidence_threshold = cfg.confidence_threshold,
        });

        MetricsWriter writer;
        std::vector<BatchReport> for_html;

        std::cout << "fixbench\n"
                  << "  Dataset: " << set.source_file << " (" << set.tasks.size() << " tasks)\n"
                  << "  Mode: " << args.mode << "\n";

        if (args.mode == "ab") {
            const AbReport ab = evaluator.run_ab(set.tasks, direct, reasoning);
            writer.write_summary(args.output_path, ab);
            for_html = {ab.first, ab.second};

            print_metrics(ab.first);
            print_metrics(ab.second);
            const auto& h = ab.head_to_head;
            std::cout << "  Head to head: both " << h.both_correct << ", only " << ab.first.agent << " "
                      << h.only_first << ", only " << ab.second.agent << " " << h.only_second << ", neither "
                      << h.both_failed << "\n";
            std::cout << "\nWINNER: " << winner(ab) << "\n";
        } else if (args.mode == "orchestrated") {
            StrategyStats stats;
            const auto secondary_temperature = cfg.secondary_temperature;
            EscalationOrchestrator orchestrator(
                direct,
                [&generator, secondary_temperature]() -> std::unique_ptr<FixProducer> {
                    return std::make_unique<ReasoningProducer>(
                        generator, ReasoningProducer::Config{.temperature = secondary_temperature});
                },
                stats, cfg.confidence_threshold);

            const auto report = evaluator.run(set.tasks, orchestrator, &stats);
            writer.write_summary(args.output_path, report, &stats);
            for_html = {report};

            print_metrics(report);
            std::cout << "  Strategies: primary " << stats.primary_success << "/" << stats.primary_used
                      << ", secondary " << stats.secondary_success << "/" << stats.secondary_used << "\n";
        } else {
            FixProducer& agent = args.mode == "direct" ? static_cast<FixProducer&>(direct)
                                                       : static_cast<FixProducer&>(reasoning);
            const auto report = evaluator.run(set.tasks, agent);
            writer.write_summary(args.output_path, report);
            for_html = {report};
            print_metrics(report);
        }

        if (args.emit_html) {
            writer.write_detailed(args.html_path, for_html);
        }

        std::cout << "Artifacts:\n"
                  << "  JSON: " << args.output_path << "\n";
        if (args.emit_html) {
            std::cout << "  HTML: " << args.html_path << "\n";
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2; // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3; // internal error
    }
}
