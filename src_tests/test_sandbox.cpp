/**
 * @file test_sandbox.cpp
 * @brief Unit Tests for the sandbox executor and marker classification
 *
 * @author fixbench contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 fixbench contributors

#include <catch2/catch_test_macros.hpp>
// fixbench
#include "fixbench/cancellation.hpp"
#include "fixbench/sandbox.hpp"
#include "test_fakes.hpp"

#include <chrono>
#include <filesystem>
#include <string>

using namespace fixbench;
using fixbench::test::kAddBuggy;
using fixbench::test::kAddFixed;
using fixbench::test::kAddTest;

namespace {

SandboxExecutor executor_in(const std::filesystem::path& dir, std::chrono::milliseconds timeout) {
    SandboxExecutor::Config cfg;
    cfg.work_dir = dir;
    cfg.timeout = timeout;
    return SandboxExecutor(cfg);
}

std::filesystem::path fresh_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace

/* ========================================================================== */
/* CLASSIFICATION                                                             */
/* ========================================================================== */

TEST_CASE("Marker precedence", "[sandbox][classify]") {
    SECTION("PASS marker wins over everything") {
        auto out = SandboxExecutor::classify("__TEST_PASSED__\n__EXECUTION_ERROR__: x\n", "noise", 2, "f");
        REQUIRE(out.succeeded);
        REQUIRE_FALSE(out.diagnostic);
    }

    SECTION("FAIL marker carries the assertion text") {
        auto out = SandboxExecutor::classify("__TEST_FAILED__: expected 5\n", "", 1, "f");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic == "Test failed: expected 5");
    }

    SECTION("FAIL marker beats ERROR marker") {
        auto out = SandboxExecutor::classify("__EXECUTION_ERROR__: boom\n__TEST_FAILED__: bad\n", "", 1, "f");
        REQUIRE(out.diagnostic == "Test failed: bad");
    }

    SECTION("NameError naming the entry point is rewritten") {
        auto out = SandboxExecutor::classify(
            "__EXECUTION_ERROR__: NameError: name 'solve' is not defined\n", "", 2, "solve");
        REQUIRE(out.diagnostic == "Function 'solve' not defined");
    }

    SECTION("Other errors are passed through") {
        auto out = SandboxExecutor::classify("__EXECUTION_ERROR__: ZeroDivisionError: division by zero\n", "", 2, "f");
        REQUIRE(out.diagnostic == "ZeroDivisionError: division by zero");
    }

    SECTION("Non-zero exit without markers reports stderr") {
        auto out = SandboxExecutor::classify("", "SyntaxError: invalid syntax\n", 1, "f");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic == "SyntaxError: invalid syntax\n");
    }

    SECTION("Non-zero exit with empty stderr names the status") {
        auto out = SandboxExecutor::classify("", "", 3, "f");
        REQUIRE(out.diagnostic == "Process exited with status 3");
    }

    SECTION("Clean exit without markers is a success") {
        auto out = SandboxExecutor::classify("hello\n", "", 0, "");
        REQUIRE(out.succeeded);
        REQUIRE(out.raw_output == "hello\n");
    }
}

TEST_CASE("Guard composition", "[sandbox][compose]") {
    SECTION("Standalone mode runs the source as is") {
        REQUIRE(SandboxExecutor::compose_program("print(1)", "", "f") == "print(1)");
        REQUIRE(SandboxExecutor::compose_program("print(1)", "def check(c): pass", "") == "print(1)");
    }

    SECTION("Harness mode appends the guard") {
        const auto program = SandboxExecutor::compose_program(kAddBuggy, kAddTest, "add");
        REQUIRE(program.find("check(add)") != std::string::npos);
        REQUIRE(program.find("import sys") != std::string::npos);
        REQUIRE(program.find("__TEST_PASSED__") != std::string::npos);
        REQUIRE(program.find("sys.exit(1)") != std::string::npos);
        REQUIRE(program.find("sys.exit(2)") != std::string::npos);
    }
}

/* ========================================================================== */
/* EXECUTION                                                                  */
/* ========================================================================== */

TEST_CASE("Sandbox runs candidates against the harness", "[sandbox][python]") {
    const auto dir = fresh_dir("fixbench_sandbox_run");
    const auto executor = executor_in(dir, std::chrono::seconds(10));

    SECTION("Correct function passes") {
        auto out = executor.run(kAddFixed, kAddTest, "add");
        REQUIRE(out.succeeded);
        REQUIRE_FALSE(out.diagnostic);
        REQUIRE(out.exit_code == 0);
    }

    SECTION("Buggy function fails with the assertion message") {
        auto out = executor.run(kAddBuggy, kAddTest, "add");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic);
        REQUIRE(out.diagnostic->find("Test failed") != std::string::npos);
        REQUIRE(out.diagnostic->find("add(2, 3) should be 5") != std::string::npos);
        REQUIRE(out.exit_code == kFailExitCode);
    }

    SECTION("Missing entry point is reported by name") {
        auto out = executor.run("def other(a, b):\n    return a + b\n", kAddTest, "add");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic == "Function 'add' not defined");
        REQUIRE(out.exit_code == kErrorExitCode);
    }

    SECTION("Runtime error inside the candidate") {
        auto out = executor.run("def add(a, b):\n    return a / 0\n", kAddTest, "add");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic->find("ZeroDivisionError") != std::string::npos);
    }

    SECTION("Syntax error surfaces through stderr") {
        auto out = executor.run("def add(a, b)\n    return a + b\n", kAddTest, "add");
        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.diagnostic->find("SyntaxError") != std::string::npos);
    }

    SECTION("Standalone mode succeeds on clean exit") {
        auto out = executor.run("print('standalone')\n", "", "");
        REQUIRE(out.succeeded);
        REQUIRE(out.raw_output.find("standalone") != std::string::npos);
    }

    SECTION("Repeated runs classify identically") {
        auto a = executor.run(kAddBuggy, kAddTest, "add");
        auto b = executor.run(kAddBuggy, kAddTest, "add");
        REQUIRE(a.succeeded == b.succeeded);
        REQUIRE(a.diagnostic == b.diagnostic);
    }

    SECTION("Temporary programs are removed") {
        (void)executor.run(kAddFixed, kAddTest, "add");
        (void)executor.run(kAddBuggy, kAddTest, "add");
        REQUIRE(std::filesystem::is_empty(dir));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Sandbox bounds runaway candidates", "[sandbox][python][timeout]") {
    const auto dir = fresh_dir("fixbench_sandbox_timeout");
    const std::string loop = "def add(a, b):\n    while True:\n        pass\n";

    SECTION("Own timeout kills the child") {
        const auto executor = executor_in(dir, std::chrono::milliseconds(500));
        const auto start = Clock::now();
        auto out = executor.run(loop, kAddTest, "add");
        const auto elapsed = Clock::now() - start;

        REQUIRE_FALSE(out.succeeded);
        REQUIRE(out.timed_out);
        REQUIRE(out.diagnostic == "Timeout: execution exceeded limit");
        REQUIRE(elapsed < std::chrono::seconds(3));
    }

    SECTION("Caller token kills the child before the own timeout") {
        const auto executor = executor_in(dir, std::chrono::seconds(30));
        CancellationToken token(Clock::now() + std::chrono::milliseconds(300));
        const auto start = Clock::now();
        auto out = executor.run(loop, kAddTest, "add", &token);
        const auto elapsed = Clock::now() - start;

        REQUIRE(out.timed_out);
        REQUIRE(out.diagnostic == "Cancelled: task deadline expired");
        REQUIRE(elapsed < std::chrono::seconds(3));
    }

    REQUIRE(std::filesystem::is_empty(dir));
    std::filesystem::remove_all(dir);
}

TEST_CASE("Infrastructure failures never throw", "[sandbox]") {
    SandboxExecutor::Config cfg;
    cfg.python_exe = "/nonexistent/fixbench-python";
    const SandboxExecutor executor(cfg);

    auto out = executor.run(kAddFixed, kAddTest, "add");
    REQUIRE_FALSE(out.succeeded);
    REQUIRE(out.diagnostic);
}
