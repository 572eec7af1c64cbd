/**
 * @file test_process.cpp
 * @brief Unit Tests for child process supervision
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
#include "fixbench/process.hpp"

#include <chrono>
#include <string>

using namespace fixbench;

TEST_CASE("Process capture", "[process]") {
    SECTION("stdout and exit status") {
        ProcessSpec spec;
        spec.argv = {"sh", "-c", "echo out; echo err 1>&2; exit 4"};
        auto r = run_process(spec);

        REQUIRE(r.started);
        REQUIRE(r.exited);
        REQUIRE(r.exit_code == 4);
        REQUIRE(r.stdout_text == "out\n");
        REQUIRE(r.stderr_text == "err\n");
        REQUIRE_FALSE(r.timed_out);
        REQUIRE_FALSE(r.cancelled);
    }

    SECTION("stdin is delivered and closed") {
        ProcessSpec spec;
        spec.argv = {"cat"};
        spec.stdin_text = "line one\nline two\n";
        auto r = run_process(spec);

        REQUIRE(r.exit_code == 0);
        REQUIRE(r.stdout_text == spec.stdin_text);
    }

    SECTION("Large stdin does not deadlock against a full stdout pipe") {
        ProcessSpec spec;
        spec.argv = {"cat"};
        spec.stdin_text.assign(512 * 1024, 'x');
        auto r = run_process(spec);

        REQUIRE(r.exit_code == 0);
        REQUIRE(r.stdout_text.size() == spec.stdin_text.size());
    }

    SECTION("Output beyond the cap is truncated") {
        ProcessSpec spec;
        spec.argv = {"sh", "-c", "yes a | head -c 10000"};
        spec.max_output_bytes = 100;
        auto r = run_process(spec);

        REQUIRE(r.stdout_text.size() == 100 + std::string("(truncated)").size());
        REQUIRE(r.stdout_text.substr(100) == "(truncated)");
    }

    SECTION("Working directory is honoured") {
        ProcessSpec spec;
        spec.argv = {"pwd"};
        spec.cwd = "/";
        auto r = run_process(spec);
        REQUIRE(r.stdout_text == "/\n");
    }

    SECTION("Missing executable exits 127") {
        ProcessSpec spec;
        spec.argv = {"/nonexistent/fixbench-binary"};
        auto r = run_process(spec);

        REQUIRE(r.started);
        REQUIRE(r.exit_code == 127);
        REQUIRE(r.stderr_text == "exec failed\n");
    }

    SECTION("Missing working directory exits 127 without running the command") {
        ProcessSpec spec;
        spec.argv = {"echo", "should not run"};
        spec.cwd = "/nonexistent/fixbench-dir";
        auto r = run_process(spec);

        REQUIRE(r.started);
        REQUIRE(r.exit_code == 127);
        REQUIRE(r.stdout_text.empty());
        REQUIRE(r.stderr_text == "chdir failed\n");
    }

    SECTION("Empty argv is rejected without forking") {
        auto r = run_process(ProcessSpec{});
        REQUIRE_FALSE(r.started);
        REQUIRE_FALSE(r.error.empty());
    }
}

TEST_CASE("Process deadlines", "[process][timeout]") {
    SECTION("Own timeout kills the whole group") {
        ProcessSpec spec;
        // The background sleeper keeps the pipes open; only a group kill ends the call promptly.
        spec.argv = {"sh", "-c", "sleep 30 & sleep 30"};
        spec.timeout = std::chrono::milliseconds(300);

        const auto start = Clock::now();
        auto r = run_process(spec);
        REQUIRE(r.timed_out);
        REQUIRE_FALSE(r.cancelled);
        REQUIRE_FALSE(r.exited);
        REQUIRE(Clock::now() - start < std::chrono::seconds(3));
    }

    SECTION("Token expiry cancels") {
        ProcessSpec spec;
        spec.argv = {"sleep", "30"};
        CancellationToken token(Clock::now() + std::chrono::milliseconds(200));

        const auto start = Clock::now();
        auto r = run_process(spec, &token);
        REQUIRE(r.cancelled);
        REQUIRE_FALSE(r.timed_out);
        REQUIRE(Clock::now() - start < std::chrono::seconds(3));
    }

    SECTION("Fast child is unaffected by a generous timeout") {
        ProcessSpec spec;
        spec.argv = {"true"};
        spec.timeout = std::chrono::seconds(10);
        auto r = run_process(spec);
        REQUIRE(r.exited);
        REQUIRE(r.exit_code == 0);
    }
}
