/**
 * @file test_config.cpp
 * @brief Unit Tests for key=value run configuration
 *
 * @author fixbench contributors
 * @date 2026
 * @copyright MIT License
 */

// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 fixbench contributors

#include <catch2/catch_test_macros.hpp>
// fixbench
#include "fixbench/config.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fixbench;

namespace {

std::filesystem::path write_config(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    const EvalConfig cfg;
    REQUIRE(cfg.sandbox_timeout == std::chrono::seconds(5));
    REQUIRE(cfg.validation_timeout == std::chrono::seconds(6));
    REQUIRE(cfg.diagnosis_timeout == std::chrono::seconds(10));
    REQUIRE(cfg.task_timeout == std::chrono::seconds(30));
    REQUIRE(cfg.generator_timeout == std::chrono::seconds(30));
    REQUIRE(cfg.confidence_threshold == 80);
    REQUIRE(cfg.limit == 0);
    REQUIRE(cfg.primary_temperature == 0.0);
    REQUIRE(cfg.secondary_temperature == 0.1);
    REQUIRE(cfg.task_timeout > cfg.sandbox_timeout);
}

TEST_CASE("Config file parsing", "[config]") {
    const ConfigLoader loader;

    SECTION("Recognised keys override the base") {
        const auto path = write_config("fixbench_cfg_ok.cfg",
                                       "# run settings\n"
                                       "\n"
                                       "  task_timeout_sec = 45  \n"
                                       "sandbox_timeout_sec=3\n"
                                       "confidence_threshold=90\n"
                                       "limit=12\n"
                                       "secondary_temperature=0.3\n"
                                       "python_exe=/usr/bin/python3\n"
                                       "work_dir=/tmp/fixbench-work\n"
                                       "generator=python3 model.py\n"
                                       "generator_arg=--model name with spaces\n");

        const auto cfg = loader.load(path);
        REQUIRE(cfg.task_timeout == std::chrono::seconds(45));
        REQUIRE(cfg.sandbox_timeout == std::chrono::seconds(3));
        REQUIRE(cfg.confidence_threshold == 90);
        REQUIRE(cfg.limit == 12);
        REQUIRE(cfg.secondary_temperature == 0.3);
        REQUIRE(cfg.python_exe == "/usr/bin/python3");
        REQUIRE(cfg.work_dir == std::filesystem::path("/tmp/fixbench-work"));
        REQUIRE(cfg.generator_command ==
                std::vector<std::string>{"python3", "model.py", "--model name with spaces"});
        REQUIRE(cfg.diagnosis_timeout == std::chrono::seconds(10));
        std::filesystem::remove(path);
    }

    SECTION("Base values survive keys the file does not set") {
        const auto path = write_config("fixbench_cfg_base.cfg", "limit=2\n");
        EvalConfig base;
        base.confidence_threshold = 70;
        const auto cfg = loader.load(path, base);
        REQUIRE(cfg.confidence_threshold == 70);
        REQUIRE(cfg.limit == 2);
        std::filesystem::remove(path);
    }

    SECTION("Unknown key names file and line") {
        const auto path = write_config("fixbench_cfg_unknown.cfg", "limit=1\nbogus=1\n");
        try {
            (void)loader.load(path);
            FAIL("expected std::runtime_error");
        } catch (const std::runtime_error& ex) {
            const std::string msg = ex.what();
            REQUIRE(msg.find("bogus") != std::string::npos);
            REQUIRE(msg.find("fixbench_cfg_unknown.cfg:2") != std::string::npos);
        }
        std::filesystem::remove(path);
    }

    SECTION("Malformed values are rejected") {
        for (const auto* line : {"task_timeout_sec=0\n", "task_timeout_sec=abc\n", "limit=-1\n",
                                 "confidence_threshold=101\n", "primary_temperature=warm\n", "no_equals_sign\n"}) {
            const auto path = write_config("fixbench_cfg_bad.cfg", line);
            REQUIRE_THROWS_AS(loader.load(path), std::runtime_error);
            std::filesystem::remove(path);
        }
    }

    SECTION("Timeouts are capped at one day") {
        auto path = write_config("fixbench_cfg_cap.cfg", "sandbox_timeout_sec=86400\n");
        REQUIRE(loader.load(path).sandbox_timeout == std::chrono::seconds(86400));
        std::filesystem::remove(path);

        path = write_config("fixbench_cfg_cap.cfg", "limit=1\ntask_timeout_sec=99999999999\n");
        try {
            (void)loader.load(path);
            FAIL("expected std::runtime_error");
        } catch (const std::runtime_error& ex) {
            const std::string msg = ex.what();
            REQUIRE(msg.find("86400") != std::string::npos);
            REQUIRE(msg.find("fixbench_cfg_cap.cfg:2") != std::string::npos);
        }
        std::filesystem::remove(path);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(loader.load("/nonexistent/fixbench.cfg"), std::runtime_error);
    }
}
