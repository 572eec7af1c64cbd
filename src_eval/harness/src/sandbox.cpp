#include "fixbench/sandbox.hpp"
#include "fixbench/process.hpp"

#include <stdlib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

// Text following `marker` (and its ": " separator) up to the next occurrence of the marker.
std::string text_after(std::string_view output, std::string_view marker) {
    const auto pos = output.find(marker);
    auto start = pos + marker.size();
    if (output.substr(start, 2) == ": ") {
        start += 2;
    } else if (output.substr(start, 1) == ":") {
        start += 1;
    }
    const auto next = output.find(marker, start);
    return trim_copy(output.substr(start, next == std::string_view::npos ? std::string_view::npos : next - start));
}

/**
 * Scoped owner of the temporary program file. Created with mkstemps so concurrent
 * invocations never share a path; removed in the destructor whatever happened in between.
 */
class TempScript {
public:
    TempScript(const fs::path& dir, const std::string& content) {
        std::string tmpl = (dir / "fixbench_XXXXXX.py").string();
        const int fd = ::mkstemps(tmpl.data(), 3);
        if (fd < 0) {
            throw std::runtime_error("cannot create temp file in " + dir.string() + ": " + std::strerror(errno));
        }
        path_ = tmpl;

        std::size_t off = 0;
        while (off < content.size()) {
            const ssize_t n = ::write(fd, content.data() + off, content.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                const std::string err = std::strerror(errno);
                ::close(fd);
                throw std::runtime_error("short write to " + path_.string() + ": " + err);
            }
            off += static_cast<std::size_t>(n);
        }
        ::close(fd);
    }

    ~TempScript() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

}  // namespace

namespace fixbench {

SandboxExecutor::SandboxExecutor(Config cfg) : cfg_(std::move(cfg)) {}

std::string SandboxExecutor::compose_program(std::string_view source,
                                             std::string_view harness,
                                             std::string_view entry_point) {
    if (harness.empty() || entry_point.empty()) {
        return std::string{source};
    }

    std::ostringstream os;
    os << source << "\n\n"
       << harness << "\n\n"
       << "import sys\n"
       << "try:\n"
       << "    check(" << entry_point << ")\n"
       << "    print(\"" << kPassMarker << "\")\n"
       << "except AssertionError as e:\n"
       << "    print(\"" << kFailMarker << ": \" + str(e))\n"
       << "    sys.exit(" << kFailExitCode << ")\n"
       << "except NameError as e:\n"
       << "    print(\"" << kErrorMarker << ": NameError: \" + str(e))\n"
       << "    sys.exit(" << kErrorExitCode << ")\n"
       << "except Exception as e:\n"
       << "    print(\"" << kErrorMarker << ": \" + type(e).__name__ + \": \" + str(e))\n"
       << "    sys.exit(" << kErrorExitCode << ")\n";
    return os.str();
}

ExecutionOutcome SandboxExecutor::classify(const std::string& stdout_text,
                                           const std::string& stderr_text,
                                           int exit_code,
                                           std::string_view entry_point) {
    ExecutionOutcome out;
    out.raw_output = stdout_text;

    if (stdout_text.find(kPassMarker) != std::string::npos) {
        out.succeeded = true;
        return out;
    }

    if (stdout_text.find(kFailMarker) != std::string::npos) {
        out.diagnostic = "Test failed: " + text_after(stdout_text, kFailMarker);
        return out;
    }

    if (stdout_text.find(kErrorMarker) != std::string::npos) {
        auto msg = text_after(stdout_text, kErrorMarker);
        if (!entry_point.empty() && msg.find("NameError") != std::string::npos &&
            msg.find(entry_point) != std::string::npos) {
            out.diagnostic = "Function '" + std::string{entry_point} + "' not defined";
        } else {
            out.diagnostic = std::move(msg);
        }
        return out;
    }

    if (exit_code != 0) {
        out.diagnostic = stderr_text.empty()
                             ? "Process exited with status " + std::to_string(exit_code)
                             : stderr_text;
        return out;
    }

    out.succeeded = true;
    return out;
}

ExecutionOutcome SandboxExecutor::run(std::string_view source,
                                      std::string_view harness,
                                      std::string_view entry_point,
                                      const CancellationToken* token) const {
    try {
        std::error_code ec;
        fs::path dir = cfg_.work_dir.empty() ? fs::temp_directory_path(ec) : cfg_.work_dir;
        if (ec) {
            throw std::runtime_error("no temp directory: " + ec.message());
        }
        if (!cfg_.work_dir.empty()) {
            fs::create_directories(dir, ec);
            if (ec) {
                throw std::runtime_error("cannot create work_dir " + dir.string() + ": " + ec.message());
            }
        }

        const TempScript script(dir, compose_program(source, harness, entry_point));

        ProcessSpec spec;
        spec.argv = {cfg_.python_exe, script.path().string()};
        spec.timeout = cfg_.timeout;
        spec.max_output_bytes = cfg_.max_output_bytes;

        spdlog::debug("sandbox: running {} (timeout {} ms)", script.path().string(), cfg_.timeout.count());
        const ProcessResult proc = run_process(spec, token);

        if (!proc.started) {
            ExecutionOutcome out;
            out.diagnostic = "Execution error: " + proc.error;
            return out;
        }
        if (proc.timed_out || proc.cancelled) {
            ExecutionOutcome out;
            out.timed_out = true;
            out.diagnostic = proc.timed_out ? "Timeout: execution exceeded limit"
                                            : "Cancelled: task deadline expired";
            return out;
        }

        const int code = proc.exited ? proc.exit_code : 128 + proc.term_signal;
        ExecutionOutcome out = classify(proc.stdout_text, proc.stderr_text, code, entry_point);
        if (proc.exited) {
            out.exit_code = proc.exit_code;
        }
        return out;
    } catch (const std::exception& ex) {
        ExecutionOutcome out;
        out.diagnostic = std::string("Execution error: ") + ex.what();
        return out;
    }
}

}  // namespace fixbench
