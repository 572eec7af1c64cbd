#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace fixbench {

using Clock = std::chrono::steady_clock;

/**
 * \brief Raised by cooperative code once its cancellation token has expired.
 */
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& what) : std::runtime_error(what) {}
};

/**
 * \brief Per-call cancellation context carrying an optional absolute deadline.
 *
 * Tokens are passed explicitly (usually as `const CancellationToken*`, null meaning
 * "no outer deadline"). Blocking code selects against `expired()`; the batch watchdog
 * flips the flag through `cancel()` when the per-task ceiling is reached.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(Clock::time_point deadline) : deadline_{deadline} {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// True once cancelled or past the deadline.
    [[nodiscard]] bool expired() const noexcept {
        if (cancelled()) return true;
        return deadline_ && Clock::now() >= *deadline_;
    }

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

    /// Throws OperationCancelled when expired.
    void throw_if_expired(const char* where) const {
        if (expired()) {
            throw OperationCancelled(std::string("cancelled: ") + where);
        }
    }

private:
    std::optional<Clock::time_point> deadline_{};
    std::atomic<bool> cancelled_{false};
};

/**
 * \brief Arms a timer thread that cancels a token when its deadline is reached.
 *
 * Disarmed and joined on destruction. `fired()` reports whether the deadline was hit
 * (as opposed to the guarded work finishing first).
 */
class Watchdog {
public:
    Watchdog(CancellationToken& token, Clock::duration ceiling);
    ~Watchdog();

    Watchdog(const Watchdog&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;

    [[nodiscard]] bool fired() const noexcept { return fired_.load(std::memory_order_acquire); }

private:
    CancellationToken& token_;
    Clock::time_point deadline_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool disarmed_{false};
    std::atomic<bool> fired_{false};
    std::thread thread_;
};

}  // namespace fixbench
