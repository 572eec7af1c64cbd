#include "fixbench/cancellation.hpp"

namespace fixbench {

Watchdog::Watchdog(CancellationToken& token, Clock::duration ceiling)
    : token_{token}, deadline_{Clock::now() + ceiling} {
    thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_until(lock, deadline_, [this] { return disarmed_; })) {
            fired_.store(true, std::memory_order_release);
            token_.cancel();
        }
    });
}

Watchdog::~Watchdog() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        disarmed_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace fixbench
