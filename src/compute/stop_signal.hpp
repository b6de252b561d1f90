#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace gceclient {

/**
 * StopSignal - One-shot local stop flag with an interruptible wait
 *
 * Used to wake operation pollers that are sleeping between status queries.
 * A stop request never reaches the remote API.
 */
class StopSignal {
public:
    StopSignal() = default;
    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void requestStop();
    bool stopRequested() const;

    // Blocks for up to period. Returns true if a stop was requested before or
    // during the wait.
    bool waitFor(std::chrono::milliseconds period) const;

private:
    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    bool stopped_ = false;
};

} // namespace gceclient
