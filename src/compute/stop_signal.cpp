#include "stop_signal.hpp"

namespace gceclient {

void StopSignal::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::stopRequested() const {
    std::lock_guard<std::mutex> lock(mu_);
    return stopped_;
}

bool StopSignal::waitFor(std::chrono::milliseconds period) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, period, [this] { return stopped_; });
}

} // namespace gceclient
