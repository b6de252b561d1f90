#pragma once

#include <chrono>
#include <string>
#include "compute_sdk_interface.hpp"
#include "log_sink.hpp"
#include "stop_signal.hpp"

namespace gceclient {

/**
 * OperationPoller - Blocks until a zonal long-running operation is DONE
 *
 * Queries the operation once immediately and then once per poll interval,
 * measured against a steady-clock deadline. A failed query only skips that
 * interval. The remote operation is never cancelled: timing out or being
 * stopped only ends the local wait.
 *
 * Outcomes:
 *   - the operation's error payload (empty on success) once status is "DONE"
 *   - kDeadlineExceeded when the timeout elapses first
 *   - kCancelled when the StopSignal fires during a wait
 *   - kInvalidArgument for empty identifiers or a non-positive timeout
 */
class OperationPoller {
public:
    static constexpr std::chrono::milliseconds kDefaultPollInterval{5000};
    static constexpr const char* kDoneStatus = "DONE";

    OperationPoller(const IComputeSDKClient& sdk_client,
                    ILogSink& log,
                    std::chrono::milliseconds poll_interval = kDefaultPollInterval);

    StatusOr<compute_v1::Error> waitForCompletion(
        const std::string& project_id,
        const std::string& zone,
        const std::string& operation_id,
        std::chrono::milliseconds timeout,
        const StopSignal* stop = nullptr) const;

    // Reads zone and name from the operation handle
    StatusOr<compute_v1::Error> waitForCompletion(
        const std::string& project_id,
        const compute_v1::Operation& operation,
        std::chrono::milliseconds timeout,
        const StopSignal* stop = nullptr) const;

    static bool isOperationDone(const compute_v1::Operation& operation);

    std::chrono::milliseconds pollInterval() const { return poll_interval_; }

private:
    const IComputeSDKClient& sdk_client_;
    ILogSink& log_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace gceclient
