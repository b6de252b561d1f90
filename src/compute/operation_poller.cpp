#include "operation_poller.hpp"
#include <algorithm>
#include "client_util.hpp"

namespace gceclient {

OperationPoller::OperationPoller(const IComputeSDKClient& sdk_client,
                                 ILogSink& log,
                                 std::chrono::milliseconds poll_interval)
    : sdk_client_(sdk_client), log_(log), poll_interval_(poll_interval) {}

bool OperationPoller::isOperationDone(const compute_v1::Operation& operation) {
    return operation.status() == kDoneStatus;
}

StatusOr<compute_v1::Error> OperationPoller::waitForCompletion(
    const std::string& project_id,
    const compute_v1::Operation& operation,
    std::chrono::milliseconds timeout,
    const StopSignal* stop) const
{
    return waitForCompletion(project_id, operation.zone(), operation.name(), timeout, stop);
}

StatusOr<compute_v1::Error> OperationPoller::waitForCompletion(
    const std::string& project_id,
    const std::string& zone,
    const std::string& operation_id,
    std::chrono::milliseconds timeout,
    const StopSignal* stop) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zone", zone}, {"operationId", operation_id}});
    if (status.ok()) status = checkTimeout(timeout);
    if (!status.ok()) {
        return status;
    }

    const std::string zone_name = nameFromSelfLink(zone);
    StopSignal never_stopped;
    const StopSignal& signal = stop != nullptr ? *stop : never_stopped;

    // Clamp so very large timeouts cannot overflow the time_point
    const auto start = std::chrono::steady_clock::now();
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::time_point::max() - start);
    const auto deadline = timeout >= headroom ? std::chrono::steady_clock::time_point::max()
                                              : start + timeout;
    int attempt = 0;
    while (true) {
        ++attempt;
        log_.debug("Waiting for operation " + operation_id + " to complete (poll " +
                   std::to_string(attempt) + ")");

        auto operation = sdk_client_.GetZoneOperation(project_id, zone_name, operation_id);
        if (!operation) {
            log_.warning("Error retrieving operation " + operation_id + ": " +
                         operation.status().message());
        } else if (isOperationDone(*operation)) {
            return operation->error();
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        if (signal.waitFor(std::min(poll_interval_, remaining))) {
            log_.debug("Stopped waiting for operation " + operation_id);
            return Status(StatusCode::kCancelled,
                          "Stopped waiting for operation " + operation_id);
        }
        // No poll once the budget is spent
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
    }

    return Status(StatusCode::kDeadlineExceeded,
                  "Timed out waiting for operation " + operation_id + " to complete");
}

} // namespace gceclient
