#include "snapshot_orchestrator.hpp"
#include <condition_variable>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include "client_util.hpp"

namespace gceclient {

namespace {

// Collects per-disk outcomes; wakes the waiter on the first failure or once all
// tasks have reported.
class CompletionChannel {
public:
    explicit CompletionChannel(size_t expected) : pending_(expected) {}

    void post(const Status& status) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (!status.ok() && !first_failure_) {
                first_failure_ = status;
            }
            --pending_;
        }
        cv_.notify_all();
    }

    Status awaitFirstFailure() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return first_failure_.has_value() || pending_ == 0; });
        return first_failure_ ? *first_failure_ : Status();
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    size_t pending_;
    std::optional<Status> first_failure_;
};

} // namespace

std::string describeOperationError(const compute_v1::Error& error) {
    std::string description;
    for (const auto& entry : error.errors()) {
        if (!description.empty()) {
            description += "; ";
        }
        description += entry.code() + ": " + entry.message();
    }
    return description;
}

SnapshotOrchestrator::SnapshotOrchestrator(const IComputeSDKClient& sdk_client,
                                           const OperationPoller& poller,
                                           ILogSink& log)
    : sdk_client_(sdk_client), poller_(poller), log_(log) {}

std::vector<std::string> SnapshotOrchestrator::attachedDiskNames(
    const compute_v1::Instance& instance)
{
    std::vector<std::string> names;
    names.reserve(instance.disks_size());
    for (const auto& disk : instance.disks()) {
        names.push_back(nameFromSelfLink(disk.source()));
    }
    return names;
}

StatusOr<compute_v1::Error> SnapshotOrchestrator::createSnapshotForDisk(
    const std::string& project_id,
    const std::string& zone,
    const std::string& disk_name,
    std::chrono::milliseconds timeout,
    const StopSignal* stop) const
{
    return createSnapshotForDisk(DiskSnapshotRequest{project_id, zone, disk_name, timeout}, stop);
}

StatusOr<compute_v1::Error> SnapshotOrchestrator::createSnapshotForDisk(
    const DiskSnapshotRequest& request,
    const StopSignal* stop) const
{
    Status status = checkNotEmpty({{"projectId", request.project_id},
                                   {"zone", request.zone},
                                   {"diskName", request.disk_name}});
    if (status.ok()) status = checkTimeout(request.timeout);
    if (!status.ok()) {
        return status;
    }

    const std::string zone_name = nameFromSelfLink(request.zone);
    compute_v1::Snapshot snapshot;
    snapshot.set_name(request.disk_name);

    auto operation = sdk_client_.CreateDiskSnapshot(
        request.project_id, zone_name, request.disk_name, snapshot);
    if (!operation) {
        return std::move(operation).status();
    }
    log_.debug("Snapshot of disk " + request.disk_name + " started as operation " +
               operation->name());

    return poller_.waitForCompletion(
        request.project_id, zone_name, operation->name(), request.timeout, stop);
}

Status SnapshotOrchestrator::snapshotDisk(const DiskSnapshotRequest& request,
                                          const StopSignal& stop) const
{
    auto result = createSnapshotForDisk(request, &stop);
    if (!result) {
        if (result.status().code() == StatusCode::kCancelled) {
            log_.debug("Stopped waiting for snapshot of disk " + request.disk_name);
        } else {
            log_.warning("Error in creating snapshot for disk " + request.disk_name + ": " +
                         result.status().message());
        }
        return std::move(result).status();
    }
    // Unlike the single-disk and generic waits, which hand the payload back as a
    // value, a DONE operation carrying errors fails this disk so that the
    // instance-wide result cannot report success over a failed snapshot.
    if (result->errors_size() > 0) {
        std::string description = describeOperationError(*result);
        log_.warning("Snapshot operation for disk " + request.disk_name +
                     " reported errors: " + description);
        return Status(StatusCode::kAborted,
                      "Snapshot of disk " + request.disk_name + " failed: " + description);
    }
    log_.info("Created snapshot of disk " + request.disk_name);
    return Status();
}

Status SnapshotOrchestrator::createSnapshot(const std::string& project_id,
                                            const std::string& zone,
                                            const std::string& instance_id,
                                            std::chrono::milliseconds timeout) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zone", zone}, {"instanceId", instance_id}});
    if (status.ok()) status = checkTimeout(timeout);
    if (!status.ok()) {
        return status;
    }

    const std::string zone_name = nameFromSelfLink(zone);
    auto instance = sdk_client_.GetInstance(project_id, zone_name, instance_id);
    if (!instance) {
        log_.warning("Error retrieving instance " + instance_id + ": " +
                     instance.status().message());
        return std::move(instance).status();
    }

    std::vector<DiskSnapshotRequest> requests;
    for (const auto& disk_name : attachedDiskNames(*instance)) {
        requests.push_back(DiskSnapshotRequest{project_id, zone_name, disk_name, timeout});
    }
    if (requests.empty()) {
        log_.info("Instance " + instance_id + " has no attached disks to snapshot");
        return Status();
    }

    StopSignal stop;
    CompletionChannel channel(requests.size());
    std::vector<std::thread> workers;
    workers.reserve(requests.size());

    Status result;
    try {
        for (const auto& request : requests) {
            workers.emplace_back([this, &request, &stop, &channel] {
                channel.post(snapshotDisk(request, stop));
            });
        }
        result = channel.awaitFirstFailure();
    } catch (const std::system_error& e) {
        log_.error(std::string("Failed to start snapshot worker: ") + e.what());
        result = Status(StatusCode::kResourceExhausted,
                        std::string("Failed to start snapshot worker: ") + e.what());
    }

    if (!result.ok()) {
        stop.requestStop();
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return result;
}

} // namespace gceclient
