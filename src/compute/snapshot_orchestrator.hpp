#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "compute_sdk_interface.hpp"
#include "log_sink.hpp"
#include "operation_poller.hpp"
#include "stop_signal.hpp"

namespace gceclient {

// One unit of snapshot work: a single disk and its wait budget
struct DiskSnapshotRequest {
    std::string project_id;
    std::string zone;
    std::string disk_name;
    std::chrono::milliseconds timeout{0};
};

/**
 * SnapshotOrchestrator - Snapshots every disk attached to an instance
 *
 * One thread per disk issues the snapshot call and waits on its operation, all
 * with the full caller timeout. The first failing disk decides the result.
 * Siblings are told to stop waiting once a failure is seen, but the snapshot
 * operations they already issued keep running on the remote side. Every
 * worker is joined before createSnapshot returns.
 */
class SnapshotOrchestrator {
public:
    SnapshotOrchestrator(const IComputeSDKClient& sdk_client,
                         const OperationPoller& poller,
                         ILogSink& log);

    /**
     * Snapshot all disks of an instance and wait for every snapshot operation.
     *
     * @return OK when every disk operation finished without errors; the
     *     instance lookup error; or the first per-disk failure. A disk whose
     *     operation finished with an error payload fails with kAborted.
     */
    Status createSnapshot(const std::string& project_id,
                          const std::string& zone,
                          const std::string& instance_id,
                          std::chrono::milliseconds timeout) const;

    // Snapshot a single disk (snapshot named after the disk) and wait for it
    StatusOr<compute_v1::Error> createSnapshotForDisk(
        const std::string& project_id,
        const std::string& zone,
        const std::string& disk_name,
        std::chrono::milliseconds timeout,
        const StopSignal* stop = nullptr) const;

    StatusOr<compute_v1::Error> createSnapshotForDisk(
        const DiskSnapshotRequest& request,
        const StopSignal* stop = nullptr) const;

    static std::vector<std::string> attachedDiskNames(const compute_v1::Instance& instance);

private:
    Status snapshotDisk(const DiskSnapshotRequest& request, const StopSignal& stop) const;

    const IComputeSDKClient& sdk_client_;
    const OperationPoller& poller_;
    ILogSink& log_;
};

// "CODE: message" for each entry, joined by "; "
std::string describeOperationError(const compute_v1::Error& error);

} // namespace gceclient
