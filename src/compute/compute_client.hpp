#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "compute_sdk_interface.hpp"
#include "log_sink.hpp"
#include "operation_poller.hpp"
#include "snapshot_orchestrator.hpp"

namespace gceclient {

/**
 * ComputeClient - Simplified interface to the Compute Engine API
 *
 * Lists are filtered (deprecated items dropped) and sorted by name. Arguments
 * named *Link accept either a self link or a bare resource name. Every method
 * rejects empty identifiers and non-positive timeouts with kInvalidArgument
 * before making a remote call. Remote failures are returned unchanged.
 *
 * Uses dependency injection with IComputeSDKClient to enable unit testing.
 */
class ComputeClient {
public:
    ComputeClient();
    // Constructor for dependency injection (enables mocking in tests)
    explicit ComputeClient(
        std::unique_ptr<IComputeSDKClient> sdk_client,
        std::shared_ptr<ILogSink> log = makeDefaultLogSink(),
        std::chrono::milliseconds poll_interval = OperationPoller::kDefaultPollInterval);
    virtual ~ComputeClient() = default;

    ComputeClient(const ComputeClient&) = delete;
    ComputeClient& operator=(const ComputeClient&) = delete;

    // Catalog lookups
    virtual StatusOr<std::vector<compute_v1::Region>> getRegions(
        const std::string& project_id) const;

    // Zones belonging to the region, compared case-insensitively against the zone's region link
    virtual StatusOr<std::vector<compute_v1::Zone>> getZones(
        const std::string& project_id,
        const std::string& region_link) const;

    virtual StatusOr<std::vector<compute_v1::MachineType>> getMachineTypes(
        const std::string& project_id,
        const std::string& zone_link) const;

    virtual StatusOr<std::vector<std::string>> getCpuPlatforms(
        const std::string& project_id,
        const std::string& zone_link) const;

    virtual StatusOr<std::vector<compute_v1::DiskType>> getDiskTypes(
        const std::string& project_id,
        const std::string& zone_link) const;

    // Like getDiskTypes, without local SSD types ("local-*")
    virtual StatusOr<std::vector<compute_v1::DiskType>> getBootDiskTypes(
        const std::string& project_id,
        const std::string& zone_link) const;

    virtual StatusOr<std::vector<compute_v1::Image>> getImages(
        const std::string& project_id) const;

    virtual StatusOr<compute_v1::Image> getImage(
        const std::string& project_id,
        const std::string& image_name) const;

    virtual StatusOr<std::vector<compute_v1::AcceleratorType>> getAcceleratorTypes(
        const std::string& project_id,
        const std::string& zone_link) const;

    virtual StatusOr<std::vector<compute_v1::Network>> getNetworks(
        const std::string& project_id) const;

    virtual StatusOr<std::vector<compute_v1::Subnetwork>> getSubnetworks(
        const std::string& project_id,
        const std::string& network_link,
        const std::string& region_link) const;

    // Instance operations

    /**
     * Insert an instance into the zone named by instance.zone().
     *
     * @param template_link optional instance template to create the instance
     *     from; if present it must not be empty
     * @return the insert Operation, not waited for
     */
    virtual StatusOr<compute_v1::Operation> insertInstance(
        const std::string& project_id,
        const std::optional<std::string>& template_link,
        const compute_v1::Instance& instance) const;

    virtual StatusOr<compute_v1::Operation> terminateInstance(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& instance_id) const;

    /**
     * Delete the instance only if its status equals desired_status.
     *
     * @return the delete Operation, or std::nullopt if the instance had another status
     */
    virtual StatusOr<std::optional<compute_v1::Operation>> terminateInstanceWithStatus(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& instance_id,
        const std::string& desired_status) const;

    virtual StatusOr<compute_v1::Instance> getInstance(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& instance_id) const;

    // Instances in any zone carrying every given label
    virtual StatusOr<std::vector<compute_v1::Instance>> getInstancesWithLabel(
        const std::string& project_id,
        const std::map<std::string, std::string>& labels) const;

    // Instance template operations
    virtual StatusOr<compute_v1::InstanceTemplate> getTemplate(
        const std::string& project_id,
        const std::string& template_name) const;

    virtual StatusOr<compute_v1::Operation> insertTemplate(
        const std::string& project_id,
        const compute_v1::InstanceTemplate& instance_template) const;

    virtual StatusOr<compute_v1::Operation> deleteTemplate(
        const std::string& project_id,
        const std::string& template_name) const;

    virtual StatusOr<std::vector<compute_v1::InstanceTemplate>> getTemplates(
        const std::string& project_id) const;

    // Snapshot operations

    // Snapshot every disk of the instance concurrently; blocks until all finish
    // or the first one fails. See SnapshotOrchestrator.
    virtual Status createSnapshot(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& instance_id,
        std::chrono::milliseconds timeout) const;

    virtual StatusOr<compute_v1::Error> createSnapshotForDisk(
        const std::string& project_id,
        const std::string& zone_name,
        const std::string& disk_name,
        std::chrono::milliseconds timeout) const;

    // Does not wait for the delete to finish
    virtual StatusOr<compute_v1::Operation> deleteSnapshot(
        const std::string& project_id,
        const std::string& snapshot_name) const;

    virtual StatusOr<compute_v1::Snapshot> getSnapshot(
        const std::string& project_id,
        const std::string& snapshot_name) const;

    // Operation tracking
    virtual StatusOr<compute_v1::Operation> getZoneOperation(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& operation_id) const;

    /**
     * Append metadata items to an instance and wait for the update.
     *
     * Items with existing keys are overwritten; other existing items are kept.
     * The instance's metadata fingerprint is sent back unchanged.
     *
     * @return the error payload of the setMetadata operation
     */
    virtual StatusOr<compute_v1::Error> appendInstanceMetadata(
        const std::string& project_id,
        const std::string& zone_link,
        const std::string& instance_id,
        const std::vector<compute_v1::Items>& items,
        std::chrono::milliseconds timeout) const;

    virtual StatusOr<compute_v1::Error> waitForOperationCompletion(
        const std::string& project_id,
        const compute_v1::Operation& operation,
        std::chrono::milliseconds timeout) const;

    virtual StatusOr<compute_v1::Error> waitForOperationCompletion(
        const std::string& project_id,
        const std::string& operation_id,
        const std::string& zone_link,
        std::chrono::milliseconds timeout) const;

private:
    std::unique_ptr<IComputeSDKClient> sdk_client_;
    std::shared_ptr<ILogSink> log_;
    OperationPoller poller_;
    SnapshotOrchestrator orchestrator_;
};

} // namespace gceclient
