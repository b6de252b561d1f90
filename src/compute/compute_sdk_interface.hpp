#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "google/cloud/compute/accelerator_types/v1/accelerator_types_client.h"
#include "google/cloud/compute/disk_types/v1/disk_types_client.h"
#include "google/cloud/compute/disks/v1/disks_client.h"
#include "google/cloud/compute/images/v1/images_client.h"
#include "google/cloud/compute/instance_templates/v1/instance_templates_client.h"
#include "google/cloud/compute/instances/v1/instances_client.h"
#include "google/cloud/compute/machine_types/v1/machine_types_client.h"
#include "google/cloud/compute/networks/v1/networks_client.h"
#include "google/cloud/compute/regions/v1/regions_client.h"
#include "google/cloud/compute/snapshots/v1/snapshots_client.h"
#include "google/cloud/compute/subnetworks/v1/subnetworks_client.h"
#include "google/cloud/compute/zone_operations/v1/zone_operations_client.h"
#include "google/cloud/compute/zones/v1/zones_client.h"
#include "google/cloud/status.h"
#include "google/cloud/status_or.h"

namespace compute_v1 = ::google::cloud::cpp::compute::v1;

namespace gceclient {

using google::cloud::Status;
using google::cloud::StatusCode;
using google::cloud::StatusOr;

/**
 * Raw interface over the Compute Engine SDK - one remote call per method, no logic
 *
 * Paginated list calls are drained into a vector, stopping at the first error.
 * Mutating calls return the long-running Operation without waiting for it.
 * Implementations must tolerate concurrent calls from several threads.
 */
class IComputeSDKClient {
public:
    virtual ~IComputeSDKClient() = default;

    // Regions and zones
    virtual StatusOr<std::vector<compute_v1::Region>> ListRegions(
        const std::string& project) const = 0;
    virtual StatusOr<std::vector<compute_v1::Zone>> ListZones(
        const std::string& project) const = 0;
    virtual StatusOr<compute_v1::Zone> GetZone(
        const std::string& project, const std::string& zone) const = 0;

    // Zonal catalogs
    virtual StatusOr<std::vector<compute_v1::MachineType>> ListMachineTypes(
        const std::string& project, const std::string& zone) const = 0;
    virtual StatusOr<std::vector<compute_v1::DiskType>> ListDiskTypes(
        const std::string& project, const std::string& zone) const = 0;
    virtual StatusOr<std::vector<compute_v1::AcceleratorType>> ListAcceleratorTypes(
        const std::string& project, const std::string& zone) const = 0;

    // Images
    virtual StatusOr<std::vector<compute_v1::Image>> ListImages(
        const std::string& project) const = 0;
    virtual StatusOr<compute_v1::Image> GetImage(
        const std::string& project, const std::string& image) const = 0;

    // Networking
    virtual StatusOr<std::vector<compute_v1::Network>> ListNetworks(
        const std::string& project) const = 0;
    virtual StatusOr<std::vector<compute_v1::Subnetwork>> ListSubnetworks(
        const std::string& project, const std::string& region) const = 0;

    // Instances
    virtual StatusOr<compute_v1::Operation> InsertInstance(
        const std::string& project,
        const std::string& zone,
        const compute_v1::Instance& instance,
        const std::optional<std::string>& template_link) const = 0;
    virtual StatusOr<compute_v1::Operation> DeleteInstance(
        const std::string& project,
        const std::string& zone,
        const std::string& instance) const = 0;
    virtual StatusOr<compute_v1::Instance> GetInstance(
        const std::string& project,
        const std::string& zone,
        const std::string& instance) const = 0;
    // Keyed by scope ("zones/us-west1-a")
    virtual StatusOr<std::map<std::string, compute_v1::InstancesScopedList>>
    AggregatedListInstances(const std::string& project,
                            const std::string& filter) const = 0;
    virtual StatusOr<compute_v1::Operation> SetInstanceMetadata(
        const std::string& project,
        const std::string& zone,
        const std::string& instance,
        const compute_v1::Metadata& metadata) const = 0;

    // Instance templates
    virtual StatusOr<compute_v1::InstanceTemplate> GetInstanceTemplate(
        const std::string& project, const std::string& name) const = 0;
    virtual StatusOr<compute_v1::Operation> InsertInstanceTemplate(
        const std::string& project,
        const compute_v1::InstanceTemplate& instance_template) const = 0;
    virtual StatusOr<compute_v1::Operation> DeleteInstanceTemplate(
        const std::string& project, const std::string& name) const = 0;
    virtual StatusOr<std::vector<compute_v1::InstanceTemplate>> ListInstanceTemplates(
        const std::string& project) const = 0;

    // Snapshots
    virtual StatusOr<compute_v1::Operation> CreateDiskSnapshot(
        const std::string& project,
        const std::string& zone,
        const std::string& disk,
        const compute_v1::Snapshot& snapshot) const = 0;
    virtual StatusOr<compute_v1::Operation> DeleteSnapshot(
        const std::string& project, const std::string& snapshot) const = 0;
    virtual StatusOr<compute_v1::Snapshot> GetSnapshot(
        const std::string& project, const std::string& snapshot) const = 0;

    // Operations
    virtual StatusOr<compute_v1::Operation> GetZoneOperation(
        const std::string& project,
        const std::string& zone,
        const std::string& operation) const = 0;
};

/**
 * Real implementation - thin wrapper over the google::cloud compute clients
 * Just forwards calls to the SDK with no business logic
 */
class ComputeSDKClientImpl : public IComputeSDKClient {
public:
    ComputeSDKClientImpl();

    StatusOr<std::vector<compute_v1::Region>> ListRegions(
        const std::string& project) const override;
    StatusOr<std::vector<compute_v1::Zone>> ListZones(
        const std::string& project) const override;
    StatusOr<compute_v1::Zone> GetZone(
        const std::string& project, const std::string& zone) const override;

    StatusOr<std::vector<compute_v1::MachineType>> ListMachineTypes(
        const std::string& project, const std::string& zone) const override;
    StatusOr<std::vector<compute_v1::DiskType>> ListDiskTypes(
        const std::string& project, const std::string& zone) const override;
    StatusOr<std::vector<compute_v1::AcceleratorType>> ListAcceleratorTypes(
        const std::string& project, const std::string& zone) const override;

    StatusOr<std::vector<compute_v1::Image>> ListImages(
        const std::string& project) const override;
    StatusOr<compute_v1::Image> GetImage(
        const std::string& project, const std::string& image) const override;

    StatusOr<std::vector<compute_v1::Network>> ListNetworks(
        const std::string& project) const override;
    StatusOr<std::vector<compute_v1::Subnetwork>> ListSubnetworks(
        const std::string& project, const std::string& region) const override;

    StatusOr<compute_v1::Operation> InsertInstance(
        const std::string& project,
        const std::string& zone,
        const compute_v1::Instance& instance,
        const std::optional<std::string>& template_link) const override;
    StatusOr<compute_v1::Operation> DeleteInstance(
        const std::string& project,
        const std::string& zone,
        const std::string& instance) const override;
    StatusOr<compute_v1::Instance> GetInstance(
        const std::string& project,
        const std::string& zone,
        const std::string& instance) const override;
    StatusOr<std::map<std::string, compute_v1::InstancesScopedList>>
    AggregatedListInstances(const std::string& project,
                            const std::string& filter) const override;
    StatusOr<compute_v1::Operation> SetInstanceMetadata(
        const std::string& project,
        const std::string& zone,
        const std::string& instance,
        const compute_v1::Metadata& metadata) const override;

    StatusOr<compute_v1::InstanceTemplate> GetInstanceTemplate(
        const std::string& project, const std::string& name) const override;
    StatusOr<compute_v1::Operation> InsertInstanceTemplate(
        const std::string& project,
        const compute_v1::InstanceTemplate& instance_template) const override;
    StatusOr<compute_v1::Operation> DeleteInstanceTemplate(
        const std::string& project, const std::string& name) const override;
    StatusOr<std::vector<compute_v1::InstanceTemplate>> ListInstanceTemplates(
        const std::string& project) const override;

    StatusOr<compute_v1::Operation> CreateDiskSnapshot(
        const std::string& project,
        const std::string& zone,
        const std::string& disk,
        const compute_v1::Snapshot& snapshot) const override;
    StatusOr<compute_v1::Operation> DeleteSnapshot(
        const std::string& project, const std::string& snapshot) const override;
    StatusOr<compute_v1::Snapshot> GetSnapshot(
        const std::string& project, const std::string& snapshot) const override;

    StatusOr<compute_v1::Operation> GetZoneOperation(
        const std::string& project,
        const std::string& zone,
        const std::string& operation) const override;

private:
    mutable google::cloud::compute_regions_v1::RegionsClient regions_;
    mutable google::cloud::compute_zones_v1::ZonesClient zones_;
    mutable google::cloud::compute_machine_types_v1::MachineTypesClient machine_types_;
    mutable google::cloud::compute_disk_types_v1::DiskTypesClient disk_types_;
    mutable google::cloud::compute_accelerator_types_v1::AcceleratorTypesClient accelerator_types_;
    mutable google::cloud::compute_images_v1::ImagesClient images_;
    mutable google::cloud::compute_networks_v1::NetworksClient networks_;
    mutable google::cloud::compute_subnetworks_v1::SubnetworksClient subnetworks_;
    mutable google::cloud::compute_instances_v1::InstancesClient instances_;
    mutable google::cloud::compute_instance_templates_v1::InstanceTemplatesClient instance_templates_;
    mutable google::cloud::compute_disks_v1::DisksClient disks_;
    mutable google::cloud::compute_snapshots_v1::SnapshotsClient snapshots_;
    mutable google::cloud::compute_zone_operations_v1::ZoneOperationsClient zone_operations_;
};

} // namespace gceclient
