#include "compute_sdk_interface.hpp"
#include <utility>

namespace gceclient {

namespace {

namespace instances_v1 = ::google::cloud::cpp::compute::instances::v1;

template <typename T>
StatusOr<std::vector<T>> drain(google::cloud::StreamRange<T> range) {
    std::vector<T> items;
    for (auto&& item : range) {
        if (!item) {
            return std::move(item).status();
        }
        items.push_back(*std::move(item));
    }
    return items;
}

} // namespace

ComputeSDKClientImpl::ComputeSDKClientImpl()
    : regions_(google::cloud::compute_regions_v1::MakeRegionsConnectionRest()),
      zones_(google::cloud::compute_zones_v1::MakeZonesConnectionRest()),
      machine_types_(google::cloud::compute_machine_types_v1::MakeMachineTypesConnectionRest()),
      disk_types_(google::cloud::compute_disk_types_v1::MakeDiskTypesConnectionRest()),
      accelerator_types_(
          google::cloud::compute_accelerator_types_v1::MakeAcceleratorTypesConnectionRest()),
      images_(google::cloud::compute_images_v1::MakeImagesConnectionRest()),
      networks_(google::cloud::compute_networks_v1::MakeNetworksConnectionRest()),
      subnetworks_(google::cloud::compute_subnetworks_v1::MakeSubnetworksConnectionRest()),
      instances_(google::cloud::compute_instances_v1::MakeInstancesConnectionRest()),
      instance_templates_(
          google::cloud::compute_instance_templates_v1::MakeInstanceTemplatesConnectionRest()),
      disks_(google::cloud::compute_disks_v1::MakeDisksConnectionRest()),
      snapshots_(google::cloud::compute_snapshots_v1::MakeSnapshotsConnectionRest()),
      zone_operations_(
          google::cloud::compute_zone_operations_v1::MakeZoneOperationsConnectionRest()) {}

StatusOr<std::vector<compute_v1::Region>> ComputeSDKClientImpl::ListRegions(
    const std::string& project) const {
    return drain(regions_.ListRegions(project));
}

StatusOr<std::vector<compute_v1::Zone>> ComputeSDKClientImpl::ListZones(
    const std::string& project) const {
    return drain(zones_.ListZones(project));
}

StatusOr<compute_v1::Zone> ComputeSDKClientImpl::GetZone(
    const std::string& project, const std::string& zone) const {
    return zones_.GetZone(project, zone);
}

StatusOr<std::vector<compute_v1::MachineType>> ComputeSDKClientImpl::ListMachineTypes(
    const std::string& project, const std::string& zone) const {
    return drain(machine_types_.ListMachineTypes(project, zone));
}

StatusOr<std::vector<compute_v1::DiskType>> ComputeSDKClientImpl::ListDiskTypes(
    const std::string& project, const std::string& zone) const {
    return drain(disk_types_.ListDiskTypes(project, zone));
}

StatusOr<std::vector<compute_v1::AcceleratorType>> ComputeSDKClientImpl::ListAcceleratorTypes(
    const std::string& project, const std::string& zone) const {
    return drain(accelerator_types_.ListAcceleratorTypes(project, zone));
}

StatusOr<std::vector<compute_v1::Image>> ComputeSDKClientImpl::ListImages(
    const std::string& project) const {
    return drain(images_.ListImages(project));
}

StatusOr<compute_v1::Image> ComputeSDKClientImpl::GetImage(
    const std::string& project, const std::string& image) const {
    return images_.GetImage(project, image);
}

StatusOr<std::vector<compute_v1::Network>> ComputeSDKClientImpl::ListNetworks(
    const std::string& project) const {
    return drain(networks_.ListNetworks(project));
}

StatusOr<std::vector<compute_v1::Subnetwork>> ComputeSDKClientImpl::ListSubnetworks(
    const std::string& project, const std::string& region) const {
    return drain(subnetworks_.ListSubnetworks(project, region));
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::InsertInstance(
    const std::string& project,
    const std::string& zone,
    const compute_v1::Instance& instance,
    const std::optional<std::string>& template_link) const
{
    instances_v1::InsertInstanceRequest request;
    request.set_project(project);
    request.set_zone(zone);
    *request.mutable_instance_resource() = instance;
    if (template_link) {
        request.set_source_instance_template(*template_link);
    }
    return instances_.InsertInstance(google::cloud::NoAwaitTag{}, request);
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::DeleteInstance(
    const std::string& project,
    const std::string& zone,
    const std::string& instance) const
{
    return instances_.DeleteInstance(google::cloud::NoAwaitTag{}, project, zone, instance);
}

StatusOr<compute_v1::Instance> ComputeSDKClientImpl::GetInstance(
    const std::string& project,
    const std::string& zone,
    const std::string& instance) const
{
    return instances_.GetInstance(project, zone, instance);
}

StatusOr<std::map<std::string, compute_v1::InstancesScopedList>>
ComputeSDKClientImpl::AggregatedListInstances(const std::string& project,
                                              const std::string& filter) const
{
    instances_v1::AggregatedListInstancesRequest request;
    request.set_project(project);
    if (!filter.empty()) {
        request.set_filter(filter);
    }

    std::map<std::string, compute_v1::InstancesScopedList> scoped;
    for (auto&& entry : instances_.AggregatedListInstances(request)) {
        if (!entry) {
            return std::move(entry).status();
        }
        scoped[entry->first] = std::move(entry->second);
    }
    return scoped;
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::SetInstanceMetadata(
    const std::string& project,
    const std::string& zone,
    const std::string& instance,
    const compute_v1::Metadata& metadata) const
{
    return instances_.SetMetadata(google::cloud::NoAwaitTag{}, project, zone, instance, metadata);
}

StatusOr<compute_v1::InstanceTemplate> ComputeSDKClientImpl::GetInstanceTemplate(
    const std::string& project, const std::string& name) const {
    return instance_templates_.GetInstanceTemplate(project, name);
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::InsertInstanceTemplate(
    const std::string& project,
    const compute_v1::InstanceTemplate& instance_template) const
{
    return instance_templates_.InsertInstanceTemplate(
        google::cloud::NoAwaitTag{}, project, instance_template);
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::DeleteInstanceTemplate(
    const std::string& project, const std::string& name) const {
    return instance_templates_.DeleteInstanceTemplate(google::cloud::NoAwaitTag{}, project, name);
}

StatusOr<std::vector<compute_v1::InstanceTemplate>> ComputeSDKClientImpl::ListInstanceTemplates(
    const std::string& project) const {
    return drain(instance_templates_.ListInstanceTemplates(project));
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::CreateDiskSnapshot(
    const std::string& project,
    const std::string& zone,
    const std::string& disk,
    const compute_v1::Snapshot& snapshot) const
{
    return disks_.CreateSnapshot(google::cloud::NoAwaitTag{}, project, zone, disk, snapshot);
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::DeleteSnapshot(
    const std::string& project, const std::string& snapshot) const {
    return snapshots_.DeleteSnapshot(google::cloud::NoAwaitTag{}, project, snapshot);
}

StatusOr<compute_v1::Snapshot> ComputeSDKClientImpl::GetSnapshot(
    const std::string& project, const std::string& snapshot) const {
    return snapshots_.GetSnapshot(project, snapshot);
}

StatusOr<compute_v1::Operation> ComputeSDKClientImpl::GetZoneOperation(
    const std::string& project,
    const std::string& zone,
    const std::string& operation) const
{
    return zone_operations_.GetOperation(project, zone, operation);
}

} // namespace gceclient
