#include "compute_client.hpp"
#include <functional>
#include <utility>
#include "client_util.hpp"

namespace gceclient {

ComputeClient::ComputeClient() : ComputeClient(std::make_unique<ComputeSDKClientImpl>()) {}

ComputeClient::ComputeClient(std::unique_ptr<IComputeSDKClient> sdk_client,
                             std::shared_ptr<ILogSink> log,
                             std::chrono::milliseconds poll_interval)
    : sdk_client_(std::move(sdk_client)),
      log_(log ? std::move(log) : std::make_shared<NullLogSink>()),
      poller_(*sdk_client_, *log_, poll_interval),
      orchestrator_(*sdk_client_, poller_, *log_) {}

StatusOr<std::vector<compute_v1::Region>> ComputeClient::getRegions(
    const std::string& project_id) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    auto regions = sdk_client_->ListRegions(project_id);
    if (!regions) {
        return std::move(regions).status();
    }
    return processResourceList(
        *std::move(regions),
        [](const compute_v1::Region& r) { return !isDeprecatedResource(r); },
        compareByName<compute_v1::Region>);
}

StatusOr<std::vector<compute_v1::Zone>> ComputeClient::getZones(
    const std::string& project_id,
    const std::string& region_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"regionLink", region_link}});
    if (!status.ok()) {
        return status;
    }
    auto zones = sdk_client_->ListZones(project_id);
    if (!zones) {
        return std::move(zones).status();
    }
    return processResourceList(
        *std::move(zones),
        [&region_link](const compute_v1::Zone& z) { return equalsIgnoreCase(region_link, z.region()); },
        compareByName<compute_v1::Zone>);
}

StatusOr<std::vector<compute_v1::MachineType>> ComputeClient::getMachineTypes(
    const std::string& project_id,
    const std::string& zone_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"zoneLink", zone_link}});
    if (!status.ok()) {
        return status;
    }
    auto machine_types = sdk_client_->ListMachineTypes(project_id, nameFromSelfLink(zone_link));
    if (!machine_types) {
        return std::move(machine_types).status();
    }
    return processResourceList(
        *std::move(machine_types),
        [](const compute_v1::MachineType& m) { return !isDeprecatedResource(m); },
        compareByName<compute_v1::MachineType>);
}

StatusOr<std::vector<std::string>> ComputeClient::getCpuPlatforms(
    const std::string& project_id,
    const std::string& zone_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"zoneLink", zone_link}});
    if (!status.ok()) {
        return status;
    }
    auto zone = sdk_client_->GetZone(project_id, nameFromSelfLink(zone_link));
    if (!zone) {
        return std::move(zone).status();
    }
    std::vector<std::string> platforms(zone->available_cpu_platforms().begin(),
                                       zone->available_cpu_platforms().end());
    return processResourceList(std::move(platforms), std::less<std::string>());
}

StatusOr<std::vector<compute_v1::DiskType>> ComputeClient::getDiskTypes(
    const std::string& project_id,
    const std::string& zone_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"zoneLink", zone_link}});
    if (!status.ok()) {
        return status;
    }
    auto disk_types = sdk_client_->ListDiskTypes(project_id, nameFromSelfLink(zone_link));
    if (!disk_types) {
        return std::move(disk_types).status();
    }
    return processResourceList(
        *std::move(disk_types),
        [](const compute_v1::DiskType& d) { return !isDeprecatedResource(d); },
        compareByName<compute_v1::DiskType>);
}

StatusOr<std::vector<compute_v1::DiskType>> ComputeClient::getBootDiskTypes(
    const std::string& project_id,
    const std::string& zone_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"zoneLink", zone_link}});
    if (!status.ok()) {
        return status;
    }
    auto disk_types = sdk_client_->ListDiskTypes(project_id, nameFromSelfLink(zone_link));
    if (!disk_types) {
        return std::move(disk_types).status();
    }
    // No local disks
    return processResourceList(
        *std::move(disk_types),
        [](const compute_v1::DiskType& d) {
            return !isDeprecatedResource(d) && d.name().rfind("local-", 0) != 0;
        },
        compareByName<compute_v1::DiskType>);
}

StatusOr<std::vector<compute_v1::Image>> ComputeClient::getImages(
    const std::string& project_id) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    auto images = sdk_client_->ListImages(project_id);
    if (!images) {
        return std::move(images).status();
    }
    return processResourceList(
        *std::move(images),
        [](const compute_v1::Image& i) { return !isDeprecatedResource(i); },
        compareByName<compute_v1::Image>);
}

StatusOr<compute_v1::Image> ComputeClient::getImage(
    const std::string& project_id,
    const std::string& image_name) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"imageName", image_name}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->GetImage(project_id, image_name);
}

StatusOr<std::vector<compute_v1::AcceleratorType>> ComputeClient::getAcceleratorTypes(
    const std::string& project_id,
    const std::string& zone_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"zoneLink", zone_link}});
    if (!status.ok()) {
        return status;
    }
    auto accelerator_types =
        sdk_client_->ListAcceleratorTypes(project_id, nameFromSelfLink(zone_link));
    if (!accelerator_types) {
        return std::move(accelerator_types).status();
    }
    return processResourceList(
        *std::move(accelerator_types),
        [](const compute_v1::AcceleratorType& a) { return !isDeprecatedResource(a); },
        compareByName<compute_v1::AcceleratorType>);
}

StatusOr<std::vector<compute_v1::Network>> ComputeClient::getNetworks(
    const std::string& project_id) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    auto networks = sdk_client_->ListNetworks(project_id);
    if (!networks) {
        return std::move(networks).status();
    }
    return processResourceList(*std::move(networks), compareByName<compute_v1::Network>);
}

StatusOr<std::vector<compute_v1::Subnetwork>> ComputeClient::getSubnetworks(
    const std::string& project_id,
    const std::string& network_link,
    const std::string& region_link) const
{
    Status status = checkNotEmpty({{"projectId", project_id},
                                   {"networkLink", network_link},
                                   {"regionLink", region_link}});
    if (!status.ok()) {
        return status;
    }
    auto subnetworks = sdk_client_->ListSubnetworks(project_id, nameFromSelfLink(region_link));
    if (!subnetworks) {
        return std::move(subnetworks).status();
    }
    return processResourceList(
        *std::move(subnetworks),
        [&network_link](const compute_v1::Subnetwork& s) {
            return equalsIgnoreCase(s.network(), network_link);
        },
        compareByName<compute_v1::Subnetwork>);
}

StatusOr<compute_v1::Operation> ComputeClient::insertInstance(
    const std::string& project_id,
    const std::optional<std::string>& template_link,
    const compute_v1::Instance& instance) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"instance.zone", instance.zone()}});
    if (status.ok() && template_link) {
        status = checkNotEmpty(*template_link, "templateLink");
    }
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->InsertInstance(
        project_id, nameFromSelfLink(instance.zone()), instance, template_link);
}

StatusOr<compute_v1::Operation> ComputeClient::terminateInstance(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& instance_id) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zoneLink", zone_link}, {"instanceId", instance_id}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->DeleteInstance(project_id, nameFromSelfLink(zone_link), instance_id);
}

StatusOr<std::optional<compute_v1::Operation>> ComputeClient::terminateInstanceWithStatus(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& instance_id,
    const std::string& desired_status) const
{
    Status status = checkNotEmpty({{"projectId", project_id},
                                   {"zoneLink", zone_link},
                                   {"instanceId", instance_id},
                                   {"desiredStatus", desired_status}});
    if (!status.ok()) {
        return status;
    }
    const std::string zone_name = nameFromSelfLink(zone_link);
    auto instance = sdk_client_->GetInstance(project_id, zone_name, instance_id);
    if (!instance) {
        return std::move(instance).status();
    }
    if (instance->status() != desired_status) {
        log_->debug("Instance " + instance_id + " has status " + instance->status() +
                    ", not " + desired_status + "; not terminating");
        return std::optional<compute_v1::Operation>();
    }
    auto operation = sdk_client_->DeleteInstance(project_id, zone_name, instance_id);
    if (!operation) {
        return std::move(operation).status();
    }
    return std::make_optional(*std::move(operation));
}

StatusOr<compute_v1::Instance> ComputeClient::getInstance(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& instance_id) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zoneLink", zone_link}, {"instanceId", instance_id}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->GetInstance(project_id, nameFromSelfLink(zone_link), instance_id);
}

StatusOr<std::vector<compute_v1::Instance>> ComputeClient::getInstancesWithLabel(
    const std::string& project_id,
    const std::map<std::string, std::string>& labels) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    auto scoped = sdk_client_->AggregatedListInstances(project_id, buildLabelsFilterString(labels));
    if (!scoped) {
        return std::move(scoped).status();
    }
    std::vector<compute_v1::Instance> instances;
    for (const auto& [scope, list] : *scoped) {
        instances.insert(instances.end(), list.instances().begin(), list.instances().end());
    }
    return instances;
}

StatusOr<compute_v1::InstanceTemplate> ComputeClient::getTemplate(
    const std::string& project_id,
    const std::string& template_name) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"templateName", template_name}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->GetInstanceTemplate(project_id, template_name);
}

StatusOr<compute_v1::Operation> ComputeClient::insertTemplate(
    const std::string& project_id,
    const compute_v1::InstanceTemplate& instance_template) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->InsertInstanceTemplate(project_id, instance_template);
}

StatusOr<compute_v1::Operation> ComputeClient::deleteTemplate(
    const std::string& project_id,
    const std::string& template_name) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"templateName", template_name}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->DeleteInstanceTemplate(project_id, template_name);
}

StatusOr<std::vector<compute_v1::InstanceTemplate>> ComputeClient::getTemplates(
    const std::string& project_id) const
{
    Status status = checkNotEmpty(project_id, "projectId");
    if (!status.ok()) {
        return status;
    }
    auto templates = sdk_client_->ListInstanceTemplates(project_id);
    if (!templates) {
        return std::move(templates).status();
    }
    return processResourceList(*std::move(templates), compareByName<compute_v1::InstanceTemplate>);
}

Status ComputeClient::createSnapshot(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& instance_id,
    std::chrono::milliseconds timeout) const
{
    return orchestrator_.createSnapshot(project_id, zone_link, instance_id, timeout);
}

StatusOr<compute_v1::Error> ComputeClient::createSnapshotForDisk(
    const std::string& project_id,
    const std::string& zone_name,
    const std::string& disk_name,
    std::chrono::milliseconds timeout) const
{
    return orchestrator_.createSnapshotForDisk(project_id, zone_name, disk_name, timeout);
}

StatusOr<compute_v1::Operation> ComputeClient::deleteSnapshot(
    const std::string& project_id,
    const std::string& snapshot_name) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"snapshotName", snapshot_name}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->DeleteSnapshot(project_id, snapshot_name);
}

StatusOr<compute_v1::Snapshot> ComputeClient::getSnapshot(
    const std::string& project_id,
    const std::string& snapshot_name) const
{
    Status status = checkNotEmpty({{"projectId", project_id}, {"snapshotName", snapshot_name}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->GetSnapshot(project_id, snapshot_name);
}

StatusOr<compute_v1::Operation> ComputeClient::getZoneOperation(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& operation_id) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zoneLink", zone_link}, {"operationId", operation_id}});
    if (!status.ok()) {
        return status;
    }
    return sdk_client_->GetZoneOperation(project_id, nameFromSelfLink(zone_link), operation_id);
}

StatusOr<compute_v1::Error> ComputeClient::appendInstanceMetadata(
    const std::string& project_id,
    const std::string& zone_link,
    const std::string& instance_id,
    const std::vector<compute_v1::Items>& items,
    std::chrono::milliseconds timeout) const
{
    Status status = checkNotEmpty(
        {{"projectId", project_id}, {"zoneLink", zone_link}, {"instanceId", instance_id}});
    if (status.ok()) status = checkTimeout(timeout);
    if (!status.ok()) {
        return status;
    }

    const std::string zone_name = nameFromSelfLink(zone_link);
    auto instance = sdk_client_->GetInstance(project_id, zone_name, instance_id);
    if (!instance) {
        return std::move(instance).status();
    }

    compute_v1::Metadata metadata = instance->metadata();
    std::vector<compute_v1::Items> existing(metadata.items().begin(), metadata.items().end());
    auto merged = mergeMetadataItems(items, instance->has_metadata() ? &existing : nullptr);
    metadata.clear_items();
    for (auto& item : merged) {
        *metadata.add_items() = std::move(item);
    }

    auto operation = sdk_client_->SetInstanceMetadata(project_id, zone_name, instance_id, metadata);
    if (!operation) {
        return std::move(operation).status();
    }
    return poller_.waitForCompletion(project_id, zone_name, operation->name(), timeout);
}

StatusOr<compute_v1::Error> ComputeClient::waitForOperationCompletion(
    const std::string& project_id,
    const compute_v1::Operation& operation,
    std::chrono::milliseconds timeout) const
{
    return poller_.waitForCompletion(project_id, operation, timeout);
}

StatusOr<compute_v1::Error> ComputeClient::waitForOperationCompletion(
    const std::string& project_id,
    const std::string& operation_id,
    const std::string& zone_link,
    std::chrono::milliseconds timeout) const
{
    return poller_.waitForCompletion(project_id, zone_link, operation_id, timeout);
}

} // namespace gceclient
