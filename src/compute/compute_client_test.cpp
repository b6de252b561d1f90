#include "compute_client.hpp"
#include "mock_compute_sdk_client.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <memory>
#include <string>
#include <vector>

using ::testing::_;
using ::testing::DoAll;
using ::testing::Eq;
using ::testing::Optional;
using ::testing::Return;
using ::testing::SaveArg;
using gceclient::ComputeClient;
using gceclient::MockComputeSDKClient;
using gceclient::makeInstance;
using gceclient::makeOperation;
using google::cloud::Status;
using google::cloud::StatusCode;
using std::chrono::milliseconds;

namespace {

const char kZoneLink[] =
    "https://www.googleapis.com/compute/v1/projects/test-project/zones/us-west1-a";
const char kRegionLink[] =
    "https://www.googleapis.com/compute/v1/projects/test-project/regions/us-west1";
const char kNetworkLink[] =
    "https://www.googleapis.com/compute/v1/projects/test-project/global/networks/default";

template <typename Resource>
Resource named(const std::string& name, const std::string& deprecation_state = "") {
    Resource resource;
    resource.set_name(name);
    if (!deprecation_state.empty()) {
        resource.mutable_deprecated()->set_state(deprecation_state);
    }
    return resource;
}

template <typename Resource>
std::vector<std::string> names(const std::vector<Resource>& resources) {
    std::vector<std::string> out;
    for (const auto& resource : resources) {
        out.push_back(resource.name());
    }
    return out;
}

compute_v1::Items item(const std::string& key, const std::string& value) {
    compute_v1::Items entry;
    entry.set_key(key);
    entry.set_value(value);
    return entry;
}

} // namespace

class ComputeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_sdk_client = std::make_unique<MockComputeSDKClient>();
        mock_sdk_client_ptr = mock_sdk_client.get();
    }

    std::unique_ptr<ComputeClient> makeClient() {
        return std::make_unique<ComputeClient>(
            std::move(mock_sdk_client), std::make_shared<gceclient::NullLogSink>(),
            milliseconds(2));
    }

    const std::string project = "test-project";
    std::unique_ptr<MockComputeSDKClient> mock_sdk_client;
    MockComputeSDKClient* mock_sdk_client_ptr;
};

// Deprecated regions are dropped and the rest sorted by name
TEST_F(ComputeClientTest, GetRegions_FiltersDeprecatedAndSorts) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListRegions(project))
        .WillOnce(Return(std::vector<compute_v1::Region>{
            named<compute_v1::Region>("c"),
            named<compute_v1::Region>("a", "DEPRECATED"),
            named<compute_v1::Region>("b")}));

    auto client = makeClient();
    auto regions = client->getRegions(project);

    ASSERT_TRUE(regions.ok()) << regions.status();
    EXPECT_EQ(names(*regions), (std::vector<std::string>{"b", "c"}));
}

TEST_F(ComputeClientTest, GetRegions_ErrorPassesThrough) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListRegions(project))
        .WillOnce(Return(Status(StatusCode::kPermissionDenied, "no access")));

    auto client = makeClient();
    auto regions = client->getRegions(project);

    EXPECT_EQ(regions.status().code(), StatusCode::kPermissionDenied);
    EXPECT_EQ(regions.status().message(), "no access");
}

TEST_F(ComputeClientTest, GetRegions_EmptyProjectMakesNoCall) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListRegions(_)).Times(0);

    auto client = makeClient();

    EXPECT_EQ(client->getRegions("").status().code(), StatusCode::kInvalidArgument);
}

// Zones are matched to the region link ignoring case
TEST_F(ComputeClientTest, GetZones_FiltersByRegion) {
    auto zone_b = named<compute_v1::Zone>("us-west1-b");
    zone_b.set_region(kRegionLink);
    auto zone_a = named<compute_v1::Zone>("us-west1-a");
    zone_a.set_region("HTTPS://WWW.GOOGLEAPIS.COM/compute/v1/projects/test-project/regions/US-WEST1");
    auto other = named<compute_v1::Zone>("europe-west1-b");
    other.set_region("https://www.googleapis.com/compute/v1/projects/test-project/regions/europe-west1");

    EXPECT_CALL(*mock_sdk_client_ptr, ListZones(project))
        .WillOnce(Return(std::vector<compute_v1::Zone>{zone_b, other, zone_a}));

    auto client = makeClient();
    auto zones = client->getZones(project, kRegionLink);

    ASSERT_TRUE(zones.ok()) << zones.status();
    EXPECT_EQ(names(*zones), (std::vector<std::string>{"us-west1-a", "us-west1-b"}));
}

TEST_F(ComputeClientTest, GetMachineTypes_UsesZoneName) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListMachineTypes(project, "us-west1-a"))
        .WillOnce(Return(std::vector<compute_v1::MachineType>{
            named<compute_v1::MachineType>("n1-standard-4"),
            named<compute_v1::MachineType>("e2-small"),
            named<compute_v1::MachineType>("f1-micro", "deprecated")}));

    auto client = makeClient();
    auto machine_types = client->getMachineTypes(project, kZoneLink);

    ASSERT_TRUE(machine_types.ok()) << machine_types.status();
    EXPECT_EQ(names(*machine_types), (std::vector<std::string>{"e2-small", "n1-standard-4"}));
}

TEST_F(ComputeClientTest, GetCpuPlatforms_Sorted) {
    compute_v1::Zone zone;
    zone.set_name("us-west1-a");
    zone.add_available_cpu_platforms("Intel Skylake");
    zone.add_available_cpu_platforms("AMD Rome");
    zone.add_available_cpu_platforms("Intel Cascade Lake");

    EXPECT_CALL(*mock_sdk_client_ptr, GetZone(project, "us-west1-a")).WillOnce(Return(zone));

    auto client = makeClient();
    auto platforms = client->getCpuPlatforms(project, "us-west1-a");

    ASSERT_TRUE(platforms.ok()) << platforms.status();
    EXPECT_EQ(*platforms,
              (std::vector<std::string>{"AMD Rome", "Intel Cascade Lake", "Intel Skylake"}));
}

TEST_F(ComputeClientTest, GetBootDiskTypes_ExcludesLocalDisks) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListDiskTypes(project, "us-west1-a"))
        .WillRepeatedly(Return(std::vector<compute_v1::DiskType>{
            named<compute_v1::DiskType>("pd-standard"),
            named<compute_v1::DiskType>("local-ssd"),
            named<compute_v1::DiskType>("pd-balanced"),
            named<compute_v1::DiskType>("pd-old", "DEPRECATED")}));

    auto client = makeClient();
    auto all_types = client->getDiskTypes(project, kZoneLink);
    auto boot_types = client->getBootDiskTypes(project, kZoneLink);

    ASSERT_TRUE(all_types.ok()) << all_types.status();
    ASSERT_TRUE(boot_types.ok()) << boot_types.status();
    EXPECT_EQ(names(*all_types),
              (std::vector<std::string>{"local-ssd", "pd-balanced", "pd-standard"}));
    EXPECT_EQ(names(*boot_types), (std::vector<std::string>{"pd-balanced", "pd-standard"}));
}

TEST_F(ComputeClientTest, GetImages_FiltersDeprecated) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListImages(project))
        .WillOnce(Return(std::vector<compute_v1::Image>{
            named<compute_v1::Image>("ubuntu-2204"),
            named<compute_v1::Image>("debian-10", "DEPRECATED"),
            named<compute_v1::Image>("debian-12")}));

    auto client = makeClient();
    auto images = client->getImages(project);

    ASSERT_TRUE(images.ok()) << images.status();
    EXPECT_EQ(names(*images), (std::vector<std::string>{"debian-12", "ubuntu-2204"}));
}

TEST_F(ComputeClientTest, GetImage_NotFoundPassesThrough) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetImage(project, "missing"))
        .WillOnce(Return(Status(StatusCode::kNotFound, "image not found")));

    auto client = makeClient();

    EXPECT_EQ(client->getImage(project, "missing").status().code(), StatusCode::kNotFound);
}

TEST_F(ComputeClientTest, GetAcceleratorTypes_FiltersDeprecated) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListAcceleratorTypes(project, "us-west1-a"))
        .WillOnce(Return(std::vector<compute_v1::AcceleratorType>{
            named<compute_v1::AcceleratorType>("nvidia-tesla-t4"),
            named<compute_v1::AcceleratorType>("nvidia-tesla-k80", "DEPRECATED")}));

    auto client = makeClient();
    auto accelerators = client->getAcceleratorTypes(project, kZoneLink);

    ASSERT_TRUE(accelerators.ok()) << accelerators.status();
    EXPECT_EQ(names(*accelerators), (std::vector<std::string>{"nvidia-tesla-t4"}));
}

TEST_F(ComputeClientTest, GetNetworks_SortedOnly) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListNetworks(project))
        .WillOnce(Return(std::vector<compute_v1::Network>{
            named<compute_v1::Network>("vpc-b"), named<compute_v1::Network>("default")}));

    auto client = makeClient();
    auto networks = client->getNetworks(project);

    ASSERT_TRUE(networks.ok()) << networks.status();
    EXPECT_EQ(names(*networks), (std::vector<std::string>{"default", "vpc-b"}));
}

TEST_F(ComputeClientTest, GetSubnetworks_FiltersByNetwork) {
    auto in_network = named<compute_v1::Subnetwork>("subnet-b");
    in_network.set_network(kNetworkLink);
    auto also_in_network = named<compute_v1::Subnetwork>("subnet-a");
    also_in_network.set_network(kNetworkLink);
    auto elsewhere = named<compute_v1::Subnetwork>("subnet-c");
    elsewhere.set_network(
        "https://www.googleapis.com/compute/v1/projects/test-project/global/networks/other");

    EXPECT_CALL(*mock_sdk_client_ptr, ListSubnetworks(project, "us-west1"))
        .WillOnce(Return(std::vector<compute_v1::Subnetwork>{in_network, elsewhere, also_in_network}));

    auto client = makeClient();
    auto subnetworks = client->getSubnetworks(project, kNetworkLink, kRegionLink);

    ASSERT_TRUE(subnetworks.ok()) << subnetworks.status();
    EXPECT_EQ(names(*subnetworks), (std::vector<std::string>{"subnet-a", "subnet-b"}));
}

TEST_F(ComputeClientTest, InsertInstance_WithTemplate) {
    compute_v1::Instance instance;
    instance.set_name("vm-1");
    instance.set_zone(kZoneLink);
    const std::string template_link = "global/instanceTemplates/agent-template";

    EXPECT_CALL(*mock_sdk_client_ptr,
                InsertInstance(project, "us-west1-a", _, Optional(Eq(template_link))))
        .WillOnce(Return(makeOperation("insert-op", "PENDING")));

    auto client = makeClient();
    auto operation = client->insertInstance(project, template_link, instance);

    ASSERT_TRUE(operation.ok()) << operation.status();
    EXPECT_EQ(operation->name(), "insert-op");
}

TEST_F(ComputeClientTest, InsertInstance_RejectsEmptyTemplateAndZone) {
    EXPECT_CALL(*mock_sdk_client_ptr, InsertInstance(_, _, _, _)).Times(0);

    compute_v1::Instance instance;
    instance.set_name("vm-1");
    instance.set_zone(kZoneLink);
    compute_v1::Instance no_zone;
    no_zone.set_name("vm-2");

    auto client = makeClient();
    EXPECT_EQ(client->insertInstance(project, std::string(), instance).status().code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->insertInstance(project, std::nullopt, no_zone).status().code(),
              StatusCode::kInvalidArgument);
}

TEST_F(ComputeClientTest, TerminateInstanceWithStatus_Matching) {
    auto instance = makeInstance("vm-1", {});
    instance.set_status("TERMINATED");

    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(instance));
    EXPECT_CALL(*mock_sdk_client_ptr, DeleteInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(makeOperation("delete-op", "PENDING")));

    auto client = makeClient();
    auto result = client->terminateInstanceWithStatus(project, kZoneLink, "vm-1", "TERMINATED");

    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_TRUE(result->has_value());
    EXPECT_EQ((*result)->name(), "delete-op");
}

TEST_F(ComputeClientTest, TerminateInstanceWithStatus_OtherStatusLeavesInstance) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(makeInstance("vm-1", {})));
    EXPECT_CALL(*mock_sdk_client_ptr, DeleteInstance(_, _, _)).Times(0);

    auto client = makeClient();
    auto result = client->terminateInstanceWithStatus(project, kZoneLink, "vm-1", "TERMINATED");

    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_FALSE(result->has_value());
}

// Instances from every zone are flattened into one list
TEST_F(ComputeClientTest, GetInstancesWithLabel_BuildsFilter) {
    compute_v1::InstancesScopedList west;
    *west.add_instances() = makeInstance("vm-west", {});
    compute_v1::InstancesScopedList east;
    *east.add_instances() = makeInstance("vm-east-1", {});
    *east.add_instances() = makeInstance("vm-east-2", {});
    compute_v1::InstancesScopedList empty;

    std::map<std::string, compute_v1::InstancesScopedList> scoped = {
        {"zones/us-east1-b", east}, {"zones/us-west1-a", west}, {"zones/asia-east1-a", empty}};

    EXPECT_CALL(*mock_sdk_client_ptr,
                AggregatedListInstances(project, "(labels.env eq prod) (labels.role eq agent)"))
        .WillOnce(Return(scoped));

    auto client = makeClient();
    auto instances = client->getInstancesWithLabel(project, {{"role", "agent"}, {"env", "prod"}});

    ASSERT_TRUE(instances.ok()) << instances.status();
    EXPECT_EQ(names(*instances),
              (std::vector<std::string>{"vm-east-1", "vm-east-2", "vm-west"}));
}

TEST_F(ComputeClientTest, GetTemplates_Sorted) {
    EXPECT_CALL(*mock_sdk_client_ptr, ListInstanceTemplates(project))
        .WillOnce(Return(std::vector<compute_v1::InstanceTemplate>{
            named<compute_v1::InstanceTemplate>("tpl-z"),
            named<compute_v1::InstanceTemplate>("tpl-a")}));

    auto client = makeClient();
    auto templates = client->getTemplates(project);

    ASSERT_TRUE(templates.ok()) << templates.status();
    EXPECT_EQ(names(*templates), (std::vector<std::string>{"tpl-a", "tpl-z"}));
}

TEST_F(ComputeClientTest, DeleteTemplate_ReturnsOperation) {
    EXPECT_CALL(*mock_sdk_client_ptr, DeleteInstanceTemplate(project, "tpl-a"))
        .WillOnce(Return(makeOperation("delete-tpl", "PENDING")));

    auto client = makeClient();
    auto operation = client->deleteTemplate(project, "tpl-a");

    ASSERT_TRUE(operation.ok()) << operation.status();
    EXPECT_EQ(operation->name(), "delete-tpl");
}

// New keys are added, existing keys overwritten, other keys kept, fingerprint preserved
TEST_F(ComputeClientTest, AppendInstanceMetadata_MergesExistingItems) {
    auto instance = makeInstance("vm-1", {});
    auto* metadata = instance.mutable_metadata();
    metadata->set_fingerprint("fp-123");
    *metadata->add_items() = item("startup-script", "old");
    *metadata->add_items() = item("ssh-keys", "alice");

    compute_v1::Metadata sent;
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(instance));
    EXPECT_CALL(*mock_sdk_client_ptr, SetInstanceMetadata(project, "us-west1-a", "vm-1", _))
        .WillOnce(DoAll(SaveArg<3>(&sent), Return(makeOperation("meta-op", "PENDING"))));
    EXPECT_CALL(*mock_sdk_client_ptr, GetZoneOperation(project, "us-west1-a", "meta-op"))
        .WillOnce(Return(makeOperation("meta-op", "DONE")));

    auto client = makeClient();
    auto result = client->appendInstanceMetadata(
        project, kZoneLink, "vm-1",
        {item("startup-script", "new"), item("agent-id", "42")},
        milliseconds(1000));

    ASSERT_TRUE(result.ok()) << result.status();
    EXPECT_EQ(result->errors_size(), 0);
    EXPECT_EQ(sent.fingerprint(), "fp-123");
    ASSERT_EQ(sent.items_size(), 3);
    EXPECT_EQ(sent.items(0).key(), "startup-script");
    EXPECT_EQ(sent.items(0).value(), "new");
    EXPECT_EQ(sent.items(1).key(), "agent-id");
    EXPECT_EQ(sent.items(2).key(), "ssh-keys");
    EXPECT_EQ(sent.items(2).value(), "alice");
}

TEST_F(ComputeClientTest, AppendInstanceMetadata_InstanceWithoutMetadata) {
    compute_v1::Metadata sent;
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(makeInstance("vm-1", {})));
    EXPECT_CALL(*mock_sdk_client_ptr, SetInstanceMetadata(project, "us-west1-a", "vm-1", _))
        .WillOnce(DoAll(SaveArg<3>(&sent), Return(makeOperation("meta-op", "PENDING"))));
    EXPECT_CALL(*mock_sdk_client_ptr, GetZoneOperation(project, "us-west1-a", "meta-op"))
        .WillOnce(Return(makeOperation("meta-op", "DONE")));

    auto client = makeClient();
    auto result = client->appendInstanceMetadata(
        project, "us-west1-a", "vm-1", {item("k", "v")}, milliseconds(1000));

    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_EQ(sent.items_size(), 1);
    EXPECT_EQ(sent.items(0).key(), "k");
}

TEST_F(ComputeClientTest, AppendInstanceMetadata_LookupErrorStopsUpdate) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(Status(StatusCode::kNotFound, "gone")));
    EXPECT_CALL(*mock_sdk_client_ptr, SetInstanceMetadata(_, _, _, _)).Times(0);

    auto client = makeClient();
    auto result = client->appendInstanceMetadata(
        project, kZoneLink, "vm-1", {item("k", "v")}, milliseconds(1000));

    EXPECT_EQ(result.status().code(), StatusCode::kNotFound);
}

TEST_F(ComputeClientTest, AppendInstanceMetadata_RejectsNonPositiveTimeout) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(_, _, _)).Times(0);
    EXPECT_CALL(*mock_sdk_client_ptr, SetInstanceMetadata(_, _, _, _)).Times(0);

    auto client = makeClient();
    EXPECT_EQ(client->appendInstanceMetadata(project, kZoneLink, "vm-1", {item("k", "v")},
                                             milliseconds(0)).status().code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->appendInstanceMetadata(project, kZoneLink, "vm-1", {item("k", "v")},
                                             milliseconds(-1)).status().code(),
              StatusCode::kInvalidArgument);
}

TEST_F(ComputeClientTest, WaitForOperationCompletion_RejectsNonPositiveTimeout) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetZoneOperation(_, _, _)).Times(0);

    auto client = makeClient();
    auto handle = makeOperation("op-1", "PENDING");

    EXPECT_EQ(client->waitForOperationCompletion(project, handle, milliseconds(0)).status().code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->waitForOperationCompletion(project, handle, milliseconds(-1)).status().code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->waitForOperationCompletion(project, "op-1", kZoneLink, milliseconds(0))
                  .status().code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->waitForOperationCompletion(project, "op-1", kZoneLink, milliseconds(-1))
                  .status().code(),
              StatusCode::kInvalidArgument);
}

TEST_F(ComputeClientTest, CreateSnapshot_RejectsNonPositiveTimeout) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(_, _, _)).Times(0);
    EXPECT_CALL(*mock_sdk_client_ptr, CreateDiskSnapshot(_, _, _, _)).Times(0);

    auto client = makeClient();
    EXPECT_EQ(client->createSnapshot(project, kZoneLink, "vm-1", milliseconds(0)).code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(client->createSnapshotForDisk(project, "us-west1-a", "boot", milliseconds(0))
                  .status().code(),
              StatusCode::kInvalidArgument);
}

TEST_F(ComputeClientTest, WaitForOperationCompletion_ByIdAndZoneLink) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetZoneOperation(project, "us-west1-a", "op-1"))
        .WillOnce(Return(makeOperation("op-1", "RUNNING")))
        .WillOnce(Return(gceclient::makeFailedOperation("op-1", "RESOURCE_NOT_READY", "not ready")));

    auto client = makeClient();
    auto result = client->waitForOperationCompletion(project, "op-1", kZoneLink, milliseconds(1000));

    ASSERT_TRUE(result.ok()) << result.status();
    ASSERT_EQ(result->errors_size(), 1);
    EXPECT_EQ(result->errors(0).code(), "RESOURCE_NOT_READY");
}

TEST_F(ComputeClientTest, CreateSnapshot_DelegatesToOrchestrator) {
    EXPECT_CALL(*mock_sdk_client_ptr, GetInstance(project, "us-west1-a", "vm-1"))
        .WillOnce(Return(makeInstance("vm-1", {"boot"})));
    EXPECT_CALL(*mock_sdk_client_ptr, CreateDiskSnapshot(project, "us-west1-a", "boot", _))
        .WillOnce(Return(makeOperation("snap-boot", "PENDING")));
    EXPECT_CALL(*mock_sdk_client_ptr, GetZoneOperation(project, "us-west1-a", "snap-boot"))
        .WillOnce(Return(makeOperation("snap-boot", "DONE")));

    auto client = makeClient();
    auto status = client->createSnapshot(project, kZoneLink, "vm-1", milliseconds(1000));

    EXPECT_TRUE(status.ok()) << status;
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
