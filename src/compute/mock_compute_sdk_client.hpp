#pragma once

#include <gmock/gmock.h>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "compute_sdk_interface.hpp"

namespace gceclient {

// Mock the raw Compute SDK interface
class MockComputeSDKClient : public IComputeSDKClient {
public:
    MOCK_METHOD((StatusOr<std::vector<compute_v1::Region>>), ListRegions,
                (const std::string& project), (const, override));
    MOCK_METHOD((StatusOr<std::vector<compute_v1::Zone>>), ListZones,
                (const std::string& project), (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Zone>, GetZone,
                (const std::string& project, const std::string& zone), (const, override));

    MOCK_METHOD((StatusOr<std::vector<compute_v1::MachineType>>), ListMachineTypes,
                (const std::string& project, const std::string& zone), (const, override));
    MOCK_METHOD((StatusOr<std::vector<compute_v1::DiskType>>), ListDiskTypes,
                (const std::string& project, const std::string& zone), (const, override));
    MOCK_METHOD((StatusOr<std::vector<compute_v1::AcceleratorType>>), ListAcceleratorTypes,
                (const std::string& project, const std::string& zone), (const, override));

    MOCK_METHOD((StatusOr<std::vector<compute_v1::Image>>), ListImages,
                (const std::string& project), (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Image>, GetImage,
                (const std::string& project, const std::string& image), (const, override));

    MOCK_METHOD((StatusOr<std::vector<compute_v1::Network>>), ListNetworks,
                (const std::string& project), (const, override));
    MOCK_METHOD((StatusOr<std::vector<compute_v1::Subnetwork>>), ListSubnetworks,
                (const std::string& project, const std::string& region), (const, override));

    MOCK_METHOD(StatusOr<compute_v1::Operation>, InsertInstance,
                (const std::string& project, const std::string& zone,
                 const compute_v1::Instance& instance,
                 const std::optional<std::string>& template_link),
                (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Operation>, DeleteInstance,
                (const std::string& project, const std::string& zone,
                 const std::string& instance),
                (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Instance>, GetInstance,
                (const std::string& project, const std::string& zone,
                 const std::string& instance),
                (const, override));
    MOCK_METHOD((StatusOr<std::map<std::string, compute_v1::InstancesScopedList>>),
                AggregatedListInstances,
                (const std::string& project, const std::string& filter), (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Operation>, SetInstanceMetadata,
                (const std::string& project, const std::string& zone,
                 const std::string& instance, const compute_v1::Metadata& metadata),
                (const, override));

    MOCK_METHOD(StatusOr<compute_v1::InstanceTemplate>, GetInstanceTemplate,
                (const std::string& project, const std::string& name), (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Operation>, InsertInstanceTemplate,
                (const std::string& project, const compute_v1::InstanceTemplate& instance_template),
                (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Operation>, DeleteInstanceTemplate,
                (const std::string& project, const std::string& name), (const, override));
    MOCK_METHOD((StatusOr<std::vector<compute_v1::InstanceTemplate>>), ListInstanceTemplates,
                (const std::string& project), (const, override));

    MOCK_METHOD(StatusOr<compute_v1::Operation>, CreateDiskSnapshot,
                (const std::string& project, const std::string& zone,
                 const std::string& disk, const compute_v1::Snapshot& snapshot),
                (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Operation>, DeleteSnapshot,
                (const std::string& project, const std::string& snapshot), (const, override));
    MOCK_METHOD(StatusOr<compute_v1::Snapshot>, GetSnapshot,
                (const std::string& project, const std::string& snapshot), (const, override));

    MOCK_METHOD(StatusOr<compute_v1::Operation>, GetZoneOperation,
                (const std::string& project, const std::string& zone,
                 const std::string& operation),
                (const, override));
};

// Helpers to build SDK resources in tests
inline compute_v1::Operation makeOperation(const std::string& name, const std::string& status) {
    compute_v1::Operation operation;
    operation.set_name(name);
    operation.set_status(status);
    operation.set_zone("https://www.googleapis.com/compute/v1/projects/test-project/zones/us-west1-a");
    return operation;
}

inline compute_v1::Operation makeFailedOperation(const std::string& name,
                                                 const std::string& code,
                                                 const std::string& message) {
    compute_v1::Operation operation = makeOperation(name, "DONE");
    auto* entry = operation.mutable_error()->add_errors();
    entry->set_code(code);
    entry->set_message(message);
    return operation;
}

inline compute_v1::Instance makeInstance(const std::string& name,
                                         const std::vector<std::string>& disk_names) {
    compute_v1::Instance instance;
    instance.set_name(name);
    instance.set_status("RUNNING");
    for (const auto& disk : disk_names) {
        instance.add_disks()->set_source(
            "https://www.googleapis.com/compute/v1/projects/test-project/zones/us-west1-a/disks/" +
            disk);
    }
    return instance;
}

} // namespace gceclient
