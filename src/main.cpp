// gce_client command-line entry point

#include "compute/compute_client.hpp"
#include "compute/client_util.hpp"
#include "config.hpp"
#include "log_sink.hpp"
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace gceclient;

namespace {

struct Command {
    size_t min_args;
    size_t max_args;
    bool needs_zone;
    std::function<int(const ComputeClient&, const ClientConfig&)> run;
};

constexpr size_t kUnbounded = static_cast<size_t>(-1);

int reportError(const Status& status) {
    std::cerr << "Error: " << status << std::endl;
    return 1;
}

template <typename Resource>
int printNames(const StatusOr<std::vector<Resource>>& resources) {
    if (!resources) {
        return reportError(resources.status());
    }
    for (const auto& resource : *resources) {
        std::cout << resource.name() << "\n";
    }
    return 0;
}

template <typename Message>
int printMessage(const StatusOr<Message>& message) {
    if (!message) {
        return reportError(message.status());
    }
    std::cout << message->DebugString();
    return 0;
}

// An operation that finished with an error payload is reported as a failure
int printOperationResult(const StatusOr<compute_v1::Error>& error) {
    if (!error) {
        return reportError(error.status());
    }
    if (error->errors_size() > 0) {
        std::cerr << "Operation failed: " << describeOperationError(*error) << std::endl;
        return 1;
    }
    std::cout << "Operation completed\n";
    return 0;
}

std::pair<std::string, std::string> splitKeyValue(const std::string& arg) {
    auto pos = arg.find('=');
    if (pos == std::string::npos || pos == 0) {
        throw std::runtime_error("Expected key=value, got: " + arg);
    }
    return {arg.substr(0, pos), arg.substr(pos + 1)};
}

std::map<std::string, Command> makeCommands() {
    std::map<std::string, Command> commands;

    commands["regions"] = {0, 0, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getRegions(config.project_id));
    }};
    commands["zones"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getZones(config.project_id, config.args[0]));
    }};
    commands["machine-types"] = {0, 0, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getMachineTypes(config.project_id, config.zone));
    }};
    commands["cpu-platforms"] = {0, 0, true, [](const ComputeClient& client, const ClientConfig& config) {
        auto platforms = client.getCpuPlatforms(config.project_id, config.zone);
        if (!platforms) {
            return reportError(platforms.status());
        }
        for (const auto& platform : *platforms) {
            std::cout << platform << "\n";
        }
        return 0;
    }};
    commands["disk-types"] = {0, 0, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getDiskTypes(config.project_id, config.zone));
    }};
    commands["boot-disk-types"] = {0, 0, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getBootDiskTypes(config.project_id, config.zone));
    }};
    commands["images"] = {0, 0, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getImages(config.project_id));
    }};
    commands["image"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.getImage(config.project_id, config.args[0]));
    }};
    commands["accelerator-types"] = {0, 0, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getAcceleratorTypes(config.project_id, config.zone));
    }};
    commands["networks"] = {0, 0, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getNetworks(config.project_id));
    }};
    commands["subnetworks"] = {2, 2, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getSubnetworks(config.project_id, config.args[0], config.args[1]));
    }};

    commands["instance"] = {1, 1, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.getInstance(config.project_id, config.zone, config.args[0]));
    }};
    commands["instances-with-labels"] = {1, kUnbounded, false,
        [](const ComputeClient& client, const ClientConfig& config) {
            std::map<std::string, std::string> labels;
            for (const auto& arg : config.args) {
                labels.insert(splitKeyValue(arg));
            }
            auto instances = client.getInstancesWithLabel(config.project_id, labels);
            if (!instances) {
                return reportError(instances.status());
            }
            for (const auto& instance : *instances) {
                std::cout << instance.name() << "\t" << nameFromSelfLink(instance.zone()) << "\t"
                          << instance.status() << "\n";
            }
            return 0;
        }};
    commands["terminate"] = {1, 2, true, [](const ComputeClient& client, const ClientConfig& config) {
        if (config.args.size() == 1) {
            return printMessage(client.terminateInstance(config.project_id, config.zone, config.args[0]));
        }
        auto operation = client.terminateInstanceWithStatus(
            config.project_id, config.zone, config.args[0], config.args[1]);
        if (!operation) {
            return reportError(operation.status());
        }
        if (!operation->has_value()) {
            std::cout << "Instance " << config.args[0] << " is not " << config.args[1]
                      << "; left running\n";
            return 0;
        }
        std::cout << (*operation)->DebugString();
        return 0;
    }};
    commands["append-metadata"] = {2, kUnbounded, true,
        [](const ComputeClient& client, const ClientConfig& config) {
            std::vector<compute_v1::Items> items;
            for (size_t i = 1; i < config.args.size(); i++) {
                auto [key, value] = splitKeyValue(config.args[i]);
                compute_v1::Items item;
                item.set_key(key);
                item.set_value(value);
                items.push_back(std::move(item));
            }
            return printOperationResult(client.appendInstanceMetadata(
                config.project_id, config.zone, config.args[0], items, config.timeout()));
        }};

    commands["templates"] = {0, 0, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printNames(client.getTemplates(config.project_id));
    }};
    commands["template"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.getTemplate(config.project_id, config.args[0]));
    }};
    commands["delete-template"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.deleteTemplate(config.project_id, config.args[0]));
    }};

    commands["snapshot"] = {1, 1, true, [](const ComputeClient& client, const ClientConfig& config) {
        Status status = client.createSnapshot(
            config.project_id, config.zone, config.args[0], config.timeout());
        if (!status.ok()) {
            return reportError(status);
        }
        std::cout << "Snapshots of " << config.args[0] << " completed\n";
        return 0;
    }};
    commands["snapshot-disk"] = {1, 1, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printOperationResult(client.createSnapshotForDisk(
            config.project_id, config.zone, config.args[0], config.timeout()));
    }};
    commands["get-snapshot"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.getSnapshot(config.project_id, config.args[0]));
    }};
    commands["delete-snapshot"] = {1, 1, false, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.deleteSnapshot(config.project_id, config.args[0]));
    }};

    commands["operation"] = {1, 1, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printMessage(client.getZoneOperation(config.project_id, config.zone, config.args[0]));
    }};
    commands["wait-operation"] = {1, 1, true, [](const ComputeClient& client, const ClientConfig& config) {
        return printOperationResult(client.waitForOperationCompletion(
            config.project_id, config.args[0], config.zone, config.timeout()));
    }};

    return commands;
}

std::shared_ptr<ILogSink> makeLogSink(const ClientConfig& config) {
    LogLevel level = LogLevel::kWarning;
    if (config.debug_mode) {
        level = LogLevel::kDebug;
    } else if (config.verbose_logging) {
        level = LogLevel::kInfo;
    }
    return std::make_shared<StreamLogSink>(level);
}

} // namespace

int main(int argc, char *argv[])
{
    try {
        ClientConfig config = ClientConfig::load(argc, argv);
        if (config.show_help) {
            ClientConfig::printUsage(argv[0]);
            return 0;
        }

        const auto commands = makeCommands();
        auto it = commands.find(config.command);
        if (it == commands.end()) {
            throw std::runtime_error("Unknown command: " + config.command);
        }
        const Command& command = it->second;
        if (config.args.size() < command.min_args || config.args.size() > command.max_args) {
            throw std::runtime_error("Wrong number of arguments for " + config.command);
        }
        if (command.needs_zone && config.zone.empty()) {
            throw std::runtime_error("Command " + config.command + " requires --zone");
        }

        auto log = makeLogSink(config);
        log->debug("Running " + config.command + " in project " + config.project_id);

        ComputeClient client(std::make_unique<ComputeSDKClientImpl>(), log, config.pollInterval());
        return command.run(client, config);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
