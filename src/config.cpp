#include "config.hpp"
#include <getopt.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

namespace gceclient {

namespace {

bool parseBool(const std::string& name, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + name + ": " + value);
}

std::int64_t parseInt(const std::string& name, const std::string& value) {
    size_t consumed = 0;
    std::int64_t result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid number for " + name + ": " + value);
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Invalid number for " + name + ": " + value);
    }
    return result;
}

const char* getEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

} // namespace

void ClientConfig::loadDefaults() {
    *this = ClientConfig();
}

bool ClientConfig::loadFromYAML(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.good()) {
        return false;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + config_path + ": " + e.what());
    }

    // Empty file or only comments
    if (root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + config_path + " must contain a mapping");
    }

    try {
        if (root["project_id"]) project_id = root["project_id"].as<std::string>();
        if (root["zone"]) zone = root["zone"].as<std::string>();
        if (root["timeout_ms"]) timeout_ms = root["timeout_ms"].as<std::int64_t>();
        if (root["poll_interval_ms"]) poll_interval_ms = root["poll_interval_ms"].as<std::int64_t>();
        if (root["debug"]) debug_mode = root["debug"].as<bool>();
        if (root["verbose"]) verbose_logging = root["verbose"].as<bool>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value in config file " + config_path + ": " + e.what());
    }
    return true;
}

void ClientConfig::loadFromEnv() {
    if (const char* value = getEnv("GCE_CLIENT_PROJECT")) {
        project_id = value;
    }
    if (const char* value = getEnv("GCE_CLIENT_ZONE")) {
        zone = value;
    }
    if (const char* value = getEnv("GCE_CLIENT_TIMEOUT_MS")) {
        timeout_ms = parseInt("GCE_CLIENT_TIMEOUT_MS", value);
    }
    if (const char* value = getEnv("GCE_CLIENT_POLL_INTERVAL_MS")) {
        poll_interval_ms = parseInt("GCE_CLIENT_POLL_INTERVAL_MS", value);
    }
    if (const char* value = getEnv("GCE_CLIENT_DEBUG")) {
        debug_mode = parseBool("GCE_CLIENT_DEBUG", value);
    }
    if (const char* value = getEnv("GCE_CLIENT_VERBOSE")) {
        verbose_logging = parseBool("GCE_CLIENT_VERBOSE", value);
    }
}

void ClientConfig::parseFromArgs(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"project",          required_argument, 0, 'p'},
        {"zone",             required_argument, 0, 'z'},
        {"timeout-ms",       required_argument, 0, 't'},
        {"poll-interval-ms", required_argument, 0, 'i'},
        {"config",           required_argument, 0, 'c'},
        {"debug",            no_argument,       0, 'd'},
        {"verbose",          no_argument,       0, 'v'},
        {"help",             no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // Reset getopt state; 0 also reinitializes glibc's internal state
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = 0;

    // Leading '+' stops at the first positional argument (the command)
    while ((opt = getopt_long(argc, argv, "+p:z:t:i:c:dvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'p':
                project_id = optarg;
                break;
            case 'z':
                zone = optarg;
                break;
            case 't':
                timeout_ms = parseInt("--timeout-ms", optarg);
                break;
            case 'i':
                poll_interval_ms = parseInt("--poll-interval-ms", optarg);
                break;
            case 'c':
                // Already applied by load()
                break;
            case 'd':
                debug_mode = true;
                break;
            case 'v':
                verbose_logging = true;
                break;
            case 'h':
                show_help = true;
                break;
            case '?':
                if (optopt != 0) {
                    throw std::runtime_error(std::string("Invalid option: -") +
                                             static_cast<char>(optopt));
                }
                throw std::runtime_error(std::string("Invalid option: ") + argv[optind - 1]);
            default:
                break;
        }
    }

    if (optind < argc) {
        command = argv[optind++];
        args.clear();
        while (optind < argc) {
            args.push_back(argv[optind++]);
        }
    }
}

std::optional<std::string> ClientConfig::extractConfigPath(int argc, char* argv[]) {
    // Options taking a value, matching parseFromArgs
    const std::string short_with_value = "pztic";
    const std::set<std::string> long_with_value = {
        "--project", "--zone", "--timeout-ms", "--poll-interval-ms"};
    const std::string prefix = "--config=";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--" || arg.size() < 2 || arg[0] != '-') {
            // Options end at the command
            break;
        }
        if (arg == "--config") {
            if (i + 1 < argc) {
                return std::string(argv[i + 1]);
            }
            throw std::runtime_error("Missing value for --config");
        }
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            return arg.substr(prefix.size());
        }
        if (arg[1] == '-') {
            if (long_with_value.count(arg) > 0) {
                ++i;
            }
            continue;
        }

        // Short option cluster such as -dv, -cFILE or -p ID
        for (size_t pos = 1; pos < arg.size(); pos++) {
            char flag = arg[pos];
            if (short_with_value.find(flag) == std::string::npos) {
                continue;
            }
            std::string attached = arg.substr(pos + 1);
            if (flag == 'c') {
                if (!attached.empty()) {
                    return attached;
                }
                if (i + 1 < argc) {
                    return std::string(argv[i + 1]);
                }
                throw std::runtime_error("Missing value for --config");
            }
            if (attached.empty()) {
                ++i;
            }
            break;
        }
    }
    return std::nullopt;
}

void ClientConfig::validate() const {
    if (project_id.empty()) {
        throw std::runtime_error("Missing required option: --project");
    }
    if (command.empty()) {
        throw std::runtime_error("Missing required argument: command");
    }
    if (timeout_ms <= 0) {
        throw std::runtime_error("timeout_ms must be positive, got " + std::to_string(timeout_ms));
    }
    if (poll_interval_ms <= 0) {
        throw std::runtime_error("poll_interval_ms must be positive, got " +
                                 std::to_string(poll_interval_ms));
    }
}

ClientConfig ClientConfig::load(int argc, char* argv[]) {
    ClientConfig config;
    config.loadDefaults();

    if (auto config_path = extractConfigPath(argc, argv)) {
        if (!config.loadFromYAML(*config_path)) {
            throw std::runtime_error("Config file not found: " + *config_path);
        }
    }

    config.loadFromEnv();
    config.parseFromArgs(argc, argv);

    if (!config.show_help) {
        config.validate();
    }
    return config;
}

void ClientConfig::printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -p, --project=ID         Project to operate on (required)\n";
    std::cout << "  -z, --zone=ZONE          Zone name or self link for zonal commands\n";
    std::cout << "  -t, --timeout-ms=N       Wait budget for blocking commands (default: 300000)\n";
    std::cout << "  -i, --poll-interval-ms=N Operation poll interval (default: 5000)\n";
    std::cout << "  -c, --config=FILE        YAML config file\n";
    std::cout << "  -d, --debug              Enable debug logging\n";
    std::cout << "  -v, --verbose            Enable verbose output\n";
    std::cout << "  -h, --help               Display this help message\n\n";

    std::cout << "Catalog commands:\n";
    std::cout << "  regions\n";
    std::cout << "  zones <region>\n";
    std::cout << "  machine-types | cpu-platforms | disk-types | boot-disk-types | accelerator-types\n";
    std::cout << "  images\n";
    std::cout << "  image <name>\n";
    std::cout << "  networks\n";
    std::cout << "  subnetworks <network> <region>\n\n";

    std::cout << "Instance commands:\n";
    std::cout << "  instance <name>\n";
    std::cout << "  instances-with-labels <key=value>...\n";
    std::cout << "  terminate <name> [required-status]\n";
    std::cout << "  append-metadata <name> <key=value>...\n\n";

    std::cout << "Template commands:\n";
    std::cout << "  templates\n";
    std::cout << "  template <name>\n";
    std::cout << "  delete-template <name>\n\n";

    std::cout << "Snapshot commands:\n";
    std::cout << "  snapshot <instance>\n";
    std::cout << "  snapshot-disk <disk>\n";
    std::cout << "  get-snapshot <name>\n";
    std::cout << "  delete-snapshot <name>\n\n";

    std::cout << "Operation commands:\n";
    std::cout << "  operation <id>\n";
    std::cout << "  wait-operation <id>\n\n";

    std::cout << "Environment:\n";
    std::cout << "  GCE_CLIENT_PROJECT, GCE_CLIENT_ZONE, GCE_CLIENT_TIMEOUT_MS,\n";
    std::cout << "  GCE_CLIENT_POLL_INTERVAL_MS, GCE_CLIENT_DEBUG, GCE_CLIENT_VERBOSE\n\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --project my-project regions\n";
    std::cout << "  " << program_name << " -p my-project -z us-west1-a snapshot my-vm\n";
    std::cout << "  " << program_name << " --config ~/.gce_client.yaml instances-with-labels env=prod\n";
}

} // namespace gceclient
