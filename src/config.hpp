#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gceclient {

/**
 * ClientConfig - Configuration options for the gce_client tool
 *
 * Supports layered configuration from multiple sources:
 * 1. Defaults (lowest priority)
 * 2. YAML config file
 * 3. Environment variables
 * 4. Command-line arguments (highest priority)
 */
struct ClientConfig {
    static constexpr std::int64_t kDefaultTimeoutMs = 300000;
    static constexpr std::int64_t kDefaultPollIntervalMs = 5000;

    // Target project and default zone (zone may be a name or a self link)
    std::string project_id;
    std::string zone;

    // Wait budget for blocking commands and the operation poll interval
    std::int64_t timeout_ms = kDefaultTimeoutMs;
    std::int64_t poll_interval_ms = kDefaultPollIntervalMs;

    // Logging settings
    bool debug_mode = false;
    bool verbose_logging = false;

    bool show_help = false;

    // Command to run and its positional arguments
    std::string command;
    std::vector<std::string> args;

    std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(timeout_ms); }
    std::chrono::milliseconds pollInterval() const {
        return std::chrono::milliseconds(poll_interval_ms);
    }

    /**
     * Load configuration from all sources in priority order
     *
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed configuration
     * @throws std::runtime_error if required arguments are missing or invalid
     */
    static ClientConfig load(int argc, char* argv[]);

    /**
     * Parse command-line arguments, applying them over the current values.
     * Option parsing stops at the command; everything after it is kept in args.
     *
     * @throws std::runtime_error on unknown options or malformed values
     */
    void parseFromArgs(int argc, char* argv[]);

    /**
     * Load configuration from YAML file
     *
     * @param config_path Path to YAML config file
     * @return true if file was loaded successfully, false if file doesn't exist
     * @throws std::runtime_error if file exists but is invalid
     */
    bool loadFromYAML(const std::string& config_path);

    /**
     * Load configuration from environment variables
     * Recognizes: GCE_CLIENT_* variables
     */
    void loadFromEnv();

    void loadDefaults();

    /**
     * Validate configuration
     * @throws std::runtime_error if configuration is invalid
     */
    void validate() const;

    static void printUsage(const char* program_name);

private:
    // Extract --config before full parsing so the file can be layered first
    static std::optional<std::string> extractConfigPath(int argc, char* argv[]);
};

} // namespace gceclient
