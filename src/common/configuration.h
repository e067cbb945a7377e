#ifndef CHRONICLE_CONFIGURATION_H_
#define CHRONICLE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace YAML {
class Node;
}

namespace Chronicle {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct ChronicleConfig {
    struct Array {
        ConfigValue<int64_t> array_size{kDefaultArraySize, "CHRONICLE_ARRAY_SIZE"};
    } array;

    struct Notification {
        ConfigValue<int64_t> section_size{kDefaultSectionSize, "CHRONICLE_SECTION_SIZE"};
        ConfigValue<int64_t> archived_max_age_seconds{kDefaultArchivedMaxAgeSeconds,
                                                      "CHRONICLE_ARCHIVED_MAX_AGE_SECONDS"};
    } notification;

    // Bounded retries for ConcurrencyError on the write path
    struct Retry {
        ConfigValue<int> max_attempts{kDefaultRetryMaxAttempts, "CHRONICLE_RETRY_MAX_ATTEMPTS"};
        ConfigValue<int> wait_ms{kDefaultRetryWaitMs, "CHRONICLE_RETRY_WAIT_MS"};
    } retry;

    struct Sequencer {
        // Supported modes: local, distributed
        ConfigValue<std::string> mode{"local", "CHRONICLE_SEQUENCER_MODE"};
        ConfigValue<std::string> counter_address{"127.0.0.1:" + std::to_string(kDefaultCounterPort),
                                                 "CHRONICLE_COUNTER_ADDRESS"};
        ConfigValue<std::string> counter_name{"application", "CHRONICLE_COUNTER_NAME"};
        // false: duplicates after counter failover are left to storage uniqueness
        ConfigValue<bool> resync_on_detection{true, "CHRONICLE_RESYNC_ON_DETECTION"};
    } sequencer;

    struct Server {
        ConfigValue<std::string> address{"0.0.0.0", "CHRONICLE_SERVER_ADDRESS"};
        ConfigValue<int> port{kDefaultServerPort, "CHRONICLE_SERVER_PORT"};
        ConfigValue<int> counter_port{kDefaultCounterPort, "CHRONICLE_COUNTER_PORT"};
        ConfigValue<int> rpc_deadline_ms{kDefaultRpcDeadlineMs, "CHRONICLE_RPC_DEADLINE_MS"};
    } server;

    struct Log {
        // Supported backends: big_array, record_store
        ConfigValue<std::string> backend{"big_array", "CHRONICLE_LOG_BACKEND"};
        ConfigValue<std::string> application_id{"6d8a3c0e-5b1f-4f3a-9a57-1c2e7b0d4e91",
                                                "CHRONICLE_APPLICATION_ID"};
    } log;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with command line arguments
    void overrideFromCommandLine(int argc, char* argv[]);

    // Drop every loaded value
    void resetToDefaults();

    // Get the configuration
    const ChronicleConfig& config() const { return config_; }
    ChronicleConfig& config() { return config_; }

    // Helper methods for common access patterns
    int64_t getArraySize() const { return config_.array.array_size.get(); }
    int64_t getSectionSize() const { return config_.notification.section_size.get(); }
    int getServerPort() const { return config_.server.port.get(); }
    bool useBigArrayBackend() const { return config_.log.backend.get() == "big_array"; }
    bool useDistributedSequencer() const { return config_.sequencer.mode.get() == "distributed"; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    ChronicleConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Chronicle

#endif // CHRONICLE_CONFIGURATION_H_
