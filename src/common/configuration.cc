#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <getopt.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "common/sequence_id.h"

namespace Chronicle {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::resetToDefaults() {
    config_ = ChronicleConfig{};
    validation_errors_.clear();
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["chronicle"]) {
        LOG(WARNING) << "Configuration has no 'chronicle' root; keeping defaults";
        return;
    }
    auto root = yaml["chronicle"];

    if (root["array"]) {
        auto array = root["array"];
        if (array["array_size"]) config_.array.array_size.set(array["array_size"].as<int64_t>());
    }

    if (root["notification"]) {
        auto notification = root["notification"];
        if (notification["section_size"]) config_.notification.section_size.set(notification["section_size"].as<int64_t>());
        if (notification["archived_max_age_seconds"]) config_.notification.archived_max_age_seconds.set(notification["archived_max_age_seconds"].as<int64_t>());
    }

    if (root["retry"]) {
        auto retry = root["retry"];
        if (retry["max_attempts"]) config_.retry.max_attempts.set(retry["max_attempts"].as<int>());
        if (retry["wait_ms"]) config_.retry.wait_ms.set(retry["wait_ms"].as<int>());
    }

    if (root["sequencer"]) {
        auto sequencer = root["sequencer"];
        if (sequencer["mode"]) config_.sequencer.mode.set(sequencer["mode"].as<std::string>());
        if (sequencer["counter_address"]) config_.sequencer.counter_address.set(sequencer["counter_address"].as<std::string>());
        if (sequencer["counter_name"]) config_.sequencer.counter_name.set(sequencer["counter_name"].as<std::string>());
        if (sequencer["resync_on_detection"]) config_.sequencer.resync_on_detection.set(sequencer["resync_on_detection"].as<bool>());
    }

    if (root["server"]) {
        auto server = root["server"];
        if (server["address"]) config_.server.address.set(server["address"].as<std::string>());
        if (server["port"]) config_.server.port.set(server["port"].as<int>());
        if (server["counter_port"]) config_.server.counter_port.set(server["counter_port"].as<int>());
        if (server["rpc_deadline_ms"]) config_.server.rpc_deadline_ms.set(server["rpc_deadline_ms"].as<int>());
    }

    if (root["log"]) {
        auto log = root["log"];
        if (log["backend"]) config_.log.backend.set(log["backend"].as<std::string>());
        if (log["application_id"]) config_.log.application_id.set(log["application_id"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::overrideFromCommandLine(int argc, char* argv[]) {
    static struct option long_options[] = {
        {"array-size", required_argument, 0, 'a'},
        {"section-size", required_argument, 0, 's'},
        {"port", required_argument, 0, 'p'},
        {"backend", required_argument, 0, 'k'},
        {"sequencer", required_argument, 0, 'q'},
        {"counter-address", required_argument, 0, 'c'},
        {"config", required_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;
    // Unknown options belong to the application's own parser
    opterr = 0;
    optind = 1;

    while ((c = getopt_long(argc, argv, "a:s:p:k:q:c:f:", long_options, &option_index)) != -1) {
        try {
            switch (c) {
                case 'a':
                    config_.array.array_size.set(std::stoll(optarg));
                    break;
                case 's':
                    config_.notification.section_size.set(std::stoll(optarg));
                    break;
                case 'p':
                    config_.server.port.set(std::stoi(optarg));
                    break;
                case 'k':
                    config_.log.backend.set(optarg);
                    break;
                case 'q':
                    config_.sequencer.mode.set(optarg);
                    break;
                case 'c':
                    config_.sequencer.counter_address.set(optarg);
                    break;
                case 'f':
                    loadFromFile(optarg);
                    break;
                default:
                    break;
            }
        } catch (const std::exception& e) {
            LOG(WARNING) << "Ignoring malformed value for --" << long_options[option_index].name
                         << ": " << e.what();
        }
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    const int64_t array_size = config_.array.array_size.get();
    const int64_t section_size = config_.notification.section_size.get();

    if (array_size < 2) {
        validation_errors_.push_back("Array size must be at least 2");
    }

    if (section_size < 1) {
        validation_errors_.push_back("Section size must be at least 1");
    } else if (config_.log.backend.get() == "big_array" && array_size >= 2 && array_size % section_size != 0) {
        validation_errors_.push_back("Section size must divide array size");
    }

    if (config_.notification.archived_max_age_seconds.get() < 0) {
        validation_errors_.push_back("Archived max age cannot be negative");
    }

    if (config_.retry.max_attempts.get() < 1) {
        validation_errors_.push_back("Retry max attempts must be at least 1");
    }
    if (config_.retry.wait_ms.get() < 0) {
        validation_errors_.push_back("Retry wait cannot be negative");
    }

    const std::string mode = config_.sequencer.mode.get();
    if (mode != "local" && mode != "distributed") {
        validation_errors_.push_back("Sequencer mode must be 'local' or 'distributed'");
    }

    const std::string backend = config_.log.backend.get();
    if (backend != "big_array" && backend != "record_store") {
        validation_errors_.push_back("Log backend must be 'big_array' or 'record_store'");
    }

    // Validate port ranges
    if (config_.server.port.get() < 1024 || config_.server.port.get() > 65535) {
        validation_errors_.push_back("Server port must be between 1024 and 65535");
    }
    if (config_.server.counter_port.get() < 1024 || config_.server.counter_port.get() > 65535) {
        validation_errors_.push_back("Counter port must be between 1024 and 65535");
    }

    if (config_.server.rpc_deadline_ms.get() < 1) {
        validation_errors_.push_back("RPC deadline must be at least 1ms");
    }

    try {
        ParseSequenceId(config_.log.application_id.get());
    } catch (const std::invalid_argument& e) {
        validation_errors_.push_back(std::string("Application id: ") + e.what());
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Chronicle
