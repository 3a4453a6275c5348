#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Tessera {

namespace {

// Copies every key present under the "tessera" root into config.
void ApplyYAML(const YAML::Node& yaml, TesseraConfig& config) {
    if (!yaml["tessera"]) {
        LOG(WARNING) << "Configuration has no 'tessera' root, nothing loaded";
        return;
    }
    auto root = yaml["tessera"];

    // Server
    if (root["server"]) {
        auto server = root["server"];
        if (server["address"]) config.server.address.set(server["address"].as<std::string>());
        if (server["port"]) config.server.port.set(server["port"].as<int>());
    }

    // Client
    if (root["client"]) {
        auto client = root["client"];
        if (client["server_address"]) config.client.server_address.set(client["server_address"].as<std::string>());
        if (client["rpc_timeout_ms"]) config.client.rpc_timeout_ms.set(client["rpc_timeout_ms"].as<int>());
    }

    // Allocator
    if (root["allocator"]) {
        auto allocator = root["allocator"];
        if (allocator["id_key"]) config.allocator.id_key.set(allocator["id_key"].as<std::string>());
        if (allocator["min_id"]) config.allocator.min_id.set(allocator["min_id"].as<int64_t>());
        if (allocator["block_size"]) config.allocator.block_size.set(allocator["block_size"].as<int64_t>());

        if (allocator["retry"]) {
            auto retry = allocator["retry"];
            if (retry["initial_backoff_ms"]) config.allocator.retry.initial_backoff_ms.set(retry["initial_backoff_ms"].as<int>());
            if (retry["max_backoff_ms"]) config.allocator.retry.max_backoff_ms.set(retry["max_backoff_ms"].as<int>());
            if (retry["multiplier"]) config.allocator.retry.multiplier.set(retry["multiplier"].as<int>());
        }
    }
}

} // namespace

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

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

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        ApplyYAML(YAML::LoadFile(filename), config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        ApplyYAML(YAML::Load(yaml_content), config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate port ranges
    if (config_.server.port.get() < 1024 || config_.server.port.get() > 65535) {
        validation_errors_.push_back("Server port must be between 1024 and 65535");
    }

    if (config_.client.server_address.get().empty()) {
        validation_errors_.push_back("Client server address must not be empty");
    }

    if (config_.client.rpc_timeout_ms.get() < 1) {
        validation_errors_.push_back("RPC timeout must be at least 1ms");
    }

    // Validate allocator settings
    if (config_.allocator.min_id.get() < 1) {
        validation_errors_.push_back("Minimum ID must be a positive integer");
    }

    if (config_.allocator.block_size.get() < 1) {
        validation_errors_.push_back("Block size must be a positive integer");
    }

    const auto& retry = config_.allocator.retry;
    if (retry.initial_backoff_ms.get() < 1) {
        validation_errors_.push_back("Initial backoff must be at least 1ms");
    }
    if (retry.max_backoff_ms.get() < retry.initial_backoff_ms.get()) {
        validation_errors_.push_back("Max backoff cannot be smaller than initial backoff");
    }
    if (retry.multiplier.get() < 1) {
        validation_errors_.push_back("Backoff multiplier must be at least 1");
    }

    for (const auto& err : validation_errors_) {
        LOG(ERROR) << "Invalid configuration: " << err;
    }
    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Tessera
