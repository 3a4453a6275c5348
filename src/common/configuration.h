#ifndef TESSERA_CONFIGURATION_H_
#define TESSERA_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace Tessera {

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
struct TesseraConfig {
    // Counter store server
    struct Server {
        ConfigValue<std::string> address{"0.0.0.0", "TESSERA_SERVER_ADDRESS"};
        ConfigValue<int> port{COUNTER_SERVICE_PORT, "TESSERA_SERVER_PORT"};
    } server;

    // Remote counter store client
    struct Client {
        ConfigValue<std::string> server_address{"127.0.0.1:" + std::to_string(COUNTER_SERVICE_PORT),
            "TESSERA_CLIENT_SERVER_ADDRESS"};
        ConfigValue<int> rpc_timeout_ms{static_cast<int>(counter_rpc_timeout_ms), "TESSERA_CLIENT_RPC_TIMEOUT_MS"};
    } client;

    struct Allocator {
        ConfigValue<std::string> id_key{DEFAULT_ID_KEY, "TESSERA_ID_KEY"};
        ConfigValue<int64_t> min_id{DEFAULT_MIN_ID, "TESSERA_MIN_ID"};
        ConfigValue<int64_t> block_size{DEFAULT_BLOCK_SIZE, "TESSERA_BLOCK_SIZE"};

        // Backoff between failed block reservations
        struct Retry {
            ConfigValue<int> initial_backoff_ms{static_cast<int>(id_alloc_initial_backoff_ms),
                "TESSERA_RETRY_INITIAL_BACKOFF_MS"};
            ConfigValue<int> max_backoff_ms{static_cast<int>(id_alloc_max_backoff_ms),
                "TESSERA_RETRY_MAX_BACKOFF_MS"};
            ConfigValue<int> multiplier{static_cast<int>(id_alloc_backoff_multiplier),
                "TESSERA_RETRY_MULTIPLIER"};
        } retry;
    } allocator;
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

    // Get the configuration
    const TesseraConfig& config() const { return config_; }
    TesseraConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getServerPort() const { return config_.server.port.get(); }
    std::string getServerAddress() const { return config_.client.server_address.get(); }
    std::string getIdKey() const { return config_.allocator.id_key.get(); }
    int64_t getMinId() const { return config_.allocator.min_id.get(); }
    int64_t getBlockSize() const { return config_.allocator.block_size.get(); }

    // Restore compiled-in defaults. Tests only.
    void reset() { config_ = TesseraConfig(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TesseraConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

} // namespace Tessera

#endif // TESSERA_CONFIGURATION_H_
