#ifndef CADENCE_CONFIGURATION_H_
#define CADENCE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace Cadence {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

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
    void reset() { value_ = default_; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct CadenceConfig {
    // Worker pool shared by every sequence manager
    struct Executor {
        ConfigValue<int> num_threads{4, "CADENCE_EXECUTOR_THREADS"};
    } executor;

    // Per-key sequence schedulers
    struct Scheduler {
        // Events handled by one drain unit before it re-submits itself. 0 = unlimited.
        ConfigValue<size_t> max_events_per_drain{0, "CADENCE_MAX_EVENTS_PER_DRAIN"};
    } scheduler;

    struct Logging {
        ConfigValue<int> verbosity{0, "CADENCE_LOG_VERBOSITY"};
    } logging;
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

    // Restore every value to its compiled-in default
    void resetToDefaults();

    // Get the configuration
    const CadenceConfig& config() const { return config_; }
    CadenceConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getExecutorThreads() const { return config_.executor.num_threads.get(); }
    size_t getMaxEventsPerDrain() const { return config_.scheduler.max_events_per_drain.get(); }
    int getLogVerbosity() const { return config_.logging.verbosity.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CadenceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void applyYAML(const YAML::Node& yaml);
};

// Global accessor
const Configuration& GetConfig();

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

} // namespace Cadence

#endif // CADENCE_CONFIGURATION_H_
