#include "configuration.h"
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Cadence {

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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["cadence"]) {
        LOG(WARNING) << "Configuration has no top-level 'cadence' section, keeping defaults";
        return;
    }
    auto root = yaml["cadence"];

    // Executor
    if (root["executor"]) {
        auto executor = root["executor"];
        if (executor["num_threads"]) config_.executor.num_threads.set(executor["num_threads"].as<int>());
    }

    // Scheduler
    if (root["scheduler"]) {
        auto scheduler = root["scheduler"];
        if (scheduler["max_events_per_drain"]) {
            config_.scheduler.max_events_per_drain.set(scheduler["max_events_per_drain"].as<size_t>());
        }
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
    if (!validate()) {
        for (const auto& error : validation_errors_) {
            LOG(ERROR) << "Invalid configuration in " << filename << ": " << error;
        }
        return false;
    }
    LOG(INFO) << "Loaded configuration from " << filename;
    return true;
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
    if (!validate()) {
        for (const auto& error : validation_errors_) {
            LOG(ERROR) << "Invalid configuration: " << error;
        }
        return false;
    }
    return true;
}

void Configuration::resetToDefaults() {
    config_.executor.num_threads.reset();
    config_.scheduler.max_events_per_drain.reset();
    config_.logging.verbosity.reset();
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    // Validate thread counts
    if (config_.executor.num_threads.get() < 1) {
        validation_errors_.push_back("Executor threads must be at least 1");
    }
    if (config_.executor.num_threads.get() > 1024) {
        validation_errors_.push_back("Executor threads must not exceed 1024");
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity cannot be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Cadence
