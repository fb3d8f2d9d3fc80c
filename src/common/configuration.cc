#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Taskfold {

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
        // stoull wraps negative input around instead of rejecting it
        if (std::string(env_val).find('-') != std::string::npos) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": negative value " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
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

bool Configuration::applyYAML(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    if (!yaml["taskfold"]) {
        LOG(WARNING) << "Configuration has no top-level 'taskfold' section, keeping defaults";
        return validate();
    }
    auto root = yaml["taskfold"];

    // Run
    if (root["run"]) {
        auto run = root["run"];
        if (run["num_workers"]) config_.run.num_workers.set(run["num_workers"].as<int>());
        if (run["num_tasks"]) config_.run.num_tasks.set(run["num_tasks"].as<int>());
        if (run["payload_prefix"]) config_.run.payload_prefix.set(run["payload_prefix"].as<std::string>());
    }

    // Worker
    if (root["worker"]) {
        auto worker = root["worker"];
        if (worker["min_delay_ms"]) config_.worker.min_delay_ms.set(worker["min_delay_ms"].as<int>());
        if (worker["max_delay_ms"]) config_.worker.max_delay_ms.set(worker["max_delay_ms"].as<int>());
    }

    // Coordinator
    if (root["coordinator"]) {
        auto coordinator = root["coordinator"];
        if (coordinator["worker_timeout_ms"]) {
            config_.coordinator.worker_timeout_ms.set(coordinator["worker_timeout_ms"].as<int>());
        }
    }

    // Sink
    if (root["sink"]) {
        auto sink = root["sink"];
        if (sink["output_path"]) config_.sink.output_path.set(sink["output_path"].as<std::string>());
        if (sink["channel_capacity"]) config_.sink.channel_capacity.set(sink["channel_capacity"].as<size_t>());
        if (sink["flush_every_record"]) config_.sink.flush_every_record.set(sink["flush_every_record"].as<bool>());
    }

    return validate();
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::reset() {
    config_ = TaskfoldConfig();
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.run.num_workers.get() < 1) {
        validation_errors_.push_back("Number of workers must be at least 1");
    }

    if (config_.run.num_tasks.get() < 0) {
        validation_errors_.push_back("Number of tasks cannot be negative");
    }

    // Validate delay bounds
    int min_delay = config_.worker.min_delay_ms.get();
    int max_delay = config_.worker.max_delay_ms.get();
    if (min_delay < 0) {
        validation_errors_.push_back("Minimum delay cannot be negative");
    }
    if (max_delay <= min_delay) {
        validation_errors_.push_back("Maximum delay must be greater than minimum delay");
    }

    if (config_.coordinator.worker_timeout_ms.get() < 0) {
        validation_errors_.push_back("Worker timeout cannot be negative");
    }

    if (config_.sink.channel_capacity.get() < 1) {
        validation_errors_.push_back("Sink channel capacity must be at least 1");
    }

    if (config_.sink.output_path.get().empty()) {
        validation_errors_.push_back("Output path must not be empty");
    }

    auto check_env = [this](const auto& value) {
        if (value.envInvalid()) {
            validation_errors_.push_back("Environment variable " + value.env_var() +
                                         " has an invalid value: " + std::getenv(value.env_var().c_str()));
        }
    };
    check_env(config_.run.num_workers);
    check_env(config_.run.num_tasks);
    check_env(config_.worker.min_delay_ms);
    check_env(config_.worker.max_delay_ms);
    check_env(config_.coordinator.worker_timeout_ms);
    check_env(config_.sink.channel_capacity);
    check_env(config_.sink.flush_every_record);

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Taskfold
