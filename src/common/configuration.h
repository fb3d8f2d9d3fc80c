#ifndef TASKFOLD_CONFIGURATION_H_
#define TASKFOLD_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstddef>
#include <cstdlib>

namespace Taskfold {

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

    // Environment variable is set, so get() ignores set() and the config file
    bool envPresent() const {
        return !env_var_.empty() && std::getenv(env_var_.c_str()) != nullptr;
    }

    // Environment variable is set but does not parse as T
    bool envInvalid() const { return envPresent() && !getEnvValue().has_value(); }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct TaskfoldConfig {
    struct Run {
        ConfigValue<int> num_workers{4, "TASKFOLD_NUM_WORKERS"};
        ConfigValue<int> num_tasks{20, "TASKFOLD_NUM_TASKS"};
        ConfigValue<std::string> payload_prefix{"data-", "TASKFOLD_PAYLOAD_PREFIX"};
    } run;

    // Simulated processing time per item, uniform in [min, max)
    struct Worker {
        ConfigValue<int> min_delay_ms{150, "TASKFOLD_MIN_DELAY_MS"};
        ConfigValue<int> max_delay_ms{450, "TASKFOLD_MAX_DELAY_MS"};
    } worker;

    struct Coordinator {
        // 0 waits for workers without a deadline
        ConfigValue<int> worker_timeout_ms{20000, "TASKFOLD_WORKER_TIMEOUT_MS"};
    } coordinator;

    struct Sink {
        ConfigValue<std::string> output_path{"target/taskfold-output.txt", "TASKFOLD_OUTPUT_PATH"};
        ConfigValue<size_t> channel_capacity{64, "TASKFOLD_SINK_CHANNEL_CAPACITY"};
        ConfigValue<bool> flush_every_record{false, "TASKFOLD_SINK_FLUSH_EVERY_RECORD"};
    } sink;
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

    // Drop every loaded or set value back to the defaults
    void reset();

    // Get the configuration
    const TaskfoldConfig& config() const { return config_; }
    TaskfoldConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getNumWorkers() const { return config_.run.num_workers.get(); }
    int getNumTasks() const { return config_.run.num_tasks.get(); }
    std::string getOutputPath() const { return config_.sink.output_path.get(); }
    int getWorkerTimeoutMs() const { return config_.coordinator.worker_timeout_ms.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    TaskfoldConfig config_;
    mutable std::vector<std::string> validation_errors_;

    // Shared by loadFromFile and loadFromString; node is a YAML::Node
    bool applyYAML(const void* node);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Taskfold

#endif // TASKFOLD_CONFIGURATION_H_
