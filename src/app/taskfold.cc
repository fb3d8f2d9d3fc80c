#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <cxxopts.hpp>
#include <glog/logging.h>

#include "common/configuration.h"
#include "taskfold/coordinator.h"

namespace fs = std::filesystem;
using namespace Taskfold;

namespace {

constexpr int kExitComplete = 0;
constexpr int kExitDegraded = 1;
constexpr int kExitBadConfig = 2;

// Output directory setup lives outside the sink; a failure here surfaces
// later as ResourceUnavailable when the sink tries to open the file.
void PrepareOutputDirectory(const std::string& output_path) {
    fs::path parent = fs::path(output_path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        LOG(ERROR) << "Failed to create output directory " << parent << ": " << ec.message();
    }
}

// Command line values go through set(), which a TASKFOLD_* variable shadows.
template <typename T>
void OverrideFromCommandLine(ConfigValue<T>& value, const T& cli_value, const std::string& flag) {
    if (value.envPresent()) {
        LOG(WARNING) << "--" << flag << " is ignored because " << value.env_var()
                     << " is set in the environment";
    }
    value.set(cli_value);
}

} // namespace

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options("taskfold",
        "Fan a fixed batch of work items out to a worker pool and fold the results into one file.\n"
        "TASKFOLD_* environment variables take precedence over flags, flags over the config file.");
    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("w,workers", "Number of worker threads", cxxopts::value<int>())
        ("n,tasks", "Number of work items", cxxopts::value<int>())
        ("o,output", "Output file path", cxxopts::value<std::string>())
        ("min_delay_ms", "Lower bound of simulated processing time", cxxopts::value<int>())
        ("max_delay_ms", "Upper bound (exclusive) of simulated processing time", cxxopts::value<int>())
        ("timeout_ms", "Wait this long for workers before cancelling them, 0 for no limit", cxxopts::value<int>())
        ("flush_every_record", "Flush the output after every line")
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
        ("h,help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return kExitComplete;
    }
    FLAGS_v = result["log_level"].as<int>();

    Configuration& config = Configuration::getInstance();
    if (result.count("config") && !config.loadFromFile(result["config"].as<std::string>())) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Config validation error: " << error;
        }
        return kExitBadConfig;
    }

    // Command line overrides the file
    TaskfoldConfig& cfg = config.config();
    if (result.count("workers")) OverrideFromCommandLine(cfg.run.num_workers, result["workers"].as<int>(), "workers");
    if (result.count("tasks")) OverrideFromCommandLine(cfg.run.num_tasks, result["tasks"].as<int>(), "tasks");
    if (result.count("output")) OverrideFromCommandLine(cfg.sink.output_path, result["output"].as<std::string>(), "output");
    if (result.count("min_delay_ms")) OverrideFromCommandLine(cfg.worker.min_delay_ms, result["min_delay_ms"].as<int>(), "min_delay_ms");
    if (result.count("max_delay_ms")) OverrideFromCommandLine(cfg.worker.max_delay_ms, result["max_delay_ms"].as<int>(), "max_delay_ms");
    if (result.count("timeout_ms")) OverrideFromCommandLine(cfg.coordinator.worker_timeout_ms, result["timeout_ms"].as<int>(), "timeout_ms");
    if (result.count("flush_every_record")) OverrideFromCommandLine(cfg.sink.flush_every_record, true, "flush_every_record");

    if (!config.validate()) {
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Validation error: " << error;
        }
        return kExitBadConfig;
    }

    const std::string output_path = config.getOutputPath();
    PrepareOutputDirectory(output_path);

    LOG(INFO) << "Taskfold starting...";
    LOG(INFO) << "Workers: " << config.getNumWorkers();
    LOG(INFO) << "Tasks: " << config.getNumTasks();
    LOG(INFO) << "Writing output to: " << output_path;

    CoordinatorOptions coordinator_options;
    coordinator_options.num_workers = config.getNumWorkers();
    coordinator_options.worker_timeout = std::chrono::milliseconds(config.getWorkerTimeoutMs());
    coordinator_options.sink_channel_capacity = cfg.sink.channel_capacity.get();
    coordinator_options.flush_every_record = cfg.sink.flush_every_record.get();

    Coordinator coordinator(
        coordinator_options,
        [output_path]() { return std::make_unique<FileOutput>(output_path); },
        MakeUniformDelayFactory(cfg.worker.min_delay_ms.get(), cfg.worker.max_delay_ms.get()));

    RunReport report = coordinator.Run(MakeBatch(config.getNumTasks(), cfg.run.payload_prefix.get()));
    LogRunReport(report);
    LOG(INFO) << "Taskfold ended in state " << CoordinatorStateName(coordinator.state());

    return report.Complete() ? kExitComplete : kExitDegraded;
}
