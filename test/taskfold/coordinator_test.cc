#include <gtest/gtest.h>
#include "../../src/taskfold/coordinator.h"
#include "test_outputs.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>

using namespace Taskfold;
using namespace std::chrono_literals;
using Taskfold::testing_util::MemoryOutput;
using Taskfold::testing_util::MockOutput;
using Taskfold::testing_util::ReadLines;
using Taskfold::testing_util::UniqueTempPath;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

DelaySourceFactory FixedDelays(std::chrono::milliseconds delay) {
    return [delay](int) { return std::make_unique<FixedDelaySource>(delay); };
}

OutputFactory FileAt(const std::string& path) {
    return [path]() { return std::make_unique<FileOutput>(path); };
}

/**
 * Requests cancellation from inside the processing step of the Nth item,
 * then sleeps long enough that only cancellation can end the sleep.
 */
class CancelOnNthItem : public IDelaySource {
public:
    CancelOnNthItem(std::atomic<int>* counter, int nth, Coordinator** coordinator)
        : counter_(counter), nth_(nth), coordinator_(coordinator) {}

    std::chrono::milliseconds Next() override {
        if (counter_->fetch_add(1) + 1 == nth_) {
            (*coordinator_)->RequestCancel();
            return 10s;
        }
        return 1ms;
    }

private:
    std::atomic<int>* counter_;
    int nth_;
    Coordinator** coordinator_;
};

class ThrowingDelaySource : public IDelaySource {
public:
    std::chrono::milliseconds Next() override {
        throw std::runtime_error("delay generator broke");
    }
};

class RawThrowDelaySource : public IDelaySource {
public:
    std::chrono::milliseconds Next() override {
        throw 42;
    }
};

// Worker 1 gets the given failing source, every other worker a fixed delay
template <typename FailingSource>
DelaySourceFactory FirstWorkerFails(std::chrono::milliseconds delay) {
    return [delay](int worker_id) -> std::unique_ptr<IDelaySource> {
        if (worker_id == 1) {
            return std::make_unique<FailingSource>();
        }
        return std::make_unique<FixedDelaySource>(delay);
    };
}

bool HasDiagnostic(const RunReport& report, const std::string& prefix) {
    auto diagnostics = report.Diagnostics();
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [&prefix](const std::string& d) { return d.rfind(prefix, 0) == 0; });
}

} // namespace

TEST(CoordinatorTest, TwentyItemsFourWorkersWriteOneLineEach) {
    std::string path = UniqueTempPath("coordinator_full");
    CoordinatorOptions options;
    options.num_workers = 4;
    Coordinator coordinator(options, FileAt(path), FixedDelays(2ms));
    EXPECT_EQ(coordinator.state(), CoordinatorState::kInit);

    RunReport report = coordinator.Run(MakeBatch(20));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.items_loaded, 20u);
    EXPECT_EQ(report.items_dequeued, 20u);
    EXPECT_EQ(report.records_produced, 20u);
    EXPECT_EQ(report.records_written, 20u);
    EXPECT_EQ(report.records_lost, 0u);
    EXPECT_EQ(report.items_not_processed, 0u);
    EXPECT_EQ(report.workers_started, 4);
    EXPECT_FALSE(report.resource_unavailable);
    EXPECT_FALSE(report.cancelled);
    EXPECT_TRUE(report.Complete());
    EXPECT_TRUE(report.Diagnostics().empty());

    auto lines = ReadLines(path);
    ASSERT_EQ(lines.size(), 20u);
    std::set<int> task_ids;
    for (const auto& line : lines) {
        ResultRecord parsed;
        ASSERT_TRUE(ParseResultLine(line, &parsed)) << line;
        EXPECT_GE(parsed.worker_id, 1);
        EXPECT_LE(parsed.worker_id, 4);
        EXPECT_EQ(parsed.payload, "data-" + std::to_string(parsed.task_id));
        EXPECT_TRUE(task_ids.insert(parsed.task_id).second) << "duplicate Task-" << parsed.task_id;
    }
    EXPECT_EQ(*task_ids.begin(), 1);
    EXPECT_EQ(*task_ids.rbegin(), 20);
}

TEST(CoordinatorTest, EmptyBatchClosesWithNoOutput) {
    std::string path = UniqueTempPath("coordinator_empty");
    Coordinator coordinator(CoordinatorOptions(), FileAt(path), FixedDelays(0ms));

    RunReport report = coordinator.Run({});

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.items_loaded, 0u);
    EXPECT_EQ(report.records_written, 0u);
    EXPECT_TRUE(report.Complete());
    EXPECT_TRUE(ReadLines(path).empty());
}

TEST(CoordinatorTest, UnavailableOutputStillDrainsEveryItem) {
    CoordinatorOptions options;
    options.num_workers = 4;
    // A single slot would deadlock workers if records were not drained
    options.sink_channel_capacity = 1;
    Coordinator coordinator(options, FileAt("/nonexistent-taskfold-dir/out.txt"), FixedDelays(1ms));

    RunReport report = coordinator.Run(MakeBatch(20));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_TRUE(report.resource_unavailable);
    EXPECT_EQ(report.items_dequeued, 20u);
    EXPECT_EQ(report.records_produced, 20u);
    EXPECT_EQ(report.records_discarded, 20u);
    EXPECT_EQ(report.records_written, 0u);
    EXPECT_EQ(report.records_lost, 20u);
    EXPECT_FALSE(report.Complete());
    EXPECT_TRUE(HasDiagnostic(report, "ResourceUnavailable"));
}

TEST(CoordinatorTest, ThrowingOutputFactoryIsResourceUnavailable) {
    OutputFactory broken = []() -> std::unique_ptr<IOutputResource> {
        throw std::runtime_error("no disk");
    };
    Coordinator coordinator(CoordinatorOptions(), broken, FixedDelays(0ms));

    RunReport report = coordinator.Run(MakeBatch(5));

    EXPECT_TRUE(report.resource_unavailable);
    EXPECT_EQ(report.items_dequeued, 5u);
    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
}

TEST(CoordinatorTest, FailedWorkerDoesNotStopTheOthers) {
    auto log = std::make_shared<MemoryOutput::Log>();
    CoordinatorOptions options;
    options.num_workers = 4;
    Coordinator coordinator(
        options,
        [log]() { return std::make_unique<MemoryOutput>(log); },
        FirstWorkerFails<ThrowingDelaySource>(10ms));

    RunReport report = coordinator.Run(MakeBatch(20));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.workers_started, 4);
    EXPECT_EQ(report.workers_failed, 1);
    EXPECT_EQ(report.items_dequeued, 20u);
    EXPECT_EQ(report.items_not_processed, 0u);
    // Worker 1 lost the one item it picked, the others wrote the rest
    EXPECT_EQ(report.records_lost, 1u);
    EXPECT_EQ(report.records_written, 19u);
    EXPECT_EQ(report.items_dequeued, report.records_written + report.records_lost);
    EXPECT_EQ(log->lines.size(), 19u);
    EXPECT_FALSE(report.Complete());
    EXPECT_TRUE(HasDiagnostic(report, "Worker-1 failed: delay generator broke"));
    EXPECT_FALSE(HasDiagnostic(report, "UnexpectedWorkerFailure"));
}

TEST(CoordinatorTest, NonStandardThrowIsContainedInItsWorker) {
    auto log = std::make_shared<MemoryOutput::Log>();
    CoordinatorOptions options;
    options.num_workers = 3;
    Coordinator coordinator(
        options,
        [log]() { return std::make_unique<MemoryOutput>(log); },
        FirstWorkerFails<RawThrowDelaySource>(10ms));

    RunReport report = coordinator.Run(MakeBatch(12));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.workers_failed, 1);
    EXPECT_EQ(report.records_written, 11u);
    EXPECT_EQ(report.items_dequeued, report.records_written + report.records_lost);
    EXPECT_TRUE(HasDiagnostic(report, "Worker-1 failed: unknown exception"));
}

TEST(CoordinatorTest, WorkerThatCannotBeBuiltIsCountedAndSkipped) {
    auto log = std::make_shared<MemoryOutput::Log>();
    CoordinatorOptions options;
    options.num_workers = 3;
    DelaySourceFactory factory = [](int worker_id) -> std::unique_ptr<IDelaySource> {
        if (worker_id == 2) {
            throw std::runtime_error("no delay source for Worker-2");
        }
        return std::make_unique<FixedDelaySource>(1ms);
    };
    Coordinator coordinator(options, [log]() { return std::make_unique<MemoryOutput>(log); }, factory);

    RunReport report = coordinator.Run(MakeBatch(10));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.workers_started, 2);
    EXPECT_EQ(report.workers_failed, 1);
    EXPECT_EQ(report.worker_outcomes.size(), 2u);
    EXPECT_EQ(report.records_written, 10u);
    EXPECT_EQ(log->lines.size(), 10u);
    EXPECT_FALSE(HasDiagnostic(report, "UnexpectedWorkerFailure"));
}

TEST(CoordinatorTest, WriteFailuresAreReportedAndRunStillCloses) {
    CoordinatorOptions options;
    options.num_workers = 2;
    OutputFactory failing_writes = []() -> std::unique_ptr<IOutputResource> {
        auto mock = std::make_unique<NiceMock<MockOutput>>();
        ON_CALL(*mock, Open()).WillByDefault(Return(true));
        ON_CALL(*mock, Write(_, _)).WillByDefault(Return(false));
        ON_CALL(*mock, Flush()).WillByDefault(Return(true));
        ON_CALL(*mock, Close()).WillByDefault(Return(true));
        ON_CALL(*mock, Describe()).WillByDefault(Return("mock"));
        return mock;
    };
    Coordinator coordinator(options, failing_writes, FixedDelays(0ms));

    RunReport report = coordinator.Run(MakeBatch(6));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_FALSE(report.resource_unavailable);
    EXPECT_EQ(report.records_produced, 6u);
    EXPECT_EQ(report.write_failures, 6u);
    EXPECT_EQ(report.records_written, 0u);
    EXPECT_EQ(report.records_lost, 6u);
    EXPECT_EQ(report.workers_failed, 0);
    EXPECT_FALSE(report.Complete());
    EXPECT_TRUE(HasDiagnostic(report, "WriteFailure: 6"));
}

TEST(CoordinatorTest, CancellationHalfwayLeavesRemainingItemsQueued) {
    auto log = std::make_shared<MemoryOutput::Log>();
    std::atomic<int> picked{0};
    Coordinator* handle = nullptr;

    CoordinatorOptions options;
    options.num_workers = 1;
    Coordinator coordinator(
        options,
        [log]() { return std::make_unique<MemoryOutput>(log); },
        [&picked, &handle](int) { return std::make_unique<CancelOnNthItem>(&picked, 10, &handle); });
    handle = &coordinator;

    auto start = std::chrono::steady_clock::now();
    RunReport report = coordinator.Run(MakeBatch(20));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_TRUE(report.cancelled);
    EXPECT_FALSE(report.timed_out);
    EXPECT_EQ(report.items_dequeued, 10u);
    EXPECT_EQ(report.items_not_processed, 10u);
    EXPECT_EQ(coordinator.queue().Size(), 10u);
    // The tenth item was interrupted mid-processing
    EXPECT_EQ(report.records_written, 9u);
    EXPECT_EQ(report.records_lost, 1u);
    EXPECT_EQ(report.workers_cancelled, 1);
    EXPECT_TRUE(HasDiagnostic(report, "Cancelled"));
    EXPECT_TRUE(HasDiagnostic(report, "NotProcessed"));

    // The sink was still finished and closed
    EXPECT_EQ(log->close_calls.load(), 1);
    EXPECT_EQ(log->lines.size(), 9u);
}

TEST(CoordinatorTest, CancellationWithManyWorkersKeepsAccounting) {
    auto log = std::make_shared<MemoryOutput::Log>();
    std::atomic<int> picked{0};
    Coordinator* handle = nullptr;

    CoordinatorOptions options;
    options.num_workers = 4;
    Coordinator coordinator(
        options,
        [log]() { return std::make_unique<MemoryOutput>(log); },
        [&picked, &handle](int) { return std::make_unique<CancelOnNthItem>(&picked, 10, &handle); });
    handle = &coordinator;

    RunReport report = coordinator.Run(MakeBatch(20));

    EXPECT_TRUE(report.cancelled);
    EXPECT_GT(report.items_not_processed, 0u);
    EXPECT_EQ(report.items_dequeued + report.items_not_processed, 20u);
    EXPECT_EQ(report.records_written + report.records_lost, report.items_dequeued);
    EXPECT_EQ(log->lines.size(), report.records_written);
    EXPECT_EQ(log->writes_after_close.load(), 0);
}

TEST(CoordinatorTest, TimeoutCancelsSlowWorkers) {
    auto log = std::make_shared<MemoryOutput::Log>();
    CoordinatorOptions options;
    options.num_workers = 2;
    options.worker_timeout = 100ms;
    Coordinator coordinator(options, [log]() { return std::make_unique<MemoryOutput>(log); },
                            FixedDelays(10s));

    auto start = std::chrono::steady_clock::now();
    RunReport report = coordinator.Run(MakeBatch(5));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_TRUE(report.timed_out);
    EXPECT_TRUE(report.cancelled);
    EXPECT_EQ(report.workers_cancelled, 2);
    EXPECT_EQ(report.items_dequeued, 2u);
    EXPECT_EQ(report.items_not_processed, 3u);
    EXPECT_EQ(report.records_lost, 2u);
    EXPECT_EQ(report.records_written, 0u);
    EXPECT_TRUE(HasDiagnostic(report, "Timeout"));
    EXPECT_EQ(log->close_calls.load(), 1);
}

TEST(CoordinatorTest, SlowOutputIsClosedOnlyAfterEveryWrite) {
    auto log = std::make_shared<MemoryOutput::Log>();
    CoordinatorOptions options;
    options.num_workers = 4;
    options.sink_channel_capacity = 1;
    Coordinator coordinator(options,
                            [log]() { return std::make_unique<MemoryOutput>(log, 5ms); },
                            FixedDelays(0ms));

    RunReport report = coordinator.Run(MakeBatch(20));

    EXPECT_EQ(report.records_written, 20u);
    EXPECT_EQ(log->lines.size(), 20u);
    EXPECT_EQ(log->writes_after_close.load(), 0);
    EXPECT_EQ(log->close_calls.load(), 1);
}

TEST(CoordinatorTest, CancelBeforeRunProcessesNothing) {
    auto log = std::make_shared<MemoryOutput::Log>();
    Coordinator coordinator(CoordinatorOptions(),
                            [log]() { return std::make_unique<MemoryOutput>(log); },
                            FixedDelays(0ms));
    coordinator.RequestCancel();

    RunReport report = coordinator.Run(MakeBatch(8));

    EXPECT_EQ(coordinator.state(), CoordinatorState::kClosed);
    EXPECT_EQ(report.items_dequeued, 0u);
    EXPECT_EQ(report.items_not_processed, 8u);
    EXPECT_EQ(log->close_calls.load(), 1);
}

TEST(CoordinatorTest, RunIsSinglePass) {
    Coordinator coordinator(CoordinatorOptions(), nullptr, FixedDelays(0ms));
    coordinator.Run(MakeBatch(2));
    EXPECT_THROW(coordinator.Run(MakeBatch(2)), std::logic_error);
}

TEST(CoordinatorTest, InvalidOptionsAreRejected) {
    CoordinatorOptions no_workers;
    no_workers.num_workers = 0;
    EXPECT_THROW(Coordinator(no_workers, nullptr, FixedDelays(0ms)), std::invalid_argument);

    CoordinatorOptions negative_timeout;
    negative_timeout.worker_timeout = -1ms;
    EXPECT_THROW(Coordinator(negative_timeout, nullptr, FixedDelays(0ms)), std::invalid_argument);

    EXPECT_THROW(Coordinator(CoordinatorOptions(), nullptr, nullptr), std::invalid_argument);
}

TEST(CoordinatorTest, UniformDelayFactoryStaysInBounds) {
    auto factory = MakeUniformDelayFactory(150, 450);
    auto source = factory(1);
    for (int i = 0; i < 1000; ++i) {
        auto delay = source->Next();
        EXPECT_GE(delay, 150ms);
        EXPECT_LT(delay, 450ms);
    }
    EXPECT_THROW(MakeUniformDelayFactory(10, 10)(1), std::invalid_argument);
}
