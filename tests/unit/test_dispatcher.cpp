/**
 * @file test_dispatcher.cpp
 * @brief Worker pool over the durable queue with scripted executors
 */

#include <gtest/gtest.h>
#include "Dispatcher.h"
#include "ErrorCodes.h"
#include "QueueStore.h"
#include "TestTree.h"

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace ParaCopy;
using ParaCopy::Testing::TestTree;

namespace {

/**
 * Records every call; fails or throws for configured paths
 */
class FakeExecutor : public ITransferExecutor {
public:
    TransferOutcome transfer(const WorkItem& item, const TransferOptions& options) override {
        int now = ++active_;
        int seen = maxActive_.load();
        while (now > seen && !maxActive_.compare_exchange_weak(seen, now)) {
        }
        if (delay_.count() > 0) {
            std::this_thread::sleep_for(delay_);
        }
        --active_;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_[item.relativePath]++;
            lastOptions_ = options;
        }
        if (throwing_.count(item.relativePath)) {
            throw std::runtime_error("boom");
        }
        if (failing_.count(item.relativePath)) {
            return TransferOutcome::failed("scripted failure");
        }
        return TransferOutcome::succeeded(!unchanged_.count(item.relativePath));
    }

    std::string name() const override { return "fake"; }

    std::map<std::string, int> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::set<std::string> failing_;
    std::set<std::string> throwing_;
    std::set<std::string> unchanged_;
    std::chrono::milliseconds delay_{0};
    std::atomic<int> maxActive_{0};
    TransferOptions lastOptions_;

private:
    std::mutex mutex_;
    std::map<std::string, int> calls_;
    std::atomic<int> active_{0};
};

/**
 * Delegates to a real queue but fails to persist the Nth completion
 */
class FailingPersistenceQueue : public IWorkQueue {
public:
    FailingPersistenceQueue(IWorkQueue& inner, int failOnCompletion)
        : inner_(inner), failOn_(failOnCompletion) {}

    std::optional<WorkItem> dequeue() override { return inner_.dequeue(); }

    void markDone(const WorkItem& item) override {
        if (++completions_ == failOn_) {
            throw Core::QueuePersistenceError("disk full");
        }
        inner_.markDone(item);
    }

    void markFailed(const WorkItem& item, const std::string& cause) override {
        inner_.markFailed(item, cause);
    }

    void close() override { inner_.close(); }

private:
    IWorkQueue& inner_;
    int failOn_;
    std::atomic<int> completions_{0};
};

std::vector<std::string> makePaths(int count) {
    std::vector<std::string> paths;
    for (int i = 0; i < count; ++i) {
        paths.push_back("item" + std::to_string(i));
    }
    return paths;
}

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<QueueStore>(tree_.path("dispatch.queue").string());
    }

    TestTree tree_{"paracopy_dispatch"};
    std::unique_ptr<QueueStore> store_;
    FakeExecutor executor_;
};

TEST_F(DispatcherTest, FourWorkersProcessEveryItemExactlyOnce) {
    const int n = 200;
    store_->initialize(makePaths(n));
    executor_.delay_ = std::chrono::milliseconds(1);

    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 4);
    auto summary = dispatcher.run();

    auto calls = executor_.calls();
    EXPECT_EQ(calls.size(), static_cast<std::size_t>(n));
    for (const auto& entry : calls) {
        EXPECT_EQ(entry.second, 1) << entry.first;
    }
    EXPECT_EQ(summary.succeeded, static_cast<std::size_t>(n));
    EXPECT_EQ(summary.failed, 0u);
    EXPECT_FALSE(summary.interrupted);
    EXPECT_EQ(store_->durableCount(), 0u);
    EXPECT_LE(executor_.maxActive_.load(), 4);
    EXPECT_GT(executor_.maxActive_.load(), 1);
}

TEST_F(DispatcherTest, SingleWorkerNeverOverlaps) {
    store_->initialize(makePaths(20));
    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 1);
    dispatcher.run();
    EXPECT_EQ(executor_.maxActive_.load(), 1);
}

TEST_F(DispatcherTest, OptionsReachTheExecutor) {
    store_->initialize({"a"});
    TransferOptions options;
    options.dryRun = false;
    options.move = true;
    options.compare = CompareMode::Fast;

    Dispatcher dispatcher(*store_, executor_, options, 2);
    dispatcher.run();

    EXPECT_FALSE(executor_.lastOptions_.dryRun);
    EXPECT_TRUE(executor_.lastOptions_.move);
    EXPECT_EQ(executor_.lastOptions_.compare, CompareMode::Fast);
}

TEST_F(DispatcherTest, FailuresStayPendingAndOthersComplete) {
    store_->initialize(makePaths(10));
    executor_.failing_ = {"item3", "item7"};
    executor_.unchanged_ = {"item0"};

    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 3);
    auto summary = dispatcher.run();

    EXPECT_EQ(summary.succeeded, 8u);
    EXPECT_EQ(summary.unchanged, 1u);
    EXPECT_EQ(summary.failed, 2u);

    auto remaining = store_->records();
    ASSERT_EQ(remaining.size(), 2u);
    EXPECT_EQ(remaining[0].relativePath, "item3");
    EXPECT_EQ(remaining[0].attempts, 1);
    EXPECT_EQ(remaining[0].lastError, "scripted failure");
    EXPECT_EQ(remaining[1].relativePath, "item7");
}

TEST_F(DispatcherTest, ExecutorExceptionCountsAsFailure) {
    store_->initialize({"ok", "explodes"});
    executor_.throwing_ = {"explodes"};

    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 2);
    auto summary = dispatcher.run();

    EXPECT_EQ(summary.succeeded, 1u);
    EXPECT_EQ(summary.failed, 1u);
    auto remaining = store_->records();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_NE(remaining[0].lastError.find("boom"), std::string::npos);
}

TEST_F(DispatcherTest, RetriesWithinRunAreHonoured) {
    store_ = std::make_unique<QueueStore>(tree_.path("retry.queue").string(), QueueStoreOptions{2, 0});
    store_->initialize({"flaky"});
    executor_.failing_ = {"flaky"};

    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 4);
    auto summary = dispatcher.run();

    EXPECT_EQ(executor_.calls()["flaky"], 3);
    EXPECT_EQ(summary.failed, 3u);
}

TEST_F(DispatcherTest, PersistenceFailureStopsAllWorkersAndPropagates) {
    const int n = 100;
    store_->initialize(makePaths(n));
    executor_.delay_ = std::chrono::milliseconds(1);
    FailingPersistenceQueue faulty(*store_, 10);

    Dispatcher dispatcher(faulty, executor_, TransferOptions{}, 4);
    EXPECT_THROW(dispatcher.run(), Core::QueuePersistenceError);

    // Workers stop promptly: most of the queue is untouched and every
    // unconfirmed item is still durable
    auto calls = executor_.calls();
    EXPECT_LT(calls.size(), static_cast<std::size_t>(n));
    EXPECT_EQ(store_->inFlightCount(), 1u);  // the item whose completion was lost
    EXPECT_GE(store_->durableCount(), static_cast<std::size_t>(n) - calls.size() + 1);
}

TEST_F(DispatcherTest, StopRequestFinishesInFlightAndLeavesRestPending) {
    const int n = 50;
    store_->initialize(makePaths(n));
    executor_.delay_ = std::chrono::milliseconds(5);

    Dispatcher dispatcher(*store_, executor_, TransferOptions{}, 2);
    std::thread stopper([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        dispatcher.requestStop();
    });
    auto summary = dispatcher.run();
    stopper.join();

    EXPECT_TRUE(summary.interrupted);
    EXPECT_LT(summary.succeeded, static_cast<std::size_t>(n));
    EXPECT_EQ(store_->inFlightCount(), 0u);
    EXPECT_EQ(store_->durableCount(), static_cast<std::size_t>(n) - summary.succeeded);
}

TEST_F(DispatcherTest, ZeroWorkersIsRejected) {
    EXPECT_THROW(Dispatcher(*store_, executor_, TransferOptions{}, 0), std::invalid_argument);
}
