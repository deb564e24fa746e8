/**
 * @file CommandDispatcherTest.cpp
 * @brief Unit tests for CommandDispatcher
 */

#include <gtest/gtest.h>
#include "application/CommandDispatcher.hpp"
#include "../mocks/TestSettings.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ordering::application;
using namespace ordering::tests;

class CommandDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<TestCommandSettings>();
        settings_->workerCount = 3;
        dispatcher_ = std::make_unique<CommandDispatcher>(settings_);
    }

    std::shared_ptr<TestCommandSettings> settings_;
    std::unique_ptr<CommandDispatcher> dispatcher_;
};

TEST_F(CommandDispatcherTest, Stop_DrainsQueuedCommands) {
    std::atomic<int> counter(0);
    dispatcher_->start();

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(dispatcher_->dispatch("ord-" + std::to_string(i),
                                          std::make_shared<FunctionCommand>("inc", [&counter]() { ++counter; })));
    }
    dispatcher_->stop();

    EXPECT_EQ(counter.load(), 50);
    EXPECT_EQ(dispatcher_->executed(), 50u);
    EXPECT_EQ(dispatcher_->pending(), 0u);
}

TEST_F(CommandDispatcherTest, ThrowingCommand_CountedAndWorkerSurvives) {
    std::atomic<int> counter(0);
    dispatcher_->start();

    dispatcher_->dispatch("ord-1", std::make_shared<FunctionCommand>("boom", []() {
        throw std::runtime_error("boom");
    }));
    dispatcher_->dispatch("ord-1", std::make_shared<FunctionCommand>("inc", [&counter]() { ++counter; }));
    dispatcher_->stop();

    EXPECT_EQ(dispatcher_->failed(), 1u);
    EXPECT_EQ(dispatcher_->executed(), 1u);
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(CommandDispatcherTest, Dispatch_AfterStop_Rejected) {
    dispatcher_->start();
    dispatcher_->stop();

    EXPECT_FALSE(dispatcher_->dispatch("ord-1", std::make_shared<FunctionCommand>("late", []() {})));
}

TEST_F(CommandDispatcherTest, Dispatch_BeforeStart_RunsOnStart) {
    std::atomic<int> counter(0);
    ASSERT_TRUE(dispatcher_->dispatch("ord-1",
                                      std::make_shared<FunctionCommand>("early", [&counter]() { ++counter; })));
    EXPECT_EQ(dispatcher_->pending(), 1u);

    dispatcher_->start();
    dispatcher_->stop();

    EXPECT_EQ(counter.load(), 1);
}

// ============================================================================
// ORDERING PER KEY
// ============================================================================

TEST_F(CommandDispatcherTest, ShardOf_StableAndInRange) {
    for (int i = 0; i < 100; ++i) {
        std::string key = "ord-" + std::to_string(i);
        size_t shard = dispatcher_->shardOf(key);
        EXPECT_LT(shard, dispatcher_->getWorkerCount());
        EXPECT_EQ(dispatcher_->shardOf(key), shard);
    }
}

TEST_F(CommandDispatcherTest, ZeroWorkers_FallsBackToOne) {
    settings_->workerCount = 0;
    CommandDispatcher single(settings_);

    EXPECT_EQ(single.getWorkerCount(), 1u);
    EXPECT_EQ(single.shardOf("ord-1"), 0u);
}

TEST_F(CommandDispatcherTest, ManyWorkers_SameKeyRunsInDispatchOrder) {
    settings_->workerCount = 4;
    dispatcher_ = std::make_unique<CommandDispatcher>(settings_);

    const int KEYS = 64;
    const int STEPS = 50;
    std::mutex mutex;
    std::map<std::string, std::vector<int>> seen;
    std::atomic<int> concurrentSameKey(0);
    std::map<std::string, std::atomic<int>> inside;
    for (int k = 0; k < KEYS; ++k) {
        inside["ord-" + std::to_string(k)] = 0;
    }

    dispatcher_->start();
    for (int step = 0; step < STEPS; ++step) {
        for (int k = 0; k < KEYS; ++k) {
            std::string key = "ord-" + std::to_string(k);
            std::atomic<int>* active = &inside[key];
            ASSERT_TRUE(dispatcher_->dispatch(key, std::make_shared<FunctionCommand>(
                "step", [&, key, step, active]() {
                    if (++(*active) > 1) {
                        ++concurrentSameKey;
                    }
                    std::this_thread::yield();
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        seen[key].push_back(step);
                    }
                    --(*active);
                })));
        }
    }
    dispatcher_->stop();

    EXPECT_EQ(concurrentSameKey.load(), 0);
    EXPECT_EQ(dispatcher_->executed(), static_cast<uint64_t>(KEYS * STEPS));
    ASSERT_EQ(seen.size(), static_cast<size_t>(KEYS));
    for (const auto& [key, steps] : seen) {
        ASSERT_EQ(steps.size(), static_cast<size_t>(STEPS)) << key;
        for (int step = 0; step < STEPS; ++step) {
            EXPECT_EQ(steps[step], step) << key;
        }
    }
}

TEST(FunctionCommandTest, NameAndExecute) {
    bool called = false;
    FunctionCommand command("payment.succeeded order=o-1", [&called]() { called = true; });

    command.execute();

    EXPECT_TRUE(called);
    EXPECT_EQ(command.name(), "payment.succeeded order=o-1");
}
