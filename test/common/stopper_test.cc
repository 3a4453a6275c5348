#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "../../src/common/stopper.h"

using namespace Tessera;

class StopperTest : public ::testing::Test {
protected:
    void SetUp() override {
        stopper_ = std::make_unique<Stopper>();
    }

    std::unique_ptr<Stopper> stopper_;
};

TEST_F(StopperTest, NotStoppingInitially) {
    EXPECT_FALSE(stopper_->ShouldStop());
}

TEST_F(StopperTest, StopCallbacksRunOnce) {
    std::atomic<int> calls{0};
    stopper_->AddStopCallback([&calls]() { calls++; });
    stopper_->AddStopCallback([&calls]() { calls++; });

    stopper_->Stop();
    stopper_->Stop();

    EXPECT_TRUE(stopper_->ShouldStop());
    EXPECT_EQ(calls, 2);
}

TEST_F(StopperTest, CallbackAddedAfterStopRunsImmediately) {
    stopper_->Stop();

    bool called = false;
    stopper_->AddStopCallback([&called]() { called = true; });
    EXPECT_TRUE(called);
}

TEST_F(StopperTest, RemovedCallbackDoesNotRun) {
    bool called = false;
    auto id = stopper_->AddStopCallback([&called]() { called = true; });
    stopper_->RemoveStopCallback(id);

    stopper_->Stop();
    EXPECT_FALSE(called);

    // Removing after stop is a no-op.
    stopper_->RemoveStopCallback(id);
}

TEST_F(StopperTest, StopJoinsWorkers) {
    std::atomic<bool> finished{false};
    ASSERT_TRUE(stopper_->RunWorker([this, &finished]() {
        stopper_->WaitForStop();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        finished = true;
    }));

    stopper_->Stop();
    EXPECT_TRUE(finished);
}

TEST_F(StopperTest, RunWorkerRefusedAfterStop) {
    stopper_->Stop();

    bool ran = false;
    EXPECT_FALSE(stopper_->RunWorker([&ran]() { ran = true; }));
    EXPECT_FALSE(ran);
}

TEST_F(StopperTest, ConcurrentStopWaitsForWorkers) {
    std::atomic<int> finished{0};
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(stopper_->RunWorker([this, &finished]() {
            stopper_->WaitForStop();
            finished++;
        }));
    }

    std::vector<std::thread> stoppers;
    for (int i = 0; i < 4; ++i) {
        stoppers.emplace_back([this, &finished]() {
            stopper_->Stop();
            // Every Stop() returns only after all workers are joined.
            EXPECT_EQ(finished, 4);
        });
    }
    for (auto& thread : stoppers) {
        thread.join();
    }
}

TEST_F(StopperTest, DestructorStops) {
    std::atomic<bool> finished{false};
    {
        Stopper stopper;
        ASSERT_TRUE(stopper.RunWorker([&stopper, &finished]() {
            stopper.WaitForStop();
            finished = true;
        }));
    }
    EXPECT_TRUE(finished);
}
