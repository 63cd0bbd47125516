#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/EventLoop.h"

using namespace std::chrono_literals;

TEST(EventLoop, RunsPostedTasksInOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    loop.runUntilIdle();
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, TaskPostedFromTaskRunsInSameDrain) {
    EventLoop loop;
    bool inner = false;
    loop.post([&] { loop.post([&] { inner = true; }); });

    loop.runUntilIdle();
    EXPECT_TRUE(inner);
}

TEST(EventLoop, ThrowingTaskDoesNotStopTheLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    loop.runUntilIdle();
    EXPECT_TRUE(after);
}

TEST(EventLoop, RunUntilIdleDoesNotWaitForFutureTimers) {
    EventLoop loop;
    bool fired = false;
    loop.schedule(10s, [&] { fired = true; });

    auto start = std::chrono::steady_clock::now();
    loop.runUntilIdle();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_FALSE(fired);
    EXPECT_EQ(loop.pendingTimers(), 1u);
}

TEST(EventLoop, RunForFiresDueTimers) {
    EventLoop loop;
    bool fired = false;
    loop.schedule(20ms, [&] { fired = true; });

    loop.runFor(200ms);
    EXPECT_TRUE(fired);
    EXPECT_EQ(loop.pendingTimers(), 0u);
}

TEST(EventLoop, CancelledTimerNeverFires) {
    EventLoop loop;
    bool fired = false;
    auto id = loop.schedule(20ms, [&] { fired = true; });
    loop.cancelTimer(id);
    loop.cancelTimer(id);  // 第二次取消是无操作

    loop.runFor(100ms);
    EXPECT_FALSE(fired);
}

TEST(EventLoop, TimersFireInDeadlineOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.schedule(60ms, [&] { order.push_back(3); });
    loop.schedule(10ms, [&] { order.push_back(1); });
    loop.schedule(30ms, [&] { order.push_back(2); });

    loop.runFor(200ms);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoop, BackgroundWorkPostsResultBack) {
    EventLoop loop;
    std::thread::id loopThread = std::this_thread::get_id();
    std::thread::id workerThread;
    std::thread::id completionThread;

    loop.runInBackground([&] {
        workerThread = std::this_thread::get_id();
        std::this_thread::sleep_for(20ms);
        loop.post([&] { completionThread = std::this_thread::get_id(); });
    });

    loop.runUntilIdle();
    EXPECT_NE(workerThread, loopThread);
    EXPECT_EQ(completionThread, loopThread);
    EXPECT_EQ(loop.backgroundJobs(), 0u);
}

TEST(EventLoop, PostFromOtherThreadsWakesRun) {
    EventLoop loop;
    std::atomic<int> count{0};

    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) {
            loop.post([&] { count++; });
        }
        loop.post([&] { loop.stop(); });
    });

    loop.run();
    producer.join();
    EXPECT_EQ(count.load(), 100);
    EXPECT_TRUE(loop.isStopped());
}

TEST(EventLoop, StopBeforeRunReturnsImmediately) {
    EventLoop loop;
    loop.stop();
    loop.run();
    EXPECT_TRUE(loop.isStopped());
}

// 析构必须等到后台线程彻底放手 mtx/cv; 在 -fsanitize=thread 下反复构造销毁最容易暴露问题
TEST(EventLoop, DestroyRightAfterBackgroundJobIsSafe) {
    std::atomic<int> finished{0};
    for (int i = 0; i < 2000; ++i) {
        auto loop = std::make_unique<EventLoop>();
        auto token = std::make_shared<int>(i);
        loop->runInBackground([token, &finished] { finished++; });
        loop.reset();
        EXPECT_EQ(token.use_count(), 1) << "job state must be released before the destructor returns";
    }
    EXPECT_EQ(finished.load(), 2000);
}
