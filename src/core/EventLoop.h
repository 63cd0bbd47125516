#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

/**
 * @brief 单线程协作式事件循环
 *
 * 所有分发逻辑都在循环线程上执行。其他线程 (stdin 读取、
 * resolve 通道、HTTP 桥) 只通过 post() 投递任务。
 *
 * - post():      线程安全, FIFO 执行
 * - schedule():  延迟任务, 返回定时器 id
 * - runInBackground(): 阻塞型工作 (弹窗进程) 交给辅助线程,
 *                完成后由工作自身 post() 回循环
 */
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);

    TimerId schedule(std::chrono::milliseconds delay, Task task);

    // 已触发或未知的 id 直接忽略
    void cancelTimer(TimerId id);

    void runInBackground(Task work);

    // 阻塞直到 stop()
    void run();
    void stop();

    /**
     * @brief 执行所有就绪任务, 并等待后台任务完成
     *
     * 不会等待尚未到期的定时器。测试用。
     */
    void runUntilIdle();

    /**
     * @brief 在给定时长内运行, 期间触发到期的定时器
     */
    void runFor(std::chrono::milliseconds duration);

    size_t pendingTimers() const;
    size_t backgroundJobs() const { return runningJobs.load(); }
    bool isStopped() const { return stopped.load(); }

private:
    struct Timer {
        TimerId id;
        Task task;
    };

    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<Task> tasks;
    std::multimap<Clock::time_point, Timer> timers;
    TimerId nextTimerId = 0;
    std::atomic<bool> stopped{false};
    std::atomic<size_t> runningJobs{0};

    // 取出一个就绪任务 (普通任务优先, 其次到期定时器)
    bool takeReady(Task& out, Clock::time_point now);
    void execute(Task& task);
};
