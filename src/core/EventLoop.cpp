#include "core/EventLoop.h"
#include "utils/Logger.h"
#include <thread>

EventLoop::~EventLoop() {
    stop();
    // Background jobs capture this; wait for them before members go away.
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait(lock, [this] { return runningJobs.load() == 0; });
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        tasks.push_back(std::move(task));
    }
    cv.notify_all();
}

EventLoop::TimerId EventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        id = ++nextTimerId;
        timers.emplace(Clock::now() + delay, Timer{id, std::move(task)});
    }
    cv.notify_all();
    return id;
}

void EventLoop::cancelTimer(TimerId id) {
    std::lock_guard<std::mutex> lock(mtx);
    for (auto it = timers.begin(); it != timers.end(); ++it) {
        if (it->second.id == id) {
            timers.erase(it);
            return;
        }
    }
}

void EventLoop::runInBackground(Task work) {
    runningJobs.fetch_add(1);
    std::thread([this, work = std::move(work)]() mutable {
        try {
            work();
        } catch (const std::exception& e) {
            Logger::getInstance().error(std::string("Background job failed: ") + e.what());
        }
        // 捕获的状态先释放; 计数归零后析构函数可能立即销毁 mtx/cv, 之后不能再碰 this
        work = nullptr;
        std::lock_guard<std::mutex> lock(mtx);
        runningJobs.fetch_sub(1);
        cv.notify_all();
    }).detach();
}

void EventLoop::stop() {
    stopped.store(true);
    cv.notify_all();
}

size_t EventLoop::pendingTimers() const {
    std::lock_guard<std::mutex> lock(mtx);
    return timers.size();
}

bool EventLoop::takeReady(Task& out, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!tasks.empty()) {
        out = std::move(tasks.front());
        tasks.pop_front();
        return true;
    }
    if (!timers.empty() && timers.begin()->first <= now) {
        out = std::move(timers.begin()->second.task);
        timers.erase(timers.begin());
        return true;
    }
    return false;
}

void EventLoop::execute(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Event loop task failed: ") + e.what());
    }
}

void EventLoop::run() {
    while (!stopped.load()) {
        Task task;
        if (takeReady(task, Clock::now())) {
            execute(task);
            continue;
        }

        std::unique_lock<std::mutex> lock(mtx);
        if (stopped.load() || !tasks.empty()) continue;
        // schedule() notifies, so an earlier timer added meanwhile is seen on the next pass.
        if (timers.empty()) {
            cv.wait(lock);
        } else {
            auto wakeAt = timers.begin()->first;
            cv.wait_until(lock, wakeAt);
        }
    }
}

void EventLoop::runUntilIdle() {
    while (true) {
        Task task;
        if (takeReady(task, Clock::now())) {
            execute(task);
            continue;
        }

        std::unique_lock<std::mutex> lock(mtx);
        if (tasks.empty() && runningJobs.load() == 0) return;
        cv.wait(lock, [this] { return !tasks.empty() || runningJobs.load() == 0; });
    }
}

void EventLoop::runFor(std::chrono::milliseconds duration) {
    auto deadline = Clock::now() + duration;
    while (Clock::now() < deadline) {
        Task task;
        if (takeReady(task, Clock::now())) {
            execute(task);
            continue;
        }

        std::unique_lock<std::mutex> lock(mtx);
        if (!tasks.empty()) continue;
        auto wakeAt = deadline;
        if (!timers.empty() && timers.begin()->first < wakeAt) {
            wakeAt = timers.begin()->first;
        }
        cv.wait_until(lock, wakeAt);
    }
}
