/*
 * CadenceLoop.h - Fixed-period task runner
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef CADENCELOOP_H
#define CADENCELOOP_H

namespace Eavesdrop {
namespace Player {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief Millisecond clock used by the loops; injectable for tests.
 */
using Clock = std::function<int64_t()>;

/**
 * @brief Milliseconds on the monotonic clock.
 */
int64_t steadyNowMs();

/**
 * @brief Runs a task every period on its own thread.
 *
 * The loop sleeps for whatever is left of the period after the task
 * returns. A task that overruns its period is not run twice to catch up.
 * Exceptions thrown by the task are logged and the loop carries on.
 */
class CadenceLoop {
public:
    using Task = std::function<void()>;

    CadenceLoop(std::string name, std::chrono::milliseconds period, Task task);
    ~CadenceLoop();

    CadenceLoop(const CadenceLoop&) = delete;
    CadenceLoop& operator=(const CadenceLoop&) = delete;

    /**
     * @brief Start the thread; does nothing if already running.
     */
    void start();

    /**
     * @brief Stop and join. Returns once any running task has finished.
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    uint64_t tickCount() const { return m_ticks.load(); }
    const std::string& name() const { return m_name; }

private:
    void threadFunc();

    std::string m_name;
    std::chrono::milliseconds m_period;
    Task m_task;

    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<bool> m_running{false};
    std::atomic<uint64_t> m_ticks{0};
};

} // namespace Player
} // namespace Eavesdrop

#endif // CADENCELOOP_H
