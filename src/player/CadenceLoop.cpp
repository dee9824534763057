/*
 * CadenceLoop.cpp - Fixed-period task runner
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Player {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

CadenceLoop::CadenceLoop(std::string name, std::chrono::milliseconds period, Task task)
    : m_name(std::move(name)), m_period(period), m_task(std::move(task))
{
    if (m_period.count() <= 0) {
        m_period = std::chrono::milliseconds(1);
    }
}

CadenceLoop::~CadenceLoop()
{
    stop();
}

void CadenceLoop::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running) {
        return; // Already running
    }
    m_running = true;
    m_thread = std::thread(&CadenceLoop::threadFunc, this);
}

void CadenceLoop::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return; // Already stopped
        }
        m_running = false;
    }

    m_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void CadenceLoop::threadFunc()
{
    Debug::setThreadName(m_name);
    Debug::log("player", "CadenceLoop[", m_name, "]: started, period ", m_period.count(), "ms");

    auto next = std::chrono::steady_clock::now();
    while (m_running) {
        try {
            m_task();
        } catch (const std::exception& e) {
            Debug::log("player", "CadenceLoop[", m_name, "]: task failed: ", e.what());
        }
        m_ticks.fetch_add(1);

        next += m_period;
        auto now = std::chrono::steady_clock::now();
        if (next < now) {
            next = now;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_until(lock, next, [this]() { return !m_running; });
    }

    Debug::log("player", "CadenceLoop[", m_name, "]: stopped after ", m_ticks.load(), " ticks");
}

} // namespace Player
} // namespace Eavesdrop
