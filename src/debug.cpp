/*
 * debug.cpp - Debug output system implementation
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

std::ofstream Debug::m_logfile;
std::mutex Debug::m_mutex;
std::unordered_set<std::string> Debug::m_enabled_channels;
bool Debug::m_all_channels = false;

namespace {

const char* const KNOWN_CHANNELS[] = {"sync", "fseq", "fpp", "http", "player", "config", "io"};

thread_local std::string t_thread_name;

} // namespace

void Debug::init(const std::string& logfile, const std::vector<std::string>& channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!logfile.empty()) {
        m_logfile.open(logfile, std::ios::out | std::ios::app);
        if (!m_logfile.is_open())
            std::cerr << "Debug: cannot open log file " << logfile << ", using stderr" << std::endl;
    }
    for (const auto& channel : channels) {
        if (channel == "all") {
            m_all_channels = true;
        } else {
            if (!isKnownChannel(channel))
                std::cerr << "Debug: unknown channel '" << channel << "'" << std::endl;
            m_enabled_channels.insert(channel);
        }
    }
}

void Debug::shutdown() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open())
        m_logfile.close();
    m_enabled_channels.clear();
    m_all_channels = false;
}

bool Debug::isChannelEnabled(const std::string& channel) {
    return m_all_channels || m_enabled_channels.count(channel) > 0;
}

bool Debug::isKnownChannel(const std::string& channel) {
    for (const char* known : KNOWN_CHANNELS) {
        if (channel == known)
            return true;
    }
    return false;
}

std::vector<std::string> Debug::parseChannelList(const std::string& list) {
    std::vector<std::string> channels;
    std::istringstream ss(list);
    std::string channel;
    while (std::getline(ss, channel, ',')) {
        if (!channel.empty())
            channels.push_back(channel);
    }
    return channels;
}

void Debug::setThreadName(const std::string& name) {
    t_thread_name = name;
}

void Debug::write(const std::string& channel, const char* function, int line, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
    std::time_t timer = std::chrono::system_clock::to_time_t(now);
    std::tm bt{};
    localtime_r(&timer, &bt);

    std::ostringstream ss;
    ss << std::put_time(&bt, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(6) << us.count();
    if (!t_thread_name.empty())
        ss << " <" << t_thread_name << ">";
    ss << " [" << channel << "]";
    if (function)
        ss << " " << function << ":" << line;
    ss << ": " << message;

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_logfile.is_open())
        m_logfile << ss.str() << std::endl;
    else
        std::cerr << ss.str() << std::endl;
}
