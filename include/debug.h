/*
 * debug.h - Debug output system header
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DEBUG_H
#define DEBUG_H

// No direct #include <mutex>
#include <iostream>
#include <unordered_set>
#include <sstream>
// should be in eavesdrop.h

/**
 * @brief Channel-filtered diagnostic logger.
 *
 * Channels in use: "sync", "fseq", "fpp", "http", "player", "config", "io".
 * The special channel "all" enables every channel. Output goes to stderr
 * unless a log file was given to init(); stdout is reserved for the event
 * stream.
 *
 * init() must run before any worker thread logs. Lines written from a
 * thread that called setThreadName() carry that name in angle brackets.
 */
class Debug {
public:
    static void init(const std::string& logfile, const std::vector<std::string>& channels);
    static void shutdown();

    static bool isChannelEnabled(const std::string& channel);
    static bool isKnownChannel(const std::string& channel);

    // "sync,,fpp," -> {"sync", "fpp"}
    static std::vector<std::string> parseChannelList(const std::string& list);

    static void setThreadName(const std::string& name);

    template<typename... Args>
    static void log(const std::string& channel, Args&&... args) {
        if (isChannelEnabled(channel))
            write(channel, nullptr, 0, format(std::forward<Args>(args)...));
    }

    // Same as log() with the calling function and line; see DEBUG_LOG
    template<typename... Args>
    static void logAt(const std::string& channel, const char* function, int line, Args&&... args) {
        if (isChannelEnabled(channel))
            write(channel, function, line, format(std::forward<Args>(args)...));
    }

private:
    template<typename... Args>
    static std::string format(Args&&... args) {
        std::ostringstream ss;
        if constexpr (sizeof...(args) > 0) {
            (ss << ... << args);
        }
        return ss.str();
    }

    static void write(const std::string& channel, const char* function, int line, const std::string& message);

    static std::ofstream m_logfile;
    static std::mutex m_mutex;
    static std::unordered_set<std::string> m_enabled_channels;
    static bool m_all_channels;
};

#define DEBUG_LOG(channel, ...) Debug::logAt(channel, __FUNCTION__, __LINE__, __VA_ARGS__)

// Arguments are not evaluated when the channel is off
#define DEBUG_LOG_LAZY(channel, ...) \
    do { \
        if (Debug::isChannelEnabled(channel)) { \
            Debug::log(channel, __VA_ARGS__); \
        } \
    } while(0)

#endif // DEBUG_H
