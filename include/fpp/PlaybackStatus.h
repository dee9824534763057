/*
 * PlaybackStatus.h - Authoritative playback status and its source
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef PLAYBACKSTATUS_H
#define PLAYBACKSTATUS_H

namespace Eavesdrop {
namespace FPP {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief One status report from the show-playback daemon.
 *
 * elapsedSeconds has whole-second resolution; the true position lies
 * anywhere in [elapsedSeconds, elapsedSeconds + 1).
 */
struct PlaybackStatus {
    // Daemon status codes
    static constexpr int STATUS_IDLE = 0;
    static constexpr int STATUS_PLAYING = 1;
    static constexpr int STATUS_STOPPING = 2;

    bool isPlaying = false;
    std::string currentItemId;
    int64_t elapsedSeconds = 0;
    int daemonStatus = STATUS_IDLE;
};

/**
 * @brief Anything that can report the authoritative playback position.
 */
class StatusSource {
public:
    virtual ~StatusSource() = default;

    /**
     * @brief Fetch the current status.
     *
     * Must return within the source's timeout.
     * @return std::nullopt if the source could not be reached or answered
     *         with something unusable
     */
    virtual std::optional<PlaybackStatus> fetchStatus() = 0;
};

} // namespace FPP
} // namespace Eavesdrop

#endif // PLAYBACKSTATUS_H
