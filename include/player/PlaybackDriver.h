/*
 * PlaybackDriver.h - Poll/correct cycle of the playback client
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef PLAYBACKDRIVER_H
#define PLAYBACKDRIVER_H

namespace Eavesdrop {
namespace Player {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief One poll of the status source per call, feeding the estimator.
 *
 * The driver is the only writer of the PositionCell. Failure signals are
 * only emitted when the sync state changes, so a dead source produces one
 * "unreachable" and one "lost sync" event rather than one per cycle.
 */
class PlaybackDriver {
public:
    PlaybackDriver(const Core::SyncConfig& config,
                   FPP::StatusSource& source,
                   Sync::PositionCell& cell,
                   CorrectionSink& sink,
                   Clock clock = steadyNowMs);

    /**
     * @brief Run one poll cycle and publish the resulting snapshot.
     */
    void pollOnce();

    const Sync::SyncEstimator& estimator() const { return m_estimator; }
    bool isPlaying() const { return m_playing; }
    const std::string& currentItem() const { return m_item; }
    uint64_t pollCount() const { return m_sequence; }

private:
    void handleFailure();
    void handleIdle();
    void handlePlaying(const FPP::PlaybackStatus& status, int64_t sentAt, int64_t receivedAt);
    void emit(CorrectionEventType type, const Sync::CorrectionDecision* decision = nullptr);

    long m_status_timeout_ms;
    FPP::StatusSource& m_source;
    Sync::PositionCell& m_cell;
    CorrectionSink& m_sink;
    Clock m_clock;

    Sync::SyncEstimator m_estimator;
    uint64_t m_sequence = 0;
    bool m_playing = false;
    std::string m_item;
};

} // namespace Player
} // namespace Eavesdrop

#endif // PLAYBACKDRIVER_H
