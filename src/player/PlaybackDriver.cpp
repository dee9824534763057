/*
 * PlaybackDriver.cpp - Poll/correct cycle of the playback client
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Player {

PlaybackDriver::PlaybackDriver(const Core::SyncConfig& config,
                               FPP::StatusSource& source,
                               Sync::PositionCell& cell,
                               CorrectionSink& sink,
                               Clock clock)
    : m_status_timeout_ms(config.statusTimeoutMs),
      m_source(source),
      m_cell(cell),
      m_sink(sink),
      m_clock(std::move(clock)),
      m_estimator(config)
{
}

void PlaybackDriver::pollOnce()
{
    ++m_sequence;
    const int64_t sentAt = m_clock();
    std::optional<FPP::PlaybackStatus> status = m_source.fetchStatus();
    const int64_t receivedAt = m_clock();

    if (status && receivedAt - sentAt > m_status_timeout_ms) {
        Debug::log("player", "PlaybackDriver: poll #", m_sequence, " took ", receivedAt - sentAt,
                   "ms, treating as failed");
        status.reset();
    }

    if (!status) {
        handleFailure();
    } else if (!status->isPlaying) {
        handleIdle();
    } else {
        handlePlaying(*status, sentAt, receivedAt);
    }

    m_cell.publish(m_estimator.snapshot());
}

void PlaybackDriver::handleFailure()
{
    const Sync::SyncState before = m_estimator.state();
    Sync::CorrectionDecision decision = m_estimator.onPollFailed();
    if (m_estimator.state() == before) {
        return;
    }
    emit(decision.type == Sync::CorrectionType::LostSync ? CorrectionEventType::LostSync
                                                         : CorrectionEventType::SourceUnreachable,
         &decision);
}

void PlaybackDriver::handleIdle()
{
    if (m_estimator.state() != Sync::SyncState::Idle || m_estimator.model().anchored) {
        m_estimator.onIdle();
    }
    if (m_playing) {
        Debug::log("player", "PlaybackDriver: '", m_item, "' finished, idle");
        m_playing = false;
        m_item.clear();
        emit(CorrectionEventType::Idle);
    }
}

void PlaybackDriver::handlePlaying(const FPP::PlaybackStatus& status, int64_t sentAt, int64_t receivedAt)
{
    const Sync::SyncState before = m_estimator.state();

    if (!m_playing) {
        Debug::log("player", "PlaybackDriver: playback started: ", status.currentItemId);
        m_estimator.onItemChanged();
    } else if (status.currentItemId != m_item) {
        Debug::log("player", "PlaybackDriver: item changed: ", m_item, " -> ", status.currentItemId);
        m_estimator.onItemChanged();
    }
    m_playing = true;
    m_item = status.currentItemId;

    Sync::SyncSample sample;
    sample.sequence = m_sequence;
    sample.requestSentAtMs = sentAt;
    sample.requestReceivedAtMs = receivedAt;
    sample.reportedElapsedSeconds = status.elapsedSeconds;
    sample.currentItemId = status.currentItemId;

    Sync::CorrectionDecision decision = m_estimator.onPoll(sample);

    if (before == Sync::SyncState::Unreachable || before == Sync::SyncState::LostSync) {
        emit(CorrectionEventType::Recovered, &decision);
    }

    switch (decision.type) {
        case Sync::CorrectionType::HardSeek:
            emit(CorrectionEventType::HardSeek, &decision);
            break;
        case Sync::CorrectionType::SoftRate:
            emit(CorrectionEventType::SoftRate, &decision);
            break;
        default:
            break;
    }
}

void PlaybackDriver::emit(CorrectionEventType type, const Sync::CorrectionDecision* decision)
{
    CorrectionEvent event;
    event.type = type;
    event.itemId = m_item;
    if (decision) {
        event.targetMs = decision->targetMs;
        event.rateFactor = decision->rateFactor;
        event.errorMs = decision->errorMs;
    }
    m_sink.onCorrection(event);
}

} // namespace Player
} // namespace Eavesdrop
