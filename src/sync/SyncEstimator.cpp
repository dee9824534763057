/*
 * SyncEstimator.cpp - Position sync estimator
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 *
 * Permission to use, copy, modify, and/or distribute this software for
 * any purpose with or without fee is hereby granted, provided that
 * the above copyright notice and this permission notice appear in all
 * copies.
 *
 * THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL
 * WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE
 * AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL
 * DAMAGES OR ANY DAMAGES WHATSOEVER RESULTING FROM LOSS OF USE, DATA
 * OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER
 * TORTIOUS ACTION, ARISING OUT OF OR IN CONNECTION WITH THE USE OR
 * PERFORMANCE OF THIS SOFTWARE.
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Sync {

const char* correctionTypeName(CorrectionType type)
{
    switch (type) {
        case CorrectionType::None: return "none";
        case CorrectionType::HardSeek: return "hardSeek";
        case CorrectionType::SoftRate: return "softRate";
        case CorrectionType::SourceUnreachable: return "sourceUnreachable";
        case CorrectionType::LostSync: return "lostSync";
        case CorrectionType::Discarded: return "discarded";
    }
    return "unknown";
}

SyncEstimator::SyncEstimator(const Core::SyncConfig& config)
    : m_config(config)
{
}

CorrectionDecision SyncEstimator::onPoll(const SyncSample& sample)
{
    CorrectionDecision decision;

    if (sample.sequence <= m_last_sequence) {
        Debug::log("sync", "SyncEstimator: discarding stale poll #", sample.sequence,
                   " (last processed #", m_last_sequence, ")");
        decision.type = CorrectionType::Discarded;
        return decision;
    }
    m_last_sequence = sample.sequence;
    m_consecutive_failures = 0;
    m_state = SyncState::Tracking;

    const double instant = sample.statusInstantMs();
    const double observed = static_cast<double>(sample.reportedElapsedSeconds) * 1000.0;

    if (m_model.anchored && sample.currentItemId != m_model.itemId) {
        Debug::log("sync", "SyncEstimator: item changed from '", m_model.itemId, "' to '",
                   sample.currentItemId, "', resetting model");
        m_model.reset(sample.currentItemId);
    }
    if (!m_model.anchored) {
        return anchor(sample, instant, observed);
    }

    const double predicted = m_model.positionAt(instant);
    const double gap = instant - m_model.lastSampleInstantMs;
    const bool secondEdge = sample.reportedElapsedSeconds == m_model.lastReportedSeconds + 1 && gap > 0.0;

    // Source position consistent with the report
    const double lower = observed;
    const double upper = observed + (secondEdge ? std::min(gap, 1000.0) : 1000.0);
    double error = 0.0;
    if (predicted < lower) {
        error = lower - predicted;
    } else if (predicted > upper) {
        error = upper - predicted;
    }
    decision.errorMs = error;

    const bool cooledDown = !m_model.lastHardSeekAt ||
                            instant - *m_model.lastHardSeekAt >= static_cast<double>(m_config.hardSeekCooldownMs);

    if (std::fabs(error) >= m_config.hardSeekThresholdMs && cooledDown) {
        m_model.estimatedOffsetMs = observed;
        m_model.lastHardSeekAt = instant;
        m_model.hasDriftBaseline = false;
        m_commanded_rate = 1.0;

        decision.type = CorrectionType::HardSeek;
        decision.targetMs = observed;
        decision.rateFactor = 1.0;
        Debug::log("sync", "SyncEstimator: hard seek to ", observed, "ms (error ", error, "ms)");
    } else {
        m_model.estimatedOffsetMs = predicted + m_config.offsetBlend * error;
        if (secondEdge) {
            updateDrift(instant, observed + std::min(gap, 1000.0) / 2.0);
        }

        double rate = m_commanded_rate;
        if (secondEdge || error != 0.0) {
            rate = requestedRate(error);
        }
        if (std::fabs(rate - m_commanded_rate) >= m_config.minRateStep) {
            m_commanded_rate = rate;
            decision.type = CorrectionType::SoftRate;
            decision.rateFactor = rate;
            Debug::log("sync", "SyncEstimator: rate ", rate, " (error ", error, "ms)");
        } else {
            decision.type = CorrectionType::None;
            decision.rateFactor = m_commanded_rate;
        }
    }

    m_model.lastSampleInstantMs = instant;
    m_model.lastReportedSeconds = sample.reportedElapsedSeconds;
    m_model.sampleCount++;

    DEBUG_LOG_LAZY("sync", "SyncEstimator: #", sample.sequence, " reported ", sample.reportedElapsedSeconds,
                   "s predicted ", predicted, "ms error ", error, "ms drift ", m_model.estimatedDriftRatePpm, "ppm");
    return decision;
}

CorrectionDecision SyncEstimator::anchor(const SyncSample& sample, double instant, double observed)
{
    m_model.reset(sample.currentItemId);
    m_model.anchored = true;
    m_model.estimatedOffsetMs = observed;
    m_model.lastSampleInstantMs = instant;
    m_model.lastReportedSeconds = sample.reportedElapsedSeconds;
    m_model.lastHardSeekAt = instant;
    m_model.sampleCount = 1;
    m_commanded_rate = 1.0;
    m_generation++;

    Debug::log("sync", "SyncEstimator: anchored '", sample.currentItemId, "' at ", observed,
               "ms (generation ", m_generation, ")");

    CorrectionDecision decision;
    decision.type = CorrectionType::HardSeek;
    decision.targetMs = observed;
    decision.rateFactor = 1.0;
    return decision;
}

void SyncEstimator::updateDrift(double instant, double edgePositionMs)
{
    if (!m_model.hasDriftBaseline) {
        m_model.hasDriftBaseline = true;
        m_model.driftBaselineInstantMs = instant;
        m_model.driftBaselineObservedMs = edgePositionMs;
        return;
    }

    const double span = instant - m_model.driftBaselineInstantMs;
    if (span < static_cast<double>(m_config.minDriftBaselineMs)) {
        return;
    }

    double implied = ((edgePositionMs - m_model.driftBaselineObservedMs) / span - 1.0) * 1e6;
    implied = std::max(-m_config.maxDriftPpm, std::min(m_config.maxDriftPpm, implied));
    m_model.estimatedDriftRatePpm += m_config.driftBlend * (implied - m_model.estimatedDriftRatePpm);
}

double SyncEstimator::requestedRate(double errorMs) const
{
    // Hysteresis: a correction in progress runs until the error is well inside the deadband
    const double threshold = m_commanded_rate != 1.0 ? m_config.deadbandReleaseMs : m_config.deadbandMs;
    if (std::fabs(errorMs) < threshold) {
        return 1.0;
    }
    double adjust = errorMs * m_config.rateGainPerMs;
    adjust = std::max(-m_config.maxRateAdjust, std::min(m_config.maxRateAdjust, adjust));
    return 1.0 + adjust;
}

CorrectionDecision SyncEstimator::onPollFailed()
{
    m_consecutive_failures++;

    CorrectionDecision decision;
    decision.rateFactor = m_commanded_rate;
    if (m_consecutive_failures >= m_config.lostSyncFailureCount) {
        decision.type = CorrectionType::LostSync;
        m_state = SyncState::LostSync;
    } else {
        decision.type = CorrectionType::SourceUnreachable;
        m_state = SyncState::Unreachable;
    }
    Debug::log("sync", "SyncEstimator: poll failed (", m_consecutive_failures, " in a row)");
    return decision;
}

void SyncEstimator::onItemChanged()
{
    Debug::log("sync", "SyncEstimator: item change, model reset");
    m_model.reset(std::string());
}

void SyncEstimator::onIdle()
{
    Debug::log("sync", "SyncEstimator: idle, model reset");
    m_model.reset(std::string());
    m_commanded_rate = 1.0;
    m_consecutive_failures = 0;
    m_state = SyncState::Idle;
}

PositionSnapshot SyncEstimator::snapshot() const
{
    PositionSnapshot snap;
    snap.generation = m_generation;
    snap.itemId = m_model.itemId;
    snap.playing = m_model.anchored;
    snap.offsetMs = m_model.estimatedOffsetMs;
    snap.driftPpm = m_model.estimatedDriftRatePpm;
    snap.instantMs = m_model.lastSampleInstantMs;
    snap.syncState = m_state;
    return snap;
}

} // namespace Sync
} // namespace Eavesdrop
