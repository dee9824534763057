/*
 * SyncEstimator.h - Position sync estimator
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

#ifndef SYNCESTIMATOR_H
#define SYNCESTIMATOR_H

namespace Eavesdrop {
namespace Sync {

// No direct includes - all includes should be in eavesdrop.h

enum class CorrectionType {
    None,               // keep going as commanded
    HardSeek,           // jump to targetMs
    SoftRate,           // play at rateFactor
    SourceUnreachable,  // poll failed, nothing changed
    LostSync,           // several polls failed in a row
    Discarded           // poll arrived out of order and was ignored
};

const char* correctionTypeName(CorrectionType type);

struct CorrectionDecision {
    CorrectionType type = CorrectionType::None;
    double targetMs = 0.0;     // HardSeek
    double rateFactor = 1.0;   // SoftRate, and 1.0 after a HardSeek
    double errorMs = 0.0;      // distance from the prediction to the reported second

    bool isCorrection() const {
        return type == CorrectionType::HardSeek || type == CorrectionType::SoftRate;
    }
};

/**
 * @brief Turns whole-second status polls into a smooth position estimate.
 *
 * A report of N seconds only says the source is somewhere in
 * [N*1000, N*1000 + 1000). When the reported second has just ticked over
 * since the previous poll the interval narrows to the time between the
 * two polls. The error of a sample is the distance from the predicted
 * position to that interval, zero when the prediction lies inside it.
 *
 * Large errors cause a hard seek, rate-limited by a cooldown; everything
 * else is absorbed by blending the offset and by a small bounded playback
 * rate change. The rate leaves 1.0 only when the error reaches deadbandMs
 * and returns to 1.0 once it falls below deadbandReleaseMs. A sample with
 * no error that is not on a second edge carries no news and leaves the
 * rate alone.
 *
 * Drift is measured from a fixed baseline: the first second edge after
 * the anchor or the last hard seek. Each later edge at least
 * minDriftBaselineMs after it gives an implied rate over the whole span,
 * so the edge timing uncertainty shrinks as playback goes on.
 *
 * Not thread-safe; owned by the poll loop.
 */
class SyncEstimator {
public:
    explicit SyncEstimator(const Core::SyncConfig& config);

    CorrectionDecision onPoll(const SyncSample& sample);

    /**
     * @brief A poll that did not produce a status.
     *
     * Leaves the model untouched.
     */
    CorrectionDecision onPollFailed();

    void onItemChanged();
    void onIdle();

    const DriftModel& model() const { return m_model; }
    double commandedRate() const { return m_commanded_rate; }
    int consecutiveFailures() const { return m_consecutive_failures; }
    SyncState state() const { return m_state; }
    uint64_t generation() const { return m_generation; }

    PositionSnapshot snapshot() const;

private:
    CorrectionDecision anchor(const SyncSample& sample, double instant, double observed);
    void updateDrift(double instant, double edgePositionMs);
    double requestedRate(double errorMs) const;

    Core::SyncConfig m_config;
    DriftModel m_model;
    double m_commanded_rate = 1.0;
    uint64_t m_last_sequence = 0;
    int m_consecutive_failures = 0;
    SyncState m_state = SyncState::Idle;
    uint64_t m_generation = 0;
};

} // namespace Sync
} // namespace Eavesdrop

#endif // SYNCESTIMATOR_H
