/*
 * DriftModel.h - Offset and drift state of the position estimator
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef DRIFTMODEL_H
#define DRIFTMODEL_H

namespace Eavesdrop {
namespace Sync {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief One status poll as seen by the estimator.
 *
 * Times are milliseconds on the local monotonic clock.
 */
struct SyncSample {
    uint64_t sequence = 0;            // strictly increasing per poll
    int64_t requestSentAtMs = 0;
    int64_t requestReceivedAtMs = 0;
    int64_t reportedElapsedSeconds = 0;
    std::string currentItemId;

    /**
     * @brief Midpoint of the request interval.
     */
    double statusInstantMs() const {
        return requestSentAtMs + (requestReceivedAtMs - requestSentAtMs) / 2.0;
    }
};

/**
 * @brief Believed playback position of the current item.
 *
 * Valid only for samples taken since the last reset; a reset discards
 * everything including the drift estimate.
 */
struct DriftModel {
    std::string itemId;
    bool anchored = false;
    double estimatedOffsetMs = 0.0;       // position at lastSampleInstantMs
    double estimatedDriftRatePpm = 0.0;
    std::optional<double> lastHardSeekAt;
    uint64_t sampleCount = 0;
    double lastSampleInstantMs = 0.0;
    int64_t lastReportedSeconds = -1;

    // First second edge after the anchor or the last hard seek
    bool hasDriftBaseline = false;
    double driftBaselineInstantMs = 0.0;
    double driftBaselineObservedMs = 0.0;   // source position at that edge, mid-gap

    void reset(const std::string& item) {
        *this = DriftModel();
        itemId = item;
    }

    /**
     * @brief Extrapolated position at a local instant.
     */
    double positionAt(double instantMs) const {
        return estimatedOffsetMs + (instantMs - lastSampleInstantMs) * (1.0 + estimatedDriftRatePpm / 1e6);
    }
};

} // namespace Sync
} // namespace Eavesdrop

#endif // DRIFTMODEL_H
