/*
 * test_sync_estimator.cpp - Unit tests for the position sync estimator
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"
#include "test_framework.h"
#include <random>

using namespace Eavesdrop;
using namespace Eavesdrop::Sync;
using namespace TestFramework;

namespace {

// Zero round trip, so the status instant is exactly atMs
SyncSample sampleAt(uint64_t sequence, int64_t atMs, int64_t reportedSeconds,
                    const std::string& item = "Wizards.fseq")
{
    SyncSample sample;
    sample.sequence = sequence;
    sample.requestSentAtMs = atMs;
    sample.requestReceivedAtMs = atMs;
    sample.reportedElapsedSeconds = reportedSeconds;
    sample.currentItemId = item;
    return sample;
}

// Status source polled every 220-280ms with 5-120ms of latency each way.
// Its clock runs driftPpm fast against the local one.
class JitteredSource {
public:
    JitteredSource(uint32_t seed, double driftPpm)
        : m_rng(seed), m_drift_ppm(driftPpm)
    {
        m_now_ms = 1000 + static_cast<int64_t>(m_rng() % 4000);
        m_start_ms = m_now_ms - static_cast<int64_t>(m_rng() % 1000);
    }

    SyncSample next()
    {
        const int64_t up = 5 + static_cast<int64_t>(m_rng() % 116);
        const int64_t down = 5 + static_cast<int64_t>(m_rng() % 116);
        const double sourceMs = static_cast<double>(m_now_ms + up - m_start_ms) * (1.0 + m_drift_ppm / 1e6);

        SyncSample sample;
        sample.sequence = ++m_sequence;
        sample.requestSentAtMs = m_now_ms;
        sample.requestReceivedAtMs = m_now_ms + up + down;
        sample.reportedElapsedSeconds = static_cast<int64_t>(std::floor(sourceMs / 1000.0));
        sample.currentItemId = "Wizards.fseq";

        m_now_ms += 220 + static_cast<int64_t>(m_rng() % 61);
        return sample;
    }

    int64_t elapsedMs() const { return m_now_ms - m_start_ms; }

private:
    std::mt19937 m_rng;
    double m_drift_ppm;
    int64_t m_now_ms = 0;
    int64_t m_start_ms = 0;
    uint64_t m_sequence = 0;
};

struct JitterRun {
    int hardSeeks = 0;
    int rateChanges = 0;
    int lateRateChanges = 0;     // after the first minute
    double worstLateErrorMs = 0.0;
};

JitterRun runJittered(SyncEstimator& estimator, JitteredSource& source, int64_t seconds)
{
    JitterRun run;
    while (source.elapsedMs() < seconds * 1000) {
        const bool settled = source.elapsedMs() > 60000;
        CorrectionDecision d = estimator.onPoll(source.next());
        if (d.type == CorrectionType::HardSeek) {
            run.hardSeeks++;
        } else if (d.type == CorrectionType::SoftRate) {
            run.rateChanges++;
            if (settled) {
                run.lateRateChanges++;
            }
        }
        if (settled) {
            run.worstLateErrorMs = std::max(run.worstLateErrorMs, std::fabs(d.errorMs));
        }
    }
    return run;
}

} // namespace

class EstimatorAnchorTest : public TestCase {
public:
    EstimatorAnchorTest() : TestCase("SyncEstimator anchors on the first sample") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        ASSERT_TRUE(estimator.state() == SyncState::Idle, "idle before any poll");

        SyncSample first = sampleAt(1, 1000, 42);
        first.requestReceivedAtMs = 1100;
        CorrectionDecision d = estimator.onPoll(first);

        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "anchor is a hard seek");
        ASSERT_NEAR(42000.0, d.targetMs, 0.0, "target is the reported position");
        ASSERT_NEAR(1.0, d.rateFactor, 0.0, "normal rate");
        ASSERT_TRUE(estimator.model().anchored, "anchored");
        ASSERT_NEAR(1050.0, estimator.model().lastSampleInstantMs, 0.0, "instant is the round trip midpoint");
        ASSERT_NEAR(1050.0, *estimator.model().lastHardSeekAt, 0.0, "cooldown starts at the anchor");
        ASSERT_EQUALS(static_cast<uint64_t>(1), estimator.generation(), "first generation");
        ASSERT_TRUE(estimator.state() == SyncState::Tracking, "tracking");

        PositionSnapshot snap = estimator.snapshot();
        ASSERT_TRUE(snap.playing, "snapshot playing");
        ASSERT_EQUALS(std::string("Wizards.fseq"), snap.itemId, "snapshot item");
        ASSERT_NEAR(43000.0, snap.positionAt(2050.0), 1e-9, "snapshot extrapolates");
    }
};

class EstimatorSteadyTest : public TestCase {
public:
    EstimatorSteadyTest() : TestCase("SyncEstimator rides out whole-second quantization") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));

        const int64_t reported[] = {10, 10, 10, 11};
        uint64_t seq = 2;
        int64_t at = 250;
        for (int64_t r : reported) {
            CorrectionDecision d = estimator.onPoll(sampleAt(seq++, at, r));
            ASSERT_TRUE(d.type != CorrectionType::HardSeek, "no hard seek while in step");
            ASSERT_TRUE(std::fabs(d.errorMs) < 1000.0, "error below the hard seek threshold");
            at += 250;
        }
        ASSERT_NEAR(0.0, estimator.model().estimatedDriftRatePpm, 0.0, "drift untouched without a long baseline");
        ASSERT_EQUALS(static_cast<uint64_t>(1), estimator.generation(), "still the first generation");
        ASSERT_EQUALS(static_cast<uint64_t>(5), estimator.model().sampleCount, "five samples");
    }
};

class EstimatorHardSeekTest : public TestCase {
public:
    EstimatorHardSeekTest() : TestCase("SyncEstimator hard seeks on a large jump") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 37));
        for (int i = 1; i <= 3; ++i) {
            CorrectionDecision d = estimator.onPoll(sampleAt(1 + i, i * 1000, 37 + i));
            ASSERT_TRUE(d.type == CorrectionType::None, "on time");
            ASSERT_NEAR(0.0, d.errorMs, 1e-9, "no error");
        }

        // Someone skipped ahead: predicted ~40100, reported 45000
        CorrectionDecision d = estimator.onPoll(sampleAt(5, 3100, 45));
        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "hard seek");
        ASSERT_NEAR(45000.0, d.targetMs, 0.0, "jump to the reported position");
        ASSERT_NEAR(4900.0, d.errorMs, 1e-9, "error reported");
        ASSERT_NEAR(1.0, d.rateFactor, 0.0, "rate restored");
        ASSERT_NEAR(45000.0, estimator.model().estimatedOffsetMs, 0.0, "offset set exactly");
        ASSERT_NEAR(3100.0, *estimator.model().lastHardSeekAt, 0.0, "cooldown restarted");
        ASSERT_EQUALS(static_cast<uint64_t>(1), estimator.generation(), "a seek is not a new generation");
    }
};

class EstimatorCooldownTest : public TestCase {
public:
    EstimatorCooldownTest() : TestCase("SyncEstimator spaces hard seeks by the cooldown") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));

        // 8.5s of error only 1.5s after the anchor
        CorrectionDecision d = estimator.onPoll(sampleAt(2, 1500, 20));
        ASSERT_TRUE(d.type == CorrectionType::SoftRate, "soft correction during cooldown");
        ASSERT_NEAR(1.02, d.rateFactor, 1e-12, "rate clamped at +2%");
        ASSERT_NEAR(13625.0, estimator.model().estimatedOffsetMs, 1e-9, "offset moves a quarter of the error");

        d = estimator.onPoll(sampleAt(3, 2500, 21));
        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "hard seek once the cooldown has passed");
        ASSERT_NEAR(21000.0, d.targetMs, 0.0, "target");
        ASSERT_NEAR(1.0, estimator.commandedRate(), 0.0, "commanded rate reset by the seek");
    }
};

class EstimatorRateTest : public TestCase {
public:
    EstimatorRateTest() : TestCase("SyncEstimator rate requests") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));

        CorrectionDecision d = estimator.onPoll(sampleAt(2, 400, 11));
        ASSERT_TRUE(d.type == CorrectionType::SoftRate, "600ms behind");
        ASSERT_NEAR(600.0, d.errorMs, 1e-9, "error");
        ASSERT_NEAR(1.012, d.rateFactor, 1e-12, "proportional rate");

        // Same error again: nothing new to command
        d = estimator.onPoll(sampleAt(3, 1250, 12));
        ASSERT_NEAR(600.0, d.errorMs, 1e-9, "error");
        ASSERT_TRUE(d.type == CorrectionType::None, "unchanged rate is not re-issued");
        ASSERT_NEAR(1.012, d.rateFactor, 1e-12, "current rate reported");

        // Below the deadband but above the release threshold the correction keeps running
        d = estimator.onPoll(sampleAt(4, 1300, 12));
        ASSERT_NEAR(400.0, d.errorMs, 1e-9, "error");
        ASSERT_TRUE(d.type == CorrectionType::SoftRate, "rate follows the error");
        ASSERT_NEAR(1.008, d.rateFactor, 1e-12, "smaller correction");

        d = estimator.onPoll(sampleAt(5, 1500, 12));
        ASSERT_NEAR(100.0, d.errorMs, 1e-9, "error");
        ASSERT_TRUE(d.type == CorrectionType::SoftRate, "rate change issued");
        ASSERT_NEAR(1.0, d.rateFactor, 0.0, "back to normal");
    }
};

class EstimatorDeadbandTest : public TestCase {
public:
    EstimatorDeadbandTest() : TestCase("SyncEstimator measures error against the reported second") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));

        // Second 11 began between 0 and 600ms, predicted 10600
        CorrectionDecision d = estimator.onPoll(sampleAt(2, 600, 11));
        ASSERT_NEAR(400.0, d.errorMs, 1e-9, "distance to the start of the second");
        ASSERT_TRUE(d.type == CorrectionType::None, "no correction starts inside the deadband");
        ASSERT_NEAR(1.0, d.rateFactor, 0.0, "normal rate");
        ASSERT_NEAR(10700.0, estimator.model().estimatedOffsetMs, 1e-9, "offset still blended");

        // Predicted 11100 lies inside second 11, nothing to correct
        d = estimator.onPoll(sampleAt(3, 1000, 11));
        ASSERT_NEAR(0.0, d.errorMs, 0.0, "prediction consistent with the report");
        ASSERT_TRUE(d.type == CorrectionType::None, "no correction");
        ASSERT_NEAR(11100.0, estimator.model().estimatedOffsetMs, 1e-9, "offset follows the prediction");

        // Predicted 12800 is past the end of second 11 by 800ms
        d = estimator.onPoll(sampleAt(4, 2700, 11));
        ASSERT_NEAR(-800.0, d.errorMs, 1e-9, "ahead of the reported second");
        ASSERT_TRUE(d.type == CorrectionType::SoftRate, "slow down");
        ASSERT_NEAR(0.984, d.rateFactor, 1e-12, "proportional rate");
    }
};

class EstimatorDriftTest : public TestCase {
public:
    EstimatorDriftTest() : TestCase("SyncEstimator learns drift from second edges") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        // Player clock runs 1% fast: a reported second every 990ms
        estimator.onPoll(sampleAt(1, 0, 10));
        for (int k = 1; k <= 31; ++k) {
            CorrectionDecision d = estimator.onPoll(sampleAt(1 + k, k * 990, 10 + k));
            ASSERT_TRUE(d.type != CorrectionType::HardSeek, "small drift never hard seeks");
            ASSERT_NEAR(0.0, estimator.model().estimatedDriftRatePpm, 0.0, "baseline still too short");
        }
        ASSERT_TRUE(estimator.model().hasDriftBaseline, "first edge is the baseline");
        ASSERT_NEAR(990.0, estimator.model().driftBaselineInstantMs, 0.0, "baseline instant");
        ASSERT_NEAR(11495.0, estimator.model().driftBaselineObservedMs, 1e-9, "baseline is mid-gap");

        // 31 seconds of position over 30690ms of wall time
        estimator.onPoll(sampleAt(33, 32 * 990, 42));
        const double implied = (1000.0 / 990.0 - 1.0) * 1e6;
        ASSERT_NEAR(0.1 * implied, estimator.model().estimatedDriftRatePpm, 1e-6, "first drift update");
        ASSERT_NEAR(990.0, estimator.model().driftBaselineInstantMs, 0.0, "baseline stays put");

        for (int k = 33; k <= 80; ++k) {
            CorrectionDecision d = estimator.onPoll(sampleAt(1 + k, k * 990, 10 + k));
            ASSERT_TRUE(d.type != CorrectionType::HardSeek, "small drift never hard seeks");
        }
        double drift = estimator.model().estimatedDriftRatePpm;
        ASSERT_TRUE(drift > 0.9 * implied && drift <= implied, "drift converges toward the true rate");
        ASSERT_NEAR(90000.0, estimator.model().estimatedOffsetMs, 5.0, "offset follows the fast clock");

        // A new item throws the learned drift away
        CorrectionDecision d = estimator.onPoll(sampleAt(100, 81 * 990, 0, "Carol.fseq"));
        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "new item anchors");
        ASSERT_NEAR(0.0, d.targetMs, 0.0, "new item starts at its own position");
        ASSERT_NEAR(0.0, estimator.model().estimatedDriftRatePpm, 0.0, "drift reset");
        ASSERT_FALSE(estimator.model().hasDriftBaseline, "baseline reset");
        ASSERT_EQUALS(std::string("Carol.fseq"), estimator.model().itemId, "model follows the item");
        ASSERT_EQUALS(static_cast<uint64_t>(2), estimator.generation(), "new generation");
    }
};

class EstimatorDriftClampTest : public TestCase {
public:
    EstimatorDriftClampTest() : TestCase("SyncEstimator bounds implied drift") {}

protected:
    void runTest() override {
        Core::SyncConfig config;
        config.hardSeekThresholdMs = 1e9;  // keep every sample soft
        config.minDriftBaselineMs = 1000;
        SyncEstimator estimator(config);
        estimator.onPoll(sampleAt(1, 0, 0));
        estimator.onPoll(sampleAt(2, 1000, 1));
        // A reported second every 100ms implies about +8500000ppm
        for (int j = 1; j <= 10; ++j) {
            estimator.onPoll(sampleAt(2 + j, 1000 + 100 * j, 1 + j));
        }
        ASSERT_NEAR(0.1 * 20000.0, estimator.model().estimatedDriftRatePpm, 1e-9, "implied drift clamped");
    }
};

class EstimatorJitterTest : public TestCase {
public:
    EstimatorJitterTest() : TestCase("SyncEstimator holds rate steady under poll jitter") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        JitteredSource source(20251017, 0.0);
        JitterRun run = runJittered(estimator, source, 600);

        ASSERT_EQUALS(1, run.hardSeeks, "only the anchor seeks");
        ASSERT_TRUE(run.rateChanges <= 10, "rate changes limited to the start");
        ASSERT_EQUALS(0, run.lateRateChanges, "no rate changes once settled");
        ASSERT_TRUE(run.worstLateErrorMs < 250.0, "settled error well inside the deadband");
        ASSERT_NEAR(1.0, estimator.commandedRate(), 0.0, "normal rate");
        ASSERT_NEAR(0.0, estimator.model().estimatedDriftRatePpm, 300.0, "no drift learned");
    }
};

class EstimatorJitterDriftTest : public TestCase {
public:
    EstimatorJitterDriftTest() : TestCase("SyncEstimator converges on drift under poll jitter") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        JitteredSource source(20251017, 1000.0);
        JitterRun run = runJittered(estimator, source, 1800);

        ASSERT_EQUALS(1, run.hardSeeks, "only the anchor seeks");
        ASSERT_EQUALS(0, run.lateRateChanges, "drift absorbed without rate changes");
        ASSERT_TRUE(run.worstLateErrorMs < 250.0, "settled error well inside the deadband");
        ASSERT_NEAR(1000.0, estimator.model().estimatedDriftRatePpm, 200.0, "drift near +1000ppm");
    }
};

class EstimatorStaleTest : public TestCase {
public:
    EstimatorStaleTest() : TestCase("SyncEstimator discards out-of-order polls") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(5, 0, 10));
        estimator.onPoll(sampleAt(6, 1000, 11));
        const double offset = estimator.model().estimatedOffsetMs;

        CorrectionDecision d = estimator.onPoll(sampleAt(6, 1200, 99));
        ASSERT_TRUE(d.type == CorrectionType::Discarded, "repeated sequence");
        d = estimator.onPoll(sampleAt(3, 1300, 99));
        ASSERT_TRUE(d.type == CorrectionType::Discarded, "older sequence");
        ASSERT_FALSE(d.isCorrection(), "discard is not a correction");

        ASSERT_NEAR(offset, estimator.model().estimatedOffsetMs, 0.0, "model untouched");
        ASSERT_EQUALS(static_cast<uint64_t>(2), estimator.model().sampleCount, "samples not counted");
        ASSERT_EQUALS(static_cast<int64_t>(11), estimator.model().lastReportedSeconds, "last report kept");
    }
};

class EstimatorFailureTest : public TestCase {
public:
    EstimatorFailureTest() : TestCase("SyncEstimator poll failures") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));
        estimator.onPoll(sampleAt(2, 400, 11));
        const double offset = estimator.model().estimatedOffsetMs;
        const double rate = estimator.commandedRate();

        CorrectionDecision d = estimator.onPollFailed();
        ASSERT_TRUE(d.type == CorrectionType::SourceUnreachable, "first failure");
        ASSERT_TRUE(estimator.state() == SyncState::Unreachable, "unreachable");
        ASSERT_NEAR(rate, d.rateFactor, 0.0, "rate carried");
        d = estimator.onPollFailed();
        ASSERT_TRUE(d.type == CorrectionType::SourceUnreachable, "second failure");
        d = estimator.onPollFailed();
        ASSERT_TRUE(d.type == CorrectionType::LostSync, "third failure loses sync");
        ASSERT_TRUE(estimator.state() == SyncState::LostSync, "lost");
        ASSERT_EQUALS(3, estimator.consecutiveFailures(), "failure count");

        ASSERT_TRUE(estimator.model().anchored, "model kept through failures");
        ASSERT_NEAR(offset, estimator.model().estimatedOffsetMs, 0.0, "offset untouched");
        ASSERT_TRUE(estimator.snapshot().syncState == SyncState::LostSync, "snapshot carries the state");

        d = estimator.onPoll(sampleAt(3, 1400, 12));
        ASSERT_TRUE(d.type != CorrectionType::Discarded, "recovery poll used");
        ASSERT_TRUE(estimator.state() == SyncState::Tracking, "tracking again");
        ASSERT_EQUALS(0, estimator.consecutiveFailures(), "failures cleared");
        ASSERT_EQUALS(static_cast<uint64_t>(1), estimator.generation(), "recovery does not re-anchor");
    }
};

class EstimatorIdleTest : public TestCase {
public:
    EstimatorIdleTest() : TestCase("SyncEstimator idle and item changes") {}

protected:
    void runTest() override {
        SyncEstimator estimator{Core::SyncConfig()};
        estimator.onPoll(sampleAt(1, 0, 10));
        estimator.onPoll(sampleAt(2, 400, 11));
        estimator.onPollFailed();

        estimator.onIdle();
        ASSERT_FALSE(estimator.model().anchored, "model cleared");
        ASSERT_TRUE(estimator.state() == SyncState::Idle, "idle");
        ASSERT_NEAR(1.0, estimator.commandedRate(), 0.0, "rate reset");
        ASSERT_EQUALS(0, estimator.consecutiveFailures(), "failures reset");
        ASSERT_FALSE(estimator.snapshot().playing, "snapshot not playing");

        CorrectionDecision d = estimator.onPoll(sampleAt(3, 5000, 0));
        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "re-anchor after idle");
        ASSERT_EQUALS(static_cast<uint64_t>(2), estimator.generation(), "new generation after idle");

        estimator.onItemChanged();
        ASSERT_FALSE(estimator.model().anchored, "item change clears the model");
        d = estimator.onPoll(sampleAt(4, 6000, 0, "Next.fseq"));
        ASSERT_TRUE(d.type == CorrectionType::HardSeek, "anchor on the new item");
        ASSERT_EQUALS(static_cast<uint64_t>(3), estimator.generation(), "generation per anchor");

        ASSERT_EQUALS(std::string("hardSeek"), std::string(correctionTypeName(CorrectionType::HardSeek)), "name");
        ASSERT_EQUALS(std::string("lost"), std::string(syncStateName(SyncState::LostSync)), "state name");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("Sync Estimator Tests");

    suite.addTest(std::make_unique<EstimatorAnchorTest>());
    suite.addTest(std::make_unique<EstimatorSteadyTest>());
    suite.addTest(std::make_unique<EstimatorHardSeekTest>());
    suite.addTest(std::make_unique<EstimatorCooldownTest>());
    suite.addTest(std::make_unique<EstimatorRateTest>());
    suite.addTest(std::make_unique<EstimatorDeadbandTest>());
    suite.addTest(std::make_unique<EstimatorDriftTest>());
    suite.addTest(std::make_unique<EstimatorDriftClampTest>());
    suite.addTest(std::make_unique<EstimatorJitterTest>());
    suite.addTest(std::make_unique<EstimatorJitterDriftTest>());
    suite.addTest(std::make_unique<EstimatorStaleTest>());
    suite.addTest(std::make_unique<EstimatorFailureTest>());
    suite.addTest(std::make_unique<EstimatorIdleTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
