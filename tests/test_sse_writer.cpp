/*
 * test_sse_writer.cpp - Unit tests for server-sent event output
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"
#include "test_framework.h"

using namespace Eavesdrop::Player;
using namespace TestFramework;
using json = nlohmann::json;

namespace {

// JSON carried on the data: line of a single event
json dataOf(const std::string& text)
{
    size_t start = text.find("data: ");
    if (start == std::string::npos) {
        throw AssertionFailure("no data line in: " + text);
    }
    start += 6;
    return json::parse(text.substr(start, text.find('\n', start) - start));
}

} // namespace

class SSECorrectionFormatTest : public TestCase {
public:
    SSECorrectionFormatTest() : TestCase("SSEWriter correction events") {}

protected:
    void runTest() override {
        CorrectionEvent seek;
        seek.type = CorrectionEventType::HardSeek;
        seek.itemId = "Wizards.fseq";
        seek.targetMs = 45000.0;
        std::string text = SSEWriter::format(seek);
        ASSERT_EQUALS(static_cast<size_t>(0), text.find("event: hardSeek\ndata: "), "event line first, no id");
        ASSERT_EQUALS(text.size() - 2, text.find("\n\n"), "blank line terminates");
        json data = dataOf(text);
        ASSERT_NEAR(45000.0, data["targetMs"].get<double>(), 0.0, "target");
        ASSERT_EQUALS(std::string("Wizards.fseq"), data["item"].get<std::string>(), "item");

        CorrectionEvent rate;
        rate.type = CorrectionEventType::SoftRate;
        rate.rateFactor = 0.985;
        rate.errorMs = -750.0;
        data = dataOf(SSEWriter::format(rate));
        ASSERT_NEAR(0.985, data["rate"].get<double>(), 1e-12, "rate");
        ASSERT_NEAR(-750.0, data["errorMs"].get<double>(), 0.0, "error");

        CorrectionEvent idle;
        idle.type = CorrectionEventType::Idle;
        ASSERT_EQUALS(std::string("event: syncIdle\ndata: {\"status\":\"idle\"}\n\n"), SSEWriter::format(idle), "idle");

        CorrectionEvent down;
        down.type = CorrectionEventType::SourceUnreachable;
        ASSERT_EQUALS(std::string("FPP unreachable"), dataOf(SSEWriter::format(down))["msg"].get<std::string>(), "unreachable");
        down.type = CorrectionEventType::LostSync;
        ASSERT_EQUALS(std::string("lost sync"), dataOf(SSEWriter::format(down))["msg"].get<std::string>(), "lost sync");
        ASSERT_EQUALS(std::string("syncRecovered"), std::string(SSEWriter::eventName(CorrectionEventType::Recovered)), "recovered");
    }
};

class SSEFrameFormatTest : public TestCase {
public:
    SSEFrameFormatTest() : TestCase("SSEWriter frame events") {}

protected:
    void runTest() override {
        FrameEvent frame;
        frame.id = 7;
        frame.type = FrameEventType::Frame;
        frame.payload = {0xAA, 0x55, 0x7F, 0xFF};
        ASSERT_EQUALS(std::string("id: 7\nevent: frame\ndata: qlV//w==\n\n"), SSEWriter::format(frame), "frame");

        FrameEvent open;
        open.id = 0;
        open.type = FrameEventType::SeqOpen;
        open.sequence.file = "Wizards";
        open.sequence.audioFile = "Wizards_Audio.fseq";
        open.sequence.channels = 2206;
        open.sequence.frames = 7200;
        open.sequence.frameDurationMs = 25;
        open.sequence.samplesPerFrame = 1102;
        open.sequence.sampleRate = 44080;
        std::string text = SSEWriter::format(open);
        ASSERT_EQUALS(static_cast<size_t>(0), text.find("id: 0\nevent: seq_open\n"), "id and event");
        json data = dataOf(text);
        ASSERT_EQUALS(std::string("Wizards"), data["file"].get<std::string>(), "file");
        ASSERT_EQUALS(std::string("Wizards_Audio.fseq"), data["audioFile"].get<std::string>(), "audio file");
        ASSERT_EQUALS(2206, data["channels"].get<int>(), "channels");
        ASSERT_EQUALS(7200, data["frames"].get<int>(), "frames");
        ASSERT_EQUALS(25, data["stepTime"].get<int>(), "step time");
        ASSERT_EQUALS(1102, data["samplesPerFrame"].get<int>(), "samples per frame");
        ASSERT_EQUALS(44080, data["sampleRate"].get<int>(), "sample rate");

        FrameEvent missing;
        missing.id = 3;
        missing.type = FrameEventType::NoData;
        missing.message = "No audio FSEQ for: \"Carol\"";
        text = SSEWriter::format(missing);
        ASSERT_EQUALS(static_cast<size_t>(0), text.find("id: 3\nevent: no_audio\n"), "no_audio");
        ASSERT_EQUALS(missing.message, dataOf(text)["msg"].get<std::string>(), "message escaped and intact");

        FrameEvent idle;
        idle.id = 4;
        idle.type = FrameEventType::Idle;
        ASSERT_EQUALS(std::string("id: 4\nevent: idle\ndata: {\"status\":\"idle\"}\n\n"), SSEWriter::format(idle), "idle");
    }
};

class SSEWriterRoutingTest : public TestCase {
public:
    SSEWriterRoutingTest() : TestCase("SSEWriter writes only the selected streams") {}

protected:
    void runTest() override {
        CorrectionEvent correction;
        correction.type = CorrectionEventType::Idle;
        FrameEvent frame;
        frame.type = FrameEventType::Idle;

        std::ostringstream syncOnly;
        SSEWriter syncWriter(syncOnly, true, false);
        syncWriter.onCorrection(correction);
        syncWriter.onFrameEvent(frame);
        ASSERT_EQUALS(SSEWriter::format(correction), syncOnly.str(), "corrections only");

        std::ostringstream framesOnly;
        SSEWriter frameWriter(framesOnly, false, true);
        frameWriter.onCorrection(correction);
        frameWriter.onFrameEvent(frame);
        ASSERT_EQUALS(SSEWriter::format(frame), framesOnly.str(), "frames only");

        std::ostringstream both;
        SSEWriter bothWriter(both, true, true);
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&]() {
                for (int i = 0; i < 250; ++i) {
                    bothWriter.onCorrection(correction);
                }
            });
        }
        for (auto& w : writers) {
            w.join();
        }
        const std::string one = SSEWriter::format(correction);
        ASSERT_EQUALS(one.size() * 1000, both.str().size(), "every event written");
        std::string expected;
        for (int i = 0; i < 1000; ++i) {
            expected += one;
        }
        ASSERT_TRUE(expected == both.str(), "events never interleave");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("SSE Writer Tests");

    suite.addTest(std::make_unique<SSECorrectionFormatTest>());
    suite.addTest(std::make_unique<SSEFrameFormatTest>());
    suite.addTest(std::make_unique<SSEWriterRoutingTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
