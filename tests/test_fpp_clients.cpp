/*
 * test_fpp_clients.cpp - Unit tests for FPP status and command parsing
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"
#include "test_framework.h"

using namespace Eavesdrop::FPP;
using namespace TestFramework;
using json = nlohmann::json;

class StatusPlayingTest : public TestCase {
public:
    StatusPlayingTest() : TestCase("FPPStatusClient parses a playing status") {}

protected:
    void runTest() override {
        auto status = FPPStatusClient::parseStatus(
            R"({"status":1,"status_name":"playing","current_sequence":"Wizards.fseq",)"
            R"("current_playlist":{"playlist":"Main Show"},"seconds_played":"42","seconds_remaining":"180"})");
        ASSERT_TRUE(status.has_value(), "parses");
        ASSERT_TRUE(status->isPlaying, "playing");
        ASSERT_EQUALS(std::string("Wizards.fseq"), status->currentItemId, "sequence wins over playlist");
        ASSERT_EQUALS(static_cast<int64_t>(42), status->elapsedSeconds, "string seconds");
        ASSERT_EQUALS(PlaybackStatus::STATUS_PLAYING, status->daemonStatus, "status code");

        status = FPPStatusClient::parseStatus(
            R"({"status":"2","current_sequence":"","current_playlist":{"playlist":"Main Show"},"seconds_played":12.9})");
        ASSERT_TRUE(status->isPlaying, "stopping still counts as playing");
        ASSERT_EQUALS(std::string("Main Show"), status->currentItemId, "playlist object name");
        ASSERT_EQUALS(static_cast<int64_t>(12), status->elapsedSeconds, "fractional seconds floored");

        status = FPPStatusClient::parseStatus(R"({"status":1,"current_playlist":"Loop","seconds_played":-3})");
        ASSERT_EQUALS(std::string("Loop"), status->currentItemId, "playlist string");
        ASSERT_EQUALS(static_cast<int64_t>(0), status->elapsedSeconds, "negative seconds clamp to zero");
    }
};

class StatusIdleTest : public TestCase {
public:
    StatusIdleTest() : TestCase("FPPStatusClient parses idle statuses") {}

protected:
    void runTest() override {
        auto status = FPPStatusClient::parseStatus(R"({"status":0,"status_name":"idle","current_sequence":""})");
        ASSERT_TRUE(status.has_value(), "parses");
        ASSERT_FALSE(status->isPlaying, "idle");
        ASSERT_EQUALS(static_cast<int64_t>(0), status->elapsedSeconds, "no seconds");

        status = FPPStatusClient::parseStatus(R"({"status":1,"current_sequence":"","seconds_played":5})");
        ASSERT_FALSE(status->isPlaying, "playing with no item is idle");

        status = FPPStatusClient::parseStatus(R"({"current_sequence":"x.fseq"})");
        ASSERT_FALSE(status->isPlaying, "missing status code is idle");

        status = FPPStatusClient::parseStatus(R"({"status":"busy","current_sequence":"x.fseq"})");
        ASSERT_FALSE(status->isPlaying, "non-numeric status code is idle");
    }
};

class StatusMalformedTest : public TestCase {
public:
    StatusMalformedTest() : TestCase("FPPStatusClient rejects unusable bodies") {}

protected:
    void runTest() override {
        ASSERT_FALSE(FPPStatusClient::parseStatus("").has_value(), "empty body");
        ASSERT_FALSE(FPPStatusClient::parseStatus("<html>502 Bad Gateway</html>").has_value(), "HTML");
        ASSERT_FALSE(FPPStatusClient::parseStatus(R"({"status":1,)").has_value(), "truncated JSON");
        ASSERT_FALSE(FPPStatusClient::parseStatus("[1,2,3]").has_value(), "array");
        ASSERT_FALSE(FPPStatusClient::parseStatus("null").has_value(), "null");
    }
};

class StatusRangeTest : public TestCase {
public:
    StatusRangeTest() : TestCase("FPPStatusClient guards numeric ranges") {}

protected:
    void runTest() override {
        auto status = FPPStatusClient::parseStatus(
            R"({"status":1,"current_sequence":"x.fseq","seconds_played":1e300})");
        ASSERT_FALSE(status.has_value(), "huge elapsed time rejected");

        status = FPPStatusClient::parseStatus(
            R"({"status":1,"current_sequence":"x.fseq","seconds_played":"1e300"})");
        ASSERT_FALSE(status.has_value(), "huge elapsed time as a string rejected");

        status = FPPStatusClient::parseStatus(
            R"({"status":1,"current_sequence":"x.fseq","seconds_played":"nan"})");
        ASSERT_TRUE(status.has_value(), "NaN field ignored");
        ASSERT_EQUALS(static_cast<int64_t>(0), status->elapsedSeconds, "NaN reads as no seconds");
        ASSERT_TRUE(status->isPlaying, "still playing");

        status = FPPStatusClient::parseStatus(
            R"({"status":"inf","current_sequence":"x.fseq","seconds_played":"12.9"})");
        ASSERT_TRUE(status.has_value(), "infinite status code ignored");
        ASSERT_FALSE(status->isPlaying, "unknown status code is idle");
        ASSERT_EQUALS(static_cast<int64_t>(12), status->elapsedSeconds, "seconds still read");

        status = FPPStatusClient::parseStatus(
            R"({"status":1e12,"current_sequence":"x.fseq","seconds_played":3})");
        ASSERT_TRUE(status.has_value(), "oversized status code ignored");
        ASSERT_FALSE(status->isPlaying, "oversized status code is idle");

        status = FPPStatusClient::parseStatus(
            R"({"status":1,"current_sequence":"x.fseq","seconds_played":86400.5})");
        ASSERT_EQUALS(static_cast<int64_t>(86400), status->elapsedSeconds, "a day of playback is fine");
    }
};

class StatusFetchFailureTest : public TestCase {
public:
    StatusFetchFailureTest() : TestCase("FPPStatusClient reports an unreachable daemon") {}

protected:
    void runTest() override {
        FPPStatusClient client("not-a-url", 100);
        ASSERT_FALSE(client.fetchStatus().has_value(), "bad URL is a failed poll");
    }
};

class CommandBodyTest : public TestCase {
public:
    CommandBodyTest() : TestCase("FPPCommandClient command bodies") {}

protected:
    void runTest() override {
        json start = json::parse(FPPCommandClient::buildCommand("Start Playlist", {"Main Show"}));
        ASSERT_EQUALS(std::string("Start Playlist"), start["command"].get<std::string>(), "command name");
        ASSERT_TRUE(start["args"].is_array(), "args array");
        ASSERT_EQUALS(static_cast<size_t>(1), start["args"].size(), "one argument");
        ASSERT_EQUALS(std::string("Main Show"), start["args"][0].get<std::string>(), "playlist name");

        json stop = json::parse(FPPCommandClient::buildCommand("Stop Now"));
        ASSERT_EQUALS(std::string("Stop Now"), stop["command"].get<std::string>(), "stop command");
        ASSERT_FALSE(stop.contains("args"), "no args member without arguments");

        json quoted = json::parse(FPPCommandClient::buildCommand("Start Playlist", {"Say \"Hi\""}));
        ASSERT_EQUALS(std::string("Say \"Hi\""), quoted["args"][0].get<std::string>(), "quotes escaped");
    }
};

class CommandListTest : public TestCase {
public:
    CommandListTest() : TestCase("FPPCommandClient name lists") {}

protected:
    void runTest() override {
        auto sequences = FPPCommandClient::parseNameList(R"(["Wizards","Carol of the Bells"])", ".fseq");
        ASSERT_EQUALS(static_cast<size_t>(2), sequences.size(), "two sequences");
        ASSERT_EQUALS(std::string("Wizards.fseq"), sequences[0], "suffix appended");
        ASSERT_EQUALS(std::string("Carol of the Bells.fseq"), sequences[1], "order kept");

        auto playlists = FPPCommandClient::parseNameList(R"(["Main Show", 7, null, "Loop"])");
        ASSERT_EQUALS(static_cast<size_t>(2), playlists.size(), "non-strings skipped");
        ASSERT_EQUALS(std::string("Loop"), playlists[1], "no suffix");

        ASSERT_TRUE(FPPCommandClient::parseNameList(R"({"playlists":[]})").empty(), "object body");
        ASSERT_TRUE(FPPCommandClient::parseNameList("garbage").empty(), "garbage body");
    }
};

class CommandValidationTest : public TestCase {
public:
    CommandValidationTest() : TestCase("FPPCommandClient failures") {}

protected:
    void runTest() override {
        FPPCommandClient client("bad-url", "bad-url", "bad-url");

        CommandResult result = client.startPlaylist("");
        ASSERT_FALSE(result.success, "empty name refused");
        ASSERT_EQUALS(std::string("Nothing selected"), result.error, "empty name message");

        result = client.stopNow();
        ASSERT_FALSE(result.success, "unreachable daemon");
        ASSERT_EQUALS(std::string("FPP command failed"), result.error, "transport failure message");

        ASSERT_TRUE(client.listSequences().empty(), "failed list is empty");
        ASSERT_TRUE(client.listPlaylists().empty(), "failed list is empty");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("FPP Client Tests");

    suite.addTest(std::make_unique<StatusPlayingTest>());
    suite.addTest(std::make_unique<StatusIdleTest>());
    suite.addTest(std::make_unique<StatusMalformedTest>());
    suite.addTest(std::make_unique<StatusRangeTest>());
    suite.addTest(std::make_unique<StatusFetchFailureTest>());
    suite.addTest(std::make_unique<CommandBodyTest>());
    suite.addTest(std::make_unique<CommandListTest>());
    suite.addTest(std::make_unique<CommandValidationTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    Eavesdrop::IO::HTTP::HTTPClient::closeAllConnections();
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
