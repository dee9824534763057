/*
 * main.cpp - contains main(), mostly.
 * This file is part of Eavesdrop.
 * Copyright © 2011-2025 Kirn Gill <segin2005@gmail.com>
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
#include <getopt.h>

using namespace Eavesdrop;

namespace {

volatile std::sig_atomic_t s_stop_requested = 0;

void handleStopSignal(int)
{
    s_stop_requested = 1;
}

enum class Action {
    Run,
    Start,
    Stop,
    List,
    Version
};

void about_console()
{
    std::cout << "Eavesdrop " EAVESDROP_VERSION << std::endl;
    std::cout << "Frame-locked audio sync for show playback." << std::endl;
    std::cout << "Maintainer: " EAVESDROP_MAINTAINER << std::endl;
}

void usage(const char* argv0)
{
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "  -c, --config FILE      read key=value settings from FILE\n"
              << "  -u, --status-url URL   playback status endpoint\n"
              << "      --command-url URL  command endpoint\n"
              << "  -a, --audio-dir DIR    directory holding companion audio sequences\n"
              << "  -r, --fps N            frame loop rate\n"
              << "  -n, --channels N       truncate frame payloads to N bytes\n"
              << "  -p, --poll-ms N        status poll interval\n"
              << "  -m, --mode MODE        sync, frames or both\n"
              << "  -d, --debug LIST       enable debug channels (comma separated, or all)\n"
              << "  -l, --logfile FILE     write debug output to FILE instead of stderr\n"
              << "      --start NAME       start a playlist or sequence and exit\n"
              << "      --stop             stop playback and exit\n"
              << "      --list             print sequences and playlists as JSON and exit\n"
              << "  -v, --version          print version and exit\n";
}

int runDaemon(const Core::SyncConfig& config)
{
    const bool correctionsOut = config.mode != Core::StreamMode::Frames;
    const bool framesOut = config.mode != Core::StreamMode::Sync;

    Player::SSEWriter writer(std::cout, correctionsOut, framesOut);
    FPP::FPPStatusClient source(config.statusUrl, config.statusTimeoutMs);
    Sync::PositionCell cell;
    Player::PlaybackDriver driver(config, source, cell, writer);

    Player::CadenceLoop pollLoop("poll", std::chrono::milliseconds(config.pollIntervalMs),
                                 [&driver]() { driver.pollOnce(); });

    std::unique_ptr<Player::FrameStreamer> streamer;
    std::unique_ptr<Player::CadenceLoop> frameLoop;
    if (framesOut) {
        streamer = std::make_unique<Player::FrameStreamer>(cell, Fseq::CompanionLocator(config.audioDirectory),
                                                           writer, config.maxFrameChannels);
        frameLoop = std::make_unique<Player::CadenceLoop>(
            "frames", std::chrono::milliseconds(config.frameIntervalMs()),
            [&streamer]() { streamer->tick(); });
    }

    Debug::log("player", "main: mode ", Core::ConfigFile::modeName(config.mode), ", status ", config.statusUrl,
               ", audio in ", config.audioDirectory);

    pollLoop.start();
    if (frameLoop) {
        frameLoop->start();
    }

    while (!s_stop_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    Debug::log("player", "main: stop requested");
    if (frameLoop) {
        frameLoop->stop();
    }
    pollLoop.stop();
    return 0;
}

int runCommand(Action action, const Core::SyncConfig& config, const std::string& startName)
{
    FPP::FPPCommandClient client(config.commandUrl, config.sequenceListUrl, config.playlistListUrl);
    nlohmann::json out;

    if (action == Action::List) {
        out["success"] = true;
        out["sequences"] = client.listSequences();
        out["playlists"] = client.listPlaylists();
        std::cout << out.dump() << std::endl;
        return 0;
    }

    FPP::CommandResult result = action == Action::Start ? client.startPlaylist(startName) : client.stopNow();
    out["success"] = result.success;
    if (!result.success) {
        out["error"] = result.error;
    }
    std::cout << out.dump() << std::endl;
    return result.success ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
    enum LongOnly {
        OPT_COMMAND_URL = 1000,
        OPT_START,
        OPT_STOP,
        OPT_LIST
    };

    static const struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"status-url", required_argument, 0, 'u'},
        {"command-url", required_argument, 0, OPT_COMMAND_URL},
        {"audio-dir", required_argument, 0, 'a'},
        {"fps", required_argument, 0, 'r'},
        {"channels", required_argument, 0, 'n'},
        {"poll-ms", required_argument, 0, 'p'},
        {"mode", required_argument, 0, 'm'},
        {"debug", required_argument, 0, 'd'},
        {"logfile", required_argument, 0, 'l'},
        {"start", required_argument, 0, OPT_START},
        {"stop", no_argument, 0, OPT_STOP},
        {"list", no_argument, 0, OPT_LIST},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    std::string configPath;
    std::string debugChannels;
    std::string logfile;
    std::string startName;
    Action action = Action::Run;
    // Command line values win over the config file, so apply them last
    std::vector<std::pair<std::string, std::string>> overrides;

    int opt;
    while ((opt = getopt_long(argc, argv, "c:u:a:r:n:p:m:d:l:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                configPath = optarg;
                break;
            case 'u':
                overrides.emplace_back("status_url", optarg);
                break;
            case OPT_COMMAND_URL:
                overrides.emplace_back("command_url", optarg);
                break;
            case 'a':
                overrides.emplace_back("audio_dir", optarg);
                break;
            case 'r':
                overrides.emplace_back("fps", optarg);
                break;
            case 'n':
                overrides.emplace_back("channels", optarg);
                break;
            case 'p':
                overrides.emplace_back("poll_interval_ms", optarg);
                break;
            case 'm':
                overrides.emplace_back("mode", optarg);
                break;
            case 'd':
                debugChannels = optarg;
                break;
            case 'l':
                logfile = optarg;
                break;
            case OPT_START:
                action = Action::Start;
                startName = optarg;
                break;
            case OPT_STOP:
                action = Action::Stop;
                break;
            case OPT_LIST:
                action = Action::List;
                break;
            case 'v':
                action = Action::Version;
                break;
            case 'h':
                usage(argv[0]);
                return 0;
            case '?': // Invalid option
                return 1; // getopt_long already prints an error message.
        }
    }

    if (action == Action::Version) {
        about_console();
        return 0;
    }

    Debug::init(logfile, Debug::parseChannelList(debugChannels));

    Core::SyncConfig config;
    try {
        if (!configPath.empty() && !Core::ConfigFile::load(configPath, config)) {
            std::cerr << argv[0] << ": cannot read config file " << configPath << std::endl;
            Debug::shutdown();
            return 1;
        }
        for (const auto& entry : overrides) {
            config.set(entry.first, entry.second);
        }
        config.validate();
    } catch (const Core::ConfigException& e) {
        std::cerr << argv[0] << ": " << e.what() << std::endl;
        Debug::shutdown();
        return 1;
    }

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);
    std::signal(SIGPIPE, handleStopSignal);

    int status = action == Action::Run ? runDaemon(config) : runCommand(action, config, startName);

    IO::HTTP::HTTPClient::closeAllConnections();
    Debug::shutdown();
    return status;
}
