/*
 * Config.h - Tunables and key=value configuration file loader
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef EAVESDROP_CORE_CONFIG_H
#define EAVESDROP_CORE_CONFIG_H

// No direct includes - all includes should be in eavesdrop.h

namespace Eavesdrop {
namespace Core {

/**
 * @brief Which of the two cadence loops the daemon runs.
 */
enum class StreamMode {
    Sync,    ///< poll/correct loop only, correction events on stdout
    Frames,  ///< poll loop feeding the frame-streaming loop, frame events on stdout
    Both
};

/**
 * @brief Every tunable of the estimator, the loops and the daemon endpoints.
 *
 * Defaults are the empirically chosen values; all of them may be
 * overridden from the configuration file or the command line.
 */
struct SyncConfig {
    // Estimator
    double hardSeekThresholdMs = 1000.0;
    int64_t hardSeekCooldownMs = 2000;
    double deadbandMs = 500.0;
    double deadbandReleaseMs = 250.0;    // a running correction stops below this
    double rateGainPerMs = 0.00002;      // 1000 ms of error -> 2% rate change
    double maxRateAdjust = 0.02;         // rate factor bound, +/-
    double minRateStep = 0.001;          // smaller changes are not re-issued
    double offsetBlend = 0.25;           // weight of the observation in the offset update
    double driftBlend = 0.1;             // EWMA weight of the implied drift
    double maxDriftPpm = 20000.0;
    int64_t minDriftBaselineMs = 30000;
    int lostSyncFailureCount = 3;

    // Loops
    int64_t pollIntervalMs = 250;
    long statusTimeoutMs = 500;
    int framesPerSecond = 40;
    uint32_t maxFrameChannels = 0;       // 0 = send the whole record

    // Endpoints and files
    std::string statusUrl = "http://127.0.0.1/api/fppd/status";
    std::string commandUrl = "http://127.0.0.1/api/command";
    std::string sequenceListUrl = "http://127.0.0.1/api/sequence";
    std::string playlistListUrl = "http://127.0.0.1/api/playlists";
    std::string audioDirectory = "/home/fpp/media/audio-fseq/";

    StreamMode mode = StreamMode::Both;

    /**
     * @brief Frame loop period derived from framesPerSecond.
     */
    int64_t frameIntervalMs() const;

    /**
     * @brief Apply one key=value pair.
     * @return false if the key is unknown (the value is then ignored)
     * @throws ConfigException if the value does not convert or is out of range
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * @brief Check cross-field constraints after all values are applied.
     * @throws ConfigException naming the first violated key
     */
    void validate() const;
};

/**
 * @brief Reader for the "key=value" configuration file format.
 *
 * Blank lines and lines starting with '#' are ignored; whitespace around
 * keys and values is trimmed. A missing file leaves the defaults in place.
 */
class ConfigFile {
public:
    /**
     * @brief Load a file into an existing configuration.
     * @return true if the file was found and read
     * @throws ConfigException on a malformed value
     */
    static bool load(const std::string& path, SyncConfig& config);

    /**
     * @brief Apply configuration text already in memory.
     * @return number of keys applied
     */
    static int parse(std::istream& in, SyncConfig& config);

    static StreamMode parseMode(const std::string& value);
    static const char* modeName(StreamMode mode);
};

} // namespace Core
} // namespace Eavesdrop

#endif // EAVESDROP_CORE_CONFIG_H
