/*
 * Config.cpp - Tunables and key=value configuration file loader
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace Core {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

double toDouble(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigException(key, "expected a number, got '" + value + "'");
    }
    if (consumed != value.size() || !std::isfinite(result)) {
        throw ConfigException(key, "expected a number, got '" + value + "'");
    }
    return result;
}

int64_t toInteger(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigException(key, "expected an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigException(key, "expected an integer, got '" + value + "'");
    }
    return static_cast<int64_t>(result);
}

double nonNegative(const std::string& key, double value) {
    if (value < 0.0) {
        throw ConfigException(key, "must not be negative");
    }
    return value;
}

int64_t nonNegative(const std::string& key, int64_t value) {
    if (value < 0) {
        throw ConfigException(key, "must not be negative");
    }
    return value;
}

int64_t positive(const std::string& key, int64_t value) {
    if (value <= 0) {
        throw ConfigException(key, "must be greater than zero");
    }
    return value;
}

double fraction(const std::string& key, double value) {
    if (value < 0.0 || value > 1.0) {
        throw ConfigException(key, "must be between 0 and 1");
    }
    return value;
}

} // namespace

int64_t SyncConfig::frameIntervalMs() const {
    return std::max<int64_t>(1, 1000 / std::max(1, framesPerSecond));
}

bool SyncConfig::set(const std::string& key, const std::string& value) {
    if (key == "hard_seek_threshold_ms") {
        hardSeekThresholdMs = nonNegative(key, toDouble(key, value));
    } else if (key == "hard_seek_cooldown_ms") {
        hardSeekCooldownMs = nonNegative(key, toInteger(key, value));
    } else if (key == "deadband_ms") {
        deadbandMs = nonNegative(key, toDouble(key, value));
    } else if (key == "deadband_release_ms") {
        deadbandReleaseMs = nonNegative(key, toDouble(key, value));
    } else if (key == "rate_gain_per_ms") {
        rateGainPerMs = nonNegative(key, toDouble(key, value));
    } else if (key == "max_rate_adjust") {
        maxRateAdjust = fraction(key, toDouble(key, value));
    } else if (key == "min_rate_step") {
        minRateStep = nonNegative(key, toDouble(key, value));
    } else if (key == "offset_blend") {
        offsetBlend = fraction(key, toDouble(key, value));
    } else if (key == "drift_blend") {
        driftBlend = fraction(key, toDouble(key, value));
    } else if (key == "max_drift_ppm") {
        maxDriftPpm = nonNegative(key, toDouble(key, value));
    } else if (key == "min_drift_baseline_ms") {
        minDriftBaselineMs = positive(key, toInteger(key, value));
    } else if (key == "lost_sync_failures") {
        lostSyncFailureCount = static_cast<int>(positive(key, toInteger(key, value)));
    } else if (key == "poll_interval_ms") {
        pollIntervalMs = positive(key, toInteger(key, value));
    } else if (key == "status_timeout_ms") {
        statusTimeoutMs = static_cast<long>(positive(key, toInteger(key, value)));
    } else if (key == "fps") {
        framesPerSecond = static_cast<int>(positive(key, toInteger(key, value)));
    } else if (key == "channels") {
        int64_t channels = toInteger(key, value);
        if (channels < 0 || channels > std::numeric_limits<uint32_t>::max()) {
            throw ConfigException(key, "out of range");
        }
        maxFrameChannels = static_cast<uint32_t>(channels);
    } else if (key == "status_url") {
        statusUrl = value;
    } else if (key == "command_url") {
        commandUrl = value;
    } else if (key == "sequence_list_url") {
        sequenceListUrl = value;
    } else if (key == "playlist_list_url") {
        playlistListUrl = value;
    } else if (key == "audio_dir") {
        audioDirectory = value;
    } else if (key == "mode") {
        mode = ConfigFile::parseMode(value);
    } else {
        return false;
    }
    Debug::log("config", "SyncConfig: ", key, " = ", value);
    return true;
}

void SyncConfig::validate() const {
    if (statusTimeoutMs > pollIntervalMs * 2) {
        throw ConfigException("status_timeout_ms", "must not exceed two poll intervals");
    }
    if (hardSeekThresholdMs <= deadbandMs) {
        throw ConfigException("hard_seek_threshold_ms", "must be larger than deadband_ms");
    }
    if (deadbandReleaseMs > deadbandMs) {
        throw ConfigException("deadband_release_ms", "must not exceed deadband_ms");
    }
    if (statusUrl.empty()) {
        throw ConfigException("status_url", "must not be empty");
    }
}

bool ConfigFile::load(const std::string& path, SyncConfig& config) {
    Debug::log("config", "Reading configuration from ", path);
    std::ifstream file(path);
    if (!file.is_open()) {
        Debug::log("config", "Config file not found - using defaults");
        return false;
    }
    int applied = parse(file, config);
    Debug::log("config", "Applied ", applied, " configuration keys from ", path);
    return true;
}

int ConfigFile::parse(std::istream& in, SyncConfig& config) {
    int applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        size_t equals = line.find('=');
        if (equals == std::string::npos) {
            Debug::log("config", "Ignoring line without '=': ", line);
            continue;
        }

        std::string key = trim(line.substr(0, equals));
        std::string value = trim(line.substr(equals + 1));

        if (config.set(key, value)) {
            ++applied;
        } else {
            Debug::log("config", "Unknown configuration key ignored: ", key);
        }
    }
    return applied;
}

StreamMode ConfigFile::parseMode(const std::string& value) {
    if (value == "sync") return StreamMode::Sync;
    if (value == "frames") return StreamMode::Frames;
    if (value == "both") return StreamMode::Both;
    throw ConfigException("mode", "expected sync, frames or both, got '" + value + "'");
}

const char* ConfigFile::modeName(StreamMode mode) {
    switch (mode) {
        case StreamMode::Sync: return "sync";
        case StreamMode::Frames: return "frames";
        case StreamMode::Both: return "both";
    }
    return "unknown";
}

} // namespace Core
} // namespace Eavesdrop
