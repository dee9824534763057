/*
 * FPPStatusClient.cpp - Status polling over the daemon's HTTP API
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace FPP {

using json = nlohmann::json;

namespace {

// Longer than any show; anything above is a corrupt status
constexpr double MAX_ELAPSED_SECONDS = 1e9;

// Numbers arrive either as JSON numbers or as numeric strings
std::optional<double> numberOf(const json& value)
{
    std::optional<double> number;
    if (value.is_number()) {
        number = value.get<double>();
    } else if (value.is_string()) {
        const std::string text = value.get<std::string>();
        char* end = nullptr;
        double parsed = strtod(text.c_str(), &end);
        if (end != text.c_str()) {
            number = parsed;
        }
    }
    if (number && !std::isfinite(*number)) {
        return std::nullopt;
    }
    return number;
}

std::string itemOf(const json& status)
{
    auto seq = status.find("current_sequence");
    if (seq != status.end() && seq->is_string() && !seq->get<std::string>().empty()) {
        return seq->get<std::string>();
    }
    auto playlist = status.find("current_playlist");
    if (playlist != status.end()) {
        if (playlist->is_string()) {
            return playlist->get<std::string>();
        }
        if (playlist->is_object()) {
            auto name = playlist->find("playlist");
            if (name != playlist->end() && name->is_string()) {
                return name->get<std::string>();
            }
        }
    }
    return std::string();
}

} // namespace

FPPStatusClient::FPPStatusClient(std::string statusUrl, long timeoutMs)
    : m_url(std::move(statusUrl)), m_timeout_ms(timeoutMs)
{
}

std::optional<PlaybackStatus> FPPStatusClient::fetchStatus()
{
    IO::HTTP::HTTPClient::Response response = IO::HTTP::HTTPClient::get(m_url, m_timeout_ms);
    if (!response.success) {
        Debug::log("fpp", "FPPStatusClient: status request failed: ", response.statusMessage,
                   response.timedOut ? " (timed out)" : "");
        return std::nullopt;
    }
    auto status = parseStatus(response.body);
    if (!status) {
        Debug::log("fpp", "FPPStatusClient: unusable status body (", response.body.size(), " bytes)");
    }
    return status;
}

std::optional<PlaybackStatus> FPPStatusClient::parseStatus(const std::string& body)
{
    json root = json::parse(body, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }

    PlaybackStatus status;
    auto code = root.find("status");
    if (code != root.end()) {
        auto value = numberOf(*code);
        if (value && *value >= std::numeric_limits<int>::min() && *value <= std::numeric_limits<int>::max()) {
            status.daemonStatus = static_cast<int>(*value);
        }
    }

    status.currentItemId = itemOf(root);

    auto seconds = root.find("seconds_played");
    if (seconds != root.end()) {
        if (auto value = numberOf(*seconds)) {
            if (*value > MAX_ELAPSED_SECONDS) {
                Debug::log("fpp", "FPPStatusClient: seconds_played ", *value, " out of range");
                return std::nullopt;
            }
            status.elapsedSeconds = *value > 0.0 ? static_cast<int64_t>(std::floor(*value)) : 0;
        }
    }

    status.isPlaying = (status.daemonStatus == PlaybackStatus::STATUS_PLAYING ||
                        status.daemonStatus == PlaybackStatus::STATUS_STOPPING) &&
                       !status.currentItemId.empty();
    return status;
}

} // namespace FPP
} // namespace Eavesdrop
