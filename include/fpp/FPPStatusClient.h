/*
 * FPPStatusClient.h - Status polling over the daemon's HTTP API
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#ifndef FPPSTATUSCLIENT_H
#define FPPSTATUSCLIENT_H

namespace Eavesdrop {
namespace FPP {

// No direct includes - all includes should be in eavesdrop.h

/**
 * @brief StatusSource backed by GET /api/fppd/status.
 */
class FPPStatusClient : public StatusSource {
public:
    FPPStatusClient(std::string statusUrl, long timeoutMs);

    std::optional<PlaybackStatus> fetchStatus() override;

    /**
     * @brief Decode a status response body.
     *
     * Understands "status", "current_sequence", "current_playlist" (a name
     * or an object with a "playlist" member) and "seconds_played" (a number
     * or a numeric string). Status 1 or 2 with a non-empty item is playing.
     *
     * @return std::nullopt if the body is not a JSON object
     */
    static std::optional<PlaybackStatus> parseStatus(const std::string& body);

private:
    std::string m_url;
    long m_timeout_ms;
};

} // namespace FPP
} // namespace Eavesdrop

#endif // FPPSTATUSCLIENT_H
