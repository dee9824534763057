/*
 * HTTPClient.h - Simple HTTP client for the show daemon's REST API
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

#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

// All external headers included via eavesdrop.h

namespace Eavesdrop {
namespace IO {
namespace HTTP {

/**
 * @brief libcurl-backed HTTP client for short request/response exchanges
 *
 * Easy handles are pooled per host:port so the status poll reuses its
 * connection. Timeouts are in milliseconds and cover connect plus transfer.
 * Failures never throw; they come back as a Response with success unset.
 */
class HTTPClient {
public:
    struct Response {
        int statusCode = 0;
        std::string statusMessage;  ///< libcurl error text or "HTTP <code>" on failure
        std::string body;
        bool success = false;       ///< transfer completed with a 2xx or 3xx status
        bool timedOut = false;
    };

    static Response get(const std::string& url, long timeoutMs = 30000);

    static Response post(const std::string& url,
                         const std::string& data,
                         const std::string& contentType = "application/json",
                         long timeoutMs = 30000);

    /**
     * @brief Split an http or https URL into its parts
     *
     * The port defaults to 80 or 443 and must lie in 1..65535 when given.
     * The path is "/" when the URL has none and keeps any query string.
     * @return false for other schemes, an empty host or a malformed port
     */
    static bool parseURL(const std::string& url, std::string& host, int& port,
                         std::string& path, bool& isHttps);

    /**
     * @brief Clean up every pooled easy handle
     */
    static void closeAllConnections();

private:
    static Response perform(const std::string& url, const std::string* postData,
                            const std::string& contentType, long timeoutMs);
};

} // namespace HTTP
} // namespace IO
} // namespace Eavesdrop

#endif // HTTPCLIENT_H
