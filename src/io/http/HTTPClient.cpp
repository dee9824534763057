/*
 * HTTPClient.cpp - libcurl-based HTTP client implementation
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"

namespace Eavesdrop {
namespace IO {
namespace HTTP {

namespace {

// Status and list responses are a few kilobytes at most
constexpr size_t MAX_RESPONSE_SIZE = 1024 * 1024;
constexpr size_t MAX_HANDLES_PER_HOST = 2;

/**
 * Process-wide libcurl state: one curl_global_init() and a small pool of
 * easy handles keyed by "host:port". curl_easy_reset() keeps the handle's
 * connection cache, which is what makes the 4 Hz poll cheap.
 */
class CurlHandlePool {
public:
    static CurlHandlePool& instance()
    {
        static CurlHandlePool pool;
        return pool;
    }

    bool ready() const { return m_ready; }

    CURL* acquire(const std::string& key)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_idle.find(key);
            if (it != m_idle.end() && !it->second.empty()) {
                CURL* handle = it->second.back();
                it->second.pop_back();
                return handle;
            }
        }
        Debug::log("http", "CurlHandlePool: new handle for ", key);
        return curl_easy_init();
    }

    void release(const std::string& key, CURL* handle)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto& idle = m_idle[key];
        if (idle.size() < MAX_HANDLES_PER_HOST) {
            curl_easy_reset(handle);
            idle.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (auto& entry : m_idle) {
            for (CURL* handle : entry.second)
                curl_easy_cleanup(handle);
            count += entry.second.size();
        }
        m_idle.clear();
        Debug::log("http", "CurlHandlePool: released ", count, " handle(s)");
    }

private:
    CurlHandlePool()
    {
        CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
        m_ready = (result == CURLE_OK);
        if (!m_ready)
            Debug::log("http", "CurlHandlePool: curl_global_init failed: ", curl_easy_strerror(result));
    }

    ~CurlHandlePool()
    {
        clear();
        if (m_ready)
            curl_global_cleanup();
    }

    bool m_ready = false;
    std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<CURL*>> m_idle;
};

// Returns the handle to the pool and frees the header list on every exit path
class PooledHandle {
public:
    PooledHandle(std::string key, CURL* handle) : m_key(std::move(key)), m_handle(handle) {}
    ~PooledHandle()
    {
        if (m_headers)
            curl_slist_free_all(m_headers);
        if (m_handle)
            CurlHandlePool::instance().release(m_key, m_handle);
    }
    PooledHandle(const PooledHandle&) = delete;
    PooledHandle& operator=(const PooledHandle&) = delete;

    CURL* get() const { return m_handle; }
    void addHeader(const std::string& line) { m_headers = curl_slist_append(m_headers, line.c_str()); }
    curl_slist* headers() const { return m_headers; }

private:
    std::string m_key;
    CURL* m_handle;
    curl_slist* m_headers = nullptr;
};

size_t appendBody(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t bytes = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    if (body->size() + bytes > MAX_RESPONSE_SIZE) {
        Debug::log("http", "HTTPClient: response larger than ", MAX_RESPONSE_SIZE, " bytes, aborting");
        return 0;
    }
    body->append(static_cast<const char*>(contents), bytes);
    return bytes;
}

} // namespace

HTTPClient::Response HTTPClient::get(const std::string& url, long timeoutMs)
{
    return perform(url, nullptr, std::string(), timeoutMs);
}

HTTPClient::Response HTTPClient::post(const std::string& url, const std::string& data,
                                      const std::string& contentType, long timeoutMs)
{
    return perform(url, &data, contentType, timeoutMs);
}

HTTPClient::Response HTTPClient::perform(const std::string& url, const std::string* postData,
                                         const std::string& contentType, long timeoutMs)
{
    Response response;
    const char* method = postData ? "POST" : "GET";

    std::string host, path;
    int port = 0;
    bool isHttps = false;
    if (!parseURL(url, host, port, path, isHttps)) {
        response.statusMessage = "Failed to parse URL";
        return response;
    }

    CurlHandlePool& pool = CurlHandlePool::instance();
    if (!pool.ready()) {
        response.statusMessage = "libcurl initialization failed";
        return response;
    }

    std::string key = host + ":" + std::to_string(port);
    PooledHandle handle(key, pool.acquire(key));
    CURL* curl = handle.get();
    if (!curl) {
        response.statusMessage = "Failed to acquire curl handle";
        return response;
    }

    std::string body;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "Eavesdrop/" EAVESDROP_VERSION);

    if (postData) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postData->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(postData->size()));
        handle.addHeader("Content-Type: " + contentType);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, handle.headers());
    }

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        response.statusMessage = std::string("libcurl error: ") + curl_easy_strerror(res);
        response.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
        DEBUG_LOG("http", method, " ", url, " failed: ", response.statusMessage);
        return response;
    }

    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    response.statusCode = static_cast<int>(code);
    response.body = std::move(body);
    response.success = (response.statusCode >= 200 && response.statusCode < 400);
    if (!response.success) {
        response.statusMessage = "HTTP " + std::to_string(response.statusCode);
        DEBUG_LOG("http", method, " ", url, " returned ", response.statusMessage);
    }
    return response;
}

bool HTTPClient::parseURL(const std::string& url, std::string& host, int& port,
                          std::string& path, bool& isHttps)
{
    size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos)
        return false;

    std::string scheme = url.substr(0, schemeEnd);
    if (scheme == "https") {
        isHttps = true;
        port = 443;
    } else if (scheme == "http") {
        isHttps = false;
        port = 80;
    } else {
        Debug::log("http", "HTTPClient::parseURL: unsupported scheme ", scheme);
        return false;
    }

    size_t authorityStart = schemeEnd + 3;
    size_t pathStart = url.find('/', authorityStart);
    std::string authority;
    if (pathStart == std::string::npos) {
        authority = url.substr(authorityStart);
        path = "/";
    } else {
        authority = url.substr(authorityStart, pathStart - authorityStart);
        path = url.substr(pathStart);
    }

    size_t colon = authority.find(':');
    host = authority.substr(0, colon);
    if (colon != std::string::npos) {
        std::string digits = authority.substr(colon + 1);
        if (digits.empty() || digits.size() > 5 ||
            digits.find_first_not_of("0123456789") != std::string::npos)
            return false;
        port = std::stoi(digits);
        if (port < 1 || port > 65535)
            return false;
    }
    return !host.empty();
}

void HTTPClient::closeAllConnections()
{
    CurlHandlePool::instance().clear();
}

} // namespace HTTP
} // namespace IO
} // namespace Eavesdrop
