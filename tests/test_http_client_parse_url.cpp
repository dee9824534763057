/*
 * test_http_client_parse_url.cpp - Unit tests for HTTPClient URL handling
 * This file is part of Eavesdrop.
 * Copyright © 2025 Kirn Gill <segin2005@gmail.com>
 *
 * Eavesdrop is free software. You may redistribute and/or modify it under
 * the terms of the ISC License <https://opensource.org/licenses/ISC>
 */

#include "eavesdrop.h"
#include "test_framework.h"

using namespace Eavesdrop::IO::HTTP;
using namespace TestFramework;

class HTTPClientParseURLTest : public TestCase {
public:
    HTTPClientParseURLTest() : TestCase("HTTPClient::parseURL") {}

protected:
    void runTest() override {
        std::string host, path;
        int port = 0;
        bool isHttps = true;

        ASSERT_TRUE(HTTPClient::parseURL("http://127.0.0.1/api/fppd/status", host, port, path, isHttps),
                    "default status URL parses");
        ASSERT_EQUALS(std::string("127.0.0.1"), host, "host");
        ASSERT_EQUALS(80, port, "http default port");
        ASSERT_EQUALS(std::string("/api/fppd/status"), path, "path");
        ASSERT_FALSE(isHttps, "plain http");

        ASSERT_TRUE(HTTPClient::parseURL("https://fpp.local", host, port, path, isHttps), "https without path");
        ASSERT_EQUALS(std::string("fpp.local"), host, "host");
        ASSERT_EQUALS(443, port, "https default port");
        ASSERT_EQUALS(std::string("/"), path, "missing path becomes /");
        ASSERT_TRUE(isHttps, "https flag");

        ASSERT_TRUE(HTTPClient::parseURL("http://fpp:32322/api/command?x=1", host, port, path, isHttps),
                    "explicit port");
        ASSERT_EQUALS(std::string("fpp"), host, "host before port");
        ASSERT_EQUALS(32322, port, "explicit port value");
        ASSERT_EQUALS(std::string("/api/command?x=1"), path, "query stays in path");

        ASSERT_TRUE(HTTPClient::parseURL("http://fpp:65535/", host, port, path, isHttps), "highest port");
        ASSERT_EQUALS(65535, port, "port 65535");
    }
};

class HTTPClientRejectURLTest : public TestCase {
public:
    HTTPClientRejectURLTest() : TestCase("HTTPClient::parseURL rejects malformed URLs") {}

protected:
    void runTest() override {
        std::string host, path;
        int port = 0;
        bool isHttps = false;

        ASSERT_FALSE(HTTPClient::parseURL("127.0.0.1/api", host, port, path, isHttps), "no scheme");
        ASSERT_FALSE(HTTPClient::parseURL("ftp://fpp/api", host, port, path, isHttps), "unsupported scheme");
        ASSERT_FALSE(HTTPClient::parseURL("http:///api", host, port, path, isHttps), "empty host");
        ASSERT_FALSE(HTTPClient::parseURL("http://fpp:/api", host, port, path, isHttps), "empty port");
        ASSERT_FALSE(HTTPClient::parseURL("http://fpp:0/api", host, port, path, isHttps), "port zero");
        ASSERT_FALSE(HTTPClient::parseURL("http://fpp:65536/api", host, port, path, isHttps), "port too large");
        ASSERT_FALSE(HTTPClient::parseURL("http://fpp:99999999999/api", host, port, path, isHttps), "port overflow");
        ASSERT_FALSE(HTTPClient::parseURL("http://fpp:8o/api", host, port, path, isHttps), "non-numeric port");
    }
};

class HTTPClientBadURLRequestTest : public TestCase {
public:
    HTTPClientBadURLRequestTest() : TestCase("HTTPClient requests against unusable URLs fail cleanly") {}

protected:
    void runTest() override {
        HTTPClient::Response response = HTTPClient::get("not a url", 200);
        ASSERT_FALSE(response.success, "unparseable URL fails");
        ASSERT_EQUALS(0, response.statusCode, "no status code");
        ASSERT_EQUALS(std::string("Failed to parse URL"), response.statusMessage, "failure reason");

        response = HTTPClient::post("gopher://fpp/api/command", "{}", "application/json", 200);
        ASSERT_FALSE(response.success, "unsupported scheme fails");
        ASSERT_FALSE(response.timedOut, "rejected before any transfer");
    }
};

int main(int argc, char* argv[]) {
    (void)argc;
    (void)argv;

    TestSuite suite("HTTPClient URL Tests");

    suite.addTest(std::make_unique<HTTPClientParseURLTest>());
    suite.addTest(std::make_unique<HTTPClientRejectURLTest>());
    suite.addTest(std::make_unique<HTTPClientBadURLRequestTest>());

    auto results = suite.runAll();
    suite.printResults(results);

    HTTPClient::closeAllConnections();
    return suite.getFailureCount(results) > 0 ? 1 : 0;
}
