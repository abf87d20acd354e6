/// @file test_curl_global.cpp
/// A CurlPool used without any CurlGlobal set up by the application.

#include <gtest/gtest.h>

#include <curl/curl.h>

#include <chrono>
#include <string>

#include "../src/http/client/curl_pool.hpp"
#include "../src/http/connector/connector.hpp"
#include "../src/http/error/http_error.hpp"

using namespace std::chrono_literals;

TEST(CurlGlobal, PoolInitializesLibcurlOnItsOwn) {
    http::client::CurlPool pool(http::client::TransportOptions{.connect_timeout_ = 2'000ms});
    const http::model::Request req{.method_ = http::model::Method::GET, .url_ = "http://127.0.0.1:1/health"};

    try {
        static_cast<void>(pool.perform(req));
        FAIL() << "expected NetworkError";
    } catch (const http::http_error::NetworkError& e) {
        EXPECT_EQ(e.curl_code_, static_cast<int>(CURLE_COULDNT_CONNECT));
    }
}

TEST(CurlGlobal, ConnectorNeedsNoSetup) {
    const http::connector::Connector connector(http::connector::ConnectorOptions{
        .base_url_ = "http://127.0.0.1:1",
        .retry_policy_ = http::retry::RetryPolicy(0, 0.0),
        .transport_ = http::client::TransportOptions{.connect_timeout_ = 2'000ms},
    });
    EXPECT_THROW(static_cast<void>(connector.get("health")), http::http_error::NetworkError);
}
