#include <gtest/gtest.h>

#include "fxrates/common/http_client.hpp"

#include <chrono>

using namespace fxrates;

// ============================================================================
// CurlHttpClient
// ============================================================================

TEST(CurlHttpClientTest, Request_ConnectionRefused_TransportError) {
    // 포트 1 은 로컬에서 열려 있지 않다
    HttpRequest req;
    req.url = "http://127.0.0.1:1/";
    req.timeout = std::chrono::milliseconds(2000);

    CurlHttpClient client;
    auto response = client.request(req);

    ASSERT_FALSE(response);
    EXPECT_EQ(response.error().code, ErrorCode::TransportError);
    EXPECT_FALSE(response.error().message.empty());
}

TEST(CurlHttpClientTest, CreateHttpClient_ReturnsCurlClient) {
    auto client = create_http_client();

    ASSERT_NE(client, nullptr);
    EXPECT_NE(dynamic_cast<CurlHttpClient*>(client.get()), nullptr);
}

// ============================================================================
// validate_url
// ============================================================================

TEST(ValidateUrlTest, HttpAndHttps_Accepted) {
    EXPECT_TRUE(validate_url("http://apilayer.net/api/live?access_key=KEY"));
    EXPECT_TRUE(validate_url("https://apilayer.net/api/live?access_key=KEY&currencies=THB,JPY"));
}

TEST(ValidateUrlTest, OtherScheme_InvalidRequest) {
    auto result = validate_url("ftp://x");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}

TEST(ValidateUrlTest, NoScheme_InvalidRequest) {
    auto result = validate_url("no-scheme");

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequest);
}
