#include <gtest/gtest.h>
#include <chrono>
#include "../../src/network/http/curl_client.hpp"

using namespace Rotor::Network::Http;

TEST(HttpClientTest, UnreachableProxyIsReportedAsFailure) {
    CurlClient client;
    client.set_timeout(std::chrono::seconds(2));
    // Port 1 on loopback is closed; the connect fails without touching the network.
    client.set_proxy("http://127.0.0.1:1");

    Response res = client.get("http://example.invalid/");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.status_code, 0);
    EXPECT_FALSE(res.error.empty());
    EXPECT_NE(res.error_type, ErrorType::None);
}
