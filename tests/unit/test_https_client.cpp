#include <gtest/gtest.h>
#include "https_client.h"

namespace pyexec {
namespace {

TEST(UrlTest, ParsesSchemeHostPortAndPath) {
    Url url = Url::parse("https://login.example.com/.well-known/jwks.json");
    EXPECT_TRUE(url.tls);
    EXPECT_EQ(url.host, "login.example.com");
    EXPECT_EQ(url.port, "443");
    EXPECT_EQ(url.path, "/.well-known/jwks.json");

    Url plain = Url::parse("http://127.0.0.1:8081");
    EXPECT_FALSE(plain.tls);
    EXPECT_EQ(plain.host, "127.0.0.1");
    EXPECT_EQ(plain.port, "8081");
    EXPECT_EQ(plain.path, "/");
}

TEST(UrlTest, RejectsUnsupportedOrMalformedUrls) {
    EXPECT_THROW(Url::parse("ftp://example.com/keys"), HttpsError);
    EXPECT_THROW(Url::parse("https:///keys"), HttpsError);
    EXPECT_THROW(Url::parse("https://example.com:/keys"), HttpsError);
}

TEST(HttpsClientTest, ParseResponseSplitsHeadersAndBody) {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "{\"keys\":[]}";

    HttpsResponse resp = HttpsClient::parse_response(raw);
    EXPECT_EQ(resp.status_code, 200);
    EXPECT_EQ(resp.headers["content-type"], "application/json");
    EXPECT_EQ(resp.body, "{\"keys\":[]}");
}

TEST(HttpsClientTest, ParseResponseHonoursContentLength) {
    std::string raw = "HTTP/1.0 404 Not Found\r\nContent-Length: 3\r\n\r\nabcdef";

    HttpsResponse resp = HttpsClient::parse_response(raw);
    EXPECT_EQ(resp.status_code, 404);
    EXPECT_EQ(resp.body, "abc");
}

TEST(HttpsClientTest, ParseResponseRejectsBrokenFraming) {
    EXPECT_THROW(HttpsClient::parse_response("HTTP/1.1 200 OK\r\n"), HttpsError)
        << "Headers never terminated";
    EXPECT_THROW(HttpsClient::parse_response("SSH-2.0-OpenSSH\r\n\r\n"), HttpsError)
        << "Not an HTTP status line";
    EXPECT_THROW(HttpsClient::parse_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"),
                 HttpsError) << "Body shorter than announced";
}

TEST(HttpsClientTest, GetFailsForUnreachableHost) {
    HttpsClient client(2);
    // Port 1 on loopback refuses connections
    EXPECT_THROW(client.get("http://127.0.0.1:1/jwks.json"), HttpsError);
}

} // namespace
} // namespace pyexec
