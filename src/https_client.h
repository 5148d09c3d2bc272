#pragma once

#include <string>
#include <map>
#include <stdexcept>

namespace pyexec {

class HttpsError : public std::runtime_error {
public:
    explicit HttpsError(const std::string& message)
        : std::runtime_error("HTTPS request failed: " + message) {}
};

struct HttpsResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;     // Lower-cased names
    std::string body;
};

// Parsed http(s)://host[:port]/path
struct Url {
    bool tls = true;
    std::string host;
    std::string port;
    std::string path = "/";

    static Url parse(const std::string& url);
};

// Minimal blocking GET client over OpenSSL. Speaks HTTP/1.0 so responses are
// never chunked.
class HttpsClient {
public:
    explicit HttpsClient(int timeout_seconds = 10);

    // Throws HttpsError on connection, TLS or framing failure
    HttpsResponse get(const std::string& url) const;

    // Split a raw HTTP response into status, headers and body
    static HttpsResponse parse_response(const std::string& raw);

private:
    int timeout_seconds_;
};

} // namespace pyexec
