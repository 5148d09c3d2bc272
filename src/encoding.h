#pragma once

#include <string>
#include <vector>

namespace pyexec {

// Base64 codecs backed by OpenSSL BIO filters
class Encoding {
public:
    // Standard alphabet with padding
    static std::string base64_encode(const unsigned char* data, size_t len);
    static std::string base64_encode(const std::string& data);

    // Returns false on characters outside the alphabet or bad padding
    static bool base64_decode(const std::string& encoded, std::vector<unsigned char>& out);

    // URL-safe alphabet without padding (JWS segments)
    static std::string base64url_encode(const unsigned char* data, size_t len);
    static std::string base64url_encode(const std::string& data);
    static bool base64url_decode(const std::string& encoded, std::vector<unsigned char>& out);
    static bool base64url_decode(const std::string& encoded, std::string& out);

    // Length of the longest prefix of data (at most max_bytes) that ends on a
    // UTF-8 character boundary
    static size_t utf8_prefix_length(const std::string& data, size_t max_bytes);
};

} // namespace pyexec
