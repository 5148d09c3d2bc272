#include "encoding.h"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

namespace pyexec {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string Encoding::base64_encode(const unsigned char* data, size_t len) {
    if (len == 0) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data, static_cast<int>(len));
    BIO_flush(bio);

    BUF_MEM* bufferPtr;
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);

    return result;
}

std::string Encoding::base64_encode(const std::string& data) {
    return base64_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

bool Encoding::base64_decode(const std::string& encoded, std::vector<unsigned char>& out) {
    out.clear();
    if (encoded.empty()) {
        return true;
    }
    if (encoded.size() % 4 != 0) {
        return false;
    }

    // BIO silently skips garbage, so validate the alphabet first
    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); i++) {
        char c = encoded[i];
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0 || !is_base64_char(c)) {
            return false;
        }
    }
    if (padding > 2) {
        return false;
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new_mem_buf(encoded.data(), static_cast<int>(encoded.length()));
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    // The filter hands back large inputs in pieces
    out.resize(encoded.length());
    size_t decoded_len = 0;
    int n;
    while (decoded_len < out.size() &&
           (n = BIO_read(bio, out.data() + decoded_len,
                         static_cast<int>(out.size() - decoded_len))) > 0) {
        decoded_len += static_cast<size_t>(n);
    }

    BIO_free_all(bio);

    size_t expected = encoded.size() / 4 * 3 - padding;
    if (decoded_len != expected) {
        out.clear();
        return false;
    }
    out.resize(decoded_len);
    return true;
}

std::string Encoding::base64url_encode(const unsigned char* data, size_t len) {
    std::string encoded = base64_encode(data, len);
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (char& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return encoded;
}

std::string Encoding::base64url_encode(const std::string& data) {
    return base64url_encode(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

bool Encoding::base64url_decode(const std::string& encoded, std::vector<unsigned char>& out) {
    std::string standard = encoded;
    for (char& c : standard) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (c == '+' || c == '/' || c == '=') return false;
    }
    if (standard.size() % 4 == 1) {
        return false;
    }
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
    }
    return base64_decode(standard, out);
}

bool Encoding::base64url_decode(const std::string& encoded, std::string& out) {
    std::vector<unsigned char> bytes;
    if (!base64url_decode(encoded, bytes)) {
        return false;
    }
    out.assign(bytes.begin(), bytes.end());
    return true;
}

size_t Encoding::utf8_prefix_length(const std::string& data, size_t max_bytes) {
    if (data.size() <= max_bytes) {
        return data.size();
    }
    size_t end = max_bytes;
    // Back up over continuation bytes to the start of the cut character
    while (end > 0 && (static_cast<unsigned char>(data[end]) & 0xC0) == 0x80) {
        end--;
    }
    return end;
}

} // namespace pyexec
