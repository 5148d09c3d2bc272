#include "https_client.h"
#include "constants.h"
#include <openssl/bio.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pyexec {

namespace {

std::string openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace

Url Url::parse(const std::string& url) {
    Url result;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        result.tls = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        result.tls = false;
        rest = url.substr(7);
    } else {
        throw HttpsError("unsupported URL scheme: " + url);
    }

    size_t slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        result.path = rest.substr(slash);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        result.port = authority.substr(colon + 1);
    } else {
        result.host = authority;
        result.port = result.tls ? "443" : "80";
    }

    if (result.host.empty() || result.port.empty()) {
        throw HttpsError("malformed URL: " + url);
    }
    return result;
}

HttpsClient::HttpsClient(int timeout_seconds) : timeout_seconds_(timeout_seconds) {}

HttpsResponse HttpsClient::get(const std::string& url) const {
    Url target = Url::parse(url);
    std::string hostport = target.host + ":" + target.port;

    SSL_CTX* ctx = nullptr;
    BIO* bio = nullptr;

    if (target.tls) {
        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) {
            throw HttpsError("cannot create TLS context: " + openssl_error());
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

        bio = BIO_new_ssl_connect(ctx);
        if (bio) {
            SSL* ssl = nullptr;
            BIO_get_ssl(bio, &ssl);
            SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
            SSL_set_tlsext_host_name(ssl, target.host.c_str());
            SSL_set1_host(ssl, target.host.c_str());
            BIO_set_conn_hostname(bio, hostport.c_str());
        }
    } else {
        bio = BIO_new_connect(hostport.c_str());
    }

    if (!bio) {
        if (ctx) SSL_CTX_free(ctx);
        throw HttpsError("cannot create connection: " + openssl_error());
    }

    auto cleanup = [&]() {
        BIO_free_all(bio);
        if (ctx) SSL_CTX_free(ctx);
    };

    if (BIO_do_connect(bio) <= 0) {
        std::string err = openssl_error();
        cleanup();
        throw HttpsError("cannot connect to " + hostport + ": " + err);
    }

    // Bound every blocking read and write on the socket
    int fd = -1;
    BIO_get_fd(bio, &fd);
    if (fd >= 0) {
        struct timeval tv;
        tv.tv_sec = timeout_seconds_;
        tv.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

    if (target.tls && BIO_do_handshake(bio) <= 0) {
        std::string err = openssl_error();
        cleanup();
        throw HttpsError("TLS handshake with " + hostport + " failed: " + err);
    }

    std::ostringstream request;
    request << "GET " << target.path << " HTTP/1.0\r\n"
            << "Host: " << target.host << "\r\n"
            << "Accept: application/json\r\n"
            << "User-Agent: pyexec\r\n"
            << "Connection: close\r\n\r\n";
    std::string req = request.str();

    if (BIO_write(bio, req.data(), static_cast<int>(req.size())) <= 0) {
        std::string err = openssl_error();
        cleanup();
        throw HttpsError("cannot send request to " + hostport + ": " + err);
    }

    std::string raw;
    char buffer[PIPE_BUFFER_SIZE];
    int n;
    while ((n = BIO_read(bio, buffer, sizeof(buffer))) > 0) {
        raw.append(buffer, n);
        if (raw.size() > MAX_HTTPS_RESPONSE) {
            cleanup();
            throw HttpsError("response from " + hostport + " exceeds size limit");
        }
    }
    cleanup();

    return parse_response(raw);
}

HttpsResponse HttpsClient::parse_response(const std::string& raw) {
    HttpsResponse resp;

    size_t header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        throw HttpsError("incomplete response headers");
    }

    std::istringstream headers(raw.substr(0, header_end));
    std::string status_line;
    std::getline(headers, status_line);
    if (!status_line.empty() && status_line.back() == '\r') {
        status_line.pop_back();
    }

    // HTTP/1.x NNN Reason
    std::istringstream status(status_line);
    std::string version;
    status >> version >> resp.status_code;
    if (version.rfind("HTTP/", 0) != 0 || resp.status_code == 0) {
        throw HttpsError("malformed status line: " + status_line);
    }

    std::string line;
    while (std::getline(headers, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(' ');
        value = (start == std::string::npos) ? "" : value.substr(start);
        resp.headers[lower(line.substr(0, colon))] = value;
    }

    resp.body = raw.substr(header_end + 4);

    auto it = resp.headers.find("content-length");
    if (it != resp.headers.end()) {
        size_t expected = 0;
        try {
            expected = std::stoul(it->second);
        } catch (const std::exception&) {
            throw HttpsError("malformed Content-Length: " + it->second);
        }
        if (resp.body.size() < expected) {
            throw HttpsError("truncated response body");
        }
        resp.body.resize(expected);
    }

    return resp;
}

} // namespace pyexec
