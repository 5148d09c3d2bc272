#include "http_server.h"
#include "constants.h"

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pyexec {

namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

void write_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[Server] Write failed: " << std::strerror(errno) << std::endl;
            return;
        }
        sent += static_cast<size_t>(n);
    }
}

HttpResponse error_response(int status, const std::string& error, const std::string& message) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = "{\"error\":\"" + error + "\",\"message\":\"" + message + "\"}";
    return resp;
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(lower(name));
    return it == headers.end() ? "" : it->second;
}

HttpServer::HttpServer(int port) : port_(port), server_fd_(-1), running_(false) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = handler;
}

int HttpServer::listen() {
    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port_);

    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to port " + std::to_string(port_));
    }

    // Listen
    if (::listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    std::cout << "[Server] Listening on port " << port_ << std::endl;
    return port_;
}

void HttpServer::serve() {
    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (running_) continue;
            break;
        }

        // Get client IP
        std::string client_ip = inet_ntoa(client_addr.sin_addr);

        // Handle in new thread (simple concurrency)
        std::thread([this, client_fd, client_ip]() {
            handle_client(client_fd, client_ip);
            close(client_fd);
        }).detach();
    }
}

void HttpServer::start() {
    listen();
    serve();
}

void HttpServer::stop() {
    running_ = false;
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
}

void HttpServer::handle_client(int client_fd, const std::string& client_ip) {
    // Read request with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    ssize_t bytes_read;
    size_t expected_size = 0;

    while ((bytes_read = read(client_fd, buffer, sizeof(buffer))) > 0) {
        request_data.append(buffer, static_cast<size_t>(bytes_read));
        if (request_data.size() > MAX_REQUEST_SIZE) {
            write_all(client_fd, build_response(
                error_response(413, "request_too_large", "Request exceeds size limit")));
            return;
        }

        size_t header_end = request_data.find("\r\n\r\n");
        if (header_end == std::string::npos) {
            continue;
        }

        // Headers complete; work out how much body follows
        HttpRequest head = parse_request(request_data.substr(0, header_end + 4));
        size_t content_length = 0;
        std::string length_str = head.header("Content-Length");
        if (!length_str.empty()) {
            // stoull would accept signs and whitespace, and wrap "-1"
            bool digits = std::all_of(length_str.begin(), length_str.end(),
                                      [](char c) { return c >= '0' && c <= '9'; });
            if (!digits) {
                write_all(client_fd, build_response(
                    error_response(400, "bad_request", "Invalid Content-Length")));
                return;
            }
            try {
                content_length = std::stoull(length_str);
            } catch (const std::out_of_range&) {
                content_length = SIZE_MAX;
            }
        }

        // Compare before adding so a huge length cannot wrap around
        if (content_length > MAX_REQUEST_SIZE - (header_end + 4)) {
            write_all(client_fd, build_response(
                error_response(413, "request_too_large", "Request exceeds size limit")));
            return;
        }
        expected_size = header_end + 4 + content_length;

        // Read remaining body if needed
        while (request_data.size() < expected_size) {
            bytes_read = read(client_fd, buffer,
                std::min(sizeof(buffer), expected_size - request_data.size()));
            if (bytes_read <= 0) break;
            request_data.append(buffer, static_cast<size_t>(bytes_read));
        }
        break;
    }

    if (request_data.empty()) return;

    // Parse request
    HttpRequest req = parse_request(request_data);
    req.client_ip = client_ip;

    HttpResponse resp = dispatch(req);
    std::cout << "[Server] " << client_ip << " " << req.method << " " << req.path
              << " -> " << resp.status_code << std::endl;

    // Send response
    write_all(client_fd, build_response(resp));
}

HttpResponse HttpServer::dispatch(const HttpRequest& req) const {
    auto it = routes_.find(req.method + " " + req.path);
    if (it == routes_.end()) {
        bool path_known = false;
        for (const auto& entry : routes_) {
            size_t space = entry.first.find(' ');
            if (entry.first.substr(space + 1) == req.path) {
                path_known = true;
                break;
            }
        }
        return path_known
            ? error_response(405, "method_not_allowed", "Method not allowed")
            : error_response(404, "not_found", "Not found");
    }

    try {
        return it->second(req);
    } catch (const std::exception& e) {
        std::cerr << "[Server] Handler for " << req.path << " failed: " << e.what() << std::endl;
        return error_response(500, "internal_error", "Internal server error");
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    if (header_end != std::string::npos) {
        req.body = raw.substr(header_end + 4);
    }

    std::istringstream stream(head);

    // Parse request line
    std::string line;
    std::getline(stream, line);
    if (!line.empty() && line.back() == '\r') line.pop_back();

    size_t space1 = line.find(' ');
    size_t space2 = line.find(' ', space1 + 1);

    if (space1 != std::string::npos && space2 != std::string::npos) {
        req.method = line.substr(0, space1);
        req.path = line.substr(space1 + 1, space2 - space1 - 1);
        size_t query = req.path.find('?');
        if (query != std::string::npos) {
            req.path.erase(query);
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            std::string key = lower(line.substr(0, colon));
            size_t value_start = line.find_first_not_of(" \t", colon + 1);
            req.headers[key] = value_start == std::string::npos ? "" : line.substr(value_start);
        }
    }

    return req;
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << reason_phrase(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

} // namespace pyexec
