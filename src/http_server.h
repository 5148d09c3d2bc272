#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>

namespace pyexec {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;     // Keys lower-cased
    std::string body;
    std::string client_ip;

    // Header value by case-insensitive name, empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
    }
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection
class HttpServer {
public:
    explicit HttpServer(int port = 8080);
    ~HttpServer();

    // Register route handlers (exact method and path)
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Bind and listen; returns the bound port (useful with port 0)
    int listen();

    // Accept loop (blocks until stop)
    void serve();

    // listen() + serve()
    void start();

    void stop();

    // Route a parsed request to its handler
    HttpResponse dispatch(const HttpRequest& req) const;

    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);

private:
    int port_;
    int server_fd_;
    std::atomic<bool> running_;
    std::map<std::string, HandlerFunc> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
};

} // namespace pyexec
