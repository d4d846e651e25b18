#pragma once

#include <string>
#include <functional>
#include <map>
#include <thread>
#include <atomic>
#include "constants.h"
#include "ingest.h"

namespace benefice {

// Simple HTTP request
struct HttpRequest {
    std::string method;
    std::string path;                      // Without the query string
    std::string query;
    std::map<std::string, std::string> headers;
    std::string body;                      // Buffered routes only
    std::string client_ip;
    size_t content_length = 0;
    BodySource* body_stream = nullptr;     // Streaming routes only

    // Case-insensitive header lookup; empty when absent
    std::string header(const std::string& name) const;
};

// Simple HTTP response
struct HttpResponse {
    int status_code = 200;
    std::map<std::string, std::string> headers;
    std::string body;

    HttpResponse() {
        headers["Content-Type"] = "application/json";
        headers["Access-Control-Allow-Origin"] = "*";
    }

    // {"error": <kind>, "message": <message>}
    static HttpResponse error(int status, const std::string& kind, const std::string& message);
};

// Request handler function type
using HandlerFunc = std::function<HttpResponse(const HttpRequest&)>;

// Minimal HTTP/1.1 server, one thread per connection, one request per
// connection
class HttpServer {
public:
    explicit HttpServer(int port = DEFAULT_HTTP_PORT, std::string bind_address = "0.0.0.0");
    ~HttpServer();

    // Register a handler that receives the body in req.body, up to
    // MAX_REQUEST_SIZE
    void route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Register a handler that pulls the body itself through req.body_stream
    void stream_route(const std::string& method, const std::string& path, HandlerFunc handler);

    // Start server (blocks)
    void start();

    // Stop server
    void stop();

    bool listening() const { return listening_; }

    // Bound port, useful when constructed with port 0
    int port() const { return port_; }

    // Request line and headers; anything after the blank line becomes the body
    static HttpRequest parse_request(const std::string& raw);
    static std::string build_response(const HttpResponse& resp);
    static std::string status_text(int status_code);

private:
    struct Route {
        HandlerFunc handler;
        bool streaming = false;
    };

    int port_;
    std::string bind_address_;
    int server_fd_;
    std::atomic<bool> running_;
    std::atomic<bool> listening_;
    std::atomic<int> active_connections_;
    std::map<std::string, Route> routes_;

    void handle_client(int client_fd, const std::string& client_ip);
    HttpResponse dispatch(int client_fd, HttpRequest& req, std::string leftover);
    void finish(int client_fd, HttpResponse resp);
    static void send_all(int fd, const std::string& data);
};

} // namespace benefice
