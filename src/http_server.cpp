#include "http_server.h"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <chrono>

namespace benefice {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

void set_receive_timeout(int fd, int seconds) {
    struct timeval tv;
    tv.tv_sec = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

// Request body limited by Content-Length. Bytes read past the headers are
// served first, then the socket.
class SocketBodySource : public BodySource {
public:
    SocketBodySource(int fd, std::string leftover, size_t length)
        : fd_(fd), leftover_(std::move(leftover)), remaining_(length) {
        if (leftover_.size() > remaining_) leftover_.resize(remaining_);
    }

    ssize_t read(char* buffer, size_t capacity) override {
        if (remaining_ == 0 || capacity == 0) return 0;
        size_t want = std::min(capacity, remaining_);

        if (offset_ < leftover_.size()) {
            size_t n = std::min(want, leftover_.size() - offset_);
            std::memcpy(buffer, leftover_.data() + offset_, n);
            offset_ += n;
            remaining_ -= n;
            return static_cast<ssize_t>(n);
        }

        ssize_t n;
        do {
            n = ::recv(fd_, buffer, want, 0);
        } while (n < 0 && errno == EINTR);

        if (n <= 0) {
            return -1;  // Peer closed early or went idle
        }
        remaining_ -= static_cast<size_t>(n);
        return n;
    }

private:
    int fd_;
    std::string leftover_;
    size_t offset_ = 0;
    size_t remaining_;
};

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = lower(name);
    for (const auto& [key, value] : headers) {
        if (lower(key) == wanted) return value;
    }
    return "";
}

HttpResponse HttpResponse::error(int status, const std::string& kind, const std::string& message) {
    Json::Value json;
    json["error"] = kind;
    json["message"] = message;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";

    HttpResponse resp;
    resp.status_code = status;
    resp.body = Json::writeString(builder, json);
    return resp;
}

HttpServer::HttpServer(int port, std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), server_fd_(-1),
      running_(false), listening_(false), active_connections_(0) {}

HttpServer::~HttpServer() {
    stop();

    // Connection threads are detached but still use the route table
    while (active_connections_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = Route{std::move(handler), false};
}

void HttpServer::stream_route(const std::string& method, const std::string& path, HandlerFunc handler) {
    routes_[method + " " + path] = Route{std::move(handler), true};
}

void HttpServer::start() {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, bind_address_.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid bind address: " + bind_address_);
    }

    // Create socket
    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    // Allow reuse
    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    // Bind
    if (bind(server_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        int err = errno;
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to bind to " + bind_address_ + ":" +
                                 std::to_string(port_) + ": " + std::strerror(err));
    }

    // Listen
    if (listen(server_fd_, LISTEN_BACKLOG) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Failed to listen");
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(server_fd_, (struct sockaddr*)&addr, &addr_len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    listening_ = true;
    std::cout << "[http] listening on " << bind_address_ << ":" << port_ << std::endl;

    // Accept connections
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (struct sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (running_ && errno != EBADF && errno != EINVAL) continue;
            break;
        }

        // Get client IP
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        std::string client_ip = ip;

        // Handle in new thread (simple concurrency)
        ++active_connections_;
        std::thread([this, client_fd, client_ip]() {
            try {
                handle_client(client_fd, client_ip);
            } catch (const std::exception& e) {
                std::cerr << "[http] connection from " << client_ip << " failed: " << e.what() << std::endl;
            }
            close(client_fd);
            --active_connections_;
        }).detach();
    }
    listening_ = false;
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
    set_receive_timeout(client_fd, CLIENT_READ_TIMEOUT_SECONDS);

    // Read request line and headers with size limit
    std::string request_data;
    request_data.reserve(INITIAL_HTTP_BUFFER);

    char buffer[PIPE_BUFFER_SIZE];
    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        ssize_t bytes_read = ::recv(client_fd, buffer, sizeof(buffer), 0);
        if (bytes_read < 0 && errno == EINTR) continue;
        if (bytes_read <= 0) return;

        request_data.append(buffer, static_cast<size_t>(bytes_read));
        header_end = request_data.find("\r\n\r\n");

        if (header_end == std::string::npos && request_data.size() > MAX_HEADER_SIZE) {
            finish(client_fd, HttpResponse::error(431, "malformed_request", "Request headers too large"));
            return;
        }
    }

    // Parse request
    HttpRequest req = parse_request(request_data.substr(0, header_end + 4));
    req.client_ip = client_ip;
    std::string leftover = request_data.substr(header_end + 4);

    finish(client_fd, dispatch(client_fd, req, std::move(leftover)));
}

void HttpServer::finish(int client_fd, HttpResponse resp) {
    resp.headers["Connection"] = "close";
    send_all(client_fd, build_response(resp));

    // Let the client read the response before an unread body resets the
    // connection
    shutdown(client_fd, SHUT_WR);
    set_receive_timeout(client_fd, 1);
    char buffer[PIPE_BUFFER_SIZE];
    size_t drained = 0;
    ssize_t n;
    while (drained < MAX_REQUEST_SIZE && (n = ::recv(client_fd, buffer, sizeof(buffer), 0)) > 0) {
        drained += static_cast<size_t>(n);
    }
}

HttpResponse HttpServer::dispatch(int client_fd, HttpRequest& req, std::string leftover) {
    if (req.method.empty() || req.path.empty()) {
        return HttpResponse::error(400, "malformed_request", "Malformed request line");
    }

    if (!req.header("Transfer-Encoding").empty()) {
        return HttpResponse::error(411, "malformed_request", "Content-Length is required");
    }
    std::string length_str = req.header("Content-Length");
    if (!length_str.empty()) {
        try {
            size_t used = 0;
            unsigned long long length = std::stoull(length_str, &used);
            if (used != length_str.size()) throw std::invalid_argument(length_str);
            req.content_length = static_cast<size_t>(length);
        } catch (const std::exception&) {
            return HttpResponse::error(400, "malformed_request", "Invalid Content-Length");
        }
    }

    // Find handler
    auto it = routes_.find(req.method + " " + req.path);
    if (it == routes_.end()) {
        for (const auto& entry : routes_) {
            if (entry.first.substr(entry.first.find(' ') + 1) == req.path) {
                return HttpResponse::error(405, "method_not_allowed", "Method not allowed");
            }
        }
        return HttpResponse::error(404, "not_found", "Not found");
    }

    SocketBodySource source(client_fd, std::move(leftover), req.content_length);
    if (it->second.streaming) {
        req.body_stream = &source;
    } else {
        if (req.content_length > MAX_REQUEST_SIZE) {
            return HttpResponse::error(413, "payload_too_large", "Request body too large");
        }
        req.body.resize(req.content_length);
        size_t filled = 0;
        while (filled < req.content_length) {
            ssize_t n = source.read(&req.body[filled], req.content_length - filled);
            if (n <= 0) {
                return HttpResponse::error(400, "malformed_request", "Truncated request body");
            }
            filled += static_cast<size_t>(n);
        }
    }

    try {
        return it->second.handler(req);
    } catch (const std::exception& e) {
        std::cerr << "[http] " << req.method << " " << req.path << " failed: " << e.what() << std::endl;
        return HttpResponse::error(500, "internal", e.what());
    }
}

HttpRequest HttpServer::parse_request(const std::string& raw) {
    HttpRequest req;

    size_t head_end = raw.find("\r\n\r\n");
    std::string head = head_end == std::string::npos ? raw : raw.substr(0, head_end);
    if (head_end != std::string::npos) {
        req.body = raw.substr(head_end + 4);
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
        std::string target = line.substr(space1 + 1, space2 - space1 - 1);
        size_t question = target.find('?');
        req.path = target.substr(0, question);
        if (question != std::string::npos) {
            req.query = target.substr(question + 1);
        }
    }

    // Parse headers
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            req.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
    }

    return req;
}

std::string HttpServer::status_text(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 303: return "See Other";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string HttpServer::build_response(const HttpResponse& resp) {
    std::ostringstream out;

    // Status line
    out << "HTTP/1.1 " << resp.status_code << " " << status_text(resp.status_code) << "\r\n";

    // Headers
    for (const auto& [key, value] : resp.headers) {
        out << key << ": " << value << "\r\n";
    }

    // Content length
    out << "Content-Length: " << resp.body.length() << "\r\n";
    out << "\r\n";

    // Body
    out << resp.body;

    return out.str();
}

void HttpServer::send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;  // Client went away
        sent += static_cast<size_t>(n);
    }
}

} // namespace benefice
