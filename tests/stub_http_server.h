#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ocl {
namespace gaiasync {
namespace test_support {

/**
 * One HTTP request as received by the stub server
 */
struct StubRequest {
    std::string method;
    std::string path;                              ///< Request target without query string
    std::map<std::string, std::string> headers;    ///< Lower-case header names
    std::string body;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }
};

/**
 * Canned HTTP response
 */
struct StubResponse {
    int status = 200;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    static StubResponse ok(std::string body = "",
                           std::vector<std::pair<std::string, std::string>> headers = {}) {
        StubResponse response;
        response.body = std::move(body);
        response.headers = std::move(headers);
        return response;
    }

    static StubResponse redirect(int status, const std::string& location) {
        StubResponse response;
        response.status = status;
        response.headers.emplace_back("Location", location);
        return response;
    }

    static StubResponse error(int status, std::string body = "") {
        StubResponse response;
        response.status = status;
        response.body = std::move(body);
        return response;
    }
};

/**
 * Decode an application/x-www-form-urlencoded body
 */
inline std::map<std::string, std::string> decodeForm(const std::string& body) {
    auto unescape = [](const std::string& text) {
        std::string out;
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '+') {
                out += ' ';
            } else if (text[i] == '%' && i + 2 < text.size()) {
                out += static_cast<char>(std::strtol(text.substr(i + 1, 2).c_str(), nullptr, 16));
                i += 2;
            } else {
                out += text[i];
            }
        }
        return out;
    };

    std::map<std::string, std::string> fields;
    if (body.empty()) {
        return fields;
    }
    size_t pos = 0;
    while (true) {
        size_t amp = body.find('&', pos);
        std::string pair = body.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            fields[unescape(pair)] = "";
        } else {
            fields[unescape(pair.substr(0, eq))] = unescape(pair.substr(eq + 1));
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return fields;
}

/**
 * Minimal HTTP/1.1 server on 127.0.0.1 for exercising the TAP client
 *
 * Every connection is served on its own thread with "Connection: close",
 * so slow handlers do not block other clients. All requests are recorded.
 */
class StubHttpServer {
public:
    using Handler = std::function<StubResponse(const StubRequest&)>;

    explicit StubHttpServer(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::runtime_error("stub server: socket() failed");
        }
        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 16) < 0) {
            ::close(listen_fd_);
            throw std::runtime_error("stub server: bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        accept_thread_ = std::thread([this] { acceptLoop(); });
    }

    ~StubHttpServer() { stop(); }

    StubHttpServer(const StubHttpServer&) = delete;
    StubHttpServer& operator=(const StubHttpServer&) = delete;

    void stop() {
        if (stopped_.exchange(true)) {
            return;
        }
        ::shutdown(listen_fd_, SHUT_RDWR);
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        ::close(listen_fd_);
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    std::string baseUrl() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    std::vector<StubRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    size_t count(const std::string& method, const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& request : requests_) {
            if (request.method == method && request.path == path) ++n;
        }
        return n;
    }

    /// Last request to method + path, empty request if none
    StubRequest last(const std::string& method, const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = requests_.rbegin(); it != requests_.rend(); ++it) {
            if (it->method == method && it->path == path) return *it;
        }
        return StubRequest();
    }

private:
    void acceptLoop() {
        while (true) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (!stopped_ && errno == EINTR) continue;
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            workers_.emplace_back([this, fd] { serve(fd); });
        }
    }

    static bool sendAll(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return false;
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    static std::string lower(std::string text) {
        for (auto& ch : text) {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return text;
    }

    static std::string reason(int status) {
        switch (status) {
            case 200: return "OK";
            case 302: return "Found";
            case 303: return "See Other";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 500: return "Internal Server Error";
            case 503: return "Service Unavailable";
            default: return "Status";
        }
    }

    void serve(int fd) {
        std::string data;
        char buffer[4096];
        size_t header_end;
        while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                ::close(fd);
                return;
            }
            data.append(buffer, static_cast<size_t>(n));
        }

        StubRequest request;
        size_t line_end = data.find("\r\n");
        std::string request_line = data.substr(0, line_end);
        size_t sp1 = request_line.find(' ');
        size_t sp2 = request_line.find(' ', sp1 + 1);
        request.method = request_line.substr(0, sp1);
        std::string target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
        request.path = target.substr(0, target.find('?'));

        size_t pos = line_end + 2;
        while (pos < header_end) {
            size_t end = data.find("\r\n", pos);
            std::string line = data.substr(pos, end - pos);
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                size_t value_start = line.find_first_not_of(' ', colon + 1);
                request.headers[lower(line.substr(0, colon))] =
                    value_start == std::string::npos ? "" : line.substr(value_start);
            }
            pos = end + 2;
        }

        size_t length = 0;
        std::string content_length = request.header("content-length");
        if (!content_length.empty()) {
            length = static_cast<size_t>(std::stoul(content_length));
        }

        std::string body = data.substr(header_end + 4);
        if (body.size() < length &&
            lower(request.header("expect")).find("100-continue") != std::string::npos) {
            sendAll(fd, "HTTP/1.1 100 Continue\r\n\r\n");
        }
        while (body.size() < length) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            body.append(buffer, static_cast<size_t>(n));
        }
        request.body = body.substr(0, length);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        StubResponse response = handler_(request);

        std::string out = "HTTP/1.1 " + std::to_string(response.status) + " " +
                          reason(response.status) + "\r\n";
        for (const auto& header : response.headers) {
            out += header.first + ": " + header.second + "\r\n";
        }
        out += "Content-Type: text/plain\r\n";
        out += "Content-Length: " + std::to_string(response.body.size()) + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += response.body;
        sendAll(fd, out);

        ::shutdown(fd, SHUT_WR);
        ::close(fd);
    }

    Handler handler_;
    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopped_{false};
    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::vector<StubRequest> requests_;
};

} // namespace test_support
} // namespace gaiasync
} // namespace ocl
