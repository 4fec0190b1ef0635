#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sf::test {

// Minimal HTTP/1.1 server on 127.0.0.1 for exercising curl-based backends. One request per
// connection, no Range support, every reply closes the connection.
class LocalHttpServer {
public:
    struct Request {
        std::string method;
        std::string target;     // path and query
        std::string headers;    // raw header block
        std::string body;

        [[nodiscard]] bool hasHeader(const std::string& lowerName) const {
            std::string lowered;
            for (const char c : headers) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return lowered.find("\n" + lowerName + ":") != std::string::npos;
        }
    };

    struct Response {
        int status = 200;
        std::string body;
        std::vector<std::string> headers;
    };

    using Handler = std::function<Response(const Request&)>;

    explicit LocalHttpServer(Handler handler) : handler_(std::move(handler)) {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) throw std::runtime_error("socket() failed");

        const int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(fd_, 8) < 0) {
            ::close(fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LocalHttpServer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<Request> requests() const {
        std::scoped_lock lock(mutex_);
        return requests_;
    }

private:
    static const char* reasonFor(const int status) {
        switch (status) {
            case 200: return "OK";
            case 302: return "Found";
            case 404: return "Not Found";
            case 413: return "Request Entity Too Large";
            case 429: return "Too Many Requests";
            default: return "Status";
        }
    }

    void serve() {
        while (!stop_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;

            const int client = ::accept(fd_, nullptr, nullptr);
            if (client < 0) continue;
            handle(client);
            ::close(client);
        }
    }

    void handle(const int client) {
        std::string raw;
        char buf[8192];
        size_t headerEnd = std::string::npos;
        size_t contentLength = 0;

        while (true) {
            pollfd pfd{client, POLLIN, 0};
            if (::poll(&pfd, 1, 2000) <= 0) return;
            const ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) return;
            raw.append(buf, static_cast<size_t>(n));

            if (headerEnd == std::string::npos) {
                headerEnd = raw.find("\r\n\r\n");
                if (headerEnd == std::string::npos) continue;

                std::string lowered;
                for (const char c : raw.substr(0, headerEnd + 2)) lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                if (const auto cl = lowered.find("\ncontent-length:"); cl != std::string::npos)
                    contentLength = std::stoul(lowered.substr(cl + 16));
                if (lowered.find("\nexpect: 100-continue") != std::string::npos) {
                    const std::string cont = "HTTP/1.1 100 Continue\r\n\r\n";
                    ::send(client, cont.data(), cont.size(), MSG_NOSIGNAL);
                }
            }
            if (raw.size() >= headerEnd + 4 + contentLength) break;
        }

        Request req;
        const auto lineEnd = raw.find("\r\n");
        const auto requestLine = raw.substr(0, lineEnd);
        const auto sp1 = requestLine.find(' ');
        const auto sp2 = requestLine.find(' ', sp1 + 1);
        req.method = requestLine.substr(0, sp1);
        req.target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
        req.headers = raw.substr(lineEnd, headerEnd + 2 - lineEnd);
        req.body = raw.substr(headerEnd + 4);

        {
            std::scoped_lock lock(mutex_);
            requests_.push_back(req);
        }

        const auto res = handler_(req);
        std::string out = "HTTP/1.1 " + std::to_string(res.status) + " " + reasonFor(res.status) + "\r\n";
        out += "Content-Length: " + std::to_string(res.body.size()) + "\r\n";
        out += "Connection: close\r\n";
        for (const auto& h : res.headers) out += h + "\r\n";
        out += "\r\n";
        if (req.method != "HEAD") out += res.body;

        size_t sent = 0;
        while (sent < out.size()) {
            const ssize_t n = ::send(client, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) return;
            sent += static_cast<size_t>(n);
        }
    }

    Handler handler_;
    int fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<Request> requests_;
};

}
