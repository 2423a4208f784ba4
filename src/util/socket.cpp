// ZEUS - TCP Socket Helpers Implementation
// Copyright (c) 2024 ZEUS Developers
// MIT License

#include "zeus/util/socket.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#define CLOSE_SOCKET close

namespace zeus {
namespace util {

// ============================================================================
// TcpStream
// ============================================================================

TcpStream::~TcpStream() {
    Close();
}

TcpStream::TcpStream(TcpStream&& other) noexcept
    : fd_(other.fd_), buffer_(std::move(other.buffer_)) {
    other.fd_ = INVALID_SOCKET_VALUE;
}

TcpStream& TcpStream::operator=(TcpStream&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        buffer_ = std::move(other.buffer_);
        other.fd_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

void TcpStream::Close() {
    if (fd_ != INVALID_SOCKET_VALUE) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VALUE;
    }
    buffer_.clear();
}

bool TcpStream::SetTimeout(int64_t timeoutMs) {
    if (fd_ == INVALID_SOCKET_VALUE) {
        return false;
    }
    if (timeoutMs < 1) {
        timeoutMs = 1;
    }
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(timeoutMs / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeoutMs % 1000) * 1000);
    return setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
           setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

TcpStream TcpStream::Connect(const std::string& host, uint16_t port,
                             int64_t timeoutMs, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    
    struct addrinfo* result = nullptr;
    std::string portStr = std::to_string(port);
    int status = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &result);
    if (status != 0) {
        error = "Failed to resolve host " + host + ": " + gai_strerror(status);
        return TcpStream();
    }
    
    for (struct addrinfo* p = result; p != nullptr; p = p->ai_next) {
        TcpStream stream(socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!stream.IsOpen()) {
            continue;
        }
        // SO_SNDTIMEO also bounds connect() on Linux
        stream.SetTimeout(timeoutMs);
        if (connect(stream.fd_, p->ai_addr, p->ai_addrlen) == 0) {
            int one = 1;
            setsockopt(stream.fd_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            freeaddrinfo(result);
            return stream;
        }
    }
    
    freeaddrinfo(result);
    error = "Failed to connect to " + host + ":" + portStr + ": " + std::strerror(errno);
    return TcpStream();
}

bool TcpStream::SendAll(const std::string& data) {
    size_t total = 0;
    while (total < data.size()) {
        ssize_t sent = send(fd_, data.data() + total, data.size() - total, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        total += static_cast<size_t>(sent);
    }
    return true;
}

bool TcpStream::ReadLine(std::string& line, size_t maxLen) {
    while (true) {
        size_t nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        if (buffer_.size() > maxLen) {
            return false;
        }
        
        char chunk[4096];
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool TcpStream::ReadUntilClose(std::string& out, size_t maxLen) {
    out = std::move(buffer_);
    buffer_.clear();
    while (out.size() <= maxLen) {
        if (!out.empty() && out.back() == '\0') {
            return true;
        }
        char chunk[4096];
        ssize_t n = recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            return true;
        }
        if (n < 0) {
            return !out.empty();
        }
        out.append(chunk, static_cast<size_t>(n));
    }
    return false;
}

std::string TcpStream::PeerAddress() const {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "unknown";
    }
    char host[INET6_ADDRSTRLEN] = {0};
    uint16_t port = 0;
    if (addr.ss_family == AF_INET) {
        auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        port = ntohs(in->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    }
    return std::string(host) + ":" + std::to_string(port);
}

// ============================================================================
// TcpListener
// ============================================================================

TcpListener::~TcpListener() {
    Close();
}

bool TcpListener::Listen(const std::string& bindAddress, uint16_t port, int backlog,
                         std::string& error) {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == INVALID_SOCKET_VALUE) {
        error = "Failed to create socket";
        return false;
    }
    
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (bindAddress.empty() || bindAddress == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        error = "Invalid bind address " + bindAddress;
        CLOSE_SOCKET(fd);
        return false;
    }
    
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        error = "Failed to bind to " + bindAddress + ":" + std::to_string(port) +
                ": " + std::strerror(errno);
        CLOSE_SOCKET(fd);
        return false;
    }
    if (listen(fd, backlog) < 0) {
        error = std::string("Failed to listen: ") + std::strerror(errno);
        CLOSE_SOCKET(fd);
        return false;
    }
    
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }
    fd_.store(fd);
    return true;
}

TcpStream TcpListener::Accept() {
    while (true) {
        socket_t fd = fd_.load();
        if (fd == INVALID_SOCKET_VALUE) {
            break;
        }
        socket_t client = accept(fd, nullptr, nullptr);
        if (client >= 0) {
            return TcpStream(client);
        }
        if (errno != EINTR && errno != ECONNABORTED) {
            break;
        }
    }
    return TcpStream();
}

void TcpListener::Close() {
    socket_t fd = fd_.exchange(INVALID_SOCKET_VALUE);
    if (fd != INVALID_SOCKET_VALUE) {
        // shutdown() wakes a thread blocked in accept()
        shutdown(fd, SHUT_RDWR);
        CLOSE_SOCKET(fd);
    }
}

bool SplitHostPort(const std::string& endpoint, std::string& host, uint16_t& port) {
    size_t colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= endpoint.size()) {
        return false;
    }
    std::string portStr = endpoint.substr(colon + 1);
    unsigned long value = 0;
    for (char c : portStr) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) {
            return false;
        }
    }
    if (value == 0) {
        return false;
    }
    host = endpoint.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

} // namespace util
} // namespace zeus
