// ZEUS - TCP Socket Helpers
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// Blocking POSIX TCP streams with per-call timeouts, used for the
// validator <-> miner line protocol and the cgminer API.

#ifndef ZEUS_UTIL_SOCKET_H
#define ZEUS_UTIL_SOCKET_H

#include <atomic>
#include <cstdint>
#include <string>

namespace zeus {
namespace util {

using socket_t = int;
constexpr socket_t INVALID_SOCKET_VALUE = -1;

/// Largest line accepted by ReadLine
constexpr size_t MAX_LINE_SIZE = 1024 * 1024;

// ============================================================================
// TcpStream
// ============================================================================

/// Owning wrapper around a connected socket
class TcpStream {
public:
    TcpStream() = default;
    explicit TcpStream(socket_t fd) : fd_(fd) {}
    ~TcpStream();
    
    TcpStream(TcpStream&& other) noexcept;
    TcpStream& operator=(TcpStream&& other) noexcept;
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;
    
    /**
     * Resolve host and connect. The timeout also becomes the send/receive
     * timeout of the returned stream.
     * 
     * @param error Set on failure
     * @return Closed stream on failure
     */
    static TcpStream Connect(const std::string& host, uint16_t port,
                             int64_t timeoutMs, std::string& error);
    
    bool IsOpen() const { return fd_ != INVALID_SOCKET_VALUE; }
    socket_t Fd() const { return fd_; }
    
    /// Apply SO_RCVTIMEO/SO_SNDTIMEO
    bool SetTimeout(int64_t timeoutMs);
    
    /// Write the whole buffer
    bool SendAll(const std::string& data);
    
    /// Read one '\n'-terminated line (terminator and trailing '\r' stripped)
    bool ReadLine(std::string& line, size_t maxLen = MAX_LINE_SIZE);
    
    /// Read until the peer closes or sends a NUL byte
    bool ReadUntilClose(std::string& out, size_t maxLen = MAX_LINE_SIZE);
    
    /// Remote address as "ip:port"
    std::string PeerAddress() const;
    
    void Close();

private:
    socket_t fd_{INVALID_SOCKET_VALUE};
    std::string buffer_;
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();
    
    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;
    
    /// Bind and listen; port 0 picks an ephemeral port
    bool Listen(const std::string& bindAddress, uint16_t port, int backlog,
                std::string& error);
    
    /// Block for the next connection; closed stream once Close() was called
    TcpStream Accept();
    
    /// Unblocks a pending Accept()
    void Close();
    
    bool IsListening() const { return fd_.load() != INVALID_SOCKET_VALUE; }
    
    /// Port actually bound
    uint16_t Port() const { return port_; }

private:
    std::atomic<socket_t> fd_{INVALID_SOCKET_VALUE};
    uint16_t port_{0};
};

/// Split "host:port"; false when malformed
bool SplitHostPort(const std::string& endpoint, std::string& host, uint16_t& port);

} // namespace util
} // namespace zeus

#endif // ZEUS_UTIL_SOCKET_H
