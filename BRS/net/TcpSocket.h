#pragma once
#include <string>
#include <cstddef>
#include <cstdint>
#include <sys/types.h>

// RAII wrapper around a POSIX TCP socket
class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(int fd);
    ~TcpSocket();

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Server: bind + listen. Throws std::runtime_error on failure.
    static TcpSocket listenOn(const std::string& ip, std::uint16_t port, int backlog = 128);
    // Client: connect. Throws std::runtime_error on failure.
    static TcpSocket connectTo(const std::string& ip, std::uint16_t port);

    // Waits up to timeoutMs for a pending connection. False on timeout.
    bool acceptWithin(int timeoutMs, TcpSocket& out);

    bool sendAll(const void* buf, std::size_t len);
    // Returns bytes read, 0 on orderly close, -1 on error or timeout
    ssize_t recvSome(void* buf, std::size_t len);
    // Non-blocking send; -1 with errno EAGAIN when the kernel buffer is full
    ssize_t sendSome(const void* buf, std::size_t len);

    bool setTimeouts(long seconds);
    void tune();

    bool isValid() const { return fd >= 0; }
    int native() const { return fd; }
    std::uint16_t localPort() const;
    std::string peerAddr() const;

    void shutdownBoth();
    void close();

private:
    int fd{ -1 };
};
