#include "TcpSocket.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace {
std::string errnoText() {
    return std::strerror(errno);
}

void fillAddress(const std::string& ip, std::uint16_t port, sockaddr_in& addr) {
    addr = sockaddr_in{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || ip == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    }
    else if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid IP address: " + ip);
    }
}
}

TcpSocket::TcpSocket() = default;

TcpSocket::TcpSocket(int f)
    : fd(f) {
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept
    : fd(o.fd) {
    o.fd = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd = o.fd;
        o.fd = -1;
    }
    return *this;
}

TcpSocket TcpSocket::listenOn(const std::string& ip, std::uint16_t port, int backlog) {
    TcpSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.isValid())
        throw std::runtime_error("socket() failed: " + errnoText());

    int on = 1;
    setsockopt(sock.fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

    sockaddr_in addr{};
    fillAddress(ip, port, addr);

    if (::bind(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        throw std::runtime_error("bind() failed: " + errnoText());

    if (::listen(sock.fd, backlog) < 0)
        throw std::runtime_error("listen() failed: " + errnoText());

    return sock;
}

TcpSocket TcpSocket::connectTo(const std::string& ip, std::uint16_t port) {
    TcpSocket sock(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
    if (!sock.isValid())
        throw std::runtime_error("socket() failed: " + errnoText());

    sockaddr_in addr{};
    fillAddress(ip, port, addr);

    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0)
        throw std::runtime_error("connect() failed: " + errnoText());

    sock.tune();
    return sock;
}

bool TcpSocket::acceptWithin(int timeoutMs, TcpSocket& out) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, timeoutMs);
    if (ready <= 0)
        return false;

    sockaddr_in peer{};
    socklen_t peerLen = sizeof(peer);
    const int client = ::accept(fd, reinterpret_cast<sockaddr*>(&peer), &peerLen);
    if (client < 0)
        return false;

    out = TcpSocket(client);
    out.tune();
    return true;
}

bool TcpSocket::sendAll(const void* buf, std::size_t len) {
    const char* p = static_cast<const char*>(buf);
    std::size_t remaining = len;

    while (remaining > 0) {
        const ssize_t sent = ::send(fd, p, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{};
                pfd.fd = fd;
                pfd.events = POLLOUT;
                if (::poll(&pfd, 1, 1000) < 0)
                    return false;
                continue;
            }
            return false;
        }
        if (sent == 0)
            return false;

        p += sent;
        remaining -= static_cast<std::size_t>(sent);
    }
    return true;
}

ssize_t TcpSocket::recvSome(void* buf, std::size_t len) {
    while (true) {
        const ssize_t n = ::recv(fd, buf, len, 0);
        if (n < 0 && errno == EINTR)
            continue;
        return n;
    }
}

ssize_t TcpSocket::sendSome(const void* buf, std::size_t len) {
    while (true) {
        const ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n < 0 && errno == EINTR)
            continue;
        return n;
    }
}

bool TcpSocket::setTimeouts(long seconds) {
    timeval tv{};
    tv.tv_sec = seconds;
    tv.tv_usec = 0;

    const bool rcv = setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    const bool snd = setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
    return rcv && snd;
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

std::uint16_t TcpSocket::localPort() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0)
        return 0;
    return ntohs(addr.sin_port);
}

std::string TcpSocket::peerAddr() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0)
        return "unknown";

    char ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

void TcpSocket::shutdownBoth() {
    if (fd >= 0)
        ::shutdown(fd, SHUT_RDWR);
}

void TcpSocket::close() {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}
