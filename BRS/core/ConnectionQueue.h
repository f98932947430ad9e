#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

#include "../net/TcpSocket.h"

// Accepted connections waiting for a worker. Bounded; the acceptor sheds load when full.
class ConnectionQueue {
public:
    explicit ConnectionQueue(std::size_t capacity);

    // False when the queue is full or closed; the socket is left with the caller.
    bool push(TcpSocket& connection);
    std::optional<TcpSocket> popFor(std::chrono::milliseconds timeout);

    void close();
    std::size_t size() const;

private:
    std::size_t capacity;
    std::deque<TcpSocket> pending;
    bool isClosed{ false };
    mutable std::mutex mtx;
    std::condition_variable cv;
};
