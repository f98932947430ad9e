#include "ConnectionQueue.h"

ConnectionQueue::ConnectionQueue(std::size_t cap)
    : capacity(cap) {
}

bool ConnectionQueue::push(TcpSocket& connection) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (isClosed || pending.size() >= capacity)
            return false;
        pending.push_back(std::move(connection));
    }
    cv.notify_one();
    return true;
}

std::optional<TcpSocket> ConnectionQueue::popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [&]() {
        return isClosed || !pending.empty();
        });

    if (pending.empty())
        return std::nullopt;

    TcpSocket connection = std::move(pending.front());
    pending.pop_front();
    return connection;
}

void ConnectionQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        isClosed = true;
        pending.clear();
    }
    cv.notify_all();
}

std::size_t ConnectionQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pending.size();
}
