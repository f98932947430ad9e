#include "SocketResponse.h"
#include "Encoding.h"

#include <poll.h>
#include <sys/socket.h>

#include <cerrno>
#include <sstream>

namespace {
constexpr std::chrono::milliseconds kPollSlice{ 100 };
}

SocketResponse::SocketResponse(TcpSocket& s, std::size_t highWaterBytes,
    std::chrono::milliseconds writeTimeout)
    : socket(s),
    highWater(highWaterBytes),
    timeout(writeTimeout) {
}

const char* SocketResponse::reasonPhrase(int status) {
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

bool SocketResponse::sendHead(int status, const HeaderList& headers) {
    if (headWritten || closed.load())
        return false;

    std::ostringstream os;
    os << "HTTP/1.1 " << status << ' ' << reasonPhrase(status) << "\r\n";
    for (const auto& header : headers) {
        os << header.first << ": " << header.second << "\r\n";

        if (encoding::toLower(header.first) == "transfer-encoding"
            && encoding::toLower(header.second) == "chunked")
            chunked = true;
    }
    os << "\r\n";

    const std::string head = os.str();
    outgoing.append(head);
    headWritten = true;

    return flush();
}

void SocketResponse::append(const char* data, std::size_t size) {
    if (!chunked) {
        outgoing.append(data, size);
        return;
    }

    std::ostringstream os;
    os << std::hex << size << "\r\n";
    outgoing.append(os.str());
    outgoing.append(data, size);
    outgoing.append("\r\n");
}

WriteStatus SocketResponse::write(const char* data, std::size_t size) {
    if (closed.load() || !headWritten || ended)
        return WriteStatus::Closed;

    // A zero-sized chunk would terminate the body
    if (size > 0)
        append(data, size);

    if (!flush())
        return WriteStatus::Closed;

    return pendingBytes() > highWater ? WriteStatus::Backpressure : WriteStatus::Accepted;
}

bool SocketResponse::flush() {
    while (sentOffset < outgoing.size()) {
        const ssize_t n = socket.sendSome(outgoing.data() + sentOffset, outgoing.size() - sentOffset);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK)
                break;
            closed.store(true);
            return false;
        }
        sentOffset += static_cast<std::size_t>(n);
    }

    if (sentOffset == outgoing.size()) {
        outgoing.clear();
        sentOffset = 0;
    }
    else if (sentOffset > (1u << 20)) {
        outgoing.erase(0, sentOffset);
        sentOffset = 0;
    }
    return true;
}

bool SocketResponse::waitDrain(const CancellationToken& cancel) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        const std::size_t before = pendingBytes();
        if (!flush())
            return false;
        if (pendingBytes() == 0)
            return true;

        if (pendingBytes() < before)
            deadline = std::chrono::steady_clock::now() + timeout;

        if (cancel.cancelled())
            return false;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;

        pollfd pfd{};
        pfd.fd = socket.native();
        pfd.events = POLLOUT;
        const int ready = ::poll(&pfd, 1, static_cast<int>(kPollSlice.count()));
        if (ready < 0 && errno != EINTR) {
            closed.store(true);
            return false;
        }
        if (ready > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
            closed.store(true);
            return false;
        }
    }
}

bool SocketResponse::connected() {
    if (closed.load())
        return false;

    pollfd pfd{};
    pfd.fd = socket.native();
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, 0);
    if (ready <= 0)
        return true;

    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
        closed.store(true);
        return false;
    }

    if (pfd.revents & POLLIN) {
        char peeked = 0;
        const ssize_t n = ::recv(socket.native(), &peeked, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
            closed.store(true);
            return false;
        }
    }
    return true;
}

bool SocketResponse::end() {
    if (closed.load() || !headWritten)
        return false;
    if (ended)
        return true;

    if (chunked)
        outgoing.append("0\r\n\r\n");
    ended = true;

    CancellationToken never;
    return waitDrain(never);
}

void SocketResponse::abort() {
    closed.store(true);
    ended = true;
    socket.shutdownBoth();
}
