#pragma once
#include <atomic>
#include <chrono>
#include <string>

#include "ResponseSink.h"
#include "TcpSocket.h"

// HTTP/1.1 response over an accepted socket. The body is chunk-framed when the head
// declares Transfer-Encoding: chunked. Writes never block: bytes go to an outgoing buffer
// that is flushed opportunistically, and Backpressure is reported while it is above the
// high-water mark.
class SocketResponse : public ResponseSink {
public:
    SocketResponse(TcpSocket& socket, std::size_t highWaterBytes,
        std::chrono::milliseconds writeTimeout);

    bool sendHead(int status, const HeaderList& headers) override;
    WriteStatus write(const char* data, std::size_t size) override;
    bool waitDrain(const CancellationToken& cancel) override;
    bool connected() override;
    bool end() override;
    void abort() override;

    std::size_t pendingBytes() const { return outgoing.size() - sentOffset; }

    static const char* reasonPhrase(int status);

private:
    // False when the connection is no longer usable
    bool flush();
    void append(const char* data, std::size_t size);

private:
    TcpSocket& socket;
    std::size_t highWater;
    std::chrono::milliseconds timeout;

    std::string outgoing;
    std::size_t sentOffset{ 0 };
    bool chunked{ false };
    bool headWritten{ false };
    bool ended{ false };
    std::atomic<bool> closed{ false };
};
