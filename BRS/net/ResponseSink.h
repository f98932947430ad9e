#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstddef>

#include "../core/CancellationToken.h"

using HeaderList = std::vector<std::pair<std::string, std::string>>;

enum class WriteStatus {
    Accepted,
    // Bytes were taken but the outgoing buffer is over its high-water mark
    Backpressure,
    Closed
};

// Outgoing side of one streamed HTTP response.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    virtual bool sendHead(int status, const HeaderList& headers) = 0;
    virtual WriteStatus write(const char* data, std::size_t size) = 0;

    // Blocks until everything buffered has been accepted by the peer.
    // False on cancellation, timeout or a dead connection.
    virtual bool waitDrain(const CancellationToken& cancel) = 0;

    virtual bool connected() = 0;

    // Terminates the body normally.
    virtual bool end() = 0;
    // Drops the connection without terminating the body.
    virtual void abort() = 0;
};
