#pragma once
#include <string>
#include <cstdint>
#include <cstddef>

#include "ResponseSink.h"
#include "../core/utils.h"
#include "../core/CancellationToken.h"
#include "../monitor/Logger.h"

struct StreamState {
    std::string boundaryToken;
    std::uint64_t bytesWrittenSoFar = 0;
    bool clientConnected = true;
    long long lastIndexSent = -1;
};

// Writes rendered parts onto one response as multipart/mixed.
// The only writer of the sink for the lifetime of a job.
class MultipartEncoder {
public:
    MultipartEncoder(ResponseSink& sink, Logger& logger, std::string boundary);

    bool begin(std::size_t total, long keepAliveSec);

    // True once the whole part was handed to the transport and any backpressure has cleared.
    // False if cancellation or a disconnect was observed before or while sending.
    // Throws TransportWriteError when the transport fails mid-part.
    bool writePart(const RenderedPart& part, std::size_t total, const CancellationToken& cancel);

    bool finish();
    void abort();

    const StreamState& state() const;
    std::size_t partsWritten() const;

    static std::string contentType(const std::string& boundary);
    static std::string partHeader(const std::string& boundary, const RenderedPart& part,
        std::size_t total, bool first);
    static std::string terminator(const std::string& boundary);

private:
    bool emit(const char* data, std::size_t size, bool& backpressure);

private:
    ResponseSink& sink;
    Logger& logger;
    StreamState streamState;
    std::size_t written{ 0 };
    bool finished{ false };
};
