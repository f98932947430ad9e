#include "MultipartEncoder.h"
#include "Encoding.h"
#include "../core/errors.h"

#include <sstream>

MultipartEncoder::MultipartEncoder(ResponseSink& s, Logger& log, std::string boundary)
    : sink(s),
    logger(log) {
    streamState.boundaryToken = std::move(boundary);
}

std::string MultipartEncoder::contentType(const std::string& boundary) {
    return "multipart/mixed; boundary=" + boundary;
}

std::string MultipartEncoder::partHeader(const std::string& boundary, const RenderedPart& part,
    std::size_t total, bool first) {
    const std::string encodedName = encoding::percentEncode(part.displayName);

    std::ostringstream os;
    if (!first)
        os << "\r\n";
    os << "--" << boundary << "\r\n";
    os << "Content-Type: application/pdf\r\n";
    os << "Content-Disposition: attachment; filename=\"" << encodedName << ".pdf\"\r\n";
    os << "X-Display-Name: " << encodedName << "\r\n";
    os << "X-Record-Id: " << encoding::percentEncode(part.id) << "\r\n";
    os << "X-Index: " << part.index << "\r\n";
    os << "X-Total: " << total << "\r\n";
    os << "Content-Length: " << part.bytes.size() << "\r\n";
    os << "\r\n";
    return os.str();
}

std::string MultipartEncoder::terminator(const std::string& boundary) {
    return "\r\n--" + boundary + "--\r\n";
}

bool MultipartEncoder::begin(std::size_t total, long keepAliveSec) {
    HeaderList headers{
        { "Content-Type", contentType(streamState.boundaryToken) },
        { "X-Total-Count", std::to_string(total) },
        { "Transfer-Encoding", "chunked" },
        { "Cache-Control", "no-cache" },
        { "Connection", "keep-alive" },
        { "Keep-Alive", "timeout=" + std::to_string(keepAliveSec) }
    };

    if (!sink.sendHead(200, headers)) {
        streamState.clientConnected = false;
        return false;
    }
    return true;
}

bool MultipartEncoder::emit(const char* data, std::size_t size, bool& backpressure) {
    switch (sink.write(data, size)) {
    case WriteStatus::Accepted:
        break;
    case WriteStatus::Backpressure:
        backpressure = true;
        break;
    case WriteStatus::Closed:
        streamState.clientConnected = false;
        return false;
    }
    streamState.bytesWrittenSoFar += size;
    return true;
}

bool MultipartEncoder::writePart(const RenderedPart& part, std::size_t total,
    const CancellationToken& cancel) {
    if (cancel.cancelled())
        return false;

    if (!sink.connected()) {
        streamState.clientConnected = false;
        return false;
    }

    const std::string header = partHeader(streamState.boundaryToken, part, total, written == 0);

    bool backpressure = false;
    if (!emit(header.data(), header.size(), backpressure))
        throw TransportWriteError("connection lost while writing headers of part "
            + std::to_string(part.index));

    if (!part.bytes.empty() && !emit(part.bytes.data(), part.bytes.size(), backpressure))
        throw TransportWriteError("connection lost while writing body of part "
            + std::to_string(part.index));

    ++written;
    streamState.lastIndexSent = static_cast<long long>(part.index);

    if (backpressure) {
        logger.warn("Backpressure after part " + std::to_string(part.index + 1) + "/"
            + std::to_string(total) + ", waiting for drain...");

        if (!sink.waitDrain(cancel)) {
            if (cancel.cancelled())
                return false;
            streamState.clientConnected = false;
            throw TransportWriteError("transport did not drain after part "
                + std::to_string(part.index));
        }
    }

    return true;
}

bool MultipartEncoder::finish() {
    if (finished)
        return true;
    finished = true;

    const std::string tail = terminator(streamState.boundaryToken);
    bool backpressure = false;
    if (!emit(tail.data(), tail.size(), backpressure))
        return false;

    return sink.end();
}

void MultipartEncoder::abort() {
    if (finished)
        return;
    finished = true;
    sink.abort();
}

const StreamState& MultipartEncoder::state() const {
    return streamState;
}

std::size_t MultipartEncoder::partsWritten() const {
    return written;
}
