#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "../core/utils.h"

// Incremental multipart/mixed reader. Bytes are fed as they arrive and each part is
// handed to the callback once all of its body bytes are present.
// The boundary is searched as a raw byte pattern; bodies are never decoded as text.
class MultipartDecoder {
public:
    using PartHandler = std::function<void(DecodedPart&&)>;
    using HeaderMap = std::map<std::string, std::string>;

    struct Result {
        std::vector<DecodedPart> parts;
        std::vector<std::string> diagnostics;
        bool terminated = false;
    };

    MultipartDecoder(std::string boundary, PartHandler onPart);

    // Throws ProtocolError when the content type is not multipart or has no boundary.
    static std::string boundaryFromContentType(const std::string& contentType);

    // One-shot decode of a complete or truncated body.
    static Result decode(const std::string& contentType, const char* body, std::size_t size);

    void feed(const char* data, std::size_t size);
    // End of input. A part whose bytes did not all arrive is dropped.
    // Throws ProtocolError if bytes were received but the boundary never appeared.
    void finish();

    bool terminated() const { return sawTerminator; }
    std::size_t partsDecoded() const { return decoded; }
    const std::vector<std::string>& diagnostics() const { return notes; }

private:
    enum class Phase {
        Preamble,
        AfterDelimiter,
        Headers,
        SizedBody,
        OpenBody,
        Done
    };

    enum class DelimiterEnd {
        Yes,
        No,
        NeedMore
    };

    // Whether the bytes at at complete a delimiter: "--", or optional blanks and a line break
    DelimiterEnd delimiterEndsAt(std::size_t at) const;

    void process(bool final);
    bool stepPreamble(bool final);
    bool stepAfterDelimiter(bool final);
    bool stepHeaders(bool final);
    bool stepSizedBody(bool final);
    bool stepOpenBody(bool final);

    bool parseHeaders(std::size_t begin, std::size_t end);
    void emit(std::size_t begin, std::size_t end);
    void dropPart(const std::string& reason);
    void compact();

private:
    std::string delimiter;
    PartHandler handler;

    std::string buffer;
    std::size_t pos{ 0 };
    std::size_t searchFrom{ 0 };

    Phase phase{ Phase::Preamble };
    HeaderMap headers;
    std::size_t bodyLength{ 0 };
    std::size_t ordinal{ 0 };
    std::size_t decoded{ 0 };
    std::size_t received{ 0 };
    bool sawDelimiter{ false };
    bool sawTerminator{ false };
    std::vector<std::string> notes;
};
