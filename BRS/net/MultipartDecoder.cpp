#include "MultipartDecoder.h"
#include "Encoding.h"
#include "../core/errors.h"

#include <algorithm>

namespace {
constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
constexpr std::size_t kCompactThreshold = 64 * 1024;

bool parseSize(const std::string& text, std::size_t& out) {
    if (text.empty() || text.size() > 19)
        return false;

    std::size_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9')
            return false;
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    out = value;
    return true;
}

std::string filenameFromDisposition(const std::string& disposition) {
    const std::string key = "filename=\"";
    const auto start = disposition.find(key);
    if (start == std::string::npos)
        return {};

    const auto end = disposition.find('"', start + key.size());
    if (end == std::string::npos)
        return {};

    std::string name = disposition.substr(start + key.size(), end - start - key.size());
    const std::string ext = ".pdf";
    if (name.size() >= ext.size()
        && encoding::toLower(name.substr(name.size() - ext.size())) == ext)
        name.resize(name.size() - ext.size());

    return encoding::percentDecode(name);
}
}

MultipartDecoder::MultipartDecoder(std::string boundary, PartHandler onPart)
    : delimiter("--" + boundary),
    handler(std::move(onPart)) {
}

std::string MultipartDecoder::boundaryFromContentType(const std::string& contentType) {
    const auto semi = contentType.find(';');
    const std::string mediaType = encoding::toLower(encoding::trim(contentType.substr(0, semi)));
    if (mediaType.rfind("multipart/", 0) != 0)
        throw ProtocolError("response is not multipart: '" + contentType + "'");

    std::size_t start = semi;
    while (start != std::string::npos) {
        const auto next = contentType.find(';', start + 1);
        const std::string param = contentType.substr(start + 1,
            next == std::string::npos ? std::string::npos : next - start - 1);
        start = next;

        const auto eq = param.find('=');
        if (eq == std::string::npos)
            continue;

        if (encoding::toLower(encoding::trim(param.substr(0, eq))) != "boundary")
            continue;

        std::string value = encoding::trim(param.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);

        if (value.empty())
            break;
        return value;
    }

    throw ProtocolError("no boundary in content type: '" + contentType + "'");
}

MultipartDecoder::Result MultipartDecoder::decode(const std::string& contentType,
    const char* body, std::size_t size) {
    Result result;
    MultipartDecoder decoder(boundaryFromContentType(contentType), [&](DecodedPart&& part) {
        result.parts.push_back(std::move(part));
        });

    decoder.feed(body, size);
    decoder.finish();

    result.diagnostics = decoder.diagnostics();
    result.terminated = decoder.terminated();
    return result;
}

void MultipartDecoder::feed(const char* data, std::size_t size) {
    if (phase == Phase::Done || size == 0)
        return;

    buffer.append(data, size);
    received += size;
    process(false);
}

void MultipartDecoder::finish() {
    process(true);

    if (!sawDelimiter && received > 0)
        throw ProtocolError("boundary '" + delimiter.substr(2) + "' not found in response body");
}

void MultipartDecoder::process(bool final) {
    bool progressed = true;
    while (progressed && phase != Phase::Done) {
        switch (phase) {
        case Phase::Preamble:       progressed = stepPreamble(final); break;
        case Phase::AfterDelimiter: progressed = stepAfterDelimiter(final); break;
        case Phase::Headers:        progressed = stepHeaders(final); break;
        case Phase::SizedBody:      progressed = stepSizedBody(final); break;
        case Phase::OpenBody:       progressed = stepOpenBody(final); break;
        case Phase::Done:           progressed = false; break;
        }
    }

    if (final)
        phase = Phase::Done;

    compact();
}

bool MultipartDecoder::stepPreamble(bool final) {
    const auto p = buffer.find(delimiter, std::max(pos, searchFrom));
    if (p == std::string::npos) {
        // Keep a tail so a delimiter split across two feeds is still found
        if (buffer.size() >= delimiter.size())
            searchFrom = std::max(searchFrom, buffer.size() - delimiter.size() + 1);
        pos = std::max(pos, searchFrom);
        if (final)
            phase = Phase::Done;
        return false;
    }

    sawDelimiter = true;
    pos = p + delimiter.size();
    searchFrom = pos;
    phase = Phase::AfterDelimiter;
    return true;
}

bool MultipartDecoder::stepAfterDelimiter(bool final) {
    if (buffer.size() - pos < 2) {
        if (final)
            phase = Phase::Done;
        return false;
    }

    if (buffer.compare(pos, 2, "--") == 0) {
        sawTerminator = true;
        pos += 2;
        searchFrom = pos;
        phase = Phase::Done;
        return true;
    }

    std::size_t i = pos;
    while (i < buffer.size() && (buffer[i] == ' ' || buffer[i] == '\t'))
        ++i;

    if (i >= buffer.size() || (buffer[i] == '\r' && i + 1 >= buffer.size())) {
        if (final)
            phase = Phase::Done;
        return false;
    }

    if (buffer[i] == '\n') {
        pos = i + 1;
    }
    else if (buffer[i] == '\r' && buffer[i + 1] == '\n') {
        pos = i + 2;
    }
    else {
        notes.push_back("ignored boundary-like sequence not followed by a line break");
        searchFrom = pos;
        phase = Phase::Preamble;
        return true;
    }

    headers.clear();
    searchFrom = pos;
    phase = Phase::Headers;
    return true;
}

bool MultipartDecoder::stepHeaders(bool final) {
    std::size_t headerEnd = std::string::npos;
    std::size_t bodyStart = std::string::npos;

    const std::size_t available = buffer.size() - pos;
    if (available >= 2 && buffer.compare(pos, 2, "\r\n") == 0) {
        headerEnd = pos;
        bodyStart = pos + 2;
    }
    else if (available >= 1 && buffer[pos] == '\n') {
        headerEnd = pos;
        bodyStart = pos + 1;
    }
    else {
        const auto crlf = buffer.find("\r\n\r\n", pos);
        const auto lf = buffer.find("\n\n", pos);
        if (crlf != std::string::npos && (lf == std::string::npos || crlf <= lf)) {
            headerEnd = crlf;
            bodyStart = crlf + 4;
        }
        else if (lf != std::string::npos) {
            headerEnd = lf;
            bodyStart = lf + 2;
        }
    }

    if (headerEnd == std::string::npos) {
        if (available > kMaxHeaderBytes) {
            dropPart("header block exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
            searchFrom = pos;
            phase = Phase::Preamble;
            return true;
        }
        if (final)
            dropPart("response ended inside a header block");
        return false;
    }

    if (headerEnd - pos > kMaxHeaderBytes) {
        dropPart("header block exceeds " + std::to_string(kMaxHeaderBytes) + " bytes");
        pos = bodyStart;
        searchFrom = pos;
        phase = Phase::Preamble;
        return true;
    }

    const bool ok = parseHeaders(pos, headerEnd);
    pos = bodyStart;
    searchFrom = pos;

    if (!ok) {
        phase = Phase::Preamble;
        return true;
    }

    const auto it = headers.find("content-length");
    if (it == headers.end()) {
        phase = Phase::OpenBody;
        return true;
    }

    if (!parseSize(it->second, bodyLength)) {
        dropPart("invalid Content-Length '" + it->second + "'");
        phase = Phase::Preamble;
        return true;
    }

    phase = Phase::SizedBody;
    return true;
}

bool MultipartDecoder::stepSizedBody(bool final) {
    if (buffer.size() - pos >= bodyLength) {
        emit(pos, pos + bodyLength);
        pos += bodyLength;
        searchFrom = pos;
        phase = Phase::Preamble;
        return true;
    }

    if (final) {
        dropPart("truncated body: expected " + std::to_string(bodyLength)
            + " bytes, received " + std::to_string(buffer.size() - pos));
    }
    return false;
}

bool MultipartDecoder::stepOpenBody(bool final) {
    std::size_t from = std::max(pos, searchFrom);
    while (true) {
        const auto p = buffer.find(delimiter, from);
        if (p == std::string::npos)
            break;

        // A delimiter only counts at the start of a line and when a line break or "--" follows
        if (p == pos || buffer[p - 1] == '\n') {
            const DelimiterEnd tail = delimiterEndsAt(p + delimiter.size());
            if (tail == DelimiterEnd::NeedMore && !final) {
                searchFrom = p;
                return false;
            }
            if (tail == DelimiterEnd::No) {
                from = p + 1;
                continue;
            }

            std::size_t end = p;
            if (end > pos && buffer[end - 1] == '\n') {
                --end;
                if (end > pos && buffer[end - 1] == '\r')
                    --end;
            }

            emit(pos, end);
            pos = p;
            searchFrom = p;
            phase = Phase::Preamble;
            return true;
        }
        from = p + 1;
    }

    if (buffer.size() > pos + delimiter.size())
        searchFrom = buffer.size() - delimiter.size();

    if (final)
        dropPart("response ended before the part without Content-Length was closed");
    return false;
}

MultipartDecoder::DelimiterEnd MultipartDecoder::delimiterEndsAt(std::size_t at) const {
    if (at >= buffer.size())
        return DelimiterEnd::NeedMore;

    if (buffer[at] == '-') {
        if (at + 1 >= buffer.size())
            return DelimiterEnd::NeedMore;
        return buffer[at + 1] == '-' ? DelimiterEnd::Yes : DelimiterEnd::No;
    }

    std::size_t i = at;
    while (i < buffer.size() && (buffer[i] == ' ' || buffer[i] == '\t'))
        ++i;

    if (i >= buffer.size())
        return DelimiterEnd::NeedMore;
    if (buffer[i] == '\n')
        return DelimiterEnd::Yes;
    if (buffer[i] == '\r') {
        if (i + 1 >= buffer.size())
            return DelimiterEnd::NeedMore;
        return buffer[i + 1] == '\n' ? DelimiterEnd::Yes : DelimiterEnd::No;
    }
    return DelimiterEnd::No;
}

bool MultipartDecoder::parseHeaders(std::size_t begin, std::size_t end) {
    std::string lastKey;
    std::size_t lineStart = begin;

    while (lineStart < end) {
        std::size_t lineEnd = buffer.find('\n', lineStart);
        if (lineEnd == std::string::npos || lineEnd > end)
            lineEnd = end;

        std::string line = buffer.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;

        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;

        // Folded continuation of the previous header
        if ((line[0] == ' ' || line[0] == '\t') && !lastKey.empty()) {
            headers[lastKey] += " " + encoding::trim(line);
            continue;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            dropPart("malformed header line '" + line.substr(0, 80) + "'");
            return false;
        }

        const std::string key = encoding::toLower(encoding::trim(line.substr(0, colon)));
        if (key.empty() || key.find_first_of(" \t") != std::string::npos) {
            dropPart("malformed header name '" + line.substr(0, colon) + "'");
            return false;
        }

        headers[key] = encoding::trim(line.substr(colon + 1));
        lastKey = key;
    }
    return true;
}

void MultipartDecoder::emit(std::size_t begin, std::size_t end) {
    if (end <= begin) {
        dropPart("empty body");
        return;
    }

    const std::size_t position = ordinal++;

    DecodedPart part{};
    part.index = position;

    auto it = headers.find("x-index");
    std::size_t declaredIndex = 0;
    if (it != headers.end() && parseSize(it->second, declaredIndex))
        part.index = declaredIndex;

    it = headers.find("x-record-id");
    if (it != headers.end())
        part.id = encoding::percentDecode(it->second);

    it = headers.find("x-display-name");
    if (it != headers.end()) {
        part.displayName = encoding::percentDecode(it->second);
    }
    else {
        it = headers.find("content-disposition");
        if (it != headers.end())
            part.displayName = filenameFromDisposition(it->second);
    }

    part.bytes.assign(buffer.data() + begin, buffer.data() + end);

    ++decoded;
    if (handler)
        handler(std::move(part));
}

void MultipartDecoder::dropPart(const std::string& reason) {
    notes.push_back("part " + std::to_string(ordinal) + " dropped: " + reason);
    ++ordinal;
}

void MultipartDecoder::compact() {
    if (pos == 0)
        return;

    if (pos < kCompactThreshold && pos < buffer.size())
        return;

    const std::size_t cut = std::min(pos, buffer.size());
    buffer.erase(0, cut);
    pos -= cut;
    searchFrom = searchFrom > cut ? searchFrom - cut : 0;
}
