#include "HttpRequest.h"
#include "Encoding.h"

#include <sstream>
#include <stdexcept>

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(encoding::toLower(name));
    return it == headers.end() ? std::string() : it->second;
}

bool HttpRequestReader::parseHead(const std::string& head, HttpRequest& out, std::string& error) {
    std::size_t lineEnd = head.find("\r\n");
    const std::string requestLine = head.substr(0, lineEnd);

    std::istringstream is(requestLine);
    if (!(is >> out.method >> out.target >> out.version)) {
        error = "malformed request line";
        return false;
    }
    if (out.version.rfind("HTTP/1.", 0) != 0) {
        error = "unsupported protocol " + out.version;
        return false;
    }

    const auto query = out.target.find_first_of("?#");
    out.path = encoding::percentDecode(out.target.substr(0, query));

    out.headers.clear();
    while (lineEnd != std::string::npos) {
        const std::size_t begin = lineEnd + 2;
        lineEnd = head.find("\r\n", begin);
        const std::string line = head.substr(begin, lineEnd == std::string::npos ? std::string::npos : lineEnd - begin);
        if (line.empty())
            continue;

        const auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            error = "malformed header line";
            return false;
        }

        const std::string key = encoding::toLower(encoding::trim(line.substr(0, colon)));
        out.headers[key] = encoding::trim(line.substr(colon + 1));
    }

    return true;
}

ReadStatus HttpRequestReader::read(TcpSocket& socket, HttpRequest& out, std::string& error) {
    std::string data;
    char buf[4096];

    std::size_t headEnd = std::string::npos;
    while (headEnd == std::string::npos) {
        const ssize_t n = socket.recvSome(buf, sizeof(buf));
        if (n == 0 && data.empty())
            return ReadStatus::Closed;
        if (n <= 0) {
            error = "connection closed inside request head";
            return ReadStatus::Closed;
        }

        data.append(buf, static_cast<std::size_t>(n));
        headEnd = data.find("\r\n\r\n");

        if (headEnd == std::string::npos && data.size() > kMaxHeadBytes) {
            error = "request head too large";
            return ReadStatus::TooLarge;
        }
    }

    if (!parseHead(data.substr(0, headEnd), out, error))
        return ReadStatus::Malformed;

    if (!out.header("transfer-encoding").empty()) {
        error = "chunked request bodies are not supported";
        return ReadStatus::Malformed;
    }

    std::size_t contentLength = 0;
    const std::string lengthText = out.header("content-length");
    if (!lengthText.empty()) {
        try {
            std::size_t used = 0;
            const unsigned long long value = std::stoull(lengthText, &used);
            if (used != lengthText.size())
                throw std::invalid_argument(lengthText);
            if (value > kMaxBodyBytes) {
                error = "request body too large";
                return ReadStatus::TooLarge;
            }
            contentLength = static_cast<std::size_t>(value);
        }
        catch (const std::exception&) {
            error = "invalid Content-Length '" + lengthText + "'";
            return ReadStatus::Malformed;
        }
    }

    out.body = data.substr(headEnd + 4);
    while (out.body.size() < contentLength) {
        const ssize_t n = socket.recvSome(buf, sizeof(buf));
        if (n <= 0) {
            error = "connection closed inside request body";
            return ReadStatus::Closed;
        }
        out.body.append(buf, static_cast<std::size_t>(n));
    }
    out.body.resize(contentLength);

    return ReadStatus::Ok;
}
