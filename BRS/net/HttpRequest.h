#pragma once
#include <cstddef>
#include <map>
#include <string>

#include "TcpSocket.h"

struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::string version;
    // Keys lower-cased
    std::map<std::string, std::string> headers;
    std::string body;

    std::string header(const std::string& name) const;
};

enum class ReadStatus {
    Ok,
    Closed,
    Malformed,
    TooLarge
};

// Reads one HTTP/1.1 request from a connection: head up to the blank line, body by Content-Length.
class HttpRequestReader {
public:
    static constexpr std::size_t kMaxHeadBytes = 16 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

    static ReadStatus read(TcpSocket& socket, HttpRequest& out, std::string& error);

    // Parses the request line and header fields (without the terminating blank line)
    static bool parseHead(const std::string& head, HttpRequest& out, std::string& error);
};
