#pragma once
#include <string>
#include <functional>
#include <map>
#include <cstdint>
#include <cstddef>

struct HttpResponseHead {
    long status = 0;
    std::string contentType;
    std::uint64_t totalCount = 0;
    bool hasTotalCount = false;
    // Every header of the final response, keys lowercased
    std::map<std::string, std::string> headers;

    std::string header(const std::string& lowerName) const {
        auto it = headers.find(lowerName);
        return it == headers.end() ? std::string() : it->second;
    }
};

class HttpClient {
public:
    using HeadCallback = std::function<bool(const HttpResponseHead&)>;
    using DataCallback = std::function<bool(const char*, std::size_t)>;
    // Polled while the transfer waits for data; true aborts it
    using StopCheck = std::function<bool()>;

    explicit HttpClient(const std::string& url);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // The transfer fails once nothing has arrived for idleSec; a slow but
    // steady response is never cut off.
    void setTimeouts(long connectSec, long idleSec);
    void setStopCheck(StopCheck check) { stopCheck = std::move(check); }

    // POST with the response body delivered as it arrives. onHead runs once before the
    // first body byte (or after the transfer if the body is empty). Returning false from
    // either callback aborts the transfer.
    bool postStream(const std::string& body,
        const HeadCallback& onHead,
        const DataCallback& onData);

    // POST with the whole response buffered
    bool post(const std::string& body, HttpResponseHead& head, std::string& responseBody);

    const std::string& lastError() const { return errorText; }

private:
    bool perform(const std::string* body, HttpResponseHead& head,
        const HeadCallback& onHead, const DataCallback& onData);

private:
    void* curl;
    std::string url;
    long connectTimeoutSec{ 10 };
    long idleTimeoutSec{ 600 };
    StopCheck stopCheck;
    std::string errorText;
};
