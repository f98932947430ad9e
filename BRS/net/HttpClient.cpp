#include "HttpClient.h"
#include "Encoding.h"

#include <curl/curl.h>

namespace {
struct Transfer {
    CURL* handle = nullptr;
    HttpResponseHead* head = nullptr;
    const HttpClient::HeadCallback* onHead = nullptr;
    const HttpClient::DataCallback* onData = nullptr;
    const HttpClient::StopCheck* stopCheck = nullptr;
    bool headDelivered = false;
    bool stopped = false;

    bool deliverHead() {
        if (headDelivered)
            return true;
        headDelivered = true;

        long status = 0;
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
        head->status = status;

        if (*onHead && !(*onHead)(*head)) {
            stopped = true;
            return false;
        }
        return true;
    }
};

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    std::size_t total = size * nmemb;

    if (!transfer->deliverHead())
        return 0;

    if (*transfer->onData && !(*transfer->onData)(ptr, total)) {
        transfer->stopped = true;
        return 0;
    }
    return total;
}

int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    if (*transfer->stopCheck && (*transfer->stopCheck)()) {
        transfer->stopped = true;
        return 1;
    }
    return 0;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* result = static_cast<HttpResponseHead*>(userdata);

    std::string header(buffer, total);

    // A new status line starts a new header block (redirects, 100 Continue)
    if (header.rfind("HTTP/", 0) == 0) {
        *result = HttpResponseHead{};
        return total;
    }

    const auto colon = header.find(':');
    if (colon == std::string::npos)
        return total;

    const std::string key = encoding::toLower(encoding::trim(header.substr(0, colon)));
    const std::string value = encoding::trim(header.substr(colon + 1));

    result->headers[key] = value;

    if (key == "content-type") {
        result->contentType = value;
    }
    else if (key == "x-total-count") {
        try {
            result->totalCount = std::stoull(value);
            result->hasTotalCount = true;
        }
        catch (const std::exception&) {
            result->hasTotalCount = false;
        }
    }

    return total;
}

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};
}

HttpClient::HttpClient(const std::string& u)
    : url(u) {
    static CurlGlobal global;
    curl = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl)
        curl_easy_cleanup(static_cast<CURL*>(curl));
}

void HttpClient::setTimeouts(long connectSec, long idleSec) {
    connectTimeoutSec = connectSec;
    idleTimeoutSec = idleSec;
}

bool HttpClient::perform(const std::string* body, HttpResponseHead& head,
    const HeadCallback& onHead, const DataCallback& onData) {
    CURL* c = static_cast<CURL*>(curl);
    errorText.clear();

    if (!c) {
        errorText = "curl_easy_init failed";
        return false;
    }

    curl_easy_reset(c);

    Transfer transfer;
    transfer.handle = c;
    transfer.head = &head;
    transfer.onHead = &onHead;
    transfer.onData = &onData;
    transfer.stopCheck = &stopCheck;

    char errorBuffer[CURL_ERROR_SIZE] = {};

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(c, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(c, CURLOPT_HEADERDATA, &head);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, connectTimeoutSec);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(c, CURLOPT_LOW_SPEED_TIME, idleTimeoutSec);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errorBuffer);

    struct curl_slist* headers = nullptr;
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(c, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    CURLcode res = curl_easy_perform(c);

    if (headers)
        curl_slist_free_all(headers);

    if (res == CURLE_OK && !transfer.headDelivered)
        transfer.deliverHead();

    if (transfer.stopped) {
        errorText = "transfer stopped by caller";
        return false;
    }

    if (res != CURLE_OK) {
        errorText = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        return false;
    }

    return true;
}

bool HttpClient::postStream(const std::string& body, const HeadCallback& onHead, const DataCallback& onData) {
    HttpResponseHead head;
    return perform(&body, head, onHead, onData);
}

bool HttpClient::post(const std::string& body, HttpResponseHead& head, std::string& responseBody) {
    responseBody.clear();
    return perform(&body, head, HeadCallback(), [&](const char* data, std::size_t size) {
        responseBody.append(data, size);
        return true;
        });
}
