#include "CancellationToken.h"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        flag.store(true);
    }
    cv.notify_all();
}

bool CancellationToken::cancelled() const {
    return flag.load();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx);
    return cv.wait_for(lock, timeout, [&]() {
        return flag.load();
        });
}
