#include "cancellation_token.h"
#include <chrono>

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::sleepFor(double seconds) {
    if (seconds <= 0.0)
        return !cancelled_.load();

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, std::chrono::duration<double>(seconds), [this] { return cancelled_.load(); });
    return !cancelled_.load();
}
