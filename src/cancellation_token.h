#ifndef CANCELLATION_TOKEN_H
#define CANCELLATION_TOKEN_H

#include <atomic>
#include <condition_variable>
#include <mutex>

/**
 * @brief Shareable stop signal with an interruptible sleep.
 *
 * One token is created per background loop run. The owner cancels it and
 * joins the thread; the loop checks it between frames and sleeps through
 * sleepFor() so a cancel wakes it immediately.
 */
class CancellationToken {
  public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    /** Request cancellation and wake every sleeper. */
    void cancel();

    bool isCancelled() const { return cancelled_.load(); }

    /**
     * @brief Sleep for the given time unless cancelled first.
     * @param seconds Sleep length; non-positive values only check the flag
     * @return false if the token was cancelled before or during the sleep
     */
    bool sleepFor(double seconds);

  private:
    std::atomic<bool> cancelled_;
    std::mutex mutex_;
    std::condition_variable cv_;
};

#endif // CANCELLATION_TOKEN_H
