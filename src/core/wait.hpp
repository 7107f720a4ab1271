#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <core/constants.hpp>
#include <core/types.hpp>

// Cooperative cancellation for bounded waits. cancel() wakes any sleeper.
class CancelToken {
public:
    void cancel();
    bool cancelled() const;

    // Block for up to d. Returns true if the token was (or became) cancelled.
    bool wait_for(std::chrono::milliseconds d) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

// Time source and suspension point for every poll loop.
class PollClock {
public:
    virtual ~PollClock() = default;

    // Wall clock, for comparing against server timestamps.
    virtual std::chrono::system_clock::time_point now() const = 0;

    // Monotonic clock, for deadlines.
    virtual std::chrono::steady_clock::time_point monotonic() const = 0;

    // Suspend the calling thread for d. Returns false when woken by cancel.
    virtual bool sleep_for(std::chrono::seconds d, const CancelToken* cancel) = 0;
};

class SystemClock : public PollClock {
public:
    std::chrono::system_clock::time_point now() const override;
    std::chrono::steady_clock::time_point monotonic() const override;
    bool sleep_for(std::chrono::seconds d, const CancelToken* cancel) override;
};

struct WaitOptions {
    std::chrono::seconds timeout{JOB_WAIT_TIMEOUT_SECS};
    std::chrono::seconds poll_interval{JOB_POLL_SECS};
    const CancelToken* cancel = nullptr;
    StatusCallback cb;
};

// Deadline bookkeeping for one wait. The deadline is fixed at construction
// and measured on the monotonic clock. Throws ConfigurationError when
// poll_interval is not positive.
class WaitContext {
public:
    WaitContext(PollClock& clock, const WaitOptions& opts);

    bool expired() const;
    bool cancelled() const;
    long elapsed_secs() const;
    long remaining_secs() const;

    // Sleep until the next poll, never past the deadline.
    // Returns false if the wait was cancelled.
    bool suspend();

    void report(const std::string& msg) const;

    std::chrono::seconds timeout() const { return opts_.timeout; }

private:
    PollClock& clock_;
    WaitOptions opts_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point deadline_;
};
