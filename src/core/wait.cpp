#include "wait.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

using namespace std::chrono;

void CancelToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancelToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancelToken::wait_for(milliseconds d) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, d, [this] { return cancelled_; });
}

system_clock::time_point SystemClock::now() const {
    return system_clock::now();
}

steady_clock::time_point SystemClock::monotonic() const {
    return steady_clock::now();
}

bool SystemClock::sleep_for(seconds d, const CancelToken* cancel) {
    if (cancel) {
        return !cancel->wait_for(duration_cast<milliseconds>(d));
    }
    std::this_thread::sleep_for(d);
    return true;
}

WaitContext::WaitContext(PollClock& clock, const WaitOptions& opts)
    : clock_(clock), opts_(opts), start_(clock.monotonic()),
      deadline_(start_ + opts.timeout) {
    if (opts_.poll_interval.count() <= 0) {
        throw ConfigurationError(
            fmt::format("Poll interval must be positive, got {}s", opts_.poll_interval.count()));
    }
}

bool WaitContext::expired() const {
    return clock_.monotonic() >= deadline_;
}

bool WaitContext::cancelled() const {
    return opts_.cancel && opts_.cancel->cancelled();
}

long WaitContext::elapsed_secs() const {
    return static_cast<long>(duration_cast<seconds>(clock_.monotonic() - start_).count());
}

long WaitContext::remaining_secs() const {
    auto left = duration_cast<seconds>(deadline_ - clock_.monotonic()).count();
    return left > 0 ? static_cast<long>(left) : 0;
}

bool WaitContext::suspend() {
    if (cancelled()) return false;
    seconds left = ceil<seconds>(deadline_ - clock_.monotonic());
    seconds step = std::min(opts_.poll_interval, left);
    if (step.count() <= 0) return true;
    return clock_.sleep_for(step, opts_.cancel);
}

void WaitContext::report(const std::string& msg) const {
    if (opts_.cb) opts_.cb(msg);
}
