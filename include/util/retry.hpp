#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include "util/errors.hpp"

namespace ferry
{

// Shared abort flag. Waiters sleep on it so cancel() wakes every pending backoff.
class CancelToken
{
  public:
    void cancel();
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

    // Sleep for `d` unless cancelled first. Returns false when cancelled.
    bool wait_for(std::chrono::milliseconds d) const;

  private:
    std::atomic<bool>               flag_{false};
    mutable std::mutex              mu_;
    mutable std::condition_variable cv_;
};

struct RetryPolicy
{
    int                       max_attempts = 40;
    std::chrono::milliseconds delay{250};
    double                    multiplier = 2.0;  // 1.0 => fixed delay
    std::chrono::milliseconds max_delay{2000};

    std::chrono::milliseconds delay_for(int attempt) const;  // attempt is 1-based
};

// Run `fn` until it returns ok, a non-retryable code, or the attempt budget is
// spent. On exhaustion the last retryable code is returned; callers test it with
// is_retryable() to tell exhaustion from a fatal error. `fn` runs at least
// once, whatever the policy says.
template <typename Fn>
Errc retry_with_backoff(const RetryPolicy &p,
                        const CancelToken *cancel,
                        Fn               &&fn,
                        int              *attempts_out = nullptr)
{
    const int budget   = p.max_attempts > 0 ? p.max_attempts : 1;
    Errc      last     = Errc::ok;
    int       attempts = 0;
    for (int attempt = 1; attempt <= budget; ++attempt)
    {
        if (cancel && cancel->cancelled())
        {
            last = Errc::cancelled;
            break;
        }
        attempts = attempt;
        last     = fn();
        if (last == Errc::ok || !is_retryable(last))
            break;
        if (attempt == budget)
            break;
        if (cancel)
        {
            if (!cancel->wait_for(p.delay_for(attempt)))
            {
                last = Errc::cancelled;
                break;
            }
        }
        else
        {
            CancelToken never;
            never.wait_for(p.delay_for(attempt));
        }
    }
    if (attempts_out)
        *attempts_out = attempts;
    return last;
}

}  // namespace ferry
