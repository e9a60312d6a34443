#include <algorithm>
#include <cmath>

#include "util/retry.hpp"

namespace ferry
{

void CancelToken::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        flag_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
}

bool CancelToken::wait_for(std::chrono::milliseconds d) const
{
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [this] { return flag_.load(std::memory_order_acquire); });
    return !flag_.load(std::memory_order_acquire);
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const
{
    if (attempt < 1)
        attempt = 1;
    const double factor = std::pow(std::max(1.0, multiplier), attempt - 1);
    const double ms     = static_cast<double>(delay.count()) * factor;
    const double cap    = static_cast<double>(std::max(delay, max_delay).count());
    return std::chrono::milliseconds(static_cast<long long>(std::min(ms, cap)));
}

}  // namespace ferry
