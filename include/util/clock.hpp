#pragma once
#include <chrono>

namespace ferry
{

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;

// Injected into the registry and the relay store so TTL and retention can be
// driven by a fake clock in tests.
struct Clock
{
    virtual TimePoint now() const = 0;
    virtual ~Clock()              = default;
};

struct SystemClock final : Clock
{
    TimePoint now() const override { return SteadyClock::now(); }
};

inline const Clock &system_clock()
{
    static SystemClock c;
    return c;
}

}  // namespace ferry
