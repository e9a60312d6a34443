#include "engine/options.hpp"
#include "model/manifest.hpp"
#include "util/log.hpp"

namespace engine
{

void ProgressMeter::add(std::uint64_t n)
{
    const std::uint64_t now = done_.fetch_add(n) + n;
    if (total_ == 0)
        return;
    const int d   = static_cast<int>(now * 10 / total_);
    int       cur = decile_.load();
    while (d > cur)
    {
        if (decile_.compare_exchange_weak(cur, d))
        {
            LOG_SYSTEM("%s: %d%% (%s of %s)", what_.c_str(), d * 10, model::format_size(now).c_str(),
                       model::format_size(total_).c_str());
            return;
        }
    }
}

}  // namespace engine
