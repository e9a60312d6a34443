#include "engine/mode.hpp"

namespace engine
{

const char *mode_name(Mode m)
{
    switch (m)
    {
        case Mode::probing:
            return "probing";
        case Mode::direct:
            return "direct";
        case Mode::peer:
            return "peer";
        case Mode::relay:
            return "relay";
        case Mode::complete:
            return "complete";
        case Mode::failed:
            return "failed";
        case Mode::cancelled:
            return "cancelled";
    }
    return "?";
}

bool is_terminal(Mode m)
{
    return m == Mode::complete || m == Mode::failed || m == Mode::cancelled;
}

bool ModeLatch::transition(Mode from, Mode to)
{
    Mode expected = from;
    return mode_.compare_exchange_strong(expected, to, std::memory_order_acq_rel);
}

bool ModeLatch::commit(Mode path)
{
    if (path != Mode::direct && path != Mode::peer && path != Mode::relay)
        return false;
    return transition(Mode::probing, path);
}

bool ModeLatch::fallback_to_relay()
{
    return transition(Mode::peer, Mode::relay);
}

bool ModeLatch::finish(Mode from, bool ok)
{
    if (from != Mode::direct && from != Mode::peer && from != Mode::relay)
        return false;
    return transition(from, ok ? Mode::complete : Mode::failed);
}

bool ModeLatch::end_as(Mode to)
{
    Mode cur = get();
    while (!is_terminal(cur))
    {
        if (mode_.compare_exchange_weak(cur, to, std::memory_order_acq_rel))
            return true;
    }
    return false;
}

}  // namespace engine
