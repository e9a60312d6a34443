#include <cstdlib>

#include "util/config.hpp"
#include "util/log.hpp"

namespace ferry
{

namespace
{

// Parses FERRY_<name> as an integer in [lo, hi]; false leaves `out` alone.
bool env_u64(const char *key, std::uint64_t lo, std::uint64_t hi, std::uint64_t &out)
{
    const char *e = std::getenv(key);
    if (!e || !*e)
        return false;
    char                  *p = nullptr;
    unsigned long long     v = std::strtoull(e, &p, 10);
    if (p && *p == '\0' && e[0] != '-' && v >= lo && v <= hi)
    {
        out = v;
        return true;
    }
    LOG_WARN("Ignoring invalid %s='%s' (expect %llu..%llu)", key, e, static_cast<unsigned long long>(lo),
             static_cast<unsigned long long>(hi));
    return false;
}

template <typename Dur>
void env_duration(const char *key, std::uint64_t lo, std::uint64_t hi, Dur &out)
{
    std::uint64_t v = 0;
    if (env_u64(key, lo, hi, v))
        out = Dur(static_cast<typename Dur::rep>(v));
}

}  // namespace

namespace
{
std::string cache_dir()
{
    const char *home = std::getenv("HOME");
    std::string base = home && *home ? std::string(home) : "/tmp";
    return base + "/.cache/ferry";
}
}  // namespace

std::string default_server()
{
    return cache_dir() + "/relay.sock";
}

std::string default_relay_dir()
{
    return cache_dir() + "/relay";
}

Config Config::from_env()
{
    Config c;
    c.server = default_server();
    if (const char *e = std::getenv("FERRY_SERVER"); e && *e)
        c.server = e;
    c.relay_dir = default_relay_dir();
    if (const char *e = std::getenv("FERRY_RELAY_DIR"); e && *e)
        c.relay_dir = e;

    std::uint64_t v = 0;
    if (env_u64("FERRY_CHUNK_SIZE", 4u << 10, 64u << 20, v))
        c.chunk_size = static_cast<std::uint32_t>(v);
    if (env_u64("FERRY_PIECE_SIZE", 1u << 10, 4u << 20, v))
        c.piece_size = static_cast<std::size_t>(v);

    env_duration("FERRY_FALLBACK_MS", 0, 600000, c.fallback);
    env_duration("FERRY_ACK_TIMEOUT_MS", 100, 3600000, c.ack_timeout);
    env_duration("FERRY_LINGER_MS", 0, 3600000, c.linger);
    env_duration("FERRY_PAIR_TTL_S", 1, 7 * 24 * 3600, c.pair_ttl);
    env_duration("FERRY_RETENTION_H", 1, 24 * 365, c.retention);
    env_duration("FERRY_SWEEP_S", 1, 24 * 3600, c.sweep_every);

    if (env_u64("FERRY_MAX_PARALLEL", 1, 64, v))
        c.max_parallel = static_cast<unsigned>(v);
    if (env_u64("FERRY_RETRY_ATTEMPTS", 1, 10000, v))
        c.retry_attempts = static_cast<int>(v);
    env_duration("FERRY_RETRY_DELAY_MS", 1, 60000, c.retry_delay);
    env_duration("FERRY_RETRY_MAX_DELAY_MS", 1, 600000, c.retry_max_delay);

    if (const char *e = std::getenv("FERRY_PEER_BIND"); e && *e)
        c.peer_bind = e;
    if (const char *e = std::getenv("FERRY_PEER_ADVERTISE"); e && *e)
        c.peer_advertise = e;
    return c;
}

engine::EngineOptions Config::engine_options() const
{
    engine::EngineOptions o;
    o.fallback               = fallback;
    o.ack_timeout            = ack_timeout;
    o.linger                 = linger;
    o.piece_size             = piece_size;
    o.max_parallel           = max_parallel;
    o.retry.max_attempts     = retry_attempts;
    o.retry.delay            = retry_delay;
    o.retry.max_delay        = retry_max_delay;
    return o;
}

transport::TcpConnectorOptions Config::connector_options() const
{
    transport::TcpConnectorOptions o;
    o.bind_host = peer_bind;
    o.advertise = peer_advertise;
    return o;
}

}  // namespace ferry
