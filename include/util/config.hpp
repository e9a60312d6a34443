#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "engine/options.hpp"
#include "transport/tcp_connector.hpp"

namespace ferry
{

// Process configuration, read once from FERRY_* environment variables.
// Invalid values are logged and replaced with the default.
struct Config
{
    std::string   server;     // unix socket path or tcp:<host>:<port>
    std::string   relay_dir;  // ferryd chunk storage; "~/" expanded by the daemon
    std::uint32_t chunk_size{1u << 20};
    std::size_t   piece_size{64u << 10};

    std::chrono::milliseconds fallback{5000};
    std::chrono::milliseconds ack_timeout{60000};
    std::chrono::milliseconds linger{10000};

    std::chrono::seconds pair_ttl{3600};
    std::chrono::hours   retention{24};
    std::chrono::seconds sweep_every{60};

    unsigned                  max_parallel{5};
    int                       retry_attempts{40};
    std::chrono::milliseconds retry_delay{250};
    std::chrono::milliseconds retry_max_delay{2000};

    std::string peer_bind{"0.0.0.0"};
    std::string peer_advertise;

    static Config from_env();

    engine::EngineOptions          engine_options() const;
    transport::TcpConnectorOptions connector_options() const;
};

// Default service endpoint: $HOME/.cache/ferry/relay.sock (/tmp when HOME is unset).
std::string default_server();
// Default relay storage: $HOME/.cache/ferry/relay (/tmp when HOME is unset).
std::string default_relay_dir();

}  // namespace ferry
