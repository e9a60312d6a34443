#pragma once
#include <cstdint>

namespace ferry
{

// Result of every service and engine operation. Per-chunk codes are retried
// locally; only path-level codes ever reach the user.
enum class Errc : std::uint8_t
{
    ok = 0,
    pair_not_found,
    pair_expired,
    code_space_exhausted,
    transfer_not_found,
    transfer_already_exists,
    chunk_not_ready,
    chunk_unavailable,
    chunk_index_out_of_range,
    integrity_mismatch,
    negotiation_timeout,
    handshake_timeout,
    peer_disconnected,
    backlog_full,
    cancelled,
    io_error,
    protocol_error,
    unreachable,
};

const char *errc_name(Errc e);
bool        is_retryable(Errc e);

// Decode a status byte received on the wire; unknown values map to protocol_error.
Errc errc_from_byte(std::uint8_t b);

}  // namespace ferry
