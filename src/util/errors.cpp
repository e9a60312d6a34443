#include "util/errors.hpp"

namespace ferry
{

const char *errc_name(Errc e)
{
    switch (e)
    {
        case Errc::ok:
            return "ok";
        case Errc::pair_not_found:
            return "pair_not_found";
        case Errc::pair_expired:
            return "pair_expired";
        case Errc::code_space_exhausted:
            return "code_space_exhausted";
        case Errc::transfer_not_found:
            return "transfer_not_found";
        case Errc::transfer_already_exists:
            return "transfer_already_exists";
        case Errc::chunk_not_ready:
            return "chunk_not_ready";
        case Errc::chunk_unavailable:
            return "chunk_unavailable";
        case Errc::chunk_index_out_of_range:
            return "chunk_index_out_of_range";
        case Errc::integrity_mismatch:
            return "integrity_mismatch";
        case Errc::negotiation_timeout:
            return "negotiation_timeout";
        case Errc::handshake_timeout:
            return "handshake_timeout";
        case Errc::peer_disconnected:
            return "peer_disconnected";
        case Errc::backlog_full:
            return "backlog_full";
        case Errc::cancelled:
            return "cancelled";
        case Errc::io_error:
            return "io_error";
        case Errc::protocol_error:
            return "protocol_error";
        case Errc::unreachable:
            return "unreachable";
    }
    return "unknown";
}

bool is_retryable(Errc e)
{
    switch (e)
    {
        case Errc::chunk_not_ready:
        case Errc::integrity_mismatch:
        case Errc::io_error:
        case Errc::unreachable:
            return true;
        default:
            return false;
    }
}

Errc errc_from_byte(std::uint8_t b)
{
    if (b > static_cast<std::uint8_t>(Errc::unreachable))
        return Errc::protocol_error;
    return static_cast<Errc>(b);
}

}  // namespace ferry
