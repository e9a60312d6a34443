#pragma once
#include <cstdint>

#include "pairing/service.hpp"
#include "relay/chunk_store.hpp"
#include "util/bytes.hpp"

/*
Service protocol, one request per frame ([u32 len][u8 tag][payload]):

  client ──▶ server   tag = Op, payload = request fields
  server ──▶ client   tag = Errc, payload = response fields when ok

After PAIR_ATTACH succeeds the connection is the role's rendezvous duplex:

  client ──▶ server   SIGNAL {message}       server ──▶ client  SIGNAL_ACK {u8 errc}
                                             server ──▶ client  PUSH {message}

Closing the connection detaches the role.
*/

namespace net
{

enum class Op : std::uint8_t
{
    create_transfer = 0x01,  // str id, blob manifest
    put_chunk       = 0x02,  // str id, u32 index, blob bytes
    get_chunk       = 0x03,  // str id, u32 index         -> blob bytes, raw hash
    status          = 0x04,  // str id                    -> status
    get_manifest    = 0x05,  // str id                    -> blob manifest
    delete_transfer = 0x06,  // str id
    cleanup         = 0x07,  //                           -> u64 purged
    pair_create     = 0x10,  // str transfer id, blob manifest -> pair info
    pair_lookup     = 0x11,  // str code                  -> pair info
    pair_attach     = 0x12,  // str code, u8 role
    signal          = 0x13,  // blob message (attached connections only)
};

const char *op_name(Op op);
// Safe to send again when the reply was lost.
bool is_idempotent(Op op);

inline constexpr std::uint8_t TAG_PUSH       = 0x40;
inline constexpr std::uint8_t TAG_SIGNAL_ACK = 0x41;

void put_status(ferry::ByteWriter &w, const relay::Status &s);
bool get_status(ferry::ByteReader &r, relay::Status &s);

void put_pair_info(ferry::ByteWriter &w, const pairing::PairInfo &p);
bool get_pair_info(ferry::ByteReader &r, pairing::PairInfo &p);

void put_manifest(ferry::ByteWriter &w, const model::Manifest &m);
bool get_manifest(ferry::ByteReader &r, model::Manifest &m);

void put_message(ferry::ByteWriter &w, const pairing::Message &m);
bool get_message(ferry::ByteReader &r, pairing::Message &m);

}  // namespace net
