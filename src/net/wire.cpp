#include "net/wire.hpp"

namespace net
{

const char *op_name(Op op)
{
    switch (op)
    {
        case Op::create_transfer:
            return "create_transfer";
        case Op::put_chunk:
            return "put_chunk";
        case Op::get_chunk:
            return "get_chunk";
        case Op::status:
            return "status";
        case Op::get_manifest:
            return "get_manifest";
        case Op::delete_transfer:
            return "delete_transfer";
        case Op::cleanup:
            return "cleanup";
        case Op::pair_create:
            return "pair_create";
        case Op::pair_lookup:
            return "pair_lookup";
        case Op::pair_attach:
            return "pair_attach";
        case Op::signal:
            return "signal";
    }
    return "?";
}

bool is_idempotent(Op op)
{
    switch (op)
    {
        case Op::create_transfer:  // same manifest is a no-op
        case Op::put_chunk:        // overwrite
        case Op::get_chunk:
        case Op::status:
        case Op::get_manifest:
        case Op::pair_lookup:
            return true;
        default:
            return false;
    }
}

void put_status(ferry::ByteWriter &w, const relay::Status &s)
{
    w.put_str(s.transfer_id);
    w.put_u32(s.uploaded_chunks);
    w.put_u32(s.total_chunks);
    w.put_u8(s.complete ? 1 : 0);
    w.put_u32(static_cast<std::uint32_t>(s.available.size()));
    for (std::uint32_t i : s.available)
        w.put_u32(i);
}

bool get_status(ferry::ByteReader &r, relay::Status &s)
{
    std::uint8_t  complete = 0;
    std::uint32_t n        = 0;
    if (!r.get_str(s.transfer_id, 256) || !r.get_u32(s.uploaded_chunks) || !r.get_u32(s.total_chunks) ||
        !r.get_u8(complete) || !r.get_u32(n) || n > s.total_chunks || n > r.remaining() / 4)
        return false;
    s.complete = complete != 0;
    s.available.resize(n);
    for (auto &i : s.available)
    {
        if (!r.get_u32(i))
            return false;
    }
    return true;
}

void put_manifest(ferry::ByteWriter &w, const model::Manifest &m)
{
    w.put_blob(model::encode(m));
}

bool get_manifest(ferry::ByteReader &r, model::Manifest &m)
{
    std::vector<std::uint8_t> blob;
    if (!r.get_blob(blob))
        return false;
    auto d = model::decode(blob);
    if (!d)
        return false;
    m = std::move(*d);
    return true;
}

void put_pair_info(ferry::ByteWriter &w, const pairing::PairInfo &p)
{
    w.put_str(p.code);
    w.put_str(p.transfer_id);
    put_manifest(w, p.manifest);
    w.put_u8(p.matched ? 1 : 0);
    w.put_u64(static_cast<std::uint64_t>(p.expires_in.count()));
}

bool get_pair_info(ferry::ByteReader &r, pairing::PairInfo &p)
{
    std::uint8_t  matched = 0;
    std::uint64_t secs    = 0;
    if (!r.get_str(p.code, 64) || !r.get_str(p.transfer_id, 256) || !get_manifest(r, p.manifest) ||
        !r.get_u8(matched) || !r.get_u64(secs))
        return false;
    p.matched    = matched != 0;
    p.expires_in = std::chrono::seconds(static_cast<std::chrono::seconds::rep>(secs));
    return true;
}

void put_message(ferry::ByteWriter &w, const pairing::Message &m)
{
    w.put_blob(pairing::encode(m));
}

bool get_message(ferry::ByteReader &r, pairing::Message &m)
{
    std::vector<std::uint8_t> blob;
    if (!r.get_blob(blob))
        return false;
    auto d = pairing::decode(blob.data(), blob.size());
    if (!d)
        return false;
    m = std::move(*d);
    return true;
}

}  // namespace net
