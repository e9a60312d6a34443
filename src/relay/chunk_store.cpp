#include "relay/chunk_store.hpp"
#include "util/log.hpp"

namespace relay
{
using ferry::Errc;

Errc check_chunk(const std::string &id, const model::Manifest &m, const model::ChunkIndex &index, std::uint32_t i,
                 const std::vector<std::uint8_t> &bytes, digest::Sha256 &hash)
{
    auto ref = index.locate(i);
    if (!ref)
        return Errc::chunk_index_out_of_range;
    if (bytes.size() != ref->length)
    {
        LOG_WARN("put_chunk %s#%u: size %zu, manifest says %u", id.c_str(), i, bytes.size(), ref->length);
        return Errc::integrity_mismatch;
    }
    hash = digest::sha256(bytes);
    if (m.has_chunk_hashes() && m.chunk_hashes[i] != hash)
    {
        LOG_WARN("put_chunk %s#%u: hash differs from manifest", id.c_str(), i);
        return Errc::integrity_mismatch;
    }
    return Errc::ok;
}

bool valid_transfer_id(const std::string &id)
{
    if (id.empty() || id.size() > 128 || id == "." || id == "..")
        return false;
    for (char c : id)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                        c == '_' || c == '.';
        if (!ok)
            return false;
    }
    return true;
}

RelayStore::RelayStore(const ferry::Clock &clock, std::chrono::seconds retention)
    : clock_(clock), retention_(retention)
{
}

std::shared_ptr<RelayStore::Transfer> RelayStore::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = transfers_.find(id);
    return it == transfers_.end() ? nullptr : it->second;
}

Errc RelayStore::create_transfer(const std::string &id, const model::Manifest &m)
{
    if (!valid_transfer_id(id) || !model::validate(m))
    {
        LOG_WARN("create_transfer: rejected invalid manifest for '%s'", id.c_str());
        return Errc::protocol_error;
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = transfers_.find(id);
    if (it != transfers_.end())
    {
        // same manifest => no-op, anything else is a conflicting registration
        if (it->second->manifest == m)
            return Errc::ok;
        LOG_WARN("create_transfer: '%s' already exists with a different manifest", id.c_str());
        return Errc::transfer_already_exists;
    }
    transfers_.emplace(id, std::make_shared<Transfer>(m, clock_.now()));
    LOG_INFO("transfer %s created: %u chunks, %s", id.c_str(), m.total_chunks(),
             model::format_size(m.total_size).c_str());
    return Errc::ok;
}

Errc RelayStore::put_chunk(const std::string &id, std::uint32_t index, const std::vector<std::uint8_t> &bytes)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    digest::Sha256 h{};
    if (Errc rc = check_chunk(id, t->manifest, t->index, index, bytes, h); rc != Errc::ok)
        return rc;

    Slot                       &s = t->slots[index];
    std::lock_guard<std::mutex> lk(s.mu);
    s.bytes = bytes;
    s.hash  = h;
    if (!s.present)
    {
        s.present = true;
        t->uploaded.fetch_add(1, std::memory_order_acq_rel);
    }
    LOG_DEBUG("put_chunk %s#%u (%zu bytes)", id.c_str(), index, bytes.size());
    return Errc::ok;
}

Errc RelayStore::get_chunk(const std::string &id, std::uint32_t index, Fetched &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    if (index >= t->slots.size())
        return Errc::chunk_index_out_of_range;

    Slot                       &s = t->slots[index];
    std::lock_guard<std::mutex> lk(s.mu);
    if (!s.present)
        return Errc::chunk_not_ready;
    out.bytes = s.bytes;
    out.hash  = s.hash;
    return Errc::ok;
}

Errc RelayStore::status(const std::string &id, Status &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;

    out.transfer_id  = id;
    out.total_chunks = static_cast<std::uint32_t>(t->slots.size());
    out.available.clear();
    for (std::uint32_t i = 0; i < t->slots.size(); ++i)
    {
        std::lock_guard<std::mutex> lk(t->slots[i].mu);
        if (t->slots[i].present)
            out.available.push_back(i);
    }
    out.uploaded_chunks = t->uploaded.load(std::memory_order_acquire);
    out.complete        = out.uploaded_chunks == out.total_chunks;
    return Errc::ok;
}

Errc RelayStore::get_manifest(const std::string &id, model::Manifest &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    out = t->manifest;
    return Errc::ok;
}

Errc RelayStore::delete_transfer(const std::string &id)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (transfers_.erase(id) == 0)
        return Errc::transfer_not_found;
    LOG_INFO("transfer %s deleted", id.c_str());
    return Errc::ok;
}

Errc RelayStore::cleanup(std::size_t &purged)
{
    purged = sweep();
    return Errc::ok;
}

std::size_t RelayStore::sweep()
{
    const ferry::TimePoint      now = clock_.now();
    std::size_t                 n   = 0;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = transfers_.begin(); it != transfers_.end();)
    {
        if (now - it->second->created_at >= retention_)
        {
            LOG_INFO("transfer %s expired after retention window", it->first.c_str());
            it = transfers_.erase(it);
            ++n;
        }
        else
        {
            ++it;
        }
    }
    return n;
}

std::size_t RelayStore::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return transfers_.size();
}

}  // namespace relay
