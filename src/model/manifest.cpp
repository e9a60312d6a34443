#include <algorithm>
#include <cstdio>

#include "model/manifest.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace model
{

static constexpr std::uint8_t MAGIC[4] = {'F', 'M', 'F', MANIFEST_VER};

const char *kind_name(Kind k)
{
    switch (k)
    {
        case Kind::SingleFile:
            return "single-file";
        case Kind::Collection:
            return "collection";
    }
    return "?";
}

std::uint32_t Manifest::total_chunks() const
{
    std::uint32_t n = 0;
    for (const auto &e : entries)
        n += e.chunk_count;
    return n;
}

bool operator==(const Entry &a, const Entry &b)
{
    return a.name == b.name && a.relative_path == b.relative_path && a.size == b.size &&
           a.chunk_count == b.chunk_count && a.has_file_hash == b.has_file_hash &&
           (!a.has_file_hash || a.file_hash == b.file_hash);
}

bool operator==(const Manifest &a, const Manifest &b)
{
    return a.kind == b.kind && a.label == b.label && a.total_size == b.total_size &&
           a.chunk_size == b.chunk_size && a.entries == b.entries &&
           a.chunk_hashes == b.chunk_hashes;
}

std::uint32_t chunks_for(std::uint64_t size, std::uint32_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

Manifest make_manifest(Kind                         kind,
                       std::string                  label,
                       std::uint32_t                chunk_size,
                       const std::vector<FileSpec> &files)
{
    Manifest m;
    m.kind       = kind;
    m.label      = std::move(label);
    m.chunk_size = chunk_size;
    m.entries.reserve(files.size());
    for (const auto &f : files)
    {
        Entry e;
        e.name          = f.name;
        e.relative_path = f.relative_path.empty() ? f.name : f.relative_path;
        e.size          = f.size;
        e.chunk_count   = chunks_for(f.size, chunk_size);
        m.total_size += f.size;
        m.entries.push_back(std::move(e));
    }
    return m;
}

bool validate(const Manifest &m)
{
    if (m.chunk_size == 0)
        return false;
    if (m.kind == Kind::SingleFile && m.entries.size() != 1)
        return false;
    std::uint64_t total  = 0;
    std::uint64_t chunks = 0;
    for (const auto &e : m.entries)
    {
        if (e.relative_path.empty())
            return false;
        if (e.chunk_count != chunks_for(e.size, m.chunk_size))
            return false;
        total += e.size;
        chunks += e.chunk_count;
    }
    if (total != m.total_size || chunks > UINT32_MAX)
        return false;
    if (!m.chunk_hashes.empty() && m.chunk_hashes.size() != chunks)
        return false;
    return true;
}

ChunkIndex::ChunkIndex(const Manifest &m) : chunk_size_(m.chunk_size)
{
    sizes_.reserve(m.entries.size());
    prefix_.reserve(m.entries.size() + 1);
    prefix_.push_back(0);
    for (const auto &e : m.entries)
    {
        sizes_.push_back(e.size);
        prefix_.push_back(prefix_.back() + e.chunk_count);
    }
}

std::optional<ChunkRef> ChunkIndex::locate(std::uint32_t global) const
{
    if (global >= total())
        return std::nullopt;
    // first entry whose end is past `global`; skips zero-chunk entries
    auto        it    = std::upper_bound(prefix_.begin() + 1, prefix_.end(), global);
    std::size_t entry = static_cast<std::size_t>(it - (prefix_.begin() + 1));

    ChunkRef r;
    r.entry  = entry;
    r.local  = global - prefix_[entry];
    r.offset = static_cast<std::uint64_t>(r.local) * chunk_size_;
    r.length = static_cast<std::uint32_t>(
        std::min<std::uint64_t>(chunk_size_, sizes_[entry] - r.offset));
    return r;
}

std::optional<std::uint32_t> ChunkIndex::global(std::size_t entry, std::uint32_t local) const
{
    if (entry >= sizes_.size() || local >= count_of(entry))
        return std::nullopt;
    return prefix_[entry] + local;
}

std::vector<std::uint8_t> encode(const Manifest &m)
{
    ferry::ByteWriter w;
    w.put_raw(MAGIC, sizeof MAGIC);
    w.put_u8(static_cast<std::uint8_t>(m.kind));
    w.put_str(m.label);
    w.put_u64(m.total_size);
    w.put_u32(m.chunk_size);
    w.put_u32(static_cast<std::uint32_t>(m.entries.size()));
    for (const auto &e : m.entries)
    {
        w.put_str(e.name);
        w.put_str(e.relative_path);
        w.put_u64(e.size);
        w.put_u32(e.chunk_count);
        w.put_u8(e.has_file_hash ? 1 : 0);
        if (e.has_file_hash)
            w.put_raw(e.file_hash.data(), e.file_hash.size());
    }
    w.put_u32(static_cast<std::uint32_t>(m.chunk_hashes.size()));
    for (const auto &h : m.chunk_hashes)
        w.put_raw(h.data(), h.size());
    return w.take();
}

std::optional<Manifest> decode(const std::uint8_t *p, std::size_t n)
{
    ferry::ByteReader r(p, n);
    std::uint8_t      magic[4];
    if (!r.get_raw(magic, sizeof magic) || !std::equal(magic, magic + 4, MAGIC))
    {
        LOG_WARN("manifest: bad magic/version");
        return std::nullopt;
    }

    Manifest      m;
    std::uint8_t  kind  = 0;
    std::uint32_t count = 0;
    if (!r.get_u8(kind) || !r.get_str(m.label) || !r.get_u64(m.total_size) ||
        !r.get_u32(m.chunk_size) || !r.get_u32(count))
        return std::nullopt;
    if (kind != static_cast<std::uint8_t>(Kind::SingleFile) &&
        kind != static_cast<std::uint8_t>(Kind::Collection))
        return std::nullopt;
    m.kind = static_cast<Kind>(kind);

    // each entry needs at least 21 bytes; reject absurd counts before reserving
    if (count > r.remaining() / 21)
        return std::nullopt;
    m.entries.resize(count);
    for (auto &e : m.entries)
    {
        std::uint8_t has = 0;
        if (!r.get_str(e.name) || !r.get_str(e.relative_path) || !r.get_u64(e.size) ||
            !r.get_u32(e.chunk_count) || !r.get_u8(has))
            return std::nullopt;
        e.has_file_hash = has != 0;
        if (e.has_file_hash && !r.get_raw(e.file_hash.data(), e.file_hash.size()))
            return std::nullopt;
    }

    std::uint32_t hashes = 0;
    if (!r.get_u32(hashes) || hashes > r.remaining() / digest::SHA256_SIZE)
        return std::nullopt;
    m.chunk_hashes.resize(hashes);
    for (auto &h : m.chunk_hashes)
    {
        if (!r.get_raw(h.data(), h.size()))
            return std::nullopt;
    }
    if (!r.done() || !validate(m))
    {
        LOG_WARN("manifest: trailing bytes or invariant violation");
        return std::nullopt;
    }
    return m;
}

std::string format_size(std::uint64_t bytes)
{
    static const char *units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double             v       = static_cast<double>(bytes);
    std::size_t        u       = 0;
    while (v >= 1024.0 && u + 1 < sizeof(units) / sizeof(units[0]))
    {
        v /= 1024.0;
        ++u;
    }
    char buf[32];
    std::snprintf(buf, sizeof buf, "%.2f %s", v, units[u]);
    return buf;
}

}  // namespace model
