#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/digest.hpp"

/*
Global chunk index space:

  entries:   [ a.bin (3 chunks) ][ empty.txt (0) ][ b.bin (2 chunks) ]
  prefix_:     0                  3                3                  5
  global:      0   1   2                            3   4

Entries are flattened in manifest order and each entry's bytes are cut into
chunk_size pieces (the last one may be shorter). ChunkIndex precomputes the
prefix sums once so index <-> (entry, local chunk) never recomputes offsets.
*/

namespace model
{

inline constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 1u << 20;  // 1 MiB
inline constexpr std::uint8_t  MANIFEST_VER       = 1;

enum class Kind : std::uint8_t
{
    SingleFile = 1,
    Collection = 2
};

const char *kind_name(Kind k);

struct Entry
{
    std::string    name;
    std::string    relative_path;
    std::uint64_t  size{0};
    std::uint32_t  chunk_count{0};
    bool           has_file_hash{false};
    digest::Sha256 file_hash{};
};

struct Manifest
{
    Kind                        kind{Kind::SingleFile};
    std::string                 label;  // file or folder name shown to the receiver
    std::uint64_t               total_size{0};
    std::uint32_t               chunk_size{DEFAULT_CHUNK_SIZE};
    std::vector<Entry>          entries;
    std::vector<digest::Sha256> chunk_hashes;  // empty, or one per global chunk

    std::size_t   entry_count() const { return entries.size(); }
    std::uint32_t total_chunks() const;
    bool          has_chunk_hashes() const { return !chunk_hashes.empty(); }
};

bool operator==(const Entry &a, const Entry &b);
bool operator==(const Manifest &a, const Manifest &b);
inline bool operator!=(const Manifest &a, const Manifest &b)
{
    return !(a == b);
}

std::uint32_t chunks_for(std::uint64_t size, std::uint32_t chunk_size);

struct FileSpec
{
    std::string   name;
    std::string   relative_path;
    std::uint64_t size{0};
};

// Fill in chunk counts and totals for an ordered file list.
Manifest make_manifest(Kind                         kind,
                       std::string                  label,
                       std::uint32_t                chunk_size,
                       const std::vector<FileSpec> &files);

// Checks sizes, chunk counts, totals and the hash table length.
bool validate(const Manifest &m);

struct ChunkRef
{
    std::size_t   entry{0};
    std::uint32_t local{0};   // chunk number within the entry
    std::uint64_t offset{0};  // byte offset within the entry
    std::uint32_t length{0};
};

class ChunkIndex
{
  public:
    explicit ChunkIndex(const Manifest &m);

    std::uint32_t total() const { return prefix_.back(); }
    std::size_t   entries() const { return sizes_.size(); }

    std::optional<ChunkRef>      locate(std::uint32_t global) const;
    std::optional<std::uint32_t> global(std::size_t entry, std::uint32_t local) const;

    std::uint32_t first_of(std::size_t entry) const { return prefix_[entry]; }
    std::uint32_t count_of(std::size_t entry) const { return prefix_[entry + 1] - prefix_[entry]; }
    std::uint32_t chunk_size() const { return chunk_size_; }

  private:
    std::uint32_t              chunk_size_;
    std::vector<std::uint64_t> sizes_;
    std::vector<std::uint32_t> prefix_;  // size == entries + 1
};

std::vector<std::uint8_t> encode(const Manifest &m);
std::optional<Manifest>   decode(const std::uint8_t *p, std::size_t n);
inline std::optional<Manifest> decode(const std::vector<std::uint8_t> &v)
{
    return decode(v.data(), v.size());
}

std::string format_size(std::uint64_t bytes);

}  // namespace model
