#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

#include "memory_storage.hpp"
#include "model/manifest.hpp"
#include "model/manifest_builder.hpp"

namespace fs = std::filesystem;
using namespace model;

namespace
{

Manifest three_entries()
{
    // 2.5 chunks, empty, exactly 2 chunks (chunk size 4)
    return make_manifest(Kind::Collection, "set", 4,
                         {{"a.bin", "set/a.bin", 10}, {"empty.txt", "set/empty.txt", 0}, {"b.bin", "set/b.bin", 8}});
}

struct TempDir
{
    fs::path path;
    TempDir()
    {
        path = fs::temp_directory_path() / ("ferry-manifest-" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path &p, const Bytes &b)
{
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out.write(reinterpret_cast<const char *>(b.data()), static_cast<std::streamsize>(b.size()));
}

}  // namespace

TEST(Manifest, ChunkCounts)
{
    EXPECT_EQ(chunks_for(0, 4), 0u);
    EXPECT_EQ(chunks_for(1, 4), 1u);
    EXPECT_EQ(chunks_for(4, 4), 1u);
    EXPECT_EQ(chunks_for(5, 4), 2u);

    Manifest m = three_entries();
    EXPECT_EQ(m.total_size, 18u);
    EXPECT_EQ(m.total_chunks(), 5u);
    EXPECT_TRUE(validate(m));
}

TEST(Manifest, ValidateRejectsInconsistencies)
{
    Manifest m = three_entries();
    m.total_size += 1;
    EXPECT_FALSE(validate(m));

    m = three_entries();
    m.entries[0].chunk_count = 2;
    EXPECT_FALSE(validate(m));

    m = three_entries();
    m.chunk_hashes.resize(4);
    EXPECT_FALSE(validate(m));

    m = three_entries();
    m.kind = Kind::SingleFile;
    EXPECT_FALSE(validate(m));

    m = three_entries();
    m.chunk_size = 0;
    EXPECT_FALSE(validate(m));
}

TEST(Manifest, EmptyCollectionIsValid)
{
    Manifest m = make_manifest(Kind::Collection, "nothing", 1024, {});
    EXPECT_TRUE(validate(m));
    EXPECT_EQ(m.total_chunks(), 0u);
}

TEST(ChunkIndex, LocateSkipsEmptyEntries)
{
    Manifest   m = three_entries();
    ChunkIndex idx(m);
    ASSERT_EQ(idx.total(), 5u);

    auto r = idx.locate(2);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->entry, 0u);
    EXPECT_EQ(r->local, 2u);
    EXPECT_EQ(r->offset, 8u);
    EXPECT_EQ(r->length, 2u);  // short tail

    r = idx.locate(3);
    ASSERT_TRUE(r);
    EXPECT_EQ(r->entry, 2u);
    EXPECT_EQ(r->local, 0u);
    EXPECT_EQ(r->length, 4u);

    EXPECT_FALSE(idx.locate(5));
    EXPECT_EQ(idx.count_of(1), 0u);
    EXPECT_EQ(idx.first_of(2), 3u);
    EXPECT_EQ(idx.global(2, 1).value(), 4u);
    EXPECT_FALSE(idx.global(1, 0));
}

TEST(Manifest, CodecKeepsHashes)
{
    Bytes    a = pattern(10, 1), b = pattern(3, 2);
    Manifest m = manifest_for({a, b}, 4);
    m.entries[0].has_file_hash = true;
    m.entries[0].file_hash     = digest::sha256(a);

    auto back = decode(encode(m));
    ASSERT_TRUE(back);
    EXPECT_EQ(*back, m);
}

TEST(Manifest, DecodeRejectsDamage)
{
    auto enc = encode(three_entries());

    auto bad_magic = enc;
    bad_magic[0]   = 'X';
    EXPECT_FALSE(decode(bad_magic));

    auto trailing = enc;
    trailing.push_back(0);
    EXPECT_FALSE(decode(trailing));

    auto truncated = enc;
    truncated.resize(enc.size() / 2);
    EXPECT_FALSE(decode(truncated));
}

TEST(Manifest, FormatSize)
{
    EXPECT_EQ(format_size(512), "512.00 B");
    EXPECT_EQ(format_size(1536), "1.50 KB");
    EXPECT_EQ(format_size(3u << 20), "3.00 MB");
}

TEST(ManifestBuilder, SingleFile)
{
    TempDir  d;
    Bytes    data = pattern(10000, 3);
    fs::path f    = d.path / "photo.raw";
    write_file(f, data);

    auto built = build_manifest({f.string()}, 4096);
    ASSERT_TRUE(built);
    const Manifest &m = built->manifest;
    EXPECT_EQ(m.kind, Kind::SingleFile);
    EXPECT_EQ(m.label, "photo.raw");
    ASSERT_EQ(m.entries.size(), 1u);
    EXPECT_EQ(m.entries[0].relative_path, "photo.raw");
    EXPECT_EQ(m.entries[0].chunk_count, 3u);
    ASSERT_EQ(m.chunk_hashes.size(), 3u);
    EXPECT_EQ(m.chunk_hashes[2], digest::sha256(data.data() + 8192, 10000 - 8192));
    EXPECT_TRUE(m.entries[0].has_file_hash);
    EXPECT_EQ(m.entries[0].file_hash, digest::sha256(data));
    ASSERT_EQ(built->sources.size(), 1u);
    EXPECT_EQ(built->sources[0], f.string());
}

TEST(ManifestBuilder, FolderIsWalkedInSortedOrder)
{
    TempDir d;
    write_file(d.path / "album" / "z.txt", pattern(5, 1));
    write_file(d.path / "album" / "a" / "deep.bin", pattern(5000, 2));
    write_file(d.path / "album" / "empty", {});

    auto built = build_manifest({(d.path / "album").string()}, 4096);
    ASSERT_TRUE(built);
    const Manifest &m = built->manifest;
    EXPECT_EQ(m.kind, Kind::Collection);
    EXPECT_EQ(m.label, "album");
    ASSERT_EQ(m.entries.size(), 3u);
    EXPECT_EQ(m.entries[0].relative_path, "album/a/deep.bin");
    EXPECT_EQ(m.entries[1].relative_path, "album/empty");
    EXPECT_EQ(m.entries[2].relative_path, "album/z.txt");
    EXPECT_EQ(m.entries[1].chunk_count, 0u);
    EXPECT_EQ(m.total_chunks(), 3u);
    EXPECT_EQ(m.chunk_hashes.size(), 3u);
    EXPECT_TRUE(validate(m));
}

TEST(ManifestBuilder, RejectsMissingPathsAndDuplicates)
{
    TempDir d;
    EXPECT_FALSE(build_manifest({(d.path / "nope").string()}, 4096));
    EXPECT_FALSE(build_manifest({}, 4096));

    write_file(d.path / "one" / "x.bin", pattern(3, 1));
    write_file(d.path / "two" / "x.bin", pattern(3, 2));
    // both contribute "x.bin" at the top level
    EXPECT_FALSE(build_manifest({(d.path / "one" / "x.bin").string(), (d.path / "two" / "x.bin").string()}, 4096));
}
