#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <thread>
#include <unistd.h>

#include "fake_clock.hpp"
#include "memory_storage.hpp"
#include "relay/disk_store.hpp"

using ferry::Errc;
namespace fs = std::filesystem;

namespace
{

struct DiskStoreFixture : ::testing::Test
{
    FakeClock       clock;
    fs::path        root;
    Bytes           a = pattern(10, 1);
    Bytes           b = pattern(4, 9);
    model::Manifest m = manifest_for({a, b}, 4);  // chunks: a0 a1 a2 b0

    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               ("ferry-disk-" + std::to_string(::getpid()) + "-" + info->name());
        fs::remove_all(root);
    }
    void TearDown() override { fs::remove_all(root); }

    std::unique_ptr<relay::DiskRelayStore> open_store()
    {
        auto s = std::make_unique<relay::DiskRelayStore>(root, clock, std::chrono::hours(24));
        EXPECT_TRUE(s->open());
        return s;
    }

    Bytes slice(const Bytes &v, std::size_t off, std::size_t n) { return Bytes(v.begin() + off, v.begin() + off + n); }
};

}  // namespace

TEST_F(DiskStoreFixture, ChunksLandInPerTransferDirectory)
{
    auto store = open_store();
    ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
    EXPECT_EQ(store->create_transfer("t1", m), Errc::ok);
    EXPECT_EQ(store->create_transfer("t1", manifest_for({a}, 4)), Errc::transfer_already_exists);

    ASSERT_EQ(store->put_chunk("t1", 3, b), Errc::ok);
    EXPECT_TRUE(fs::exists(root / "t1" / "manifest.bin"));
    EXPECT_TRUE(fs::exists(root / "t1" / "chunks" / "chunk_000003"));
    EXPECT_FALSE(fs::exists(root / "t1" / "chunks" / "chunk_000003.part"));

    relay::Fetched f;
    ASSERT_EQ(store->get_chunk("t1", 3, f), Errc::ok);
    EXPECT_EQ(f.bytes, b);
    EXPECT_EQ(f.hash, digest::sha256(b));
    EXPECT_EQ(store->get_chunk("t1", 0, f), Errc::chunk_not_ready);
    EXPECT_EQ(store->get_chunk("t1", 4, f), Errc::chunk_index_out_of_range);
    EXPECT_EQ(store->get_chunk("nope", 0, f), Errc::transfer_not_found);
}

TEST_F(DiskStoreFixture, PutVerifiesSizeAndHash)
{
    auto store = open_store();
    ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
    EXPECT_EQ(store->put_chunk("t1", 2, slice(a, 0, 4)), Errc::integrity_mismatch);  // last chunk of a is 2 bytes
    EXPECT_EQ(store->put_chunk("t1", 0, slice(a, 4, 4)), Errc::integrity_mismatch);
    EXPECT_EQ(store->put_chunk("t1", 9, b), Errc::chunk_index_out_of_range);
    EXPECT_EQ(store->put_chunk("nope", 0, b), Errc::transfer_not_found);
    EXPECT_FALSE(fs::exists(root / "t1" / "chunks" / "chunk_000000"));
    EXPECT_EQ(store->create_transfer("../escape", m), Errc::protocol_error);
}

TEST_F(DiskStoreFixture, TransfersSurviveReopen)
{
    {
        auto store = open_store();
        ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
        ASSERT_EQ(store->put_chunk("t1", 0, slice(a, 0, 4)), Errc::ok);
        ASSERT_EQ(store->put_chunk("t1", 2, slice(a, 8, 2)), Errc::ok);
    }

    auto store = open_store();
    EXPECT_EQ(store->size(), 1u);
    model::Manifest got;
    ASSERT_EQ(store->get_manifest("t1", got), Errc::ok);
    EXPECT_TRUE(got == m);

    relay::Status st;
    ASSERT_EQ(store->status("t1", st), Errc::ok);
    EXPECT_EQ(st.uploaded_chunks, 2u);
    EXPECT_EQ(st.total_chunks, 4u);
    EXPECT_FALSE(st.complete);
    EXPECT_EQ(st.available, (std::vector<std::uint32_t>{0, 2}));

    ASSERT_EQ(store->put_chunk("t1", 1, slice(a, 4, 4)), Errc::ok);
    ASSERT_EQ(store->put_chunk("t1", 3, b), Errc::ok);
    ASSERT_EQ(store->status("t1", st), Errc::ok);
    EXPECT_TRUE(st.complete);
    EXPECT_DOUBLE_EQ(st.progress(), 100.0);
}

TEST_F(DiskStoreFixture, ReopenDropsTornAndForeignEntries)
{
    {
        auto store = open_store();
        ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
        ASSERT_EQ(store->put_chunk("t1", 0, slice(a, 0, 4)), Errc::ok);
    }
    // a short chunk file and a directory without a manifest
    {
        std::ofstream torn(root / "t1" / "chunks" / "chunk_000001", std::ios::binary);
        torn << "xy";
    }
    fs::create_directories(root / "junk");

    auto          store = open_store();
    relay::Status st;
    ASSERT_EQ(store->status("t1", st), Errc::ok);
    EXPECT_EQ(st.available, (std::vector<std::uint32_t>{0}));
    EXPECT_FALSE(fs::exists(root / "t1" / "chunks" / "chunk_000001"));
    EXPECT_EQ(store->size(), 1u);
    EXPECT_EQ(store->status("junk", st), Errc::transfer_not_found);
}

TEST_F(DiskStoreFixture, CorruptedChunkIsNotServed)
{
    auto store = open_store();
    ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
    ASSERT_EQ(store->put_chunk("t1", 3, b), Errc::ok);
    {
        std::ofstream f(root / "t1" / "chunks" / "chunk_000003", std::ios::binary | std::ios::trunc);
        f << "zzzz";
    }
    relay::Fetched got;
    EXPECT_EQ(store->get_chunk("t1", 3, got), Errc::integrity_mismatch);
}

TEST_F(DiskStoreFixture, DeleteAndRetentionRemoveDirectories)
{
    auto store = open_store();
    ASSERT_EQ(store->create_transfer("gone", m), Errc::ok);
    ASSERT_EQ(store->delete_transfer("gone"), Errc::ok);
    EXPECT_EQ(store->delete_transfer("gone"), Errc::transfer_not_found);
    EXPECT_FALSE(fs::exists(root / "gone"));

    ASSERT_EQ(store->create_transfer("old", m), Errc::ok);
    clock.advance(std::chrono::hours(23));
    ASSERT_EQ(store->create_transfer("new", m), Errc::ok);
    EXPECT_EQ(store->sweep(), 0u);

    clock.advance(std::chrono::hours(1));
    std::size_t purged = 0;
    ASSERT_EQ(store->cleanup(purged), Errc::ok);
    EXPECT_EQ(purged, 1u);
    EXPECT_FALSE(fs::exists(root / "old"));
    EXPECT_TRUE(fs::exists(root / "new"));
}

TEST_F(DiskStoreFixture, ReloadedTransferKeepsItsRetentionClock)
{
    {
        auto store = open_store();
        ASSERT_EQ(store->create_transfer("t1", m), Errc::ok);
    }
    auto store = open_store();
    EXPECT_EQ(store->sweep(), 0u);
    clock.advance(std::chrono::hours(24));
    EXPECT_EQ(store->sweep(), 1u);
    EXPECT_FALSE(fs::exists(root / "t1"));
}

TEST_F(DiskStoreFixture, ConcurrentUploadsOfDistinctChunks)
{
    Bytes           big = pattern(64 * 256, 5);
    model::Manifest bm  = manifest_for({big}, 256);
    auto            store = open_store();
    ASSERT_EQ(store->create_transfer("big", bm), Errc::ok);

    std::vector<std::thread> ts;
    for (int w = 0; w < 4; ++w)
        ts.emplace_back([&, w] {
            for (std::uint32_t i = w; i < 64; i += 4)
                EXPECT_EQ(store->put_chunk("big", i, slice(big, i * 256, 256)), Errc::ok);
        });
    for (auto &t : ts)
        t.join();

    relay::Status st;
    ASSERT_EQ(store->status("big", st), Errc::ok);
    EXPECT_TRUE(st.complete);
    EXPECT_EQ(st.uploaded_chunks, 64u);
}
