#include <gtest/gtest.h>
#include <thread>

#include "fake_clock.hpp"
#include "memory_storage.hpp"
#include "relay/chunk_store.hpp"

using ferry::Errc;
using namespace std::chrono_literals;

namespace
{

struct StoreFixture : ::testing::Test
{
    FakeClock          clock;
    relay::RelayStore  store{clock, std::chrono::hours(24)};
    Bytes              a = pattern(10, 1);
    Bytes              b = pattern(4, 9);
    model::Manifest    m = manifest_for({a, b}, 4);  // chunks: a0 a1 a2 b0

    Bytes slice(const Bytes &v, std::size_t off, std::size_t n) { return Bytes(v.begin() + off, v.begin() + off + n); }
};

}  // namespace

TEST_F(StoreFixture, CreateIsIdempotentForSameManifest)
{
    EXPECT_EQ(store.create_transfer("t1", m), Errc::ok);
    EXPECT_EQ(store.create_transfer("t1", m), Errc::ok);

    model::Manifest other = manifest_for({a}, 4);
    EXPECT_EQ(store.create_transfer("t1", other), Errc::transfer_already_exists);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(StoreFixture, CreateRejectsInvalidManifest)
{
    model::Manifest bad = m;
    bad.total_size++;
    EXPECT_EQ(store.create_transfer("t1", bad), Errc::protocol_error);
    EXPECT_EQ(store.create_transfer("", m), Errc::protocol_error);
    EXPECT_EQ(store.create_transfer("../t1", m), Errc::protocol_error);
    EXPECT_EQ(store.create_transfer("..", m), Errc::protocol_error);
}

TEST_F(StoreFixture, PutThenGetReturnsBytesAndHash)
{
    ASSERT_EQ(store.create_transfer("t1", m), Errc::ok);
    const Bytes c2 = slice(a, 8, 2);
    ASSERT_EQ(store.put_chunk("t1", 2, c2), Errc::ok);

    relay::Fetched f;
    ASSERT_EQ(store.get_chunk("t1", 2, f), Errc::ok);
    EXPECT_EQ(f.bytes, c2);
    EXPECT_EQ(f.hash, digest::sha256(c2));
}

TEST_F(StoreFixture, GetBeforePutIsNotReady)
{
    ASSERT_EQ(store.create_transfer("t1", m), Errc::ok);
    relay::Fetched f;
    EXPECT_EQ(store.get_chunk("t1", 0, f), Errc::chunk_not_ready);
    EXPECT_EQ(store.get_chunk("t1", 4, f), Errc::chunk_index_out_of_range);
    EXPECT_EQ(store.get_chunk("nope", 0, f), Errc::transfer_not_found);
}

TEST_F(StoreFixture, PutVerifiesSizeAndHash)
{
    ASSERT_EQ(store.create_transfer("t1", m), Errc::ok);
    EXPECT_EQ(store.put_chunk("t1", 0, slice(a, 0, 3)), Errc::integrity_mismatch);

    Bytes wrong = slice(a, 0, 4);
    wrong[1] ^= 0xFF;
    EXPECT_EQ(store.put_chunk("t1", 0, wrong), Errc::integrity_mismatch);
    EXPECT_EQ(store.put_chunk("t1", 9, slice(a, 0, 4)), Errc::chunk_index_out_of_range);
    EXPECT_EQ(store.put_chunk("nope", 0, slice(a, 0, 4)), Errc::transfer_not_found);

    relay::Status st;
    ASSERT_EQ(store.status("t1", st), Errc::ok);
    EXPECT_EQ(st.uploaded_chunks, 0u);
}

TEST_F(StoreFixture, StatusTracksProgressAndRepeatedPutsCountOnce)
{
    ASSERT_EQ(store.create_transfer("t1", m), Errc::ok);
    ASSERT_EQ(store.put_chunk("t1", 3, b), Errc::ok);
    ASSERT_EQ(store.put_chunk("t1", 3, b), Errc::ok);
    ASSERT_EQ(store.put_chunk("t1", 0, slice(a, 0, 4)), Errc::ok);

    relay::Status st;
    ASSERT_EQ(store.status("t1", st), Errc::ok);
    EXPECT_EQ(st.uploaded_chunks, 2u);
    EXPECT_EQ(st.total_chunks, 4u);
    EXPECT_FALSE(st.complete);
    EXPECT_EQ(st.available, (std::vector<std::uint32_t>{0, 3}));
    EXPECT_DOUBLE_EQ(st.progress(), 50.0);

    ASSERT_EQ(store.put_chunk("t1", 1, slice(a, 4, 4)), Errc::ok);
    ASSERT_EQ(store.put_chunk("t1", 2, slice(a, 8, 2)), Errc::ok);
    ASSERT_EQ(store.status("t1", st), Errc::ok);
    EXPECT_TRUE(st.complete);
}

TEST_F(StoreFixture, WithoutManifestHashesStoredHashIsComputed)
{
    model::Manifest plain = manifest_for({a}, 4, false);
    ASSERT_EQ(store.create_transfer("plain", plain), Errc::ok);
    Bytes junk = {1, 2, 3, 4};
    ASSERT_EQ(store.put_chunk("plain", 0, junk), Errc::ok);
    relay::Fetched f;
    ASSERT_EQ(store.get_chunk("plain", 0, f), Errc::ok);
    EXPECT_EQ(f.hash, digest::sha256(junk));
}

TEST_F(StoreFixture, ZeroChunkTransferIsCompleteImmediately)
{
    model::Manifest empty = manifest_for({Bytes{}}, 4);
    ASSERT_EQ(store.create_transfer("e", empty), Errc::ok);
    relay::Status st;
    ASSERT_EQ(store.status("e", st), Errc::ok);
    EXPECT_EQ(st.total_chunks, 0u);
    EXPECT_TRUE(st.complete);
}

TEST_F(StoreFixture, ManifestFetchAndDelete)
{
    ASSERT_EQ(store.create_transfer("t1", m), Errc::ok);
    model::Manifest got;
    ASSERT_EQ(store.get_manifest("t1", got), Errc::ok);
    EXPECT_EQ(got, m);

    EXPECT_EQ(store.delete_transfer("t1"), Errc::ok);
    EXPECT_EQ(store.delete_transfer("t1"), Errc::transfer_not_found);
    EXPECT_EQ(store.get_manifest("t1", got), Errc::transfer_not_found);
}

TEST_F(StoreFixture, RetentionSweepDropsOldTransfersOnly)
{
    ASSERT_EQ(store.create_transfer("old", m), Errc::ok);
    clock.advance(std::chrono::hours(23));
    ASSERT_EQ(store.create_transfer("new", m), Errc::ok);

    EXPECT_EQ(store.sweep(), 0u);
    clock.advance(std::chrono::hours(1));
    std::size_t purged = 0;
    ASSERT_EQ(store.cleanup(purged), Errc::ok);
    EXPECT_EQ(purged, 1u);

    relay::Status st;
    EXPECT_EQ(store.status("old", st), Errc::transfer_not_found);
    EXPECT_EQ(store.status("new", st), Errc::ok);
}

TEST_F(StoreFixture, ConcurrentUploadsOfDistinctChunks)
{
    Bytes           big = pattern(64 * 1024, 5);
    model::Manifest bm  = manifest_for({big}, 1024);
    ASSERT_EQ(store.create_transfer("big", bm), Errc::ok);

    std::vector<std::thread> th;
    for (int w = 0; w < 4; ++w)
    {
        th.emplace_back([&, w] {
            for (std::uint32_t i = static_cast<std::uint32_t>(w); i < 64; i += 4)
                EXPECT_EQ(store.put_chunk("big", i, slice(big, i * 1024, 1024)), Errc::ok);
        });
    }
    for (auto &t : th)
        t.join();

    relay::Status st;
    ASSERT_EQ(store.status("big", st), Errc::ok);
    EXPECT_EQ(st.uploaded_chunks, 64u);
    EXPECT_TRUE(st.complete);
}
