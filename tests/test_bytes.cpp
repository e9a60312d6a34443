#include <gtest/gtest.h>

#include "crypto/digest.hpp"
#include "util/bytes.hpp"
#include "util/errors.hpp"

using ferry::ByteReader;
using ferry::ByteWriter;
using ferry::Errc;

TEST(Bytes, BigEndianLayout)
{
    ByteWriter w;
    w.put_u16(0x0102);
    w.put_u32(0x03040506);
    w.put_u64(0x0708090a0b0c0d0eULL);
    const std::vector<std::uint8_t> want = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14};
    EXPECT_EQ(w.bytes(), want);
}

TEST(Bytes, ReaderFailsWhenShortAndStaysFailed)
{
    ByteWriter w;
    w.put_str("hello");
    auto bytes = w.take();
    bytes.pop_back();

    ByteReader  r(bytes);
    std::string s;
    EXPECT_FALSE(r.get_str(s));
    EXPECT_FALSE(r.ok());
    std::uint8_t b = 0;
    EXPECT_FALSE(r.get_u8(b));
    EXPECT_EQ(r.remaining(), 0u);
}

TEST(Bytes, StringLengthLimit)
{
    ByteWriter w;
    w.put_str(std::string(100, 'x'));
    ByteReader  r(w.bytes());
    std::string s;
    EXPECT_FALSE(r.get_str(s, 99));
}

TEST(Bytes, DoneRequiresFullConsumption)
{
    ByteWriter w;
    w.put_u32(7);
    w.put_u8(1);
    ByteReader    r(w.bytes());
    std::uint32_t v = 0;
    ASSERT_TRUE(r.get_u32(v));
    EXPECT_EQ(v, 7u);
    EXPECT_FALSE(r.done());
    std::uint8_t b = 0;
    ASSERT_TRUE(r.get_u8(b));
    EXPECT_TRUE(r.done());
}

TEST(Errors, NamesAndRetryClasses)
{
    EXPECT_STREQ(ferry::errc_name(Errc::negotiation_timeout), "negotiation_timeout");
    EXPECT_STREQ(ferry::errc_name(Errc::chunk_unavailable), "chunk_unavailable");
    EXPECT_TRUE(ferry::is_retryable(Errc::chunk_not_ready));
    EXPECT_TRUE(ferry::is_retryable(Errc::integrity_mismatch));
    EXPECT_TRUE(ferry::is_retryable(Errc::unreachable));
    EXPECT_FALSE(ferry::is_retryable(Errc::transfer_not_found));
    EXPECT_FALSE(ferry::is_retryable(Errc::chunk_index_out_of_range));
}

TEST(Errors, WireByteMapping)
{
    EXPECT_EQ(ferry::errc_from_byte(0), Errc::ok);
    EXPECT_EQ(ferry::errc_from_byte(static_cast<std::uint8_t>(Errc::backlog_full)), Errc::backlog_full);
    EXPECT_EQ(ferry::errc_from_byte(0xEE), Errc::protocol_error);
}

TEST(Digest, KnownSha256AndHex)
{
    ASSERT_TRUE(digest::ensure_init());
    const std::string abc = "abc";
    auto h = digest::sha256(reinterpret_cast<const std::uint8_t *>(abc.data()), abc.size());
    EXPECT_EQ(digest::to_hex(h), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Digest, StreamMatchesOneShot)
{
    std::vector<std::uint8_t> data(10000);
    for (std::size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i * 31);
    digest::Sha256Stream s;
    s.update(data.data(), 4000);
    s.update(data.data() + 4000, 6000);
    EXPECT_EQ(s.finish(), digest::sha256(data));
}

TEST(Digest, RandomMaterial)
{
    EXPECT_EQ(digest::random_hex(16).size(), 32u);
    EXPECT_NE(digest::random_hex(16), digest::random_hex(16));
    for (int i = 0; i < 100; ++i)
        EXPECT_LT(digest::random_below(10), 10u);
    auto a = digest::random_token();
    auto b = a;
    EXPECT_TRUE(digest::equal_ct(a.data(), b.data(), a.size()));
    b[3] ^= 1;
    EXPECT_FALSE(digest::equal_ct(a.data(), b.data(), a.size()));
}
