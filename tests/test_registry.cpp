#include <cctype>
#include <gtest/gtest.h>
#include <set>

#include "fake_clock.hpp"
#include "memory_storage.hpp"
#include "pairing/registry.hpp"

using ferry::Errc;
using namespace pairing;
using namespace std::chrono_literals;

namespace
{

struct RegistryFixture : ::testing::Test
{
    FakeClock       clock;
    PairingRegistry reg{clock};
    model::Manifest m = manifest_for({pattern(100, 1)}, 64);
};

}  // namespace

TEST_F(RegistryFixture, CreateIssuesSixDigitCode)
{
    PairInfo info;
    ASSERT_EQ(reg.create(m, "tid-1", info), Errc::ok);
    ASSERT_EQ(info.code.size(), 6u);
    for (char c : info.code)
        EXPECT_TRUE(std::isdigit(static_cast<unsigned char>(c)));
    EXPECT_EQ(info.transfer_id, "tid-1");
    EXPECT_EQ(info.expires_in, std::chrono::seconds(3600));
    EXPECT_FALSE(info.matched);
    EXPECT_EQ(reg.active(), 1u);
}

TEST_F(RegistryFixture, CreateAllocatesTransferIdWhenEmpty)
{
    PairInfo info;
    ASSERT_EQ(reg.create(m, "", info), Errc::ok);
    EXPECT_EQ(info.transfer_id.size(), 32u);
}

TEST_F(RegistryFixture, CreateRejectsInvalidManifest)
{
    model::Manifest bad = m;
    bad.entries.clear();
    PairInfo info;
    EXPECT_EQ(reg.create(bad, "t", info), Errc::protocol_error);
}

TEST_F(RegistryFixture, LookupReportsManifestAndRemainingTime)
{
    PairInfo created;
    ASSERT_EQ(reg.create(m, "tid", created), Errc::ok);
    clock.advance(600s);

    PairInfo info;
    ASSERT_EQ(reg.lookup(created.code, info), Errc::ok);
    EXPECT_EQ(info.transfer_id, "tid");
    EXPECT_EQ(info.manifest, m);
    EXPECT_EQ(info.expires_in, std::chrono::seconds(3000));
}

TEST_F(RegistryFixture, ExpiredCodeLooksUnknown)
{
    PairInfo created;
    ASSERT_EQ(reg.create(m, "tid", created), Errc::ok);
    clock.advance(3599s);
    PairInfo info;
    EXPECT_EQ(reg.lookup(created.code, info), Errc::ok);

    clock.advance(1s);
    EXPECT_EQ(reg.lookup(created.code, info), Errc::pair_not_found);
    std::unique_ptr<IChannel> ch;
    EXPECT_EQ(reg.attach(created.code, Role::Receiver, ch), Errc::pair_not_found);
    EXPECT_EQ(reg.active(), 0u);
}

TEST_F(RegistryFixture, UnknownCode)
{
    PairInfo info;
    EXPECT_EQ(reg.lookup("000000", info), Errc::pair_not_found);
}

TEST_F(RegistryFixture, AttachBothRolesMatchesAndNotifies)
{
    PairInfo created;
    ASSERT_EQ(reg.create(m, "tid", created), Errc::ok);

    std::unique_ptr<IChannel> s, r;
    ASSERT_EQ(reg.attach(created.code, Role::Sender, s), Errc::ok);
    ASSERT_EQ(reg.attach(created.code, Role::Receiver, r), Errc::ok);

    Message got;
    ASSERT_TRUE(s->recv(got, 100ms));
    EXPECT_EQ(got.type, tag::PEER_CONNECTED);
    ASSERT_TRUE(r->recv(got, 100ms));
    EXPECT_EQ(got.type, tag::PEER_CONNECTED);

    PairInfo info;
    ASSERT_EQ(reg.lookup(created.code, info), Errc::ok);
    EXPECT_TRUE(info.matched);

    ASSERT_EQ(s->send(make_message(tag::OFFER, "hello")), Errc::ok);
    ASSERT_TRUE(r->recv(got, 100ms));
    EXPECT_EQ(got.type, tag::OFFER);
    EXPECT_EQ(got.text(), "hello");

    r->close();
    ASSERT_TRUE(s->recv(got, 100ms));
    EXPECT_EQ(got.type, tag::PEER_DISCONNECTED);
    EXPECT_TRUE(r->closed());
}

TEST_F(RegistryFixture, ExpiryClosesAttachedChannels)
{
    PairInfo created;
    ASSERT_EQ(reg.create(m, "tid", created), Errc::ok);
    std::unique_ptr<IChannel> s;
    ASSERT_EQ(reg.attach(created.code, Role::Sender, s), Errc::ok);

    clock.advance(3600s);
    EXPECT_EQ(reg.sweep(), 1u);
    Message got;
    EXPECT_FALSE(s->recv(got, 50ms));
    EXPECT_TRUE(s->closed());
}

TEST_F(RegistryFixture, CloseRemovesCode)
{
    PairInfo created;
    ASSERT_EQ(reg.create(m, "tid", created), Errc::ok);
    EXPECT_EQ(reg.close(created.code), Errc::ok);
    EXPECT_EQ(reg.close(created.code), Errc::pair_not_found);
}

TEST(Registry, CodeSpaceExhaustion)
{
    FakeClock       clock;
    PairingRegistry reg(clock, std::chrono::seconds(60), 1);  // ten codes
    model::Manifest m = manifest_for({pattern(10, 1)}, 64);

    std::set<std::string> codes;
    PairInfo              info;
    for (int i = 0; i < 9; ++i)
    {
        ASSERT_EQ(reg.create(m, "", info), Errc::ok);
        codes.insert(info.code);
    }
    EXPECT_EQ(codes.size(), 9u);
    EXPECT_EQ(reg.create(m, "", info), Errc::code_space_exhausted);

    clock.advance(std::chrono::seconds(60));
    EXPECT_EQ(reg.sweep(), 9u);
    EXPECT_EQ(reg.create(m, "", info), Errc::ok);
}
