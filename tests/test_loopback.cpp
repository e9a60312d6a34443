#include <gtest/gtest.h>

#include "transport/itransport.hpp"
#include "transport/loopback_transport.hpp"

using namespace transport;

TEST(Loopback, DeliversToTheOtherEnd)
{
    auto  pair = LoopbackTransport::make_pair();
    Frame at_a, at_b;

    Settings s{};
    s.role = "sender";
    ASSERT_TRUE(pair.first->start(s, [&](const Frame &f) { at_a = f; }));
    s.role = "receiver";
    ASSERT_TRUE(pair.second->start(s, [&](const Frame &f) { at_b = f; }));

    Frame f = {1, 2, 3, 4, 5};
    EXPECT_TRUE(pair.first->send(f));
    EXPECT_EQ(at_b, f);
    EXPECT_TRUE(at_a.empty());

    Frame g = {9};
    EXPECT_TRUE(pair.second->send(g));
    EXPECT_EQ(at_a, g);
    EXPECT_EQ(pair.first->name(), "loopback");
}

TEST(Loopback, FramesBeforeStartAreHeldInOrder)
{
    auto pair = LoopbackTransport::make_pair();
    ASSERT_TRUE(pair.first->start({}, [](const Frame &) {}));
    EXPECT_TRUE(pair.first->send({1}));
    EXPECT_TRUE(pair.first->send({2}));

    std::vector<Frame> got;
    ASSERT_TRUE(pair.second->start({}, [&](const Frame &f) { got.push_back(f); }));
    EXPECT_TRUE(pair.first->send({3}));
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0], Frame{1});
    EXPECT_EQ(got[2], Frame{3});
}

TEST(Loopback, DropTakesBothEndsDown)
{
    auto pair = LoopbackTransport::make_pair();
    ASSERT_TRUE(pair.first->start({}, [](const Frame &) {}));
    ASSERT_TRUE(pair.second->start({}, [](const Frame &) {}));
    EXPECT_TRUE(pair.first->link_ready());

    pair.second->drop();
    EXPECT_FALSE(pair.first->link_ready());
    EXPECT_FALSE(pair.first->send({1}));
    EXPECT_FALSE(pair.second->send({1}));
}

TEST(Loopback, StopEndsTheLink)
{
    auto pair = LoopbackTransport::make_pair();
    ASSERT_TRUE(pair.first->start({}, [](const Frame &) {}));
    pair.first->stop();
    EXPECT_FALSE(pair.second->link_ready());
    EXPECT_FALSE(pair.second->start({}, [](const Frame &) {}));
}

TEST(Loopback, OversizedFrameIsRefused)
{
    auto     pair = LoopbackTransport::make_pair();
    Settings s{};
    s.max_frame = 4;
    ASSERT_TRUE(pair.first->start(s, [](const Frame &) {}));
    ASSERT_TRUE(pair.second->start({}, [](const Frame &) {}));
    EXPECT_TRUE(pair.first->send({1, 2, 3, 4}));
    EXPECT_FALSE(pair.first->send({1, 2, 3, 4, 5}));
}
