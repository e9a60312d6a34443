#include <atomic>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "engine/mode.hpp"
#include "engine/options.hpp"

using namespace engine;

TEST(ModeLatch, CommitsOnlyFromProbing)
{
    ModeLatch m;
    EXPECT_EQ(m.get(), Mode::probing);
    EXPECT_FALSE(m.commit(Mode::complete));
    EXPECT_TRUE(m.commit(Mode::peer));
    EXPECT_FALSE(m.commit(Mode::relay));
    EXPECT_EQ(m.get(), Mode::peer);
}

TEST(ModeLatch, PeerMayFallBackToRelayOnce)
{
    ModeLatch m;
    ASSERT_TRUE(m.commit(Mode::peer));
    EXPECT_TRUE(m.fallback_to_relay());
    EXPECT_FALSE(m.fallback_to_relay());
    EXPECT_EQ(m.get(), Mode::relay);
    EXPECT_FALSE(m.finish(Mode::peer, true));
    EXPECT_TRUE(m.finish(Mode::relay, true));
    EXPECT_EQ(m.get(), Mode::complete);
}

TEST(ModeLatch, RelayNeverReturnsToPeer)
{
    ModeLatch m;
    ASSERT_TRUE(m.commit(Mode::relay));
    EXPECT_FALSE(m.fallback_to_relay());
    EXPECT_FALSE(m.commit(Mode::peer));
    EXPECT_TRUE(m.finish(Mode::relay, false));
    EXPECT_EQ(m.get(), Mode::failed);
}

TEST(ModeLatch, TerminalStatesAreFinal)
{
    ModeLatch m;
    EXPECT_TRUE(m.cancel());
    EXPECT_FALSE(m.fail());
    EXPECT_FALSE(m.commit(Mode::relay));
    EXPECT_EQ(m.get(), Mode::cancelled);
    EXPECT_TRUE(is_terminal(m.get()));
    EXPECT_FALSE(is_terminal(Mode::relay));
    EXPECT_STREQ(mode_name(Mode::probing), "probing");
}

TEST(ModeLatch, RacingCommitsHaveOneWinner)
{
    for (int round = 0; round < 50; ++round)
    {
        ModeLatch                m;
        std::atomic<int>         wins{0};
        std::vector<std::thread> th;
        for (int i = 0; i < 4; ++i)
        {
            th.emplace_back([&, i] {
                if (m.commit(i % 2 ? Mode::peer : Mode::relay))
                    ++wins;
            });
        }
        for (auto &t : th)
            t.join();
        EXPECT_EQ(wins.load(), 1);
    }
}

TEST(ProgressMeter, CountsBytes)
{
    ProgressMeter p("upload", 1000);
    p.add(400);
    p.add(600);
    EXPECT_EQ(p.done(), 1000u);

    ProgressMeter empty("empty", 0);
    empty.add(0);
    EXPECT_EQ(empty.done(), 0u);
}
