#include <condition_variable>
#include <gtest/gtest.h>
#include <mutex>

#include "transport/tcp_connector.hpp"

using ferry::Errc;
using namespace transport;
using namespace std::chrono_literals;

namespace
{

// Collects what one connector reports.
struct Observed
{
    std::mutex                  mu;
    std::condition_variable     cv;
    std::vector<pairing::Message> emitted;
    std::unique_ptr<ITransport> link;
    bool                        failed{false};
    Errc                        error{Errc::ok};

    Emit emit()
    {
        return [this](const pairing::Message &m) {
            std::lock_guard<std::mutex> lk(mu);
            emitted.push_back(m);
            cv.notify_all();
            return Errc::ok;
        };
    }
    OnConnected connected()
    {
        return [this](std::unique_ptr<ITransport> t) {
            std::lock_guard<std::mutex> lk(mu);
            link = std::move(t);
            cv.notify_all();
        };
    }
    OnFailed on_failed()
    {
        return [this](Errc e) {
            std::lock_guard<std::mutex> lk(mu);
            failed = true;
            error  = e;
            cv.notify_all();
        };
    }
    bool wait_done(std::chrono::milliseconds d)
    {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, d, [&] { return link != nullptr || failed; });
    }
};

TcpConnectorOptions loopback_only()
{
    TcpConnectorOptions o;
    o.bind_host    = "127.0.0.1";
    o.advertise    = "127.0.0.1";
    o.dial_timeout = 1000ms;
    return o;
}

}  // namespace

TEST(TcpConnector, OfferAnswerYieldsConnectedLink)
{
    Observed         s_obs, r_obs;
    TcpPeerConnector sender(loopback_only()), receiver(loopback_only());

    sender.begin(pairing::Role::Sender, s_obs.emit(), s_obs.connected(), s_obs.on_failed());
    receiver.begin(pairing::Role::Receiver, r_obs.emit(), r_obs.connected(), r_obs.on_failed());

    pairing::Message offer;
    {
        std::lock_guard<std::mutex> lk(s_obs.mu);
        ASSERT_EQ(s_obs.emitted.size(), 1u);
        offer = s_obs.emitted[0];
    }
    EXPECT_EQ(offer.type, pairing::tag::OFFER);
    receiver.on_signal(offer);

    ASSERT_TRUE(r_obs.wait_done(5s));
    ASSERT_TRUE(s_obs.wait_done(5s));
    ASSERT_TRUE(r_obs.link);
    ASSERT_TRUE(s_obs.link);
    {
        std::lock_guard<std::mutex> lk(r_obs.mu);
        ASSERT_EQ(r_obs.emitted.size(), 1u);
        EXPECT_EQ(r_obs.emitted[0].type, pairing::tag::ANSWER);
        sender.on_signal(r_obs.emitted[0]);
    }

    std::mutex              mu;
    std::condition_variable cv;
    Frame                   got;
    Settings                st;
    ASSERT_TRUE(r_obs.link->start(st, [&](const Frame &f) {
        std::lock_guard<std::mutex> lk(mu);
        got = f;
        cv.notify_all();
    }));
    ASSERT_TRUE(s_obs.link->start(st, [](const Frame &) {}));
    EXPECT_EQ(s_obs.link->name(), "tcp");

    const Frame hello = {'h', 'e', 'l', 'l', 'o'};
    ASSERT_TRUE(s_obs.link->send(hello));
    {
        std::unique_lock<std::mutex> lk(mu);
        ASSERT_TRUE(cv.wait_for(lk, 5s, [&] { return !got.empty(); }));
        EXPECT_EQ(got, hello);
    }

    s_obs.link->stop();
    r_obs.link->stop();
    sender.cancel();
    receiver.cancel();
}

TEST(TcpConnector, MalformedOfferFails)
{
    Observed         obs;
    TcpPeerConnector receiver(loopback_only());
    receiver.begin(pairing::Role::Receiver, obs.emit(), obs.connected(), obs.on_failed());
    receiver.on_signal(pairing::make_message(pairing::tag::OFFER, "not-a-token 127.0.0.1:1"));
    ASSERT_TRUE(obs.wait_done(5s));
    EXPECT_TRUE(obs.failed);
    EXPECT_EQ(obs.error, Errc::protocol_error);
    receiver.cancel();
}

TEST(TcpConnector, UnreachableCandidatesFail)
{
    Observed         obs;
    TcpPeerConnector receiver(loopback_only());
    receiver.begin(pairing::Role::Receiver, obs.emit(), obs.connected(), obs.on_failed());
    const std::string token(2 * digest::TOKEN_SIZE, 'a');
    receiver.on_signal(pairing::make_message(pairing::tag::OFFER, token + " 127.0.0.1:1"));
    ASSERT_TRUE(obs.wait_done(5s));
    EXPECT_TRUE(obs.failed);
    EXPECT_EQ(obs.error, Errc::unreachable);
    receiver.cancel();
}

TEST(TcpConnector, CancelSilencesSender)
{
    Observed         obs;
    TcpPeerConnector sender(loopback_only());
    sender.begin(pairing::Role::Sender, obs.emit(), obs.connected(), obs.on_failed());
    sender.cancel();
    EXPECT_FALSE(obs.wait_done(300ms));
}
