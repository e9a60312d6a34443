#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include "net/socket.hpp"
#include "transport/socket_transport.hpp"
#include "transport/tcp_connector.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
constexpr int ACCEPT_POLL_MS = 200;

bool parse_token(const std::string &hex, digest::Token &out)
{
    if (hex.size() != out.size() * 2)
        return false;
    for (std::size_t i = 0; i < out.size(); ++i)
    {
        unsigned v = 0;
        for (int k = 0; k < 2; ++k)
        {
            const char c = hex[i * 2 + k];
            v <<= 4;
            if (c >= '0' && c <= '9')
                v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f')
                v |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                v |= static_cast<unsigned>(c - 'A' + 10);
            else
                return false;
        }
        out[i] = static_cast<std::uint8_t>(v);
    }
    return true;
}

void set_recv_timeout(int fd, std::chrono::milliseconds t)
{
    timeval tv{};
    tv.tv_sec  = static_cast<time_t>(t.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((t.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}
}  // namespace

TcpPeerConnector::TcpPeerConnector(TcpConnectorOptions opt) : opt_(std::move(opt)) {}

TcpPeerConnector::~TcpPeerConnector()
{
    cancel();
}

bool TcpPeerConnector::claim()
{
    bool expected = false;
    return !cancelled_.load() && reported_.compare_exchange_strong(expected, true);
}

void TcpPeerConnector::begin(pairing::Role role, Emit emit, OnConnected on_connected, OnFailed on_failed)
{
    role_         = role;
    emit_         = std::move(emit);
    on_connected_ = std::move(on_connected);
    on_failed_    = std::move(on_failed);
    if (role_ == pairing::Role::Receiver)
        return;  // waits for the offer

    net::Endpoint ep;
    ep.kind = net::Endpoint::Kind::Tcp;
    ep.host = opt_.bind_host;
    ep.port = 0;
    int lfd = net::listen_on(ep, 4);
    if (lfd < 0)
    {
        if (claim())
            on_failed_(ferry::Errc::io_error);
        return;
    }
    const std::uint16_t port = net::local_port(lfd);
    token_                   = digest::random_token();

    std::vector<std::string> hosts;
    if (!opt_.advertise.empty())
        hosts.push_back(opt_.advertise);
    else
    {
        hosts = net::local_ipv4_addresses();
        hosts.push_back("127.0.0.1");
    }
    std::string offer = digest::to_hex(token_.data(), token_.size());
    for (const auto &h : hosts)
        offer += " " + h + ":" + std::to_string(port);

    {
        std::lock_guard<std::mutex> lk(mu_);
        listen_fd_ = lfd;
        worker_    = std::thread([this, lfd] { accept_loop(lfd); });
    }
    LOG_DEBUG("peer: listening on port %u, %zu candidate(s)", port, hosts.size());
    const ferry::Errc rc = emit_(pairing::make_message(pairing::tag::OFFER, offer));
    if (rc != ferry::Errc::ok)
        LOG_WARN("peer: offer not delivered: %s", ferry::errc_name(rc));
}

void TcpPeerConnector::accept_loop(int lfd)
{
    while (!cancelled_.load())
    {
        pollfd pfd{lfd, POLLIN, 0};
        int    pr = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (pr <= 0)
            continue;
        int fd = ::accept(lfd, nullptr, nullptr);
        if (fd < 0)
            continue;
        net::set_cloexec(fd);

        digest::Token presented{};
        set_recv_timeout(fd, opt_.dial_timeout);
        if (!net::read_all(fd, presented.data(), presented.size()) ||
            !digest::equal_ct(presented.data(), token_.data(), token_.size()))
        {
            LOG_WARN("peer: rejected inbound connection without a valid token");
            ::close(fd);
            continue;
        }
        set_recv_timeout(fd, std::chrono::milliseconds(0));
        if (claim())
        {
            LOG_INFO("peer: direct link accepted");
            on_connected_(std::unique_ptr<ITransport>(new SocketTransport(fd)));
        }
        else
            ::close(fd);
        return;
    }
}

void TcpPeerConnector::on_signal(const pairing::Message &m)
{
    if (role_ == pairing::Role::Receiver && m.type == pairing::tag::OFFER)
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (dialing_ || cancelled_.load())
        {
            LOG_DEBUG("peer: duplicate offer ignored");
            return;
        }
        dialing_ = true;
        worker_  = std::thread([this, offer = m.text()] { dial(offer); });
        return;
    }
    if (role_ == pairing::Role::Sender && m.type == pairing::tag::ANSWER)
    {
        LOG_DEBUG("peer: answer received: %s", m.text().c_str());
        return;
    }
    LOG_DEBUG("peer: ignoring %s signal", m.type.c_str());
}

void TcpPeerConnector::dial(std::string offer)
{
    std::istringstream in(offer);
    std::string        tok_hex;
    in >> tok_hex;
    digest::Token token{};
    if (!parse_token(tok_hex, token))
    {
        LOG_WARN("peer: malformed offer");
        if (claim())
            on_failed_(ferry::Errc::protocol_error);
        return;
    }

    std::string cand;
    while (in >> cand && !cancelled_.load())
    {
        auto ep = net::parse_endpoint("tcp:" + cand);
        if (!ep)
        {
            LOG_DEBUG("peer: skipping bad candidate '%s'", cand.c_str());
            continue;
        }
        int fd = net::connect_to(*ep, opt_.dial_timeout);
        if (fd < 0)
            continue;
        if (!net::write_all(fd, token.data(), token.size()))
        {
            ::close(fd);
            continue;
        }
        if (!claim())
        {
            ::close(fd);
            return;
        }
        LOG_INFO("peer: direct link to %s", cand.c_str());
        const ferry::Errc rc = emit_(pairing::make_message(pairing::tag::ANSWER, cand));
        if (rc != ferry::Errc::ok)
            LOG_DEBUG("peer: answer not delivered: %s", ferry::errc_name(rc));
        on_connected_(std::unique_ptr<ITransport>(new SocketTransport(fd)));
        return;
    }
    if (claim())
    {
        LOG_INFO("peer: no candidate reachable");
        on_failed_(ferry::Errc::unreachable);
    }
}

void TcpPeerConnector::cancel()
{
    cancelled_.store(true);
    std::thread worker;
    int         lfd = -1;
    {
        std::lock_guard<std::mutex> lk(mu_);
        worker.swap(worker_);
        lfd        = listen_fd_;
        listen_fd_ = -1;
    }
    if (worker.joinable())
        worker.join();
    if (lfd >= 0)
        ::close(lfd);
}

}  // namespace transport
