#include <sys/socket.h>
#include <unistd.h>

#include "net/socket.hpp"
#include "transport/socket_transport.hpp"
#include "util/log.hpp"

namespace transport
{

namespace
{
constexpr std::uint8_t TAG_FRAME = 0x00;
}

SocketTransport::SocketTransport(int fd) : fd_(fd) {}

SocketTransport::~SocketTransport()
{
    stop();
}

bool SocketTransport::start(const Settings &s, OnFrame on_rx)
{
    if (fd_ < 0 || reader_.joinable())
        return false;
    settings_ = s;
    on_rx_    = std::move(on_rx);
    up_.store(true);
    reader_ = std::thread([this] { reader_loop(); });
    LOG_DEBUG("socket transport started (%s)", s.role.c_str());
    return true;
}

bool SocketTransport::send(const Frame &frame)
{
    if (!up_.load())
        return false;
    if (settings_.max_frame != 0 && frame.size() > settings_.max_frame)
    {
        LOG_WARN("frame of %zu bytes exceeds max %zu", frame.size(), settings_.max_frame);
        return false;
    }
    std::lock_guard<std::mutex> lk(tx_mu_);
    if (!net::write_frame(fd_, TAG_FRAME, frame))
    {
        LOG_WARN("peer link write failed");
        up_.store(false);
        return false;
    }
    return true;
}

void SocketTransport::reader_loop()
{
    std::uint8_t tag = 0;
    Frame        frame;
    const std::size_t max = settings_.max_frame ? settings_.max_frame : net::MAX_FRAME;
    while (!stopping_.load())
    {
        if (!net::read_frame(fd_, tag, frame, max))
            break;
        if (tag != TAG_FRAME)
        {
            LOG_WARN("unexpected tag 0x%02x on peer link", tag);
            break;
        }
        if (on_rx_)
            on_rx_(frame);
    }
    if (!stopping_.load())
        LOG_DEBUG("peer link closed by remote");
    up_.store(false);
}

void SocketTransport::stop()
{
    std::lock_guard<std::mutex> lk(stop_mu_);
    if (fd_ < 0)
        return;
    stopping_.store(true);
    up_.store(false);
    ::shutdown(fd_, SHUT_RDWR);
    if (reader_.joinable())
    {
        // stop() may run inside on_rx on the reader thread itself
        if (reader_.get_id() == std::this_thread::get_id())
            reader_.detach();
        else
            reader_.join();
    }
    ::close(fd_);
    fd_ = -1;
}

}  // namespace transport
