#include <arpa/inet.h>
#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "net/socket.hpp"
#include "util/log.hpp"

namespace net
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
        fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    }
    return true;
}

std::string expand_user(const std::string &path)
{
    if (path.rfind("~/", 0) != 0)
        return path;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    return std::string(home) + path.substr(1);
}

std::optional<Endpoint> parse_endpoint(const std::string &s)
{
    if (s.empty())
        return std::nullopt;
    Endpoint ep;
    if (s.rfind("tcp:", 0) == 0)
    {
        std::string rest  = s.substr(4);
        std::size_t colon = rest.rfind(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size())
            return std::nullopt;
        char         *end  = nullptr;
        unsigned long port = std::strtoul(rest.c_str() + colon + 1, &end, 10);
        if (*end != '\0' || port == 0 || port > 65535)
            return std::nullopt;
        ep.kind = Endpoint::Kind::Tcp;
        ep.host = rest.substr(0, colon);
        ep.port = static_cast<std::uint16_t>(port);
        return ep;
    }
    ep.kind = Endpoint::Kind::Unix;
    ep.path = expand_user(s);
    return ep;
}

std::string to_string(const Endpoint &ep)
{
    if (ep.kind == Endpoint::Kind::Tcp)
        return "tcp:" + ep.host + ":" + std::to_string(ep.port);
    return ep.path;
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD, 0);
    if (flags != -1)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static bool fill_unix_addr(const std::string &path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + std::strlen(addr.sun_path) + 1);
    return true;
}

static int listen_unix(const std::string &path, int backlog)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_unix_addr(path, addr, addr_len))
        return -1;
    if (!ensure_parent_dir(path))
        return -1;

    (void)::unlink(path.c_str());  // stale socket from a previous run

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);

    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind(%s) failed: %s", path.c_str(), std::strerror(errno));
        return -1;
    }
    if (listen(fd, backlog) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return -1;
    }
    LOG_DEBUG("Listening on %s", path.c_str());
    return fd;
}

static int listen_tcp(const std::string &host, std::uint16_t port, int backlog)
{
    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;
    addrinfo   *res   = nullptr;
    std::string ports = std::to_string(port);
    int         rc    = getaddrinfo(host.empty() ? nullptr : host.c_str(), ports.c_str(), &hints, &res);
    if (rc != 0)
    {
        LOG_ERROR("getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(rc));
        return -1;
    }

    int fd = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        freeaddrinfo(res);
        return -1;
    }
    set_cloexec(fd);
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (bind(fd, res->ai_addr, res->ai_addrlen) == -1 || listen(fd, backlog) == -1)
    {
        int saved = errno;
        close(fd);
        freeaddrinfo(res);
        errno = saved;
        LOG_ERROR("bind/listen on %s:%u failed: %s", host.c_str(), port, std::strerror(errno));
        return -1;
    }
    freeaddrinfo(res);
    LOG_DEBUG("Listening on %s:%u", host.c_str(), local_port(fd));
    return fd;
}

int listen_on(const Endpoint &ep, int backlog)
{
    if (ep.kind == Endpoint::Kind::Unix)
        return listen_unix(ep.path, backlog);
    return listen_tcp(ep.host, ep.port, backlog);
}

static int connect_unix(const std::string &path)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_unix_addr(path, addr, addr_len))
        return -1;

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return -1;
    }
    set_cloexec(fd);
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        LOG_DEBUG("connect(%s) failed: %s", path.c_str(), std::strerror(errno));
        close(fd);
        return -1;
    }
    return fd;
}

static int connect_tcp(const std::string &host, std::uint16_t port, std::chrono::milliseconds timeout)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo   *res   = nullptr;
    std::string ports = std::to_string(port);
    int         rc    = getaddrinfo(host.c_str(), ports.c_str(), &hints, &res);
    if (rc != 0)
    {
        LOG_DEBUG("getaddrinfo(%s) failed: %s", host.c_str(), gai_strerror(rc));
        return -1;
    }

    int fd = -1;
    for (addrinfo *ai = res; ai; ai = ai->ai_next)
    {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd == -1)
            continue;
        set_cloexec(fd);
        int fl = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, fl | O_NONBLOCK);

        bool ok = connect(fd, ai->ai_addr, ai->ai_addrlen) == 0;
        if (!ok && errno == EINPROGRESS)
        {
            pollfd pfd{fd, POLLOUT, 0};
            if (poll(&pfd, 1, static_cast<int>(timeout.count())) == 1)
            {
                int       err = 0;
                socklen_t len = sizeof(err);
                ok = getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err == 0;
            }
        }
        if (ok)
        {
            fcntl(fd, F_SETFL, fl);
            int one = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            break;
        }
        close(fd);
        fd = -1;
    }
    freeaddrinfo(res);
    if (fd == -1)
        LOG_DEBUG("connect(%s:%u) failed", host.c_str(), port);
    return fd;
}

int connect_to(const Endpoint &ep, std::chrono::milliseconds timeout)
{
    if (ep.kind == Endpoint::Kind::Unix)
        return connect_unix(ep.path);
    return connect_tcp(ep.host, ep.port, timeout);
}

std::uint16_t local_port(int fd)
{
    sockaddr_storage ss{};
    socklen_t        len = sizeof(ss);
    if (getsockname(fd, reinterpret_cast<sockaddr *>(&ss), &len) == -1)
        return 0;
    if (ss.ss_family == AF_INET)
        return ntohs(reinterpret_cast<sockaddr_in *>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<sockaddr_in6 *>(&ss)->sin6_port);
    return 0;
}

std::vector<std::string> local_ipv4_addresses()
{
    std::vector<std::string> out;
    ifaddrs                 *ifs = nullptr;
    if (getifaddrs(&ifs) == -1)
    {
        LOG_WARN("getifaddrs() failed: %s", std::strerror(errno));
        return out;
    }
    for (ifaddrs *i = ifs; i; i = i->ifa_next)
    {
        if (!i->ifa_addr || i->ifa_addr->sa_family != AF_INET)
            continue;
        char buf[INET_ADDRSTRLEN];
        auto sin = reinterpret_cast<sockaddr_in *>(i->ifa_addr);
        if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)))
            continue;
        if (std::strncmp(buf, "127.", 4) == 0)
            continue;
        out.emplace_back(buf);
    }
    freeifaddrs(ifs);
    return out;
}

bool write_all(int fd, const std::uint8_t *p, std::size_t n)
{
    while (n > 0)
    {
        ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += w;
        n -= static_cast<std::size_t>(w);
    }
    return true;
}

bool read_all(int fd, std::uint8_t *p, std::size_t n)
{
    while (n > 0)
    {
        ssize_t r = ::recv(fd, p, n, 0);
        if (r == 0)
            return false;
        if (r < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += r;
        n -= static_cast<std::size_t>(r);
    }
    return true;
}

bool write_frame(int fd, std::uint8_t tag, const std::vector<std::uint8_t> &payload)
{
    const std::uint32_t len = static_cast<std::uint32_t>(payload.size() + 1);
    std::uint8_t        hdr[5];
    const std::uint32_t be = htonl(len);
    std::memcpy(hdr, &be, 4);
    hdr[4] = tag;
    return write_all(fd, hdr, sizeof(hdr)) && write_all(fd, payload.data(), payload.size());
}

bool read_frame(int fd, std::uint8_t &tag, std::vector<std::uint8_t> &payload, std::size_t max)
{
    std::uint8_t hdr[5];
    if (!read_all(fd, hdr, sizeof(hdr)))
        return false;
    std::uint32_t be = 0;
    std::memcpy(&be, hdr, 4);
    const std::uint32_t len = ntohl(be);
    if (len == 0 || len > max)
    {
        LOG_WARN("Dropping connection: frame length %u out of range", len);
        return false;
    }
    tag = hdr[4];
    payload.resize(len - 1);
    return read_all(fd, payload.data(), payload.size());
}

}  // namespace net
