#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net
{

struct Endpoint
{
    enum class Kind
    {
        Unix,
        Tcp
    };
    Kind          kind{Kind::Unix};
    std::string   path;  // Unix
    std::string   host;  // Tcp
    std::uint16_t port{0};
};

// "tcp:<host>:<port>" or a unix socket path ("~/" expanded).
std::optional<Endpoint> parse_endpoint(const std::string &s);
std::string             to_string(const Endpoint &ep);
std::string             expand_user(const std::string &path);

// Both return -1 on failure (already logged).
int listen_on(const Endpoint &ep, int backlog = 16);
int connect_to(const Endpoint &ep, std::chrono::milliseconds timeout);

void          set_cloexec(int fd);
std::uint16_t local_port(int fd);
// Non-loopback IPv4 addresses of this host, for peer offers.
std::vector<std::string> local_ipv4_addresses();

bool write_all(int fd, const std::uint8_t *p, std::size_t n);
bool read_all(int fd, std::uint8_t *p, std::size_t n);  // false on EOF or error

// [u32 length][u8 tag][payload], length counts tag + payload.
inline constexpr std::size_t MAX_FRAME = 80u << 20;
bool write_frame(int fd, std::uint8_t tag, const std::vector<std::uint8_t> &payload);
bool read_frame(int fd, std::uint8_t &tag, std::vector<std::uint8_t> &payload,
                std::size_t max = MAX_FRAME);

}  // namespace net
