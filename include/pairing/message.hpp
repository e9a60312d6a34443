#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pairing
{

enum class Role : std::uint8_t
{
    Sender   = 0,
    Receiver = 1
};

const char         *role_name(Role r);
std::optional<Role> parse_role(std::string_view s);
inline Role         peer_of(Role r)
{
    return r == Role::Sender ? Role::Receiver : Role::Sender;
}

// Message tags. The registry synthesizes the first two; everything else is
// relayed verbatim and only interpreted by the endpoints.
namespace tag
{
inline constexpr std::string_view PEER_CONNECTED    = "peer_connected";
inline constexpr std::string_view PEER_DISCONNECTED = "peer_disconnected";
inline constexpr std::string_view OFFER             = "offer";
inline constexpr std::string_view ANSWER            = "answer";
inline constexpr std::string_view CANDIDATE         = "candidate";
inline constexpr std::string_view RELAY             = "relay";   // sender already committed to relay
inline constexpr std::string_view DONE              = "done";    // receiver holds a verified copy
inline constexpr std::string_view CANCEL            = "cancel";  // either side aborted
}  // namespace tag

struct Message
{
    std::string               type;
    std::vector<std::uint8_t> payload;

    std::string text() const { return std::string(payload.begin(), payload.end()); }
};

Message make_message(std::string_view type, std::string_view text = {});
bool    is_reserved(std::string_view type);

std::vector<std::uint8_t> encode(const Message &m);
std::optional<Message>    decode(const std::uint8_t *p, std::size_t n);

}  // namespace pairing
