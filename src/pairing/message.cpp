#include "pairing/message.hpp"
#include "util/bytes.hpp"

namespace pairing
{

static constexpr std::size_t MAX_TYPE_LEN    = 64;
static constexpr std::size_t MAX_PAYLOAD_LEN = 64 * 1024;

const char *role_name(Role r)
{
    return r == Role::Sender ? "sender" : "receiver";
}

std::optional<Role> parse_role(std::string_view s)
{
    if (s == "sender")
        return Role::Sender;
    if (s == "receiver")
        return Role::Receiver;
    return std::nullopt;
}

Message make_message(std::string_view type, std::string_view text)
{
    Message m;
    m.type.assign(type.begin(), type.end());
    m.payload.assign(text.begin(), text.end());
    return m;
}

bool is_reserved(std::string_view type)
{
    return type == tag::PEER_CONNECTED || type == tag::PEER_DISCONNECTED;
}

std::vector<std::uint8_t> encode(const Message &m)
{
    ferry::ByteWriter w;
    w.put_str(m.type);
    w.put_blob(m.payload);
    return w.take();
}

std::optional<Message> decode(const std::uint8_t *p, std::size_t n)
{
    ferry::ByteReader r(p, n);
    Message           m;
    if (!r.get_str(m.type, MAX_TYPE_LEN) || !r.get_blob(m.payload, MAX_PAYLOAD_LEN) || !r.done())
        return std::nullopt;
    if (m.type.empty())
        return std::nullopt;
    return m;
}

}  // namespace pairing
