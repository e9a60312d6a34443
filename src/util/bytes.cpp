#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstring>

#include "util/bytes.hpp"

namespace ferry
{

void ByteWriter::put_u16(std::uint16_t v)
{
    std::uint16_t be = htons(v);
    put_raw(reinterpret_cast<const std::uint8_t *>(&be), sizeof be);
}

void ByteWriter::put_u32(std::uint32_t v)
{
    std::uint32_t be = htonl(v);
    put_raw(reinterpret_cast<const std::uint8_t *>(&be), sizeof be);
}

void ByteWriter::put_u64(std::uint64_t v)
{
    put_u32(static_cast<std::uint32_t>(v >> 32));
    put_u32(static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
}

void ByteWriter::put_raw(const std::uint8_t *p, std::size_t n)
{
    if (n)
        out_.insert(out_.end(), p, p + n);
}

void ByteWriter::put_str(std::string_view s)
{
    put_u32(static_cast<std::uint32_t>(s.size()));
    put_raw(reinterpret_cast<const std::uint8_t *>(s.data()), s.size());
}

void ByteWriter::put_blob(const std::vector<std::uint8_t> &b)
{
    put_u32(static_cast<std::uint32_t>(b.size()));
    put_raw(b.data(), b.size());
}

bool ByteReader::need(std::size_t k)
{
    if (!ok_ || n_ - off_ < k)
    {
        ok_ = false;
        return false;
    }
    return true;
}

bool ByteReader::get_u8(std::uint8_t &v)
{
    if (!need(1))
        return false;
    v = p_[off_++];
    return true;
}

bool ByteReader::get_u16(std::uint16_t &v)
{
    if (!need(2))
        return false;
    std::uint16_t be;
    std::memcpy(&be, p_ + off_, sizeof be);
    off_ += sizeof be;
    v = ntohs(be);
    return true;
}

bool ByteReader::get_u32(std::uint32_t &v)
{
    if (!need(4))
        return false;
    std::uint32_t be;
    std::memcpy(&be, p_ + off_, sizeof be);
    off_ += sizeof be;
    v = ntohl(be);
    return true;
}

bool ByteReader::get_u64(std::uint64_t &v)
{
    std::uint32_t hi = 0, lo = 0;
    if (!get_u32(hi) || !get_u32(lo))
        return false;
    v = (static_cast<std::uint64_t>(hi) << 32) | lo;
    return true;
}

bool ByteReader::get_raw(std::uint8_t *dst, std::size_t n)
{
    if (!need(n))
        return false;
    if (n)
        std::memcpy(dst, p_ + off_, n);
    off_ += n;
    return true;
}

bool ByteReader::get_str(std::string &s, std::size_t max_len)
{
    std::uint32_t len = 0;
    if (!get_u32(len))
        return false;
    if (len > max_len || !need(len))
    {
        ok_ = false;
        return false;
    }
    s.assign(reinterpret_cast<const char *>(p_ + off_), len);
    off_ += len;
    return true;
}

bool ByteReader::get_blob(std::vector<std::uint8_t> &b, std::size_t max_len)
{
    std::uint32_t len = 0;
    if (!get_u32(len))
        return false;
    if (len > max_len || !need(len))
    {
        ok_ = false;
        return false;
    }
    b.assign(p_ + off_, p_ + off_ + len);
    off_ += len;
    return true;
}

}  // namespace ferry
