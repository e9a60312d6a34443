#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ferry
{

// Big-endian writer shared by the manifest codec, the peer stream frames and
// the service wire protocol. Strings and blobs are u32 length + bytes.
class ByteWriter
{
  public:
    void put_u8(std::uint8_t v) { out_.push_back(v); }
    void put_u16(std::uint16_t v);
    void put_u32(std::uint32_t v);
    void put_u64(std::uint64_t v);
    void put_raw(const std::uint8_t *p, std::size_t n);
    void put_str(std::string_view s);
    void put_blob(const std::vector<std::uint8_t> &b);

    std::vector<std::uint8_t>       &bytes() { return out_; }
    const std::vector<std::uint8_t> &bytes() const { return out_; }
    std::vector<std::uint8_t>        take() { return std::move(out_); }

  private:
    std::vector<std::uint8_t> out_;
};

// Bounds-checked reader; every getter returns false once the input runs short
// and leaves the reader in the failed state.
class ByteReader
{
  public:
    ByteReader(const std::uint8_t *p, std::size_t n) : p_(p), n_(n) {}
    explicit ByteReader(const std::vector<std::uint8_t> &v) : p_(v.data()), n_(v.size()) {}

    bool get_u8(std::uint8_t &v);
    bool get_u16(std::uint16_t &v);
    bool get_u32(std::uint32_t &v);
    bool get_u64(std::uint64_t &v);
    bool get_raw(std::uint8_t *dst, std::size_t n);
    bool get_str(std::string &s, std::size_t max_len = 1u << 20);
    bool get_blob(std::vector<std::uint8_t> &b, std::size_t max_len = 64u << 20);

    std::size_t remaining() const { return ok_ ? n_ - off_ : 0; }
    bool        ok() const { return ok_; }
    bool        done() const { return ok_ && off_ == n_; }

  private:
    bool need(std::size_t k);

    const std::uint8_t *p_;
    std::size_t         n_;
    std::size_t         off_{0};
    bool                ok_{true};
};

}  // namespace ferry
