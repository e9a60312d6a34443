#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace digest
{

constexpr std::size_t SHA256_SIZE = 32;  // crypto_hash_sha256_BYTES
constexpr std::size_t TOKEN_SIZE  = 16;

using Sha256 = std::array<std::uint8_t, SHA256_SIZE>;
using Token  = std::array<std::uint8_t, TOKEN_SIZE>;

bool ensure_init();

Sha256 sha256(const std::uint8_t *data, std::size_t len);
inline Sha256 sha256(const std::vector<std::uint8_t> &v)
{
    return sha256(v.data(), v.size());
}

// Incremental hash for whole-file and per-chunk digests over streamed bytes.
class Sha256Stream
{
  public:
    Sha256Stream();
    ~Sha256Stream();
    Sha256Stream(const Sha256Stream &)            = delete;
    Sha256Stream &operator=(const Sha256Stream &) = delete;

    void   update(const std::uint8_t *data, std::size_t len);
    Sha256 finish();

  private:
    struct State;
    std::unique_ptr<State> st_;
};

std::string to_hex(const std::uint8_t *p, std::size_t n);
inline std::string to_hex(const Sha256 &h)
{
    return to_hex(h.data(), h.size());
}

// Random material for transfer ids, pair codes and peer tokens.
std::string   random_hex(std::size_t nbytes);
std::uint32_t random_below(std::uint32_t upper);
Token         random_token();

// Constant-time compare for tokens presented by a dialing peer.
bool equal_ct(const std::uint8_t *a, const std::uint8_t *b, std::size_t n);

}  // namespace digest
