#include <sodium.h>
#include <vector>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(digest::SHA256_SIZE == crypto_hash_sha256_BYTES, "sha256 size mismatch");

bool ensure_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    if (!ok)
        LOG_ERROR("sodium_init failed");
    return ok;
}

Sha256 sha256(const std::uint8_t *data, std::size_t len)
{
    ensure_init();
    Sha256 out{};
    crypto_hash_sha256(out.data(), data, static_cast<unsigned long long>(len));
    return out;
}

struct Sha256Stream::State
{
    crypto_hash_sha256_state h;
};

Sha256Stream::Sha256Stream() : st_(std::make_unique<State>())
{
    ensure_init();
    crypto_hash_sha256_init(&st_->h);
}

Sha256Stream::~Sha256Stream() = default;

void Sha256Stream::update(const std::uint8_t *data, std::size_t len)
{
    crypto_hash_sha256_update(&st_->h, data, static_cast<unsigned long long>(len));
}

Sha256 Sha256Stream::finish()
{
    Sha256 out{};
    crypto_hash_sha256_final(&st_->h, out.data());
    return out;
}

std::string to_hex(const std::uint8_t *p, std::size_t n)
{
    std::vector<char> buf(n * 2 + 1);
    sodium_bin2hex(buf.data(), buf.size(), p, n);
    return std::string(buf.data(), n * 2);
}

std::string random_hex(std::size_t nbytes)
{
    ensure_init();
    std::vector<std::uint8_t> raw(nbytes);
    randombytes_buf(raw.data(), raw.size());
    return to_hex(raw.data(), raw.size());
}

std::uint32_t random_below(std::uint32_t upper)
{
    ensure_init();
    return randombytes_uniform(upper);
}

Token random_token()
{
    ensure_init();
    Token t{};
    randombytes_buf(t.data(), t.size());
    return t;
}

bool equal_ct(const std::uint8_t *a, const std::uint8_t *b, std::size_t n)
{
    return sodium_memcmp(a, b, n) == 0;
}

}  // namespace digest
