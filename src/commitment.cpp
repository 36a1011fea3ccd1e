#include <coil/commitment.hpp>

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace coil {

namespace {

constexpr std::string_view STATE_TAG = "coil/v1";

void put_u32(std::vector<std::uint8_t> & out, std::uint32_t value)
{
    out.push_back((std::uint8_t)(value >> 24));
    out.push_back((std::uint8_t)(value >> 16));
    out.push_back((std::uint8_t)(value >> 8));
    out.push_back((std::uint8_t)value);
}

void put_i32(std::vector<std::uint8_t> & out, int value)
{
    put_u32(out, (std::uint32_t)value);
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

std::vector<std::uint8_t> serialize_state(std::span<Position const> snake, Grid grid)
{
    std::vector<std::uint8_t> out;
    out.reserve(STATE_TAG.size() + 4 + snake.size() * 8 + 8);
    out.insert(out.end(), STATE_TAG.begin(), STATE_TAG.end());
    put_u32(out, (std::uint32_t)snake.size());
    for (auto & pos : snake) {
        put_i32(out, pos.x);
        put_i32(out, pos.y);
    }
    put_i32(out, grid.width);
    put_i32(out, grid.height);
    return out;
}

Digest commit(std::span<Position const> snake, Grid grid)
{
    auto bytes = serialize_state(snake, grid);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new()");
    }

    Digest digest;
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
            || EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1
            || EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    if (len != digest.size()) {
        throw std::runtime_error("unexpected SHA-256 digest length");
    }
    return digest;
}

std::string to_hex(std::span<std::uint8_t const> bytes)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        hex += digits[b >> 4];
        hex += digits[b & 0xf];
    }
    return hex;
}

Digest digest_from_hex(std::string_view hex)
{
    Digest digest;
    if (hex.size() != digest.size() * 2) {
        throw std::invalid_argument("digest must be " + std::to_string(digest.size() * 2) + " hex digits");
    }
    for (std::size_t i = 0; i < digest.size(); ++ i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("digest contains a non-hex character");
        }
        digest[i] = (std::uint8_t)(hi << 4 | lo);
    }
    return digest;
}

} // namespace coil
