#include "crypto/digest.hpp"
#include "crypto/error.hpp"
#include "crypto/utils.hpp"
#include <algorithm>
#include <optional>

namespace Ledger::Crypto {

namespace {

    constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

    std::optional<Byte> nibble(char c)
    {
        if (c >= '0' && c <= '9')
            return static_cast<Byte>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<Byte>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F')
            return static_cast<Byte>(c - 'A' + 10);
        return std::nullopt;
    }

} // namespace

std::expected<Digest, std::error_code> digest_from_bytes(BytesSpan bytes)
{
    if (bytes.size() != DIGEST_SIZE) {
        return std::unexpected(make_error_code(Error::InvalidDigestLength));
    }
    Digest d;
    std::ranges::copy(bytes, d.begin());
    return d;
}

std::expected<Digest, std::error_code> digest_from_hex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() != 2 * DIGEST_SIZE) {
        return std::unexpected(make_error_code(Error::InvalidHexLength));
    }

    Digest d;
    for (std::size_t i = 0; i < DIGEST_SIZE; ++i) {
        auto hi = nibble(hex[2 * i]);
        auto lo = nibble(hex[2 * i + 1]);
        if (!hi || !lo) {
            return std::unexpected(make_error_code(Error::InvalidHexDigit));
        }
        d[i] = static_cast<Byte>((*hi << 4) | *lo);
    }
    return d;
}

std::string to_hex(const Digest& d)
{
    std::string out;
    out.reserve(2 * DIGEST_SIZE);
    for (Byte b : d) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0f]);
    }
    return out;
}

Digest digest_of(const Digest& d)
{
    return Utils::sha256(d);
}

Digest digest_of(BytesSpan bytes)
{
    return Utils::sha256(bytes);
}

} // namespace Ledger::Crypto
