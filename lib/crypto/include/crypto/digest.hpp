#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include "crypto/common.hpp"

namespace Ledger::Crypto {

constexpr std::size_t DIGEST_SIZE = 32;

// SHA-256 输出, 只要求逐字节相等
using Digest = std::array<Byte, DIGEST_SIZE>;

[[nodiscard]] constexpr Digest zero_digest() { return Digest {}; }

[[nodiscard]]
std::expected<Digest, std::error_code> digest_from_bytes(BytesSpan bytes);

[[nodiscard]]
std::expected<Digest, std::error_code> digest_from_hex(std::string_view hex);

[[nodiscard]] std::string to_hex(const Digest& d);

// --- Hashable capability ---

// A digest used as an item is itself hashed: leaf = SHA-256(d).
Digest digest_of(const Digest& d);

Digest digest_of(BytesSpan bytes);

template <typename T>
    requires requires(const T& item) {
        { item.digest() } -> std::convertible_to<Digest>;
    }
Digest digest_of(const T& item)
{
    return item.digest();
}

template <typename T>
concept Hashable = requires(const T& item) {
    { digest_of(item) } -> std::convertible_to<Digest>;
};

} // namespace Ledger::Crypto
