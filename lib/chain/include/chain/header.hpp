#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "crypto/common.hpp"
#include "crypto/digest.hpp"

namespace Ledger::Chain {

using Crypto::Byte;
using Crypto::Digest;

/// Wall-clock time since the Unix epoch, split like std::chrono would report it
struct Timestamp {
    std::uint64_t seconds = 0;
    std::uint32_t nanos = 0; ///< always < 1'000'000'000

    static Timestamp now();

    bool operator==(const Timestamp&) const = default;
};

/// Block header. Field order here is the serialization order.
struct Header {
    Digest parent {}; ///< digest of the parent header
    std::uint32_t nonce = 0;
    Digest difficulty {}; ///< difficulty target
    Timestamp timestamp;

    /// SHA-256 over serialize(*this); the block's identity
    [[nodiscard]] Digest digest() const;

    bool operator==(const Header&) const = default;
};

/// parent(32) | nonce(u32 LE) | difficulty(32) | seconds(u64 LE) | nanos(u32 LE)
constexpr std::size_t HEADER_SIZE = 32 + 4 + 32 + 8 + 4;

using HeaderBytes = std::array<Byte, HEADER_SIZE>;

[[nodiscard]] HeaderBytes serialize(const Header& header);

} // namespace Ledger::Chain
