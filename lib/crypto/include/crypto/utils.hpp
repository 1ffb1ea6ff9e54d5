#pragma once

#include <expected>
#include <span>
#include <system_error>

#include "crypto/common.hpp"
#include "crypto/digest.hpp"

namespace Ledger::Crypto::Utils {

// SHA-256 (OpenSSL EVP). 后端失败抛出 std::system_error(Error::OpenSSLError)
Digest sha256(BytesSpan data);

// SHA-256(left || right), 64 字节直接拼接, 无前缀无分隔符
Digest hash_pair(const Digest& left, const Digest& right);

// Fill `out` from the OpenSSL CSPRNG.
[[nodiscard]]
std::expected<void, std::error_code> random_bytes(std::span<Byte> out);

} // namespace Ledger::Crypto::Utils
