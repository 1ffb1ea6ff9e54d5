#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace Ledger::Crypto {

using Byte = std::uint8_t;
using BytesSpan = std::span<const Byte>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

// OpenSSL takes unsigned char*, keep the casts in one place
inline const unsigned char* u8ptr(const Byte* p)
{
    return reinterpret_cast<const unsigned char*>(p);
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

inline const unsigned char* u8ptr(BytesSpan s)
{
    return u8ptr(s.data());
}

} // namespace Ledger::Crypto
