#include "chain/header.hpp"
#include "crypto/utils.hpp"
#include <chrono>
#include <cstring>

namespace Ledger::Chain {

namespace {

    // 小端写入, 和机器字节序无关
    template <typename UInt>
    Byte* put_le(Byte* out, UInt value)
    {
        for (std::size_t k = 0; k < sizeof(UInt); ++k) {
            *out++ = static_cast<Byte>(value >> (8 * k));
        }
        return out;
    }

    Byte* put_digest(Byte* out, const Digest& d)
    {
        std::memcpy(out, d.data(), d.size());
        return out + d.size();
    }

} // namespace

Timestamp Timestamp::now()
{
    // Timestamp::seconds hides std::chrono::seconds here, qualify it
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    return Timestamp {
        .seconds = static_cast<std::uint64_t>(secs.count()),
        .nanos = static_cast<std::uint32_t>(ns.count())
    };
}

HeaderBytes serialize(const Header& header)
{
    HeaderBytes buf {};
    Byte* p = buf.data();
    p = put_digest(p, header.parent);
    p = put_le(p, header.nonce);
    p = put_digest(p, header.difficulty);
    p = put_le(p, header.timestamp.seconds);
    put_le(p, header.timestamp.nanos);
    return buf;
}

Digest Header::digest() const
{
    return Crypto::Utils::sha256(serialize(*this));
}

} // namespace Ledger::Chain
