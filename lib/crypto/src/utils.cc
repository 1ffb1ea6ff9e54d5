#include "crypto/utils.hpp"
#include "crypto/error.hpp"
#include "impl_common.hpp"
#include <array>
#include <climits>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace Ledger::Crypto::Utils {
using Crypto::impl::EvpMdCtxPtr;

namespace {

    [[noreturn]] void throw_openssl(const char* what)
    {
        throw std::system_error(make_error_code(Error::OpenSSLError), what);
    }

} // namespace

Digest sha256(BytesSpan data)
{
    Digest h;
    unsigned int len = 0;

    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw_openssl("EVP_MD_CTX_new");
    }
    if (1 != EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) {
        throw_openssl("EVP_DigestInit_ex");
    }
    if (1 != EVP_DigestUpdate(ctx.get(), u8ptr(data), data.size())) {
        throw_openssl("EVP_DigestUpdate");
    }
    if (1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(h.data()), &len) || len != h.size()) {
        throw_openssl("EVP_DigestFinal_ex");
    }
    return h;
}

Digest hash_pair(const Digest& left, const Digest& right)
{
    std::array<Byte, 2 * DIGEST_SIZE> buf;
    std::memcpy(buf.data(), left.data(), DIGEST_SIZE);
    std::memcpy(buf.data() + DIGEST_SIZE, right.data(), DIGEST_SIZE);

    return sha256(buf);
}

std::expected<void, std::error_code> random_bytes(std::span<Byte> out)
{
    if (out.size() > static_cast<std::size_t>(INT_MAX)) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    if (RAND_bytes(u8ptr(out.data()), static_cast<int>(out.size())) != 1) {
        return std::unexpected(make_error_code(Error::OpenSSLError));
    }
    return {};
}

} // namespace Ledger::Crypto::Utils
