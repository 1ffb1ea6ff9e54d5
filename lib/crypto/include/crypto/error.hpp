#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace Ledger::Crypto {
enum class Error : std::uint8_t {
    Success = 0,
    EmptyInput, // 没有叶子 / 没有条目
    IndexOutOfRange, // 叶子索引 >= leaf_count
    InvalidDigestLength, // 原始字节不是 32 字节
    InvalidHexLength,
    InvalidHexDigit,
    OpenSSLError // 哈希或随机数后端失败
};

class LedgerErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "LedgerCrypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::EmptyInput:
            return "At least one leaf is required";
        case Error::IndexOutOfRange:
            return "Leaf index is out of range";
        case Error::InvalidDigestLength:
            return "Digest must be exactly 32 bytes";
        case Error::InvalidHexLength:
            return "Hex digest must be exactly 64 characters";
        case Error::InvalidHexDigit:
            return "Hex digest contains a non-hex character";
        case Error::OpenSSLError:
            return "OpenSSL backend failure";
        default:
            return "Unknown ledger crypto error";
        }
    }
};

inline const std::error_category& ledger_category()
{
    static LedgerErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), ledger_category() };
}
} // namespace Ledger::Crypto

namespace std {
template <>
struct is_error_code_enum<Ledger::Crypto::Error> : true_type { };
} // namespace std
