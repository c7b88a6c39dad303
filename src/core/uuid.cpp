#include <dv_alm/core/uuid.hpp>

#include <openssl/rand.h>

#include <array>

namespace dv_alm {

Result<std::string, Error> NewUuid() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Result<std::string, Error>::Err(Error{
            "NewUuid", "", std::nullopt, "OpenSSL RAND_bytes failed",
            std::nullopt, ErrorCategory::Internal});
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += kHex[bytes[i] >> 4];
        out += kHex[bytes[i] & 0x0F];
    }
    return Result<std::string, Error>::Ok(std::move(out));
}

} // namespace dv_alm
