#include <dv_alm/core/base64.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <vector>

namespace dv_alm {

namespace {

// EVP_*Block take int lengths. Work in chunks that keep every call far below
// INT_MAX and keep quads aligned: 3 input bytes per 4 output characters.
constexpr size_t kEncodeChunk = 3 * 16384;
constexpr size_t kDecodeChunk = 4 * 16384;

} // anonymous namespace

std::string Base64Encode(std::string_view data) {
    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    std::vector<unsigned char> buffer(kEncodeChunk / 3 * 4 + 1);
    for (size_t offset = 0; offset < data.size(); offset += kEncodeChunk) {
        const auto length = std::min(kEncodeChunk, data.size() - offset);
        const int written = EVP_EncodeBlock(
            buffer.data(),
            reinterpret_cast<const unsigned char*>(data.data() + offset),
            static_cast<int>(length));
        out.append(reinterpret_cast<const char*>(buffer.data()),
                   static_cast<size_t>(written));
    }
    return out;
}

Result<std::string, std::string> Base64Decode(std::string_view encoded) {
    using R = Result<std::string, std::string>;

    if (encoded.size() % 4 != 0) {
        return R::Err("base64 length must be a multiple of 4, got " +
                      std::to_string(encoded.size()));
    }

    // EVP_DecodeBlock decodes '=' as zero bits anywhere. Padding is only
    // valid as the last one or two characters.
    size_t padding = 0;
    while (padding < 2 && padding < encoded.size() &&
           encoded[encoded.size() - 1 - padding] == '=') {
        ++padding;
    }
    const auto misplaced = encoded.find('=');
    if (misplaced != std::string_view::npos && misplaced < encoded.size() - padding) {
        return R::Err("unexpected '=' at offset " + std::to_string(misplaced));
    }

    std::string out;
    out.reserve(encoded.size() / 4 * 3);

    std::vector<unsigned char> buffer(kDecodeChunk / 4 * 3);
    for (size_t offset = 0; offset < encoded.size(); offset += kDecodeChunk) {
        const auto length = std::min(kDecodeChunk, encoded.size() - offset);
        const int written = EVP_DecodeBlock(
            buffer.data(),
            reinterpret_cast<const unsigned char*>(encoded.data() + offset),
            static_cast<int>(length));
        if (written < 0) {
            return R::Err("invalid base64 character in block at offset " +
                          std::to_string(offset));
        }
        out.append(reinterpret_cast<const char*>(buffer.data()),
                   static_cast<size_t>(written));
    }
    // Padding decodes to zero bytes at the end of the last block.
    out.resize(out.size() - padding);
    return R::Ok(std::move(out));
}

} // namespace dv_alm
