#pragma once

// Base64 (RFC 4648, padded) for binary fields carried in JSON.
// Internal header, not installed.

#include <ledgersync/error.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace ledgersync::util {

inline auto base64_encode(const std::vector<std::byte>& data) -> std::string {
    if (data.empty()) return {};
    auto out = std::string(4 * ((data.size() + 2) / 3), '\0');
    auto n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                               reinterpret_cast<const unsigned char*>(data.data()),
                               static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

// Throws DecodeError on malformed input.
inline auto base64_decode(std::string_view encoded) -> std::vector<std::byte> {
    if (encoded.empty()) return {};
    if (encoded.size() % 4 != 0) throw DecodeError{"base64 length is not a multiple of 4"};

    auto out = std::vector<std::byte>(3 * (encoded.size() / 4));
    auto n = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                               reinterpret_cast<const unsigned char*>(encoded.data()),
                               static_cast<int>(encoded.size()));
    if (n < 0) throw DecodeError{"invalid base64"};

    // EVP_DecodeBlock counts padding characters as zero bytes.
    auto size = static_cast<std::size_t>(n);
    if (encoded.back() == '=') --size;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') --size;
    out.resize(size);
    return out;
}

}  // namespace ledgersync::util
