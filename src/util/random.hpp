#pragma once

// CSPRNG helpers backed by OpenSSL: raw bytes, hex strings and UUIDs.
// Internal header, not installed.

#include <ledgersync/error.hpp>

#include <cstddef>
#include <string>
#include <vector>

#include <openssl/rand.h>

namespace ledgersync::util {

inline auto random_bytes(std::size_t n) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>(n);
    if (n == 0) return out;
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(n)) != 1) {
        throw Error{ErrorKind::invalid_operation, "RAND_bytes failed"};
    }
    return out;
}

inline auto to_hex(const std::byte* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        auto b = static_cast<unsigned char>(data[i]);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

inline auto random_hex(std::size_t n_bytes) -> std::string {
    auto bytes = random_bytes(n_bytes);
    return to_hex(bytes.data(), bytes.size());
}

// RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
inline auto make_uuid() -> std::string {
    auto bytes = random_bytes(16);
    bytes[6] = (bytes[6] & std::byte{0x0F}) | std::byte{0x40};
    bytes[8] = (bytes[8] & std::byte{0x3F}) | std::byte{0x80};
    auto hex = to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace ledgersync::util
