#pragma once

// LEB128 (Little Endian Base 128) variable-length integers.
// The change-set codec stores every length, count and integer value
// this way. Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace ledgersync::encoding {

// Longest encoding of a 64-bit value: ceil(64 / 7).
inline constexpr std::size_t max_leb128_bytes = 10;

// Result of a decode: the value plus the number of bytes consumed.
template <typename T>
struct Decoded {
    T value;
    std::size_t bytes_read;
};

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) byte |= std::byte{0x80};
        output.push_back(byte);
    } while (value != 0);
}

// nullopt on truncated input or more than max_leb128_bytes.
inline auto decode_uleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::uint64_t>> {
    auto value = std::uint64_t{0};
    const auto limit = std::min(input.size(), max_leb128_bytes);
    for (std::size_t i = 0; i < limit; ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        value |= bits << (7 * i);
        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return Decoded<std::uint64_t>{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    for (;;) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;  // arithmetic shift keeps the sign
        const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            output.push_back(byte);
            return;
        }
        output.push_back(byte | std::byte{0x80});
    }
}

inline auto decode_sleb128(std::span<const std::byte> input)
    -> std::optional<Decoded<std::int64_t>> {
    auto value = std::int64_t{0};
    auto shift = 0u;
    const auto limit = std::min(input.size(), max_leb128_bytes);
    for (std::size_t i = 0; i < limit; ++i) {
        const auto byte = input[i];
        value |= static_cast<std::int64_t>(byte & std::byte{0x7F}) << shift;
        shift += 7;
        if ((byte & std::byte{0x80}) == std::byte{0}) {
            if (shift < 64 && (byte & std::byte{0x40}) != std::byte{0}) {
                value |= -(std::int64_t{1} << shift);
            }
            return Decoded<std::int64_t>{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

}  // namespace ledgersync::encoding
