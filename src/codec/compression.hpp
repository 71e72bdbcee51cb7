#pragma once

// DEFLATE compression and CRC-32 for change-set bodies, via zlib.
//
// Bodies larger than ReplicaConfig::compress_threshold are stored as raw
// DEFLATE (no zlib/gzip header); the deflate flag in the envelope says
// which. The CRC always covers the uncompressed body.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace ledgersync::codec {

// Decompressed bodies larger than this are rejected.
inline constexpr std::size_t max_body_size = std::size_t{64} * 1024 * 1024;

inline auto crc32_of(std::span<const std::byte> data) -> std::uint32_t {
    auto crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data.data()),
                  static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 selects raw deflate
    if (::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    auto ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// expected_size is the body length recorded in the envelope; anything
// else is treated as corruption.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t expected_size)
    -> std::optional<std::vector<std::byte>> {
    if (expected_size > max_body_size) return std::nullopt;
    if (input.empty()) {
        if (expected_size != 0) return std::nullopt;
        return std::vector<std::byte>{};
    }

    auto output = std::vector<std::byte>(expected_size);
    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    if (::inflateInit2(&stream, -15) != Z_OK) return std::nullopt;
    auto ret = ::inflate(&stream, Z_FINISH);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || stream.total_out != expected_size || stream.avail_in != 0) {
        return std::nullopt;
    }
    return output;
}

}  // namespace ledgersync::codec
