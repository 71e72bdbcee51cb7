/// @file codec.hpp
/// @brief Binary encoding of change sets for the relay.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace ledgersync {

/// First four bytes of every encoded change set ("LSCS").
inline constexpr std::array<std::byte, 4> change_set_magic = {
    std::byte{'L'}, std::byte{'S'}, std::byte{'C'}, std::byte{'S'},
};

/// Wire format version written by this library.
inline constexpr std::uint8_t change_set_version = 1;

/// Options for encode_change_set().
struct CodecOptions {
    /// Bodies larger than this many bytes are DEFLATE compressed.
    std::size_t compress_threshold{256};
};

/// Encode a sequence of records.
///
/// Layout: magic, version, flags (bit 0 = deflate), CRC-32 of the body,
/// body length, stored length, stored bytes. The body is the record
/// count followed by each record. Record order is preserved.
/// @throws Error(invalid_operation) if a record's client id is malformed.
auto encode_change_set(std::span<const ChangeRecord> records,
                       const CodecOptions& options = {}) -> Bytes;

/// Decode a payload produced by encode_change_set().
///
/// Decoding is all-or-nothing: any truncation, trailing data, bad tag,
/// checksum mismatch or malformed client id fails the whole payload.
/// @throws DecodeError
auto decode_change_set(std::span<const std::byte> payload) -> ChangeSet;

/// The highest timestamp in a sequence, or nullopt if it is empty.
auto max_timestamp(std::span<const ChangeRecord> records) -> std::optional<LogicalTimestamp>;

}  // namespace ledgersync
