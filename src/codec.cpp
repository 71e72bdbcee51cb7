#include <ledgersync/codec.hpp>
#include <ledgersync/error.hpp>

#include "codec/compression.hpp"
#include "codec/reader.hpp"
#include "codec/writer.hpp"

#include <algorithm>
#include <string>

namespace ledgersync {

namespace {

constexpr std::uint8_t flag_deflate = 0x01;

auto decode_body(std::span<const std::byte> body) -> std::optional<ChangeSet> {
    auto reader = codec::Reader{body};
    auto count = reader.read_uleb128();
    if (!count) return std::nullopt;

    auto records = ChangeSet{};
    // Each record takes at least 20 bytes, so a count beyond that is corrupt.
    if (*count > reader.remaining() / 20 + 1) return std::nullopt;
    records.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto record = reader.read_record();
        if (!record) return std::nullopt;
        records.push_back(std::move(*record));
    }
    if (!reader.at_end()) return std::nullopt;
    return records;
}

}  // anonymous namespace

auto encode_change_set(std::span<const ChangeRecord> records,
                       const CodecOptions& options) -> Bytes {
    auto body = codec::Writer{};
    body.write_uleb128(records.size());
    for (const auto& record : records) {
        if (!is_valid_client_id(record.timestamp.client_id)) {
            throw Error{ErrorKind::invalid_operation,
                        "record " + record.dataset + "/" + record.row +
                        " has a malformed client id"};
        }
        body.write_record(record);
    }

    auto plain = body.take();
    auto flags = std::uint8_t{0};
    auto stored = plain;
    if (plain.size() > options.compress_threshold) {
        if (auto compressed = codec::deflate_compress(plain);
            compressed && compressed->size() < plain.size()) {
            stored = std::move(*compressed);
            flags |= flag_deflate;
        }
    }

    auto out = codec::Writer{};
    out.write_bytes(change_set_magic);
    out.write_u8(change_set_version);
    out.write_u8(flags);
    out.write_u32_le(codec::crc32_of(plain));
    out.write_uleb128(plain.size());
    out.write_uleb128(stored.size());
    out.write_bytes(stored);
    return out.take();
}

auto decode_change_set(std::span<const std::byte> payload) -> ChangeSet {
    auto reader = codec::Reader{payload};

    auto magic = reader.read_bytes(change_set_magic.size());
    if (!magic || !std::ranges::equal(*magic, change_set_magic)) {
        throw DecodeError{"not a change set (bad magic)"};
    }
    auto version = reader.read_u8();
    if (!version || *version != change_set_version) {
        throw DecodeError{"unsupported change set version"};
    }
    auto flags = reader.read_u8();
    if (!flags || (*flags & ~flag_deflate) != 0) {
        throw DecodeError{"unknown change set flags"};
    }
    auto crc = reader.read_u32_le();
    auto body_size = reader.read_uleb128();
    auto stored_size = reader.read_uleb128();
    if (!crc || !body_size || !stored_size) {
        throw DecodeError{"truncated change set header"};
    }
    auto stored = reader.read_bytes(static_cast<std::size_t>(*stored_size));
    if (!stored || !reader.at_end()) {
        throw DecodeError{"change set length does not match payload"};
    }

    auto body = std::vector<std::byte>{};
    if (*flags & flag_deflate) {
        auto inflated = codec::deflate_decompress(*stored, static_cast<std::size_t>(*body_size));
        if (!inflated) throw DecodeError{"change set body failed to inflate"};
        body = std::move(*inflated);
    } else {
        if (*body_size != *stored_size) throw DecodeError{"change set body size mismatch"};
        body.assign(stored->begin(), stored->end());
    }

    if (codec::crc32_of(body) != *crc) {
        throw DecodeError{"change set checksum mismatch"};
    }

    auto records = decode_body(body);
    if (!records) throw DecodeError{"malformed change record"};
    return std::move(*records);
}

auto max_timestamp(std::span<const ChangeRecord> records) -> std::optional<LogicalTimestamp> {
    if (records.empty()) return std::nullopt;
    auto it = std::ranges::max_element(records, {}, &ChangeRecord::timestamp);
    return it->timestamp;
}

}  // namespace ledgersync
