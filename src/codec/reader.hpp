#pragma once

// Byte stream reader for the change-set wire format. Every read returns
// nullopt on truncated or malformed input; nothing here throws.
// Internal header, not installed.

#include <ledgersync/change.hpp>
#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>
#include "../encoding/leb128.hpp"
#include "writer.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace ledgersync::codec {

class Reader {
public:
    explicit Reader(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_u32_le() -> std::optional<std::uint32_t> {
        auto bytes = read_bytes(4);
        if (!bytes) return std::nullopt;
        auto v = std::uint32_t{0};
        for (std::size_t i = 0; i < 4; ++i) {
            v |= static_cast<std::uint32_t>((*bytes)[i]) << (8 * i);
        }
        return v;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_f64() -> std::optional<double> {
        auto bytes = read_bytes(8);
        if (!bytes) return std::nullopt;
        auto bits = std::uint64_t{0};
        for (std::size_t i = 0; i < 8; ++i) {
            bits |= static_cast<std::uint64_t>((*bytes)[i]) << (8 * i);
        }
        return std::bit_cast<double>(bits);
    }

    auto read_timestamp() -> std::optional<LogicalTimestamp> {
        auto millis = read_uleb128();
        if (!millis) return std::nullopt;
        auto counter = read_uleb128();
        if (!counter || *counter > 0xFFFF) return std::nullopt;
        auto client = read_bytes(client_id_length);
        if (!client) return std::nullopt;
        auto id = std::string{reinterpret_cast<const char*>(client->data()), client->size()};
        if (!is_valid_client_id(id)) return std::nullopt;
        return LogicalTimestamp{
            .millis = *millis,
            .counter = static_cast<std::uint16_t>(*counter),
            .client_id = std::move(id),
        };
    }

    auto read_value() -> std::optional<ScalarValue> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        switch (static_cast<ValueTag>(*tag)) {
            case ValueTag::null:
                return ScalarValue{Null{}};
            case ValueTag::boolean: {
                auto b = read_u8();
                if (!b || *b > 1) return std::nullopt;
                return ScalarValue{*b != 0};
            }
            case ValueTag::integer: {
                auto v = read_sleb128();
                if (!v) return std::nullopt;
                return ScalarValue{*v};
            }
            case ValueTag::real: {
                auto v = read_f64();
                if (!v) return std::nullopt;
                return ScalarValue{*v};
            }
            case ValueTag::text: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return ScalarValue{std::move(*s)};
            }
        }
        return std::nullopt;
    }

    auto read_record() -> std::optional<ChangeRecord> {
        auto dataset = read_string();
        if (!dataset) return std::nullopt;
        auto row = read_string();
        if (!row) return std::nullopt;
        auto column = read_string();
        if (!column) return std::nullopt;
        auto timestamp = read_timestamp();
        if (!timestamp) return std::nullopt;
        auto value = read_value();
        if (!value) return std::nullopt;
        return ChangeRecord{
            .dataset = std::move(*dataset),
            .row = std::move(*row),
            .column = std::move(*column),
            .value = std::move(*value),
            .timestamp = std::move(*timestamp),
        };
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace ledgersync::codec
