#pragma once

// Byte stream writer for the change-set wire format.
// Internal header, not installed.

#include <ledgersync/change.hpp>
#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>
#include "../encoding/leb128.hpp"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ledgersync::codec {

// Value tags. 0 is reserved so a zeroed buffer never decodes as a value.
enum class ValueTag : std::uint8_t {
    null    = 1,
    boolean = 2,
    integer = 3,
    real    = 4,
    text    = 5,
};

class Writer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_u32_le(std::uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            write_u8(static_cast<std::uint8_t>(v >> (8 * i)));
        }
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    // IEEE-754 bits, little endian.
    void write_f64(double v) {
        auto bits = std::bit_cast<std::uint64_t>(v);
        for (int i = 0; i < 8; ++i) {
            write_u8(static_cast<std::uint8_t>(bits >> (8 * i)));
        }
    }

    // The client id is validated by the caller; it is written as 16 raw
    // ASCII bytes with no length prefix.
    void write_timestamp(const LogicalTimestamp& ts) {
        write_uleb128(ts.millis);
        write_uleb128(ts.counter);
        for (auto c : ts.client_id) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_value(const ScalarValue& sv) {
        std::visit([this](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                write_u8(static_cast<std::uint8_t>(ValueTag::null));
            } else if constexpr (std::is_same_v<T, bool>) {
                write_u8(static_cast<std::uint8_t>(ValueTag::boolean));
                write_u8(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                write_u8(static_cast<std::uint8_t>(ValueTag::integer));
                write_sleb128(v);
            } else if constexpr (std::is_same_v<T, double>) {
                write_u8(static_cast<std::uint8_t>(ValueTag::real));
                write_f64(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_u8(static_cast<std::uint8_t>(ValueTag::text));
                write_string(v);
            }
        }, sv);
    }

    void write_record(const ChangeRecord& record) {
        write_string(record.dataset);
        write_string(record.row);
        write_string(record.column);
        write_timestamp(record.timestamp);
        write_value(record.value);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace ledgersync::codec
