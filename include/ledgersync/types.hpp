/// @file types.hpp
/// @brief Core identity types: Bytes, ClientId and LogicalTimestamp.

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ledgersync {

/// A raw byte buffer (wire payloads, keys, salts).
using Bytes = std::vector<std::byte>;

/// A replica identity: exactly 16 hexadecimal characters.
using ClientId = std::string;

/// Number of characters in a ClientId.
inline constexpr std::size_t client_id_length = 16;

/// The all-zero client id used by the null timestamp.
inline constexpr std::string_view null_client_id = "0000000000000000";

/// Check that a string is a well-formed ClientId.
auto is_valid_client_id(std::string_view id) -> bool;

/// Generate a fresh random ClientId (lowercase hex).
auto make_client_id() -> ClientId;

/// A hybrid logical clock reading, tagged with the issuing replica.
///
/// Totally ordered by (millis, counter, client_id). Two timestamps
/// compare equal only when all three fields are equal, so readings from
/// different replicas never tie.
struct LogicalTimestamp {
    std::uint64_t millis{0};                     ///< Wall-clock milliseconds since epoch.
    std::uint16_t counter{0};                    ///< Logical counter within one millisecond.
    ClientId client_id{null_client_id};          ///< Issuing replica.

    auto operator<=>(const LogicalTimestamp&) const = default;
    auto operator==(const LogicalTimestamp&) const -> bool = default;
};

/// Number of decimal digits used for millis in the string form.
inline constexpr std::size_t timestamp_millis_digits = 16;

/// Length of the serialized form: millis, '-', 4 hex counter, '-', client id.
inline constexpr std::size_t timestamp_string_length =
    timestamp_millis_digits + 1 + 4 + 1 + client_id_length;

/// Serialize as "<millis>-<counter>-<clientId>".
///
/// millis is zero padded to 16 digits and the counter is 4 uppercase hex
/// digits, so byte-wise comparison of two strings agrees with operator<=>
/// whenever both client ids use the same letter case.
auto to_string(const LogicalTimestamp& ts) -> std::string;

/// Parse the form produced by to_string(). Returns nullopt if malformed.
auto parse_timestamp(std::string_view text) -> std::optional<LogicalTimestamp>;

}  // namespace ledgersync

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<ledgersync::LogicalTimestamp> {
    auto operator()(const ledgersync::LogicalTimestamp& ts) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(ts.millis);
        auto h2 = std::hash<std::uint16_t>{}(ts.counter);
        auto h3 = std::hash<std::string>{}(ts.client_id);
        return h1 ^ (h2 << 1) ^ (h3 << 2);
    }
};

/// @endcond
