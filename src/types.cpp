#include <ledgersync/types.hpp>

#include "util/random.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>

namespace ledgersync {

namespace {

auto is_hex_digit(char c) -> bool {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

}  // anonymous namespace

auto is_valid_client_id(std::string_view id) -> bool {
    return id.size() == client_id_length && std::ranges::all_of(id, is_hex_digit);
}

auto make_client_id() -> ClientId {
    return util::random_hex(client_id_length / 2);
}

auto to_string(const LogicalTimestamp& ts) -> std::string {
    char buf[timestamp_string_length + 1];
    std::snprintf(buf, sizeof(buf), "%016llu-%04X-",
                  static_cast<unsigned long long>(ts.millis),
                  static_cast<unsigned int>(ts.counter));
    auto result = std::string{buf};
    result += ts.client_id;
    return result;
}

auto parse_timestamp(std::string_view text) -> std::optional<LogicalTimestamp> {
    if (text.size() != timestamp_string_length) return std::nullopt;

    const auto millis_part = text.substr(0, timestamp_millis_digits);
    const auto counter_part = text.substr(timestamp_millis_digits + 1, 4);
    const auto client_part = text.substr(timestamp_millis_digits + 6);
    if (text[timestamp_millis_digits] != '-' || text[timestamp_millis_digits + 5] != '-') {
        return std::nullopt;
    }
    if (!std::ranges::all_of(millis_part, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    if (!std::ranges::all_of(counter_part, is_hex_digit)) return std::nullopt;
    if (!is_valid_client_id(client_part)) return std::nullopt;

    auto ts = LogicalTimestamp{};
    auto [p1, e1] = std::from_chars(millis_part.data(), millis_part.data() + millis_part.size(),
                                    ts.millis);
    if (e1 != std::errc{}) return std::nullopt;
    auto [p2, e2] = std::from_chars(counter_part.data(), counter_part.data() + counter_part.size(),
                                    ts.counter, 16);
    if (e2 != std::errc{}) return std::nullopt;
    ts.client_id = std::string{client_part};
    return ts;
}

}  // namespace ledgersync
