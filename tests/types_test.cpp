#include <ledgersync/types.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <unordered_set>
#include <vector>

using namespace ledgersync;

namespace {

auto ts(std::uint64_t millis, std::uint16_t counter, ClientId client) -> LogicalTimestamp {
    return LogicalTimestamp{.millis = millis, .counter = counter, .client_id = std::move(client)};
}

}  // anonymous namespace

// -- ClientId -----------------------------------------------------------------

TEST(ClientId, generated_ids_are_valid_and_distinct) {
    const auto a = make_client_id();
    const auto b = make_client_id();

    EXPECT_TRUE(is_valid_client_id(a));
    EXPECT_TRUE(is_valid_client_id(b));
    EXPECT_NE(a, b);
}

TEST(ClientId, validation_rejects_wrong_length_and_non_hex) {
    EXPECT_TRUE(is_valid_client_id("0123456789abcdef"));
    EXPECT_FALSE(is_valid_client_id("0123456789abcde"));
    EXPECT_FALSE(is_valid_client_id("0123456789abcdefa"));
    EXPECT_FALSE(is_valid_client_id("0123456789abcdeg"));
    EXPECT_FALSE(is_valid_client_id(""));
}

// -- LogicalTimestamp ordering ------------------------------------------------

TEST(LogicalTimestamp, default_is_null_timestamp) {
    const auto t = LogicalTimestamp{};
    EXPECT_EQ(t.millis, 0u);
    EXPECT_EQ(t.counter, 0u);
    EXPECT_EQ(t.client_id, null_client_id);
}

TEST(LogicalTimestamp, millis_dominates_counter) {
    EXPECT_LT(ts(1, 0xFFFF, "ffffffffffffffff"), ts(2, 0, "0000000000000000"));
}

TEST(LogicalTimestamp, counter_dominates_client) {
    EXPECT_LT(ts(5, 1, "ffffffffffffffff"), ts(5, 2, "0000000000000000"));
}

TEST(LogicalTimestamp, client_breaks_ties) {
    const auto a = ts(5, 1, "aaaaaaaaaaaaaaaa");
    const auto b = ts(5, 1, "bbbbbbbbbbbbbbbb");

    EXPECT_LT(a, b);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, ts(5, 1, "aaaaaaaaaaaaaaaa"));
}

TEST(LogicalTimestamp, hashable_and_usable_in_unordered_set) {
    auto set = std::unordered_set<LogicalTimestamp>{};
    set.insert(ts(1, 0, "aaaaaaaaaaaaaaaa"));
    set.insert(ts(1, 0, "aaaaaaaaaaaaaaaa"));
    set.insert(ts(1, 1, "aaaaaaaaaaaaaaaa"));
    EXPECT_EQ(set.size(), 2u);
}

// -- String form --------------------------------------------------------------

TEST(LogicalTimestamp, to_string_is_fixed_width) {
    EXPECT_EQ(to_string(ts(1700000000000, 0x1A, "0123456789abcdef")),
              "0001700000000000-001A-0123456789abcdef");
    EXPECT_EQ(to_string(LogicalTimestamp{}).size(), timestamp_string_length);
}

TEST(LogicalTimestamp, string_order_matches_value_order) {
    auto values = std::vector<LogicalTimestamp>{
        ts(20, 0, "aaaaaaaaaaaaaaaa"),
        ts(3, 0xFFFF, "bbbbbbbbbbbbbbbb"),
        ts(3, 0x00FF, "cccccccccccccccc"),
        ts(3, 0x00FF, "aaaaaaaaaaaaaaaa"),
    };
    auto strings = std::vector<std::string>{};
    for (const auto& v : values) strings.push_back(to_string(v));

    std::ranges::sort(values);
    std::ranges::sort(strings);
    for (std::size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(to_string(values[i]), strings[i]);
    }
}

TEST(LogicalTimestamp, parse_inverts_to_string) {
    const auto original = ts(1700000000123, 0xBEEF, "0123456789abcdef");
    auto parsed = parse_timestamp(to_string(original));

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, original);
}

TEST(LogicalTimestamp, parse_rejects_malformed_strings) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("0001700000000000-001A").has_value());
    EXPECT_FALSE(parse_timestamp("0001700000000000_001A-0123456789abcdef").has_value());
    EXPECT_FALSE(parse_timestamp("00017000000000x0-001A-0123456789abcdef").has_value());
    EXPECT_FALSE(parse_timestamp("0001700000000000-00G1-0123456789abcdef").has_value());
    EXPECT_FALSE(parse_timestamp("0001700000000000-001A-0123456789abcdez").has_value());
}
