#include "../src/encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

using namespace ledgersync::encoding;

namespace {

auto uleb(std::uint64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_uleb128(value, out);
    return out;
}

auto sleb(std::int64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_sleb128(value, out);
    return out;
}

}  // anonymous namespace

// -- Unsigned LEB128 ----------------------------------------------------------

TEST(Leb128, encode_uleb128_zero) {
    auto bytes = uleb(0);
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], std::byte{0x00});
}

TEST(Leb128, encode_uleb128_max_single_byte) {
    auto bytes = uleb(127);
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], std::byte{0x7F});
}

TEST(Leb128, encode_uleb128_300) {
    // 300 = 0x12C -> [0xAC, 0x02]
    auto bytes = uleb(300);
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], std::byte{0xAC});
    EXPECT_EQ(bytes[1], std::byte{0x02});
}

TEST(Leb128, encode_appends_to_existing_output) {
    auto out = std::vector<std::byte>{std::byte{0xFF}};
    encode_uleb128(1, out);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[1], std::byte{0x01});
}

TEST(Leb128, uleb128_max_value_takes_ten_bytes) {
    auto bytes = uleb(std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(bytes.size(), max_leb128_bytes);

    auto decoded = decode_uleb128(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value, std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(decoded->bytes_read, max_leb128_bytes);
}

TEST(Leb128, decode_uleb128_reports_bytes_read) {
    const auto bytes = std::vector<std::byte>{std::byte{0xAC}, std::byte{0x02}, std::byte{0x55}};
    auto decoded = decode_uleb128(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->value, 300u);
    EXPECT_EQ(decoded->bytes_read, 2u);
}

TEST(Leb128, decode_uleb128_truncated_returns_nullopt) {
    const auto bytes = std::vector<std::byte>{std::byte{0x80}, std::byte{0x80}};
    EXPECT_FALSE(decode_uleb128(bytes).has_value());
}

TEST(Leb128, decode_uleb128_empty_returns_nullopt) {
    EXPECT_FALSE(decode_uleb128({}).has_value());
}

TEST(Leb128, decode_uleb128_overlong_returns_nullopt) {
    const auto bytes = std::vector<std::byte>(11, std::byte{0x80});
    EXPECT_FALSE(decode_uleb128(bytes).has_value());
}

// -- Signed LEB128 ------------------------------------------------------------

TEST(Leb128, encode_sleb128_minus_one) {
    auto bytes = sleb(-1);
    ASSERT_EQ(bytes.size(), 1u);
    EXPECT_EQ(bytes[0], std::byte{0x7F});
}

TEST(Leb128, encode_sleb128_64_needs_two_bytes) {
    // 64 has bit 6 set, which would read back as negative in one byte.
    auto bytes = sleb(64);
    ASSERT_EQ(bytes.size(), 2u);
    EXPECT_EQ(bytes[0], std::byte{0xC0});
    EXPECT_EQ(bytes[1], std::byte{0x00});
}

TEST(Leb128, sleb128_extremes_decode_back) {
    for (auto value : {std::numeric_limits<std::int64_t>::min(),
                       std::numeric_limits<std::int64_t>::max(),
                       std::int64_t{-1200}, std::int64_t{0}, std::int64_t{6200}}) {
        auto bytes = sleb(value);
        auto decoded = decode_sleb128(bytes);
        ASSERT_TRUE(decoded.has_value()) << value;
        EXPECT_EQ(decoded->value, value);
        EXPECT_EQ(decoded->bytes_read, bytes.size());
    }
}

TEST(Leb128, decode_sleb128_truncated_returns_nullopt) {
    const auto bytes = std::vector<std::byte>{std::byte{0xFF}};
    EXPECT_FALSE(decode_sleb128(bytes).has_value());
}
