#include "../src/encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

using namespace jsonrev_cpp::encoding;

// -- Unsigned LEB128 ----------------------------------------------------------

TEST(Leb128, uleb128_known_encodings) {
    EXPECT_EQ(encode_uleb128(0), std::vector<std::byte>{std::byte{0x00}});
    EXPECT_EQ(encode_uleb128(127), std::vector<std::byte>{std::byte{0x7F}});
    EXPECT_EQ(encode_uleb128(128), (std::vector<std::byte>{std::byte{0x80}, std::byte{0x01}}));
    // 624485 = 0x98765
    EXPECT_EQ(encode_uleb128(624485),
              (std::vector<std::byte>{std::byte{0xE5}, std::byte{0x8E}, std::byte{0x26}}));
    EXPECT_EQ(encode_uleb128(std::numeric_limits<std::uint64_t>::max()).size(), 10u);
}

TEST(Leb128, uleb128_round_trip) {
    for (auto val : {std::uint64_t{0}, std::uint64_t{1}, std::uint64_t{300},
                     std::uint64_t{1} << 35, std::numeric_limits<std::uint64_t>::max()}) {
        auto bytes = encode_uleb128(val);
        auto result = decode_uleb128(bytes);
        ASSERT_TRUE(result.has_value()) << val;
        EXPECT_EQ(result->value, val);
        EXPECT_EQ(result->bytes_read, bytes.size());
    }
}

TEST(Leb128, uleb128_truncated_or_empty_is_rejected) {
    EXPECT_FALSE(decode_uleb128({}).has_value());
    auto input = std::vector<std::byte>{std::byte{0x80}, std::byte{0x80}};
    EXPECT_FALSE(decode_uleb128(input).has_value());
}

TEST(Leb128, uleb128_overflow_is_rejected) {
    // Ten bytes whose last carries more than the single remaining bit.
    auto too_big = std::vector<std::byte>(9, std::byte{0xFF});
    too_big.push_back(std::byte{0x02});
    EXPECT_FALSE(decode_uleb128(too_big).has_value());

    // Eleven bytes can never fit.
    auto too_long = std::vector<std::byte>(10, std::byte{0x80});
    too_long.push_back(std::byte{0x00});
    EXPECT_FALSE(decode_uleb128(too_long).has_value());
}

TEST(Leb128, decode_reads_only_the_first_value) {
    auto output = std::vector<std::byte>{};
    encode_uleb128(100, output);
    encode_uleb128(70000, output);
    encode_uleb128(3, output);

    auto rest = std::span<const std::byte>{output};
    auto values = std::vector<std::uint64_t>{};
    while (!rest.empty()) {
        auto result = decode_uleb128(rest);
        ASSERT_TRUE(result.has_value());
        values.push_back(result->value);
        rest = rest.subspan(result->bytes_read);
    }
    EXPECT_EQ(values, (std::vector<std::uint64_t>{100, 70000, 3}));
}

// -- Signed LEB128 ------------------------------------------------------------

TEST(Leb128, sleb128_known_encodings) {
    EXPECT_EQ(encode_sleb128(0), std::vector<std::byte>{std::byte{0x00}});
    EXPECT_EQ(encode_sleb128(-1), std::vector<std::byte>{std::byte{0x7F}});
    EXPECT_EQ(encode_sleb128(63), std::vector<std::byte>{std::byte{0x3F}});
    EXPECT_EQ(encode_sleb128(64), (std::vector<std::byte>{std::byte{0xC0}, std::byte{0x00}}));
    EXPECT_EQ(encode_sleb128(-128), (std::vector<std::byte>{std::byte{0x80}, std::byte{0x7F}}));
}

TEST(Leb128, sleb128_round_trip_covers_timestamps) {
    for (auto val : {std::int64_t{0}, std::int64_t{-64}, std::int64_t{-65},
                     std::int64_t{1700000000000}, std::int64_t{-1700000000000},
                     std::numeric_limits<std::int64_t>::max(),
                     std::numeric_limits<std::int64_t>::min()}) {
        auto bytes = encode_sleb128(val);
        auto result = decode_sleb128(bytes);
        ASSERT_TRUE(result.has_value()) << val;
        EXPECT_EQ(result->value, val);
        EXPECT_EQ(result->bytes_read, bytes.size());
    }
}

TEST(Leb128, sleb128_truncated_or_too_long_is_rejected) {
    auto truncated = std::vector<std::byte>{std::byte{0x80}};
    EXPECT_FALSE(decode_sleb128(truncated).has_value());

    auto too_long = std::vector<std::byte>(10, std::byte{0x80});
    too_long.push_back(std::byte{0x00});
    EXPECT_FALSE(decode_sleb128(too_long).has_value());
}
