#pragma once

// Variable-length integers for stored revisions.
//
// Versions, lengths, counts and array indices are unsigned LEB128;
// timestamps are signed LEB128. Both forms are capped at ten bytes,
// which is enough for any 64-bit value.
//
// Internal header — not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace jsonrev_cpp::encoding {

inline constexpr std::size_t max_leb128_bytes = 10;

namespace leb128_detail {

inline constexpr auto payload_mask = std::uint8_t{0x7F};
inline constexpr auto continuation = std::uint8_t{0x80};
inline constexpr auto sign_flag = std::uint8_t{0x40};

inline auto octet(std::byte b) -> std::uint8_t { return std::to_integer<std::uint8_t>(b); }

}  // namespace leb128_detail

/// A decoded integer and how many input bytes it occupied.
struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

struct SignedDecodeResult {
    std::int64_t value;
    std::size_t bytes_read;
};

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    using namespace leb128_detail;
    while (value > payload_mask) {
        output.push_back(std::byte{static_cast<std::uint8_t>((value & payload_mask) | continuation)});
        value >>= 7;
    }
    output.push_back(std::byte{static_cast<std::uint8_t>(value)});
}

inline auto encode_uleb128(std::uint64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    out.reserve(max_leb128_bytes);
    encode_uleb128(value, out);
    return out;
}

// Read an unsigned value from the front of input. nullopt when the input
// ends mid-value or the value needs more than 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    using namespace leb128_detail;
    auto result = std::uint64_t{0};
    const auto limit = input.size() < max_leb128_bytes ? input.size() : max_leb128_bytes;

    for (std::size_t n = 0; n < limit; ++n) {
        const auto b = octet(input[n]);
        const auto payload = static_cast<std::uint64_t>(b & payload_mask);
        // The tenth byte may only carry the single remaining bit.
        if (n == max_leb128_bytes - 1 && payload > 1) return std::nullopt;
        result |= payload << (7 * n);
        if ((b & continuation) == 0) return DecodeResult{.value = result, .bytes_read = n + 1};
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    using namespace leb128_detail;
    for (;;) {
        const auto low = static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) & payload_mask);
        value >>= 7;
        const auto done = (value == 0 && (low & sign_flag) == 0) ||
                          (value == -1 && (low & sign_flag) != 0);
        if (done) {
            output.push_back(std::byte{low});
            return;
        }
        output.push_back(std::byte{static_cast<std::uint8_t>(low | continuation)});
    }
}

inline auto encode_sleb128(std::int64_t value) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    out.reserve(max_leb128_bytes);
    encode_sleb128(value, out);
    return out;
}

// Read a signed value from the front of input. nullopt when the input ends
// mid-value or the encoding runs past ten bytes.
inline auto decode_sleb128(std::span<const std::byte> input) -> std::optional<SignedDecodeResult> {
    using namespace leb128_detail;
    auto bits = std::uint64_t{0};
    const auto limit = input.size() < max_leb128_bytes ? input.size() : max_leb128_bytes;

    for (std::size_t n = 0; n < limit; ++n) {
        const auto b = octet(input[n]);
        const auto width = 7 * (n + 1);
        bits |= static_cast<std::uint64_t>(b & payload_mask) << (7 * n);
        if ((b & continuation) != 0) continue;

        if (width < 64 && (b & sign_flag) != 0) bits |= ~std::uint64_t{0} << width;
        return SignedDecodeResult{.value = static_cast<std::int64_t>(bits), .bytes_read = n + 1};
    }
    return std::nullopt;
}

}  // namespace jsonrev_cpp::encoding
