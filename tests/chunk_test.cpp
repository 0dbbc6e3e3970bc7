#include "../src/storage/chunk.hpp"
#include "../src/storage/compression.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <string_view>
#include <vector>

using namespace jsonrev_cpp::storage;

namespace {

auto bytes_of(std::string_view text) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    for (auto c : text) out.push_back(static_cast<std::byte>(c));
    return out;
}

auto chunk_of(ChunkType type, const std::vector<std::byte>& body) -> std::vector<std::byte> {
    auto output = std::vector<std::byte>{};
    write_chunk(type, body, output);
    return output;
}

}  // namespace

// -- Envelope -------------------------------------------------------------------

TEST(Chunk, starts_with_jrev_magic) {
    auto output = chunk_of(ChunkType::revision, bytes_of("x"));
    ASSERT_GE(output.size(), 4u);
    EXPECT_EQ(output[0], std::byte{'J'});
    EXPECT_EQ(output[1], std::byte{'R'});
    EXPECT_EQ(output[2], std::byte{'E'});
    EXPECT_EQ(output[3], std::byte{'V'});
}

TEST(Chunk, checksum_is_crc32_little_endian) {
    // CRC-32 of "123456789" is 0xCBF43926.
    auto checksum = compute_chunk_checksum(bytes_of("123456789"));
    EXPECT_EQ(checksum[0], std::byte{0x26});
    EXPECT_EQ(checksum[1], std::byte{0x39});
    EXPECT_EQ(checksum[2], std::byte{0xF4});
    EXPECT_EQ(checksum[3], std::byte{0xCB});
}

TEST(Chunk, header_describes_body) {
    auto body = bytes_of("revision body");
    auto output = chunk_of(ChunkType::deflated_revision, body);

    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->type, ChunkType::deflated_revision);
    EXPECT_EQ(header->body_offset, 10u);
    EXPECT_EQ(header->body_length, body.size());
    EXPECT_EQ(header->body_offset + header->body_length, output.size());
    EXPECT_TRUE(validate_chunk_checksum(*header, output));
}

TEST(Chunk, long_body_uses_multi_byte_length) {
    auto body = std::vector<std::byte>(300, std::byte{0x5A});
    auto output = chunk_of(ChunkType::revision, body);

    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->body_offset, 11u);
    EXPECT_EQ(header->body_length, 300u);
    EXPECT_TRUE(validate_chunk_checksum(*header, output));
}

TEST(Chunk, empty_body_is_valid) {
    auto output = chunk_of(ChunkType::revision, {});
    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->body_length, 0u);
    EXPECT_TRUE(validate_chunk_checksum(*header, output));
}

// -- Rejection ------------------------------------------------------------------

TEST(Chunk, any_flipped_body_byte_fails_checksum) {
    const auto output = chunk_of(ChunkType::revision, bytes_of("{\"a\":1}"));
    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());

    for (auto i = header->body_offset; i < output.size(); ++i) {
        auto tampered = output;
        tampered[i] ^= std::byte{0x01};
        EXPECT_FALSE(validate_chunk_checksum(*header, tampered)) << "byte " << i;
    }
}

TEST(Chunk, tampered_checksum_fails_validation) {
    auto output = chunk_of(ChunkType::revision, bytes_of("abc"));
    output[5] ^= std::byte{0x80};
    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_FALSE(validate_chunk_checksum(*header, output));
}

TEST(Chunk, wrong_magic_is_rejected) {
    auto output = chunk_of(ChunkType::revision, bytes_of("abc"));
    output[0] = std::byte{0x85};
    EXPECT_FALSE(parse_chunk_header(output).has_value());
}

TEST(Chunk, unknown_chunk_type_is_rejected) {
    auto output = chunk_of(ChunkType::revision, bytes_of("abc"));
    output[8] = std::byte{0x02};
    EXPECT_FALSE(parse_chunk_header(output).has_value());
}

TEST(Chunk, truncated_header_is_rejected) {
    auto output = chunk_of(ChunkType::revision, bytes_of("abc"));
    for (std::size_t n = 0; n < 10; ++n) {
        auto prefix = std::vector<std::byte>(output.begin(), output.begin() + static_cast<std::ptrdiff_t>(n));
        EXPECT_FALSE(parse_chunk_header(prefix).has_value()) << n << " bytes";
    }
}

TEST(Chunk, body_past_end_of_data_fails_validation) {
    auto output = chunk_of(ChunkType::revision, bytes_of("abcdef"));
    output.resize(output.size() - 2);
    auto header = parse_chunk_header(output);
    ASSERT_TRUE(header.has_value());
    EXPECT_FALSE(validate_chunk_checksum(*header, output));
}

// -- Compression ----------------------------------------------------------------

TEST(Compression, repetitive_body_round_trip) {
    auto body = std::vector<std::byte>{};
    for (int i = 0; i < 200; ++i) {
        auto part = bytes_of(R"({"op":"replace","path":["replicas"]})");
        body.insert(body.end(), part.begin(), part.end());
    }
    auto compressed = deflate_compress(body);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), body.size());

    auto restored = deflate_decompress(*compressed, body.size());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, body);
}

TEST(Compression, wrong_raw_size_is_rejected) {
    auto body = std::vector<std::byte>(1000, std::byte{0x41});
    auto compressed = deflate_compress(body);
    ASSERT_TRUE(compressed.has_value());

    EXPECT_FALSE(deflate_decompress(*compressed, 999).has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, 1001).has_value());
    EXPECT_FALSE(deflate_decompress(*compressed, max_inflated_size + 1).has_value());
}

TEST(Compression, garbage_does_not_inflate) {
    auto garbage = bytes_of("definitely not deflate data");
    EXPECT_FALSE(deflate_decompress(garbage, 64).has_value());
}
