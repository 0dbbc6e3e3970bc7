#pragma once

// Chunk envelope for stored revisions.
//
//   magic (4 bytes: 0x4A 0x52 0x45 0x56, "JREV")
//   checksum (4 bytes: CRC-32 of body, little endian)
//   chunk_type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// Internal header — not installed.

#include "../encoding/leb128.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace jsonrev_cpp::storage {

inline constexpr std::array<std::byte, 4> chunk_magic = {
    std::byte{0x4A}, std::byte{0x52}, std::byte{0x45}, std::byte{0x56}
};

enum class ChunkType : std::uint8_t {
    revision          = 0x00,  // body is a plain revision
    deflated_revision = 0x01,  // body is ULEB128(raw length) + raw DEFLATE data
};

struct ChunkHeader {
    ChunkType type;
    std::array<std::byte, 4> checksum;
    std::size_t body_offset;  // offset into the original data where body starts
    std::size_t body_length;
};

inline auto compute_chunk_checksum(std::span<const std::byte> body)
    -> std::array<std::byte, 4> {
    auto crc = ::crc32(0L, Z_NULL, 0);
    // zlib takes uInt lengths; feed large bodies in pieces
    auto rest = body;
    while (!rest.empty()) {
        auto n = std::min<std::size_t>(rest.size(), 1u << 30);
        crc = ::crc32(crc, reinterpret_cast<const Bytef*>(rest.data()), static_cast<uInt>(n));
        rest = rest.subspan(n);
    }
    auto value = static_cast<std::uint32_t>(crc);
    return {
        static_cast<std::byte>(value & 0xFF),
        static_cast<std::byte>((value >> 8) & 0xFF),
        static_cast<std::byte>((value >> 16) & 0xFF),
        static_cast<std::byte>((value >> 24) & 0xFF),
    };
}

// Parse a chunk header from the beginning of data.
// Returns nullopt if the data is malformed.
inline auto parse_chunk_header(std::span<const std::byte> data)
    -> std::optional<ChunkHeader> {

    if (data.size() < 9) return std::nullopt;
    if (std::memcmp(data.data(), chunk_magic.data(), 4) != 0) return std::nullopt;

    auto checksum = std::array<std::byte, 4>{};
    std::memcpy(checksum.data(), &data[4], 4);

    auto raw_type = static_cast<std::uint8_t>(data[8]);
    if (raw_type > static_cast<std::uint8_t>(ChunkType::deflated_revision)) return std::nullopt;

    auto pos = std::size_t{9};
    auto len_result = encoding::decode_uleb128(data.subspan(pos));
    if (!len_result) return std::nullopt;
    pos += len_result->bytes_read;

    return ChunkHeader{
        .type = static_cast<ChunkType>(raw_type),
        .checksum = checksum,
        .body_offset = pos,
        .body_length = static_cast<std::size_t>(len_result->value),
    };
}

// True when the body is inside data and matches the header checksum.
inline auto validate_chunk_checksum(const ChunkHeader& header,
                                    std::span<const std::byte> data) -> bool {
    if (header.body_offset > data.size() ||
        header.body_length > data.size() - header.body_offset) {
        return false;
    }
    auto expected = compute_chunk_checksum(data.subspan(header.body_offset, header.body_length));
    return header.checksum == expected;
}

// Append magic + checksum + type + ULEB128(length) + body.
inline void write_chunk(ChunkType type, std::span<const std::byte> body,
                        std::vector<std::byte>& output) {
    output.insert(output.end(), chunk_magic.begin(), chunk_magic.end());

    auto checksum = compute_chunk_checksum(body);
    output.insert(output.end(), checksum.begin(), checksum.end());

    output.push_back(static_cast<std::byte>(type));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace jsonrev_cpp::storage
