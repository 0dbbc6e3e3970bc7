#pragma once

// DEFLATE compression for revision bodies.
//
// Bodies larger than the threshold are stored as raw DEFLATE (no zlib or
// gzip header) when that makes them smaller. The uncompressed length is
// recorded beside the data, so inflation allocates exactly once.
//
// Internal header — not installed.

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace jsonrev_cpp::storage {

// Bodies up to this size are never compressed.
inline constexpr std::size_t deflate_threshold = 256;

// Largest body a stored revision may inflate to.
inline constexpr std::size_t max_inflated_size = std::size_t{256} * 1024 * 1024;

// Compress data using raw DEFLATE.
inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {

    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 for raw deflate (negative = no header)
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);

    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// Decompress raw DEFLATE data that must expand to exactly `raw_size` bytes.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t raw_size)
    -> std::optional<std::vector<std::byte>> {

    if (raw_size > max_inflated_size) return std::nullopt;

    // One spare byte detects streams that inflate past raw_size.
    auto output = std::vector<std::byte>(raw_size + 1);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || stream.total_out != raw_size) return std::nullopt;

    output.resize(raw_size);
    return output;
}

}  // namespace jsonrev_cpp::storage
