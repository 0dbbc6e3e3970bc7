/// @file codec.hpp
/// @brief Binary encoding of revisions, the blobs a RevisionStore keeps.

#pragma once

#include <jsonrev-cpp/revision.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace jsonrev_cpp {

/// Encode a revision as a self-checking binary blob.
///
/// The blob is a chunk: 4 magic bytes, a CRC-32 of the body, a chunk type
/// byte, the ULEB128 body length, then the body. Bodies over 256 bytes
/// are DEFLATE-compressed when that makes them smaller. Numbers keep
/// their decimal text and objects keep member order, so decoding yields
/// a revision equal to the one encoded.
auto encode_revision(const Revision& revision) -> std::vector<std::byte>;

/// Decode a blob produced by encode_revision().
///
/// Returns nullopt if the blob is truncated, has trailing bytes, fails its
/// checksum, or carries anything that is not a well-formed revision.
auto decode_revision(std::span<const std::byte> data) -> std::optional<Revision>;

}  // namespace jsonrev_cpp
