#include <jsonrev-cpp/codec.hpp>

#include "encoding/leb128.hpp"
#include "storage/chunk.hpp"
#include "storage/compression.hpp"
#include "storage/deserializer.hpp"
#include "storage/serializer.hpp"

#include <utility>

namespace jsonrev_cpp {

auto encode_revision(const Revision& revision) -> std::vector<std::byte> {
    auto ser = storage::Serializer{};
    ser.write_revision(revision);
    auto body = ser.take();

    auto output = std::vector<std::byte>{};
    if (body.size() > storage::deflate_threshold) {
        auto compressed = storage::deflate_compress(body);
        if (compressed) {
            auto packed = encoding::encode_uleb128(body.size());
            if (packed.size() + compressed->size() < body.size()) {
                packed.insert(packed.end(), compressed->begin(), compressed->end());
                storage::write_chunk(storage::ChunkType::deflated_revision, packed, output);
                return output;
            }
        }
    }
    storage::write_chunk(storage::ChunkType::revision, body, output);
    return output;
}

auto decode_revision(std::span<const std::byte> data) -> std::optional<Revision> {
    auto header = storage::parse_chunk_header(data);
    if (!header) return std::nullopt;
    if (!storage::validate_chunk_checksum(*header, data)) return std::nullopt;
    if (header->body_offset + header->body_length != data.size()) return std::nullopt;

    auto body = data.subspan(header->body_offset, header->body_length);

    auto inflated = std::vector<std::byte>{};
    if (header->type == storage::ChunkType::deflated_revision) {
        auto raw_size = encoding::decode_uleb128(body);
        if (!raw_size || raw_size->value > storage::max_inflated_size) return std::nullopt;
        auto raw = storage::deflate_decompress(body.subspan(raw_size->bytes_read),
                                               static_cast<std::size_t>(raw_size->value));
        if (!raw) return std::nullopt;
        inflated = std::move(*raw);
        body = inflated;
    }

    auto de = storage::Deserializer{body};
    auto revision = de.read_revision();
    if (!revision || !de.at_end()) return std::nullopt;
    return revision;
}

}  // namespace jsonrev_cpp
