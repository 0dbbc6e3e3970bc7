#pragma once

// Byte stream deserializer for stored revisions.
//
// Every read returns nullopt on truncated or malformed input; nothing
// here throws for bad bytes.
// Internal header — not installed.

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/path.hpp>
#include <jsonrev-cpp/revision.hpp>
#include <jsonrev-cpp/value.hpp>
#include "../encoding/leb128.hpp"
#include "serializer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace jsonrev_cpp::storage {

// Deepest container nesting accepted from stored bytes.
inline constexpr std::size_t max_value_depth = 512;

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    // A count of items that each take at least one byte.
    auto read_count() -> std::optional<std::size_t> {
        auto n = read_uleb128();
        if (!n || *n > remaining()) return std::nullopt;
        return static_cast<std::size_t>(*n);
    }

    auto read_value(std::size_t depth = 0) -> std::optional<Value> {
        auto tag = read_u8();
        if (!tag) return std::nullopt;
        switch (static_cast<ValueTag>(*tag)) {
            case ValueTag::null:        return Value{};
            case ValueTag::false_value: return Value{false};
            case ValueTag::true_value:  return Value{true};
            case ValueTag::number: {
                auto text = read_string();
                if (!text || !is_number_text(*text)) return std::nullopt;
                return Value{Number::from_text(*text)};
            }
            case ValueTag::string: {
                auto s = read_string();
                if (!s) return std::nullopt;
                return Value{std::move(*s)};
            }
            case ValueTag::array: {
                if (depth >= max_value_depth) return std::nullopt;
                auto n = read_count();
                if (!n) return std::nullopt;
                auto arr = Array{};
                arr.reserve(*n);
                for (std::size_t i = 0; i < *n; ++i) {
                    auto item = read_value(depth + 1);
                    if (!item) return std::nullopt;
                    arr.push_back(std::move(*item));
                }
                return Value{std::move(arr)};
            }
            case ValueTag::object: {
                if (depth >= max_value_depth) return std::nullopt;
                auto n = read_count();
                if (!n) return std::nullopt;
                auto obj = Object{};
                for (std::size_t i = 0; i < *n; ++i) {
                    auto key = read_string();
                    if (!key) return std::nullopt;
                    auto item = read_value(depth + 1);
                    if (!item) return std::nullopt;
                    if (!obj.insert(std::move(*key), std::move(*item))) return std::nullopt;
                }
                return Value{std::move(obj)};
            }
        }
        return std::nullopt;
    }

    auto read_path() -> std::optional<Path> {
        auto n = read_count();
        if (!n) return std::nullopt;
        auto path = Path{};
        path.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto tag = read_u8();
            if (!tag) return std::nullopt;
            if (*tag == static_cast<std::uint8_t>(SegmentTag::key)) {
                auto s = read_string();
                if (!s) return std::nullopt;
                path.push_back(object_key(std::move(*s)));
            } else if (*tag == static_cast<std::uint8_t>(SegmentTag::index)) {
                auto idx = read_uleb128();
                if (!idx) return std::nullopt;
                path.push_back(array_index(static_cast<std::size_t>(*idx)));
            } else {
                return std::nullopt;
            }
        }
        return path;
    }

    auto read_edit() -> std::optional<EditOp> {
        auto op = read_u8();
        if (!op) return std::nullopt;
        auto path = read_path();
        if (!path) return std::nullopt;
        switch (static_cast<EditKind>(*op)) {
            case EditKind::remove:
                return EditOp::remove(std::move(*path));
            case EditKind::add:
            case EditKind::replace: {
                auto value = read_value();
                if (!value) return std::nullopt;
                if (static_cast<EditKind>(*op) == EditKind::add) {
                    return EditOp::add(std::move(*path), std::move(*value));
                }
                return EditOp::replace(std::move(*path), std::move(*value));
            }
        }
        return std::nullopt;
    }

    auto read_revision() -> std::optional<Revision> {
        auto rev = Revision{};

        auto version = read_uleb128();
        if (!version || *version == 0) return std::nullopt;
        rev.version = *version;

        auto timestamp = read_sleb128();
        if (!timestamp) return std::nullopt;
        rev.timestamp = *timestamp;

        auto author = read_string();
        if (!author) return std::nullopt;
        rev.author = std::move(*author);

        auto has_document = read_u8();
        if (!has_document || *has_document > 1) return std::nullopt;
        if (*has_document == 1) {
            auto document = read_value();
            if (!document) return std::nullopt;
            rev.document = std::move(*document);
        }

        auto n = read_count();
        if (!n) return std::nullopt;
        rev.edits.reserve(*n);
        for (std::size_t i = 0; i < *n; ++i) {
            auto op = read_edit();
            if (!op) return std::nullopt;
            rev.edits.push_back(std::move(*op));
        }
        return rev;
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace jsonrev_cpp::storage
