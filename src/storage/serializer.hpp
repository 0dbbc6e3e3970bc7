#pragma once

// Byte stream serializer for stored revisions.
// Internal header — not installed.

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/path.hpp>
#include <jsonrev-cpp/revision.hpp>
#include <jsonrev-cpp/value.hpp>
#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonrev_cpp::storage {

// Value tags. Numbers are written as their decimal text.
enum class ValueTag : std::uint8_t {
    null         = 0,
    false_value  = 1,
    true_value   = 2,
    number       = 3,
    string       = 4,
    array        = 5,
    object       = 6,
};

// Path segment tags.
enum class SegmentTag : std::uint8_t {
    key   = 0,
    index = 1,
};

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    void write_string(std::string_view s) {
        write_uleb128(s.size());
        for (auto c : s) {
            data_.push_back(static_cast<std::byte>(c));
        }
    }

    void write_value(const Value& value) {
        std::visit([this](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                write_tag(ValueTag::null);
            } else if constexpr (std::is_same_v<T, bool>) {
                write_tag(v ? ValueTag::true_value : ValueTag::false_value);
            } else if constexpr (std::is_same_v<T, Number>) {
                write_tag(ValueTag::number);
                write_string(v.text());
            } else if constexpr (std::is_same_v<T, std::string>) {
                write_tag(ValueTag::string);
                write_string(v);
            } else if constexpr (std::is_same_v<T, Array>) {
                write_tag(ValueTag::array);
                write_uleb128(v.size());
                for (const auto& item : v) write_value(item);
            } else if constexpr (std::is_same_v<T, Object>) {
                write_tag(ValueTag::object);
                write_uleb128(v.size());
                for (const auto& m : v) {
                    write_string(m.key);
                    write_value(m.value);
                }
            }
        }, value.data());
    }

    void write_path(const Path& path) {
        write_uleb128(path.size());
        for (const auto& element : path) {
            std::visit([this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>) {
                    write_u8(static_cast<std::uint8_t>(SegmentTag::key));
                    write_string(v);
                } else {
                    write_u8(static_cast<std::uint8_t>(SegmentTag::index));
                    write_uleb128(v);
                }
            }, element);
        }
    }

    void write_edit(const EditOp& op) {
        write_u8(static_cast<std::uint8_t>(kind(op)));
        write_path(op.path);
        std::visit(overload{
            [this](const EditAdd& a) { write_value(a.value); },
            [](const EditRemove&) {},
            [this](const EditReplace& r) { write_value(r.value); },
        }, op.action);
    }

    // uleb version, sleb timestamp, author, document flag [+ document],
    // uleb edit count, edits
    void write_revision(const Revision& rev) {
        write_uleb128(rev.version);
        write_sleb128(rev.timestamp);
        write_string(rev.author);
        write_u8(rev.document ? 1 : 0);
        if (rev.document) write_value(*rev.document);
        write_uleb128(rev.edits.size());
        for (const auto& op : rev.edits) write_edit(op);
    }

    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    void write_tag(ValueTag tag) {
        write_u8(static_cast<std::uint8_t>(tag));
    }

    std::vector<std::byte> data_;
};

}  // namespace jsonrev_cpp::storage
