/// @file path.hpp
/// @brief Path addressing: locate any node of a Value tree from the root.

#pragma once

#include <jsonrev-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonrev_cpp {

/// A path element: either an object key or an array index.
using PathElement = std::variant<std::string, std::size_t>;

/// A path into the document tree (e.g. "config" / "items" / 0).
/// The empty path denotes the document root.
using Path = std::vector<PathElement>;

/// Create an object key PathElement.
inline auto object_key(std::string k) -> PathElement { return PathElement{std::move(k)}; }

/// Create an array index PathElement.
inline auto array_index(std::size_t i) -> PathElement { return PathElement{i}; }

/// Interpret a key segment as an array index.
///
/// Only canonical decimal text qualifies: "0", "7", "42" but not "07",
/// "+1" or "".
auto key_to_index(std::string_view key) -> std::optional<std::size_t>;

/// Resolve a path, or nullptr if some segment does not match.
///
/// A key segment applied to an array resolves when it is a canonical
/// decimal index. An index segment applied to an object never resolves.
auto find(const Value& root, const Path& path) -> const Value*;
auto find(Value& root, const Path& path) -> Value*;

/// Resolve a path.
/// @throws Exception (path_not_found) naming the first segment that failed.
auto at(const Value& root, const Path& path) -> const Value&;

/// Render a path as an RFC 6901 JSON Pointer ("" for the root).
auto to_pointer(const Path& path) -> std::string;

/// Parse an RFC 6901 JSON Pointer. Every segment becomes a key.
/// @throws Exception (malformed_edit) if the text does not start with
///         '/' (and is not empty) or contains a bad '~' escape.
auto parse_pointer(std::string_view pointer) -> Path;

}  // namespace jsonrev_cpp
