/// @file diff.hpp
/// @brief Structural diff between two Value trees.

#pragma once

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/value.hpp>

namespace jsonrev_cpp {

/// Compute the edits that turn `before` into `after`.
///
/// The result is deterministic. Applying it to `before` with apply_edits()
/// yields a value equivalent() to `after`; identical inputs yield an
/// empty script.
///
/// - Scalars of the same kind: one replace when the values differ.
/// - Objects: removals of vanished keys in `before` member order, then
///   recursion into shared keys in `before` order, then adds of new keys
///   in `after` member order.
/// - Arrays: positional recursion over the common prefix, then removals
///   of trailing elements highest index first, or adds of trailing
///   elements in ascending order. Moves are not detected.
/// - Different kinds: one replace of the whole subtree.
///
/// @code
/// auto edits = diff(parse(R"({"a":1})"), parse(R"({"a":2,"b":true})"));
/// // [replace /a 2, add /b true]
/// @endcode
auto diff(const Value& before, const Value& after) -> EditScript;

}  // namespace jsonrev_cpp
