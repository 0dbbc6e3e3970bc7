/// @file patch.hpp
/// @brief Apply edit scripts to Value trees.

#pragma once

#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/value.hpp>

namespace jsonrev_cpp {

/// Apply edits in order to a copy of a document and return the result.
///
/// Each edit's path is resolved against the result of all earlier edits.
/// Adds must be new: an add onto an existing object key is an error, never
/// an implicit replace. An add into an array accepts any index in
/// [0, size], and the key "-" appends. Replace at the root path swaps the
/// whole document; add and remove at the root are rejected.
///
/// @throws Exception path_not_found, conflicting_add or invalid_edit. The
///         message names the index of the failing edit.
auto apply_edits(const Value& document, const EditScript& edits) -> Value;

/// Apply edits to a document in place.
///
/// Strong guarantee: if any edit fails the document is left unchanged.
void apply_in_place(Value& document, const EditScript& edits);

}  // namespace jsonrev_cpp
