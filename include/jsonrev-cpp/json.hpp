/// @file json.hpp
/// @brief JSON text form and nlohmann/json interoperability for jsonrev-cpp.
///
/// Provides parsing and canonical dumping of Value trees, the serialized
/// edit form ({op, path, value} records), ADL serialization
/// (to_json/from_json) and JSON Patch (RFC 6902) conversion.

#pragma once

#include <jsonrev-cpp/chain.hpp>
#include <jsonrev-cpp/edit.hpp>
#include <jsonrev-cpp/revision.hpp>
#include <jsonrev-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace jsonrev_cpp {

// =============================================================================
// Text form
// =============================================================================

/// Parse JSON text into a Value.
///
/// Member order and the exact text of every number are kept, with one
/// exception: the integer `-0` reads back as `0`, since integers arrive
/// from the parser as values rather than text. `-0.0` keeps its text.
/// @throws Exception (malformed_document) on a syntax error, invalid
///         UTF-8 or a duplicate object key.
auto parse(std::string_view text) -> Value;

/// Serialize a Value as JSON text.
///
/// Output is deterministic: members in stored order, numbers as stored.
/// @param indent Spaces per nesting level; negative for compact output.
/// @throws Exception (malformed_document) if a string is not valid UTF-8.
auto dump(const Value& value, int indent = -1) -> std::string;

// =============================================================================
// Serialized edit form
// =============================================================================

/// Convert edits to their serialized shape: an array of
/// {"op": "add"|"remove"|"replace", "path": [key-or-index...], "value": ...}
/// records, with "value" absent for remove.
auto to_value(const EditScript& edits) -> Value;

/// Inverse of to_value(const EditScript&).
/// @throws Exception (malformed_edit) if the value does not have that shape.
auto edits_from_value(const Value& value) -> EditScript;

/// dump(to_value(edits), indent)
auto dump_edits(const EditScript& edits, int indent = -1) -> std::string;

/// edits_from_value(parse(text)), with parse errors reported as malformed_edit.
auto parse_edits(std::string_view text) -> EditScript;

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// Numbers go through nlohmann's numeric types, so decimal text such as
// "1.50" is not preserved. Use dump()/parse() where it matters.

void to_json(nlohmann::json& j, const Null&);

void to_json(nlohmann::json& j, const Number& n);

void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

void to_json(nlohmann::json& j, const EditOp& op);
void from_json(const nlohmann::json& j, EditOp& op);

void to_json(nlohmann::json& j, const RevisionInfo& info);
void from_json(const nlohmann::json& j, RevisionInfo& info);

/// The clock is not serialized.
void to_json(nlohmann::json& j, const ChainOptions& options);
void from_json(const nlohmann::json& j, ChainOptions& options);

// =============================================================================
// JSON Patch (RFC 6902)
// =============================================================================

/// Express edits as an RFC 6902 JSON Patch with string pointer paths.
auto to_json_patch(const EditScript& edits) -> nlohmann::json;

/// Read an RFC 6902 JSON Patch made of add, remove and replace operations.
///
/// Every pointer segment becomes a key segment; the patch engine
/// resolves canonical decimal keys against arrays.
/// @throws Exception (malformed_edit) on any other op or a bad pointer.
auto from_json_patch(const nlohmann::json& patch) -> EditScript;

}  // namespace jsonrev_cpp
