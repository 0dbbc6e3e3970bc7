#include <jsonrev-cpp/json.hpp>

#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonrev_cpp {

namespace {

constexpr std::size_t max_parse_depth = 512;

// =============================================================================
// SAX handler: builds a Value directly, keeping number text and member order
// =============================================================================

class ValueBuilder {
public:
    using number_integer_t = nlohmann::json::number_integer_t;
    using number_unsigned_t = nlohmann::json::number_unsigned_t;
    using number_float_t = nlohmann::json::number_float_t;
    using string_t = nlohmann::json::string_t;
    using binary_t = nlohmann::json::binary_t;

    auto null() -> bool { return add(Value{}); }
    auto boolean(bool b) -> bool { return add(Value{b}); }

    auto number_integer(number_integer_t i) -> bool {
        return add(Value{Number{static_cast<std::int64_t>(i)}});
    }

    auto number_unsigned(number_unsigned_t u) -> bool {
        return add(Value{Number{static_cast<std::uint64_t>(u)}});
    }

    // The lexer hands over the token text, which is kept verbatim.
    auto number_float(number_float_t, const string_t& text) -> bool {
        if (!is_number_text(text)) {
            error_ = "invalid number '" + text + "'";
            return false;
        }
        return add(Value{Number::from_text(text)});
    }

    auto string(string_t& s) -> bool { return add(Value{std::move(s)}); }

    auto binary(binary_t&) -> bool {
        error_ = "binary values are not JSON";
        return false;
    }

    auto start_object(std::size_t) -> bool { return open(Value{Object{}}); }
    auto key(string_t& k) -> bool {
        key_ = std::move(k);
        return true;
    }
    auto end_object() -> bool { return close(); }

    auto start_array(std::size_t) -> bool { return open(Value{Array{}}); }
    auto end_array() -> bool { return close(); }

    auto parse_error(std::size_t, const std::string&,
                     const nlohmann::detail::exception& ex) -> bool {
        error_ = ex.what();
        return false;
    }

    auto error() const -> const std::string& { return error_; }
    auto result() && -> Value { return std::move(root_); }

private:
    auto open(Value container) -> bool {
        if (stack_.size() >= max_parse_depth) {
            error_ = "nesting deeper than " + std::to_string(max_parse_depth) + " levels";
            return false;
        }
        auto* slot = place(std::move(container));
        if (!slot) return false;
        stack_.push_back(slot);
        return true;
    }

    auto close() -> bool {
        stack_.pop_back();
        return true;
    }

    auto add(Value value) -> bool { return place(std::move(value)) != nullptr; }

    // Attach a value to the innermost open container (or make it the root).
    auto place(Value value) -> Value* {
        if (stack_.empty()) {
            root_ = std::move(value);
            return &root_;
        }
        auto& parent = *stack_.back();
        if (auto* arr = parent.get_if<Array>()) {
            arr->push_back(std::move(value));
            return &arr->back();
        }
        auto [slot, inserted] = parent.get_if<Object>()->try_emplace(key_, std::move(value));
        if (!inserted) {
            error_ = "duplicate object key '" + key_ + "'";
            return nullptr;
        }
        return slot;
    }

    Value root_;
    std::vector<Value*> stack_;
    std::string key_;
    std::string error_;
};

// =============================================================================
// Dump
// =============================================================================

void dump_string(std::string& out, const std::string& s) {
    try {
        out += nlohmann::json(s).dump();
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::malformed_document, e.what()};
    }
}

void newline(std::string& out, int indent, std::size_t depth) {
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent) * depth, ' ');
}

void dump_to(std::string& out, const Value& value, int indent, std::size_t depth) {
    std::visit(overload{
        [&](const Null&) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](const Number& n) { out += n.text(); },
        [&](const std::string& s) { dump_string(out, s); },
        [&](const Array& a) {
            if (a.empty()) {
                out += "[]";
                return;
            }
            out.push_back('[');
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (i > 0) out.push_back(',');
                if (indent >= 0) newline(out, indent, depth + 1);
                dump_to(out, a[i], indent, depth + 1);
            }
            if (indent >= 0) newline(out, indent, depth);
            out.push_back(']');
        },
        [&](const Object& o) {
            if (o.empty()) {
                out += "{}";
                return;
            }
            out.push_back('{');
            auto first = true;
            for (const auto& m : o) {
                if (!first) out.push_back(',');
                first = false;
                if (indent >= 0) newline(out, indent, depth + 1);
                dump_string(out, m.key);
                out += indent >= 0 ? ": " : ":";
                dump_to(out, m.value, indent, depth + 1);
            }
            if (indent >= 0) newline(out, indent, depth);
            out.push_back('}');
        },
    }, value.data());
}

// =============================================================================
// Serialized edit form helpers
// =============================================================================

[[noreturn]] void bad_edit(std::size_t index, const std::string& what) {
    throw Exception{ErrorKind::malformed_edit,
                    "edit " + std::to_string(index) + ": " + what};
}

auto path_to_value(const Path& path) -> Value {
    auto segments = Array{};
    segments.reserve(path.size());
    for (const auto& element : path) {
        std::visit(overload{
            [&](const std::string& k) { segments.emplace_back(k); },
            [&](std::size_t i) { segments.emplace_back(Number{static_cast<std::uint64_t>(i)}); },
        }, element);
    }
    return Value{std::move(segments)};
}

auto path_from_value(const Value& value, std::size_t index) -> Path {
    const auto* segments = value.get_if<Array>();
    if (!segments) bad_edit(index, "\"path\" must be an array");
    auto path = Path{};
    path.reserve(segments->size());
    for (const auto& seg : *segments) {
        if (const auto* k = seg.get_if<std::string>()) {
            path.emplace_back(*k);
            continue;
        }
        const auto* n = seg.get_if<Number>();
        auto idx = n ? n->as_uint64() : std::nullopt;
        if (!idx) bad_edit(index, "path segments must be strings or non-negative integers");
        path.emplace_back(static_cast<std::size_t>(*idx));
    }
    return path;
}

auto edit_to_value(const EditOp& op) -> Value {
    auto record = Object{};
    record.insert("op", std::string{to_string_view(kind(op))});
    record.insert("path", path_to_value(op.path));
    std::visit(overload{
        [&](const EditAdd& a) { record.insert("value", a.value); },
        [](const EditRemove&) {},
        [&](const EditReplace& r) { record.insert("value", r.value); },
    }, op.action);
    return Value{std::move(record)};
}

auto edit_from_value(const Value& value, std::size_t index) -> EditOp {
    const auto* record = value.get_if<Object>();
    if (!record) bad_edit(index, "must be an object");

    const auto* op = record->find("op");
    const auto* name = op ? op->get_if<std::string>() : nullptr;
    if (!name) bad_edit(index, "missing \"op\" string");

    const auto* path_value = record->find("path");
    if (!path_value) bad_edit(index, "missing \"path\"");
    auto path = path_from_value(*path_value, index);

    const auto* payload = record->find("value");
    if (*name == "remove") return EditOp::remove(std::move(path));
    if (*name != "add" && *name != "replace") bad_edit(index, "unknown op '" + *name + "'");
    if (!payload) bad_edit(index, "\"" + *name + "\" needs a \"value\"");
    if (*name == "add") return EditOp::add(std::move(path), *payload);
    return EditOp::replace(std::move(path), *payload);
}

}  // anonymous namespace

// =============================================================================
// Text form
// =============================================================================

auto parse(std::string_view text) -> Value {
    auto builder = ValueBuilder{};
    auto ok = nlohmann::json::sax_parse(text, &builder);
    if (!ok) {
        throw Exception{ErrorKind::malformed_document,
                        builder.error().empty() ? "invalid JSON" : builder.error()};
    }
    return std::move(builder).result();
}

auto dump(const Value& value, int indent) -> std::string {
    auto out = std::string{};
    dump_to(out, value, indent, 0);
    return out;
}

// =============================================================================
// Serialized edit form
// =============================================================================

auto to_value(const EditScript& edits) -> Value {
    auto records = Array{};
    records.reserve(edits.size());
    for (const auto& op : edits) records.push_back(edit_to_value(op));
    return Value{std::move(records)};
}

auto edits_from_value(const Value& value) -> EditScript {
    const auto* records = value.get_if<Array>();
    if (!records) {
        throw Exception{ErrorKind::malformed_edit, "edits must be a JSON array"};
    }
    auto edits = EditScript{};
    edits.reserve(records->size());
    for (std::size_t i = 0; i < records->size(); ++i) {
        edits.push_back(edit_from_value((*records)[i], i));
    }
    return edits;
}

auto dump_edits(const EditScript& edits, int indent) -> std::string {
    return dump(to_value(edits), indent);
}

auto parse_edits(std::string_view text) -> EditScript {
    auto value = Value{};
    try {
        value = parse(text);
    } catch (const Exception& e) {
        throw Exception{ErrorKind::malformed_edit, e.what()};
    }
    return edits_from_value(value);
}

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const Null&) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Number& n) {
    if (auto i = n.as_int64()) {
        j = *i;
    } else if (auto u = n.as_uint64()) {
        j = *u;
    } else {
        j = n.as_double();
    }
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](const Null& n) { to_json(j, n); },
        [&](bool b) { j = b; },
        [&](const Number& n) { to_json(j, n); },
        [&](const std::string& s) { j = s; },
        [&](const Array& a) {
            j = nlohmann::json::array();
            for (const auto& item : a) {
                auto element = nlohmann::json{};
                to_json(element, item);
                j.push_back(std::move(element));
            }
        },
        [&](const Object& o) {
            j = nlohmann::json::object();
            for (const auto& m : o) to_json(j[m.key], m.value);
        },
    }, v.data());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Value{};
            return;
        case nlohmann::json::value_t::boolean:
            v = Value{j.get<bool>()};
            return;
        case nlohmann::json::value_t::number_integer:
            v = Value{Number{j.get<std::int64_t>()}};
            return;
        case nlohmann::json::value_t::number_unsigned:
            v = Value{Number{j.get<std::uint64_t>()}};
            return;
        case nlohmann::json::value_t::number_float:
            v = Value{Number{j.get<double>()}};
            return;
        case nlohmann::json::value_t::string:
            v = Value{j.get<std::string>()};
            return;
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& item : j) {
                auto element = Value{};
                from_json(item, element);
                arr.push_back(std::move(element));
            }
            v = Value{std::move(arr)};
            return;
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& item : j.items()) {
                auto element = Value{};
                from_json(item.value(), element);
                obj.insert(item.key(), std::move(element));
            }
            v = Value{std::move(obj)};
            return;
        }
        default:
            throw Exception{ErrorKind::malformed_document,
                            std::string{"cannot convert JSON "} + j.type_name() + " to Value"};
    }
}

void to_json(nlohmann::json& j, const EditOp& op) {
    to_json(j, edit_to_value(op));
}

void from_json(const nlohmann::json& j, EditOp& op) {
    auto value = Value{};
    from_json(j, value);
    op = edit_from_value(value, 0);
}

void to_json(nlohmann::json& j, const RevisionInfo& info) {
    j = nlohmann::json{
        {"version", info.version},
        {"author", info.author},
        {"timestamp", info.timestamp},
        {"edit_count", info.edit_count},
        {"snapshot", info.snapshot},
    };
}

void from_json(const nlohmann::json& j, RevisionInfo& info) {
    try {
        j.at("version").get_to(info.version);
        j.at("author").get_to(info.author);
        j.at("timestamp").get_to(info.timestamp);
        j.at("edit_count").get_to(info.edit_count);
        j.at("snapshot").get_to(info.snapshot);
    } catch (const nlohmann::json::exception& e) {
        throw Exception{ErrorKind::malformed_document,
                        std::string{"invalid revision info: "} + e.what()};
    }
}

void to_json(nlohmann::json& j, const ChainOptions& options) {
    j = nlohmann::json{
        {"mode", std::string{to_string_view(options.mode)}},
        {"snapshot_interval", options.snapshot_interval},
    };
}

void from_json(const nlohmann::json& j, ChainOptions& options) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::malformed_document, "chain options must be a JSON object"};
    }
    if (auto it = j.find("mode"); it != j.end()) {
        if (!it->is_string()) {
            throw Exception{ErrorKind::malformed_document, "chain option 'mode' must be a string"};
        }
        auto mode = it->get<std::string>();
        if (mode == to_string_view(StorageMode::full_documents)) {
            options.mode = StorageMode::full_documents;
        } else if (mode == to_string_view(StorageMode::edits_only)) {
            options.mode = StorageMode::edits_only;
        } else {
            throw Exception{ErrorKind::malformed_document,
                            "unknown storage mode '" + mode + "'"};
        }
    }
    if (auto it = j.find("snapshot_interval"); it != j.end()) {
        // Integers built in code are signed even when non-negative.
        if (!it->is_number_unsigned() &&
            !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
            throw Exception{ErrorKind::malformed_document,
                            "chain option 'snapshot_interval' must be a non-negative integer"};
        }
        options.snapshot_interval = it->get<std::uint64_t>();
    }
}

// =============================================================================
// JSON Patch (RFC 6902)
// =============================================================================

auto to_json_patch(const EditScript& edits) -> nlohmann::json {
    auto patch = nlohmann::json::array();
    for (const auto& op : edits) {
        auto entry = nlohmann::json{
            {"op", std::string{to_string_view(kind(op))}},
            {"path", to_pointer(op.path)},
        };
        std::visit(overload{
            [&](const EditAdd& a) { to_json(entry["value"], a.value); },
            [](const EditRemove&) {},
            [&](const EditReplace& r) { to_json(entry["value"], r.value); },
        }, op.action);
        patch.push_back(std::move(entry));
    }
    return patch;
}

auto from_json_patch(const nlohmann::json& patch) -> EditScript {
    if (!patch.is_array()) {
        throw Exception{ErrorKind::malformed_edit, "JSON Patch must be an array"};
    }
    auto edits = EditScript{};
    edits.reserve(patch.size());
    for (std::size_t i = 0; i < patch.size(); ++i) {
        const auto& entry = patch[i];
        if (!entry.is_object()) bad_edit(i, "must be an object");

        auto op_it = entry.find("op");
        if (op_it == entry.end() || !op_it->is_string()) bad_edit(i, "missing \"op\" string");
        auto path_it = entry.find("path");
        if (path_it == entry.end() || !path_it->is_string()) bad_edit(i, "missing \"path\" string");

        const auto& name = op_it->get_ref<const std::string&>();
        auto path = parse_pointer(path_it->get_ref<const std::string&>());

        if (name == "remove") {
            edits.push_back(EditOp::remove(std::move(path)));
            continue;
        }
        if (name != "add" && name != "replace") bad_edit(i, "unsupported op '" + name + "'");

        auto value_it = entry.find("value");
        if (value_it == entry.end()) bad_edit(i, "\"" + name + "\" needs a \"value\"");
        auto value = Value{};
        from_json(*value_it, value);
        edits.push_back(name == "add" ? EditOp::add(std::move(path), std::move(value))
                                      : EditOp::replace(std::move(path), std::move(value)));
    }
    return edits;
}

}  // namespace jsonrev_cpp
