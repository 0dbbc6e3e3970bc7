#include <jsonrev-cpp/diff.hpp>
#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/json.hpp>
#include <jsonrev-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <tuple>
#include <utility>

using namespace jsonrev_cpp;

namespace {

auto expect_kind(const Value& doc, const EditScript& edits, ErrorKind kind) -> std::string {
    try {
        static_cast<void>(apply_edits(doc, edits));
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), kind) << e.what();
        return e.what();
    }
    ADD_FAILURE() << "expected " << to_string_view(kind);
    return {};
}

}  // namespace

// -- Identity -----------------------------------------------------------------

TEST(Patch, empty_script_is_identity) {
    const auto doc = parse(R"({"b":1,"a":[true,null]})");
    const auto result = apply_edits(doc, EditScript{});
    EXPECT_EQ(result, doc);
    EXPECT_EQ(dump(result), dump(doc));
}

TEST(Patch, apply_leaves_input_untouched) {
    const auto doc = parse(R"({"a":1})");
    const auto before = doc;
    static_cast<void>(apply_edits(doc, EditScript{EditOp::replace({"a"}, Value{2})}));
    EXPECT_EQ(doc, before);
}

// -- Add ----------------------------------------------------------------------

TEST(Patch, add_appends_new_object_member) {
    auto result = apply_edits(parse(R"({"a":1})"), EditScript{EditOp::add({"b"}, Value{true})});
    EXPECT_EQ(dump(result), R"({"a":1,"b":true})");
}

TEST(Patch, add_inserts_into_array_shifting_right) {
    auto result = apply_edits(parse("[1,3]"), EditScript{EditOp::add({std::size_t{1}}, Value{2})});
    EXPECT_EQ(dump(result), "[1,2,3]");
}

TEST(Patch, add_at_array_end_and_dash_append) {
    auto result = apply_edits(parse("[1]"), EditScript{
        EditOp::add({std::size_t{1}}, Value{2}),
        EditOp::add({"-"}, Value{3}),
    });
    EXPECT_EQ(dump(result), "[1,2,3]");
}

TEST(Patch, add_past_array_end_is_path_not_found) {
    expect_kind(parse("[1]"), EditScript{EditOp::add({std::size_t{2}}, Value{0})},
                ErrorKind::path_not_found);
}

TEST(Patch, add_onto_existing_key_conflicts) {
    expect_kind(parse(R"({"a":1})"), EditScript{EditOp::add({"a"}, Value{2})},
                ErrorKind::conflicting_add);
}

TEST(Patch, add_under_missing_parent_is_path_not_found) {
    expect_kind(parse(R"({"a":1})"), EditScript{EditOp::add({"x", "y"}, Value{2})},
                ErrorKind::path_not_found);
}

TEST(Patch, add_at_root_is_invalid) {
    expect_kind(parse("{}"), EditScript{EditOp::add({}, Value{1})}, ErrorKind::invalid_edit);
}

// -- Remove -------------------------------------------------------------------

TEST(Patch, remove_object_member) {
    auto result = apply_edits(parse(R"({"a":1,"b":2})"), EditScript{EditOp::remove({"a"})});
    EXPECT_EQ(dump(result), R"({"b":2})");
}

TEST(Patch, remove_array_element_shifts_left) {
    auto result = apply_edits(parse("[1,2,3]"), EditScript{EditOp::remove({std::size_t{0}})});
    EXPECT_EQ(dump(result), "[2,3]");
}

TEST(Patch, remove_missing_is_path_not_found) {
    expect_kind(parse(R"({"a":1})"), EditScript{EditOp::remove({"b"})},
                ErrorKind::path_not_found);
    expect_kind(parse("[1]"), EditScript{EditOp::remove({std::size_t{1}})},
                ErrorKind::path_not_found);
}

TEST(Patch, remove_root_is_invalid) {
    expect_kind(parse("[1]"), EditScript{EditOp::remove({})}, ErrorKind::invalid_edit);
}

// -- Replace ------------------------------------------------------------------

TEST(Patch, replace_existing_node) {
    auto result = apply_edits(parse(R"({"a":{"b":[1,2]}})"),
                        EditScript{EditOp::replace({"a", "b", std::size_t{1}}, Value{"two"})});
    EXPECT_EQ(dump(result), R"({"a":{"b":[1,"two"]}})");
}

TEST(Patch, replace_at_root_swaps_document) {
    auto result = apply_edits(parse(R"({"a":1})"), EditScript{EditOp::replace({}, Value{Array{}})});
    EXPECT_EQ(result, Value{Array{}});
}

TEST(Patch, replace_missing_is_path_not_found) {
    expect_kind(parse(R"({"a":1})"), EditScript{EditOp::replace({"b"}, Value{1})},
                ErrorKind::path_not_found);
}

TEST(Patch, decimal_key_addresses_array_element) {
    auto result = apply_edits(parse(R"({"l":[1,2]})"), EditScript{EditOp::replace({"l", "1"}, Value{5})});
    EXPECT_EQ(dump(result), R"({"l":[1,5]})");
}

// -- Sequencing and failure reporting -------------------------------------------

TEST(Patch, each_edit_sees_result_of_previous) {
    auto result = apply_edits(parse("[]"), EditScript{
        EditOp::add({std::size_t{0}}, Value{Object{}}),
        EditOp::add({std::size_t{0}, "k"}, Value{Array{}}),
        EditOp::add({std::size_t{0}, "k", std::size_t{0}}, Value{"v"}),
    });
    EXPECT_EQ(dump(result), R"([{"k":["v"]}])");
}

TEST(Patch, error_names_failing_edit_index) {
    auto message = expect_kind(parse(R"({"a":1})"), EditScript{
        EditOp::replace({"a"}, Value{2}),
        EditOp::remove({"missing"}),
    }, ErrorKind::path_not_found);
    EXPECT_NE(message.find("edit 1"), std::string::npos);
    EXPECT_NE(message.find("/missing"), std::string::npos);
}

TEST(Patch, apply_in_place_is_all_or_nothing) {
    auto doc = parse(R"({"a":1,"b":2})");
    const auto original = doc;
    EXPECT_THROW(apply_in_place(doc, EditScript{
        EditOp::remove({"a"}),
        EditOp::remove({"a"}),
    }), Exception);
    EXPECT_EQ(doc, original);

    apply_in_place(doc, EditScript{EditOp::remove({"a"})});
    EXPECT_EQ(dump(doc), R"({"b":2})");
}

// -- Scenarios ------------------------------------------------------------------

TEST(Patch, object_diff_round_trip) {
    auto v1 = parse(R"({"a":1})");
    auto v2 = parse(R"({"a":2,"b":true})");
    auto edits = diff(v1, v2);
    EXPECT_EQ(apply_edits(v1, edits), v2);
}

TEST(Patch, array_shrink_round_trip) {
    auto v1 = parse(R"({"list":[1,2,3]})");
    auto v2 = parse(R"({"list":[1,2]})");
    EXPECT_EQ(apply_edits(v1, diff(v1, v2)), v2);
}

TEST(Patch, self_diff_round_trip) {
    auto doc = parse(R"({"deep":[{"x":[[],{}]},"s",-0.5e3]})");
    auto edits = diff(doc, doc);
    EXPECT_TRUE(edits.empty());
    EXPECT_EQ(apply_edits(doc, edits), doc);
}

// -- Overload resolution --------------------------------------------------------

TEST(Patch, apply_edits_with_non_const_and_temporary_arguments) {
    // <tuple> is visible here, so std::apply is a candidate for unqualified calls.
    auto doc = parse(R"({"n":1})");
    auto edits = EditScript{EditOp::replace({"n"}, Value{2})};
    EXPECT_EQ(apply_edits(doc, edits), parse(R"({"n":2})"));
    EXPECT_EQ(apply_edits(parse("[]"), EditScript{EditOp::add({"-"}, Value{1})}), parse("[1]"));
    EXPECT_EQ(apply_edits(std::move(doc), std::move(edits)), parse(R"({"n":2})"));
    EXPECT_EQ(std::apply([](int a, int b) { return a + b; }, std::tuple{1, 2}), 3);
}
