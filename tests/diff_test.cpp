#include <jsonrev-cpp/diff.hpp>
#include <jsonrev-cpp/json.hpp>
#include <jsonrev-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace jsonrev_cpp;

namespace {

auto p(std::string_view pointer) -> Path {
    auto path = Path{};
    // Test paths use numeric segments for array positions.
    for (auto& element : parse_pointer(pointer)) {
        if (auto idx = key_to_index(std::get<std::string>(element))) {
            path.emplace_back(*idx);
        } else {
            path.push_back(std::move(element));
        }
    }
    return path;
}

}  // namespace

// -- Identity -----------------------------------------------------------------

TEST(Diff, identical_documents_give_empty_script) {
    const auto doc = parse(R"({"a":[1,{"b":null}],"c":"x"})");
    EXPECT_TRUE(diff(doc, doc).empty());
}

TEST(Diff, identical_scalars_give_empty_script) {
    EXPECT_TRUE(diff(Value{}, Value{}).empty());
    EXPECT_TRUE(diff(Value{true}, Value{true}).empty());
    EXPECT_TRUE(diff(Value{"s"}, Value{"s"}).empty());
}

// -- Scalars ------------------------------------------------------------------

TEST(Diff, changed_root_scalar_is_replaced) {
    auto edits = diff(Value{1}, Value{2});
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0], EditOp::replace(Path{}, Value{2}));
}

TEST(Diff, number_text_difference_is_a_change) {
    auto edits = diff(parse("1.0"), parse("1"));
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(kind(edits[0]), EditKind::replace);
}

TEST(Diff, kind_mismatch_replaces_whole_subtree) {
    auto edits = diff(parse(R"({"a":{"x":1}})"), parse(R"({"a":[1]})"));
    ASSERT_EQ(edits.size(), 1u);
    EXPECT_EQ(edits[0], EditOp::replace(p("/a"), Value{Array{1}}));
}

// -- Objects ------------------------------------------------------------------

TEST(Diff, replace_then_add) {
    auto edits = diff(parse(R"({"a":1})"), parse(R"({"a":2,"b":true})"));
    auto expected = EditScript{
        EditOp::replace(p("/a"), Value{2}),
        EditOp::add(p("/b"), Value{true}),
    };
    EXPECT_EQ(edits, expected);
}

TEST(Diff, removals_then_recursion_then_additions) {
    auto before = parse(R"({"gone1":0,"keep":{"v":1},"gone2":0})");
    auto after = parse(R"({"new2":2,"keep":{"v":2},"new1":1})");
    auto expected = EditScript{
        EditOp::remove(p("/gone1")),
        EditOp::remove(p("/gone2")),
        EditOp::replace(p("/keep/v"), Value{2}),
        EditOp::add(p("/new2"), Value{2}),
        EditOp::add(p("/new1"), Value{1}),
    };
    EXPECT_EQ(diff(before, after), expected);
}

TEST(Diff, member_reorder_alone_is_not_a_change) {
    EXPECT_TRUE(diff(parse(R"({"a":1,"b":2})"), parse(R"({"b":2,"a":1})")).empty());
}

TEST(Diff, recursion_follows_before_member_order) {
    auto before = parse(R"({"x":1,"y":1})");
    auto after = parse(R"({"y":2,"x":2})");
    auto expected = EditScript{
        EditOp::replace(p("/x"), Value{2}),
        EditOp::replace(p("/y"), Value{2}),
    };
    EXPECT_EQ(diff(before, after), expected);
}

// -- Arrays -------------------------------------------------------------------

TEST(Diff, trailing_removal) {
    auto edits = diff(parse(R"({"list":[1,2,3]})"), parse(R"({"list":[1,2]})"));
    auto expected = EditScript{EditOp::remove(p("/list/2"))};
    EXPECT_EQ(edits, expected);
}

TEST(Diff, trailing_removals_highest_index_first) {
    auto edits = diff(parse("[1,2,3,4]"), parse("[1]"));
    auto expected = EditScript{
        EditOp::remove(p("/3")),
        EditOp::remove(p("/2")),
        EditOp::remove(p("/1")),
    };
    EXPECT_EQ(edits, expected);
}

TEST(Diff, trailing_additions_ascending) {
    auto edits = diff(parse("[1]"), parse("[1,2,3]"));
    auto expected = EditScript{
        EditOp::add(p("/1"), Value{2}),
        EditOp::add(p("/2"), Value{3}),
    };
    EXPECT_EQ(edits, expected);
}

TEST(Diff, positional_comparison_without_move_detection) {
    // Prepending shifts every element: each position changes, one add at the end.
    auto edits = diff(parse("[2,3]"), parse("[1,2,3]"));
    auto expected = EditScript{
        EditOp::replace(p("/0"), Value{1}),
        EditOp::replace(p("/1"), Value{2}),
        EditOp::add(p("/2"), Value{3}),
    };
    EXPECT_EQ(edits, expected);
}

TEST(Diff, recurses_into_nested_array_elements) {
    auto edits = diff(parse(R"([{"id":1,"on":false}])"), parse(R"([{"id":1,"on":true}])"));
    auto expected = EditScript{EditOp::replace(p("/0/on"), Value{true})};
    EXPECT_EQ(edits, expected);
}

// -- Laws ---------------------------------------------------------------------

TEST(Diff, is_deterministic) {
    auto a = parse(R"({"a":[1,2,{"b":3}],"c":{"d":"e"},"f":null})");
    auto b = parse(R"({"a":[1,{"b":4}],"c":{"g":1},"h":[true]})");
    EXPECT_EQ(diff(a, b), diff(a, b));
}

TEST(Diff, applying_diff_reconstructs_target) {
    const auto cases = std::vector<std::pair<std::string, std::string>>{
        {R"({"a":1})", R"({"a":2,"b":true})"},
        {R"({"list":[1,2,3]})", R"({"list":[1,2]})"},
        {R"([1,[2,[3,[4]]]])", R"([1,[2,[5]],6,7])"},
        {R"({"a":{"b":{"c":[]}}})", R"({"a":{"b":{"c":[{"d":1}]}}})"},
        {R"({"k":"v"})", R"([])"},
        {R"(null)", R"({"x":[1,2]})"},
        {R"({"a/b":1,"m~n":2})", R"({"a/b":3})"},
        {R"({"n":1.50})", R"({"n":1.5})"},
    };
    for (const auto& [before_text, after_text] : cases) {
        auto before = parse(before_text);
        auto after = parse(after_text);
        auto result = apply_edits(before, diff(before, after));
        EXPECT_TRUE(equivalent(result, after)) << before_text << " -> " << after_text;
        EXPECT_TRUE(diff(result, after).empty()) << before_text << " -> " << after_text;
    }
}
