// Fuzz target for parse() and the diff/patch engine.
//
// The input is split at the first newline into two JSON texts. When both
// parse, applying diff(a, b) to a must give a document equivalent to b
// with nothing left to diff, and dump() must round-trip through parse().

#include <jsonrev-cpp/diff.hpp>
#include <jsonrev-cpp/error.hpp>
#include <jsonrev-cpp/json.hpp>
#include <jsonrev-cpp/patch.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>

namespace jr = jsonrev_cpp;

namespace {

auto try_parse(std::string_view text) -> std::optional<jr::Value> {
    try {
        return jr::parse(text);
    } catch (const jr::Exception&) {
        return std::nullopt;
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto split = input.find('\n');
    const auto first = input.substr(0, split);
    const auto second = split == std::string_view::npos ? first : input.substr(split + 1);

    auto a = try_parse(first);
    if (!a) return 0;

    if (try_parse(jr::dump(*a)) != a) std::abort();

    auto b = try_parse(second);
    if (!b) return 0;

    auto result = jr::apply_edits(*a, jr::diff(*a, *b));
    if (!jr::equivalent(result, *b)) std::abort();
    if (!jr::diff(result, *b).empty()) std::abort();
    return 0;
}
