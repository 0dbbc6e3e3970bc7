// json_interop_demo — jsonrev-cpp + nlohmann/json interoperability
//
// Demonstrates:
//   - Converting between nlohmann::json and jsonrev Values (ADL)
//   - Why parse()/dump() are used for stored documents (number text, order)
//   - Exporting a version diff as an RFC 6902 JSON Patch
//   - Importing a JSON Patch produced elsewhere and committing the result
//   - Chain options and history as JSON
//
// Build: cmake --build build -DJSONREV_BUILD_EXAMPLES=ON
// Run:   ./build/examples/json_interop_demo

#include <jsonrev-cpp/jsonrev.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace jr = jsonrev_cpp;
using json = nlohmann::json;

int main() {
    // =========================================================================
    // nlohmann::json <-> Value
    // =========================================================================
    std::printf("=== nlohmann::json <-> Value ===\n");

    auto config = json{
        {"service", "billing"},
        {"replicas", 3},
        {"ratio", 0.25},
        {"regions", json::array({"eu-west-1", "us-east-1"})},
    };
    auto value = config.get<jr::Value>();
    std::printf("From json:   %s\n", jr::dump(value).c_str());

    json back = value;
    std::printf("Back again:  %s\n", back.dump().c_str());

    // nlohmann::json reorders keys and re-renders numbers; parse() does not.
    auto text = std::string{R"({"z":1.50,"a":1e3})"};
    std::printf("parse/dump:  %s\n", jr::dump(jr::parse(text)).c_str());
    std::printf("via json:    %s\n", json::parse(text).dump().c_str());

    // =========================================================================
    // Diffs as JSON Patch
    // =========================================================================
    std::printf("\n=== Version diff as JSON Patch ===\n");

    auto store = std::make_shared<jr::MemoryRevisionStore>();
    auto chain = jr::ChainManager{store};
    chain.commit("billing", value, "alice");

    auto next = value;
    if (auto* obj = next.get_if<jr::Object>()) {
        obj->insert_or_assign("replicas", 5);
        obj->insert("owner", "payments-team");
    }
    chain.commit("billing", next, "bob");

    auto patch = jr::to_json_patch(chain.diff_between("billing", 1, 2));
    std::printf("%s\n", patch.dump(2).c_str());

    // =========================================================================
    // Applying a JSON Patch from another system
    // =========================================================================
    std::printf("\n=== Applying an external JSON Patch ===\n");

    auto incoming = json::parse(R"([
        {"op": "replace", "path": "/regions/1", "value": "ap-south-1"},
        {"op": "add", "path": "/regions/-", "value": "sa-east-1"},
        {"op": "remove", "path": "/ratio"}
    ])");
    auto head = chain.reconstruct("billing", 2);
    auto patched = jr::apply_edits(head, jr::from_json_patch(incoming));
    auto rev = chain.commit("billing", patched, "carol");
    std::printf("Committed v%llu: %s\n", static_cast<unsigned long long>(rev.version),
                jr::dump(*rev.document).c_str());

    // Unsupported operations are rejected before anything is applied.
    try {
        static_cast<void>(jr::from_json_patch(
            json::parse(R"([{"op":"move","from":"/a","path":"/b"}])")));
    } catch (const jr::Exception& e) {
        std::printf("Rejected: %s\n", e.what());
    }

    // =========================================================================
    // Edits, history and options as JSON
    // =========================================================================
    std::printf("\n=== Edits, history and options as JSON ===\n");

    std::printf("Stored edits of v3: %s\n", jr::dump_edits(rev.edits, 2).c_str());

    json history = chain.history("billing");
    std::printf("History: %s\n", history.dump(2).c_str());

    auto options = json::parse(R"({"mode": "edits_only", "snapshot_interval": 50})")
                       .get<jr::ChainOptions>();
    auto lean = jr::ChainManager{std::make_shared<jr::MemoryRevisionStore>(), options};
    std::printf("Options: %s\n", json(lean.options()).dump().c_str());

    std::printf("\nDone.\n");
    return 0;
}
