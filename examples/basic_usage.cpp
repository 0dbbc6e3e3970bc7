// basic_usage — demonstrates the core jsonrev-cpp API
//
// Shows: committing versions, reading stored edits, history,
// reconstructing old versions, diffing any two versions, rollback,
// and the edits_only storage mode with periodic snapshots.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonrev-cpp/jsonrev.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace jr = jsonrev_cpp;

int main() {
    auto store = std::make_shared<jr::MemoryRevisionStore>();
    auto chain = jr::ChainManager{store};

    // -- Commit three versions ------------------------------------------------
    chain.commit("gateway", jr::parse(R"({
        "listen": {"port": 80},
        "upstreams": ["10.0.0.1", "10.0.0.2"],
        "timeout_ms": 1500
    })"), "alice");

    chain.commit("gateway", jr::parse(R"({
        "listen": {"port": 443, "tls": true},
        "upstreams": ["10.0.0.1", "10.0.0.2", "10.0.0.3"],
        "timeout_ms": 1500
    })"), "bob");

    auto v3 = chain.commit("gateway", jr::parse(R"({
        "listen": {"port": 443, "tls": true},
        "upstreams": ["10.0.0.1"]
    })"), "carol");

    std::printf("Head: version %llu\n", static_cast<unsigned long long>(v3.version));
    std::printf("Edits in v3: %s\n", jr::dump_edits(v3.edits).c_str());

    // -- History --------------------------------------------------------------
    std::printf("\nHistory:\n");
    for (const auto& entry : chain.history("gateway")) {
        std::printf("  v%llu by %-6s %zu edit(s)%s\n",
                    static_cast<unsigned long long>(entry.version), entry.author.c_str(),
                    entry.edit_count, entry.snapshot ? " [snapshot]" : "");
    }

    // -- Reconstruct an old version -------------------------------------------
    std::printf("\nVersion 1:\n%s\n", jr::dump(chain.reconstruct("gateway", 1), 2).c_str());

    // -- Diff across several versions -----------------------------------------
    auto edits = chain.diff_between("gateway", 1, 3);
    std::printf("\nDiff v1 -> v3 as JSON Patch:\n%s\n",
                jr::to_json_patch(edits).dump(2).c_str());

    // -- Rollback appends a new version equal to an old one -------------------
    auto rolled = chain.rollback("gateway", 2, "dave");
    std::printf("\nRolled back to v2 as v%llu; equal to v2: %s\n",
                static_cast<unsigned long long>(rolled.version),
                chain.reconstruct("gateway", rolled.version) == chain.reconstruct("gateway", 2)
                    ? "yes" : "no");

    // -- Errors are typed -----------------------------------------------------
    try {
        static_cast<void>(chain.reconstruct("gateway", 99));
    } catch (const jr::Exception& e) {
        std::printf("\n%s: %s\n", std::string{jr::to_string_view(e.kind())}.c_str(), e.what());
    }

    // -- edits_only keeps full documents only at snapshots --------------------
    auto lean_store = std::make_shared<jr::MemoryRevisionStore>();
    auto options = jr::ChainOptions{};
    options.mode = jr::StorageMode::edits_only;
    options.snapshot_interval = 10;
    auto lean = jr::ChainManager{lean_store, options};
    auto full_store = std::make_shared<jr::MemoryRevisionStore>();
    auto full = jr::ChainManager{full_store};

    for (int i = 0; i < 25; ++i) {
        auto doc = jr::parse(R"({"replicas":)" + std::to_string(i) +
                             R"(,"image":"registry.local/api:1.4","env":{"LOG":"info"}})");
        lean.commit("api", doc, "ci");
        full.commit("api", doc, "ci");
    }
    std::printf("\n25 versions: full_documents %zu bytes, edits_only %zu bytes\n",
                full_store->stored_bytes("api"), lean_store->stored_bytes("api"));
    std::printf("Chain verified: %s\n", lean.verify("api").ok() ? "ok" : "FAILED");

    std::printf("Done.\n");
    return 0;
}
