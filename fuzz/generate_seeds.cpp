// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself — just a corpus generator.

#include <jsonrev-cpp/jsonrev.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace jr = jsonrev_cpp;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static void write_text_seed(const std::string& path, const std::string& text) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << text;
}

int main() {
    namespace fs = std::filesystem;
    const auto revisions = std::string{"fuzz/corpus/decode_revision"};
    const auto documents = std::string{"fuzz/corpus/parse"};
    fs::create_directories(revisions);
    fs::create_directories(documents);

    // Seed 1: first revision of a chain (snapshot, no edits)
    auto store = std::make_shared<jr::MemoryRevisionStore>();
    auto chain = jr::ChainManager{store};
    auto first = chain.commit("seed", jr::parse(R"({"port":80,"hosts":["a","b"]})"), "seed");
    write_seed(revisions + "/seed_snapshot.bin", jr::encode_revision(first));

    // Seed 2: a revision with edits and no document
    auto second = chain.commit("seed", jr::parse(R"({"port":443,"hosts":["a"],"tls":true})"), "seed");
    second.document.reset();
    write_seed(revisions + "/seed_edits.bin", jr::encode_revision(second));

    // Seed 3: a body large enough to be deflated
    {
        auto items = jr::Array{};
        for (int i = 0; i < 64; ++i) items.emplace_back("upstream-" + std::to_string(i));
        auto rev = chain.commit("seed", jr::Value{jr::Object{{"hosts", std::move(items)}}}, "seed");
        write_seed(revisions + "/seed_deflated.bin", jr::encode_revision(rev));
    }

    // Seed 4: document pairs for the parse/diff target
    write_text_seed(documents + "/seed_objects.json",
                    "{\"a\":1,\"b\":[1,2,3]}\n{\"b\":[1,2],\"c\":{\"d\":1.50}}");
    write_text_seed(documents + "/seed_kinds.json", "[null,true,\"s\"]\n{\"k\":[]}");
    write_text_seed(documents + "/seed_escapes.json",
                    "{\"a/b\":{\"m~n\":\"\\u00e9\"}}\n{\"a/b\":{}}");

    return 0;
}
