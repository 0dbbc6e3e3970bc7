// Fuzz target for decode_revision() — exercises the chunk envelope,
// inflation and the revision body reader. Anything that decodes must
// encode and decode back to an equal revision.

#include <jsonrev-cpp/codec.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto rev = jsonrev_cpp::decode_revision(span);
    if (rev) {
        auto again = jsonrev_cpp::decode_revision(jsonrev_cpp::encode_revision(*rev));
        if (!again || *again != *rev) std::abort();
    }
    return 0;
}
