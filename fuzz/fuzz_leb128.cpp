// Fuzz target for the LEB128 codec — exercises decode edge cases
// (overflow, truncation, maximum-length encodings) and checks that every
// decoded value re-encodes to a prefix that decodes the same way.

#include "encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace enc = jsonrev_cpp::encoding;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    if (auto u = enc::decode_uleb128(span)) {
        auto again = enc::decode_uleb128(enc::encode_uleb128(u->value));
        if (!again || again->value != u->value) std::abort();
    }

    if (auto s = enc::decode_sleb128(span)) {
        auto again = enc::decode_sleb128(enc::encode_sleb128(s->value));
        if (!again || again->value != s->value) std::abort();
    }

    return 0;
}
