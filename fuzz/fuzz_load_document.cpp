// Fuzz target for decode_document() — exercises the persisted-document codec
// and the invariant checks. Any accepted document must re-encode to text that
// decodes to the same value.

#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto doc = issuehub_cpp::decode_document(text);
        if (issuehub_cpp::decode_document(issuehub_cpp::encode_document(doc)) != doc) {
            std::abort();
        }
    } catch (const issuehub_cpp::Exception&) {
        // Rejected input.
    }
    return 0;
}
