// Fuzz target for decode_event() — exercises the transport codec for the
// three event variants, including unknown discriminators.

#include <issuehub-cpp/error.hpp>
#include <issuehub-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        auto event = issuehub_cpp::decode_event(text);
        auto encoded = issuehub_cpp::encode_event(event);
        (void)encoded;
    } catch (const issuehub_cpp::Exception&) {
        // Rejected input.
    }
    return 0;
}
