// Fuzz target for decode_fields() — exercises the wire decoder on arbitrary
// JSON. Anything that decodes must encode again without error unless it
// holds a shape only the encoder rejects.

#include <firestore-cpp/codec.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto wire = nlohmann::json::parse(data, data + size, nullptr, false);
    if (wire.is_discarded()) return 0;

    auto fields = firestore_cpp::decode_fields(wire);
    if (fields) {
        auto again = firestore_cpp::encode_fields(*fields);
        (void)again;
    }
    return 0;
}
