// Fuzz target for chunk decompression: feeds arbitrary bytes to the raw
// DEFLATE decoder with a small output limit.

#include "transfer/compression.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto result = peersync::transfer::deflate_decompress(span, 1024 * 1024);
    (void)result;

    return 0;
}
