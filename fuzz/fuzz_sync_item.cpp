// Fuzz target for parse_sync_item(): exercises the JSON record decoder,
// including CRDT snapshots, envelopes and payload descriptors.
// Any record that parses is serialized again to verify consistency.

#include <peersync/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    auto item = peersync::parse_sync_item(text);
    if (item) {
        // Round-trip: if parse succeeded, dump and value() must not crash
        auto dumped = nlohmann::json(*item).dump();
        (void)dumped;
        if (item->crdt) {
            auto value = item->crdt->value();
            (void)value;
        }
    }
    return 0;
}
