#include <peersync/types.hpp>

#include <array>
#include <chrono>
#include <cstring>
#include <random>

namespace peersync {

auto now_millis() -> Timestamp {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
}

auto random_hex(std::size_t num_bytes) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    thread_local auto engine = std::mt19937_64{std::random_device{}()};
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};

    auto result = std::string{};
    result.reserve(num_bytes * 2);
    for (std::size_t i = 0; i < num_bytes; ++i) {
        auto b = dist(engine);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

auto generate_node_id() -> NodeId {
    return random_hex(16);
}

auto to_bytes(std::string_view s) -> Bytes {
    auto result = Bytes(s.size());
    if (!s.empty()) std::memcpy(result.data(), s.data(), s.size());
    return result;
}

auto to_string(std::span<const std::byte> bytes) -> std::string {
    auto result = std::string(bytes.size(), '\0');
    if (!bytes.empty()) std::memcpy(result.data(), bytes.data(), bytes.size());
    return result;
}

}  // namespace peersync
