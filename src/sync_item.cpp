#include <peersync/sync_item.hpp>

#include "crypto/sha256.hpp"

namespace peersync {

auto compute_content_hash(const nlohmann::json& content) -> std::string {
    return crypto::sha256_hex(content.dump());
}

}  // namespace peersync
