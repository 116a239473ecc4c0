/// @file encryption.hpp
/// @brief The encryption capability consumed by the sync engine.

#pragma once

#include <peersync/config.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace peersync {

/// Key-derivation parameters recorded alongside a ciphertext.
struct KdfParams {
    std::string algorithm;
    std::string salt;        ///< Encoded as the capability chooses (e.g. base64).
    std::uint32_t iterations = 0;

    auto operator==(const KdfParams&) const -> bool = default;
};

/// A sealed payload. Field encodings are owned by the Encryption
/// implementation; the engine treats them as opaque strings.
struct EncryptedEnvelope {
    std::string algorithm;
    std::string iv;
    std::string auth_tag;
    std::string ciphertext;
    std::optional<KdfParams> kdf;
    std::string key_id;
    std::uint32_t version = 1;

    auto operator==(const EncryptedEnvelope&) const -> bool = default;
};

/// Symmetric encryption capability.
///
/// The engine never inspects keys; it calls encrypt() before a body leaves
/// the node and decrypt() after it arrives. Implementations report failure
/// by throwing SyncError (encryption_error).
class Encryption {
public:
    virtual ~Encryption() = default;

    /// Derive keys from a password. Must be called before encrypt/decrypt.
    virtual void initialize(const std::string& password) = 0;

    virtual auto is_ready() const -> bool = 0;

    virtual auto encrypt(const std::string& plaintext) -> EncryptedEnvelope = 0;

    virtual auto decrypt(const EncryptedEnvelope& envelope) -> std::string = 0;

    virtual void update_config(const EncryptionConfig& config) = 0;

    /// Forget all key material.
    virtual void destroy() = 0;
};

}  // namespace peersync
