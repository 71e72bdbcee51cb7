/// @file crypto.hpp
/// @brief Crypto envelope: password-based key derivation and AEAD for payloads.

#pragma once

#include <ledgersync/types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace ledgersync {

inline constexpr std::size_t master_key_size = 32;   ///< AES-256 key length.
inline constexpr std::size_t salt_size = 32;         ///< Length of make_salt() output.
inline constexpr std::size_t iv_size = 12;           ///< GCM nonce length.
inline constexpr std::size_t auth_tag_size = 16;     ///< GCM tag length.
inline constexpr int pbkdf2_iterations = 10000;      ///< PBKDF2-HMAC-SHA512 rounds.

/// The only AEAD algorithm this library produces or accepts.
inline constexpr std::string_view aead_algorithm = "aes-256-gcm";

/// Parameters needed to decrypt a payload, transmitted beside it.
struct EncryptionMeta {
    std::string key_id;                              ///< Key identity, bound as associated data.
    std::string algorithm{aead_algorithm};           ///< AEAD algorithm name.
    Bytes iv;                                        ///< Per-message random nonce.
    Bytes auth_tag;                                  ///< GCM authentication tag.

    auto operator==(const EncryptionMeta&) const -> bool = default;
};

/// Ciphertext plus its metadata.
struct EncryptedPayload {
    Bytes value;          ///< Ciphertext, same length as the plaintext.
    EncryptionMeta meta;  ///< Decryption parameters.

    auto operator==(const EncryptedPayload&) const -> bool = default;
};

/// Generate a random salt for a new key.
auto make_salt() -> Bytes;

/// Generate a new key id (UUID v4).
auto make_key_id() -> std::string;

/// Derive a master key from a password and salt (PBKDF2-HMAC-SHA512).
///
/// Deterministic for a given (password, salt).
/// @throws KeyDerivationError if the password or salt is empty.
auto derive_key(std::string_view password, std::span<const std::byte> salt) -> Bytes;

/// Encrypt with AES-256-GCM, binding key_id as associated data.
/// @throws Error(invalid_operation) if the key has the wrong length.
auto encrypt(std::string_view key_id, std::span<const std::byte> master_key,
             std::span<const std::byte> plaintext) -> EncryptedPayload;

/// Decrypt and authenticate.
///
/// Never returns unauthenticated data.
/// @throws DecryptionError on tag mismatch (tampered ciphertext, wrong key
///         or altered key id) or on malformed metadata.
auto decrypt(std::span<const std::byte> master_key, std::span<const std::byte> ciphertext,
             const EncryptionMeta& meta) -> Bytes;

/// A replica's encryption key, held in memory for the session.
///
/// The master key is never persisted; it is wiped when the context is
/// destroyed. key_id and salt are what the key registry stores.
class EncryptionContext {
public:
    /// Wrap an already derived key.
    EncryptionContext(std::string key_id, Bytes salt, Bytes master_key);

    /// Derive the master key from a password.
    /// @throws KeyDerivationError
    static auto derive(std::string key_id, Bytes salt, std::string_view password)
        -> EncryptionContext;

    ~EncryptionContext();

    EncryptionContext(EncryptionContext&&) noexcept;
    auto operator=(EncryptionContext&&) noexcept -> EncryptionContext&;
    EncryptionContext(const EncryptionContext&) = delete;
    auto operator=(const EncryptionContext&) -> EncryptionContext& = delete;

    auto key_id() const -> const std::string& { return key_id_; }
    auto salt() const -> const Bytes& { return salt_; }

    /// Encrypt under this context's key id.
    auto encrypt(std::span<const std::byte> plaintext) const -> EncryptedPayload;

    /// Decrypt a payload issued under this context's key id.
    /// @throws DecryptionError if meta names another key or fails to verify.
    auto decrypt(std::span<const std::byte> ciphertext, const EncryptionMeta& meta) const -> Bytes;

private:
    void wipe() noexcept;

    std::string key_id_;
    Bytes salt_;
    Bytes master_key_;
};

}  // namespace ledgersync
