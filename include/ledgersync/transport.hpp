/// @file transport.hpp
/// @brief Collaborator interfaces for the relay and the key registry.

#pragma once

#include <ledgersync/crypto.hpp>
#include <ledgersync/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ledgersync {

/// One change set as stored by the relay.
struct WirePayload {
    std::string timestamp;               ///< Highest record timestamp, canonical string form.
    Bytes content;                       ///< Encoded change set, encrypted iff meta is set.
    std::optional<EncryptionMeta> meta;  ///< Decryption parameters.

    auto operator==(const WirePayload&) const -> bool = default;
};

/// The relay server that stores and redistributes change sets.
///
/// Calls block. Implementations report every failure as TransportError;
/// retrying is the caller's decision.
class RelayTransport {
public:
    virtual ~RelayTransport() = default;

    /// Append a change set to a sync group.
    virtual void send_change_set(const std::string& group_id,
                                 const std::optional<std::string>& key_id,
                                 const WirePayload& payload) = 0;

    /// Every change set of the group the relay has not yet delivered to
    /// the client named by since.client_id.
    virtual auto fetch_backlog(const std::string& group_id, const LogicalTimestamp& since)
        -> std::vector<WirePayload> = 0;
};

/// What the key registry keeps for an encrypted ledger file.
struct KeyInfo {
    std::string key_id;                         ///< Identity of the current key.
    Bytes salt;                                 ///< Salt the key was derived with.
    std::optional<EncryptedPayload> test;       ///< Known content encrypted under the key.

    auto operator==(const KeyInfo&) const -> bool = default;
};

/// Remote registry of encryption keys, one per ledger file.
///
/// The password never leaves the replica. The registry holds the salt and
/// a test payload that lets another replica check a password before
/// using the key.
class KeyRegistry {
public:
    virtual ~KeyRegistry() = default;

    /// Register a new key for a file, replacing any previous one.
    virtual void create_key(const std::string& file_id, const KeyInfo& key) = 0;

    /// The file's current key, or nullopt if it has none.
    virtual auto get_key(const std::string& file_id) -> std::optional<KeyInfo> = 0;
};

}  // namespace ledgersync
