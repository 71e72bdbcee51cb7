/// @file config.hpp
/// @brief ReplicaConfig: identity and sync settings of one replica.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace ledgersync {

/// Configuration of a replica, as kept in its metadata.json.
struct ReplicaConfig {
    std::string file_id;                   ///< Identity of the ledger file (cloudFileId).
    std::optional<std::string> group_id;   ///< Relay sync group; absent means local only.
    std::optional<std::string> key_id;     ///< Encryption key; absent means plaintext.
    std::size_t compress_threshold = 256;  ///< Bodies larger than this are deflated.

    /// Read `cloudFileId`, `groupId` and `encryptKeyId`; missing or null
    /// keys leave the defaults.
    static auto from_metadata(const nlohmann::json& metadata) -> ReplicaConfig;

    /// The metadata keys this config owns, ready for MetadataStore::patch().
    auto to_metadata() const -> nlohmann::json;

    auto operator==(const ReplicaConfig&) const -> bool = default;
};

}  // namespace ledgersync
