/// @file json.hpp
/// @brief nlohmann/json interoperability for ledgersync.
///
/// Provides ADL serialization (to_json/from_json) for the types that
/// cross a JSON boundary: the persisted clock, encryption metadata,
/// preference values and change records in diagnostics.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/clock.hpp>
#include <ledgersync/crypto.hpp>
#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>

#include <nlohmann/json.hpp>

namespace ledgersync {

// -- ScalarValue (variant) ----------------------------------------------------

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const ScalarValue& sv);
void from_json(const nlohmann::json& j, ScalarValue& sv);

// -- Timestamps (canonical string form) ---------------------------------------

void to_json(nlohmann::json& j, const LogicalTimestamp& ts);
void from_json(const nlohmann::json& j, LogicalTimestamp& ts);

// -- Compound types -----------------------------------------------------------

/// `{"timestamp": "<ts>"}`; the client id is recovered from the timestamp.
void to_json(nlohmann::json& j, const ReplicaClock& clock);
void from_json(const nlohmann::json& j, ReplicaClock& clock);

/// `{"keyId", "algorithm", "iv", "authTag"}` with base64 binary fields.
void to_json(nlohmann::json& j, const EncryptionMeta& meta);
void from_json(const nlohmann::json& j, EncryptionMeta& meta);

void to_json(nlohmann::json& j, const ChangeRecord& record);
void from_json(const nlohmann::json& j, ChangeRecord& record);

}  // namespace ledgersync
