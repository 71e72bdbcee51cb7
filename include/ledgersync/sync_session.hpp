/// @file sync_session.hpp
/// @brief SyncSession: the per-replica sync state machine.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/change_buffer.hpp>
#include <ledgersync/clock.hpp>
#include <ledgersync/config.hpp>
#include <ledgersync/crypto.hpp>
#include <ledgersync/merge_applier.hpp>
#include <ledgersync/metadata.hpp>
#include <ledgersync/schema.hpp>
#include <ledgersync/store.hpp>
#include <ledgersync/transport.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace ledgersync {

/// Phase of a sync round.
enum class SyncState : std::uint8_t {
    idle,
    sending,
    awaiting_remote,
    applying,
    error,
};

constexpr auto to_string_view(SyncState state) noexcept -> std::string_view {
    switch (state) {
        case SyncState::idle:            return "idle";
        case SyncState::sending:         return "sending";
        case SyncState::awaiting_remote: return "awaiting_remote";
        case SyncState::applying:        return "applying";
        case SyncState::error:           return "error";
    }
    return "unknown";
}

/// A fully decoded backlog, ready to apply.
struct RemoteBatch {
    ChangeSet records;                             ///< Sorted by timestamp.
    std::optional<LogicalTimestamp> max_timestamp; ///< Highest timestamp in records.
};

/// Orchestrates one replica's exchange with the relay.
///
/// Owns the replica's config, its LogicalClock and, once enabled, its
/// EncryptionContext. The persisted clock is only saved after the records
/// it covers are durably applied.
///
/// A round moves idle -> sending -> awaiting_remote -> applying -> idle.
/// Any failure leaves the session in error until reset(). Before applying
/// starts, abandon() returns to idle without touching the store or the
/// clock.
///
/// Not thread-safe; serialize rounds and commits per replica.
class SyncSession {
public:
    /// Load (or create) the replica clock and read the config from metadata.
    /// @throws UnsupportedSchemaError if the store lacks a declared dataset
    ///         or column.
    SyncSession(LocalStore& store, ClockStore& clocks, MetadataStore& metadata,
                RelayTransport& relay, const Schema& schema = ledger_schema(),
                WallClock wall = system_wall_clock());

    auto state() const -> SyncState { return state_; }
    auto config() const -> const ReplicaConfig& { return config_; }
    auto clock() const -> const LogicalClock& { return clock_; }
    auto client_id() const -> const ClientId& { return clock_.client_id(); }
    auto encrypted() const -> bool { return encryption_.has_value(); }

    // -- Setup ----------------------------------------------------------------

    /// Join a relay sync group and record it in metadata.
    void register_group(std::string group_id);

    /// Set up the encryption key from a password.
    ///
    /// A replica without a key id creates one (new key id and salt) and
    /// registers it with a test payload. Otherwise the salt is fetched and
    /// the password is checked against the registered test payload.
    /// @throws KeyDerivationError on an empty or wrong password, or if the
    ///         registry does not know the replica's key.
    void enable_encryption(std::string_view password, KeyRegistry& keys);

    // -- Local edits ----------------------------------------------------------

    /// Flush the buffer, apply the records locally, persist the clock and
    /// send them if the replica has a group id.
    ///
    /// With a group id the records are queued in the store in the same
    /// transaction that applies them, and leave the queue only once the
    /// relay accepts them. If sending fails the commit still stands and the
    /// records go out with the next send() or sync().
    /// @return The records committed.
    auto commit(ChangeBuffer& buffer) -> ChangeSet;

    // -- Round phases ---------------------------------------------------------

    /// Encode, encrypt if enabled and send records to the relay. A no-op
    /// without a group id.
    /// @throws TransportError, leaving the session in error.
    void send(std::span<const ChangeRecord> records);

    /// Send every queued record, then clear the queue.
    /// @return The number of records sent; zero without a group id.
    /// @throws TransportError, leaving the session in error and the
    ///         records queued.
    auto send() -> std::size_t;

    /// Fetch, decrypt and decode the relay backlog. Nothing is applied and
    /// the clock is unchanged. Leaves the session awaiting_remote.
    /// @throws TransportError, DecryptionError or DecodeError, leaving the
    ///         session in error.
    auto receive() -> RemoteBatch;

    /// Apply a received batch, then advance and persist the clock.
    auto apply(const RemoteBatch& batch) -> ApplyStats;

    /// Drop a round that has not started applying.
    void abandon();

    /// Leave the error state.
    void reset();

    /// Commit the buffer, then receive and apply the backlog.
    ///
    /// Abandons (and returns empty stats) if a stop is requested before
    /// applying starts.
    auto sync(ChangeBuffer& buffer, std::stop_token stop = {}) -> ApplyStats;

    /// Send queued records, then receive and apply the backlog.
    auto sync(std::stop_token stop = {}) -> ApplyStats;

private:
    void require(SyncState expected, std::string_view operation) const;
    void fail(const std::exception& e);
    void push(std::span<const ChangeRecord> records);
    auto pull() -> RemoteBatch;
    auto round(std::stop_token stop) -> ApplyStats;

    const Schema& schema_;
    LocalStore& store_;
    ClockStore& clocks_;
    MetadataStore& metadata_;
    RelayTransport& relay_;
    MergeApplier applier_;
    ReplicaConfig config_;
    LogicalClock clock_;
    std::optional<EncryptionContext> encryption_;
    SyncState state_ = SyncState::idle;
};

}  // namespace ledgersync
