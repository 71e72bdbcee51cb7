/// @file clock.hpp
/// @brief Hybrid logical clock: ReplicaClock state and the LogicalClock driver.

#pragma once

#include <ledgersync/types.hpp>

#include <cstdint>
#include <functional>

namespace ledgersync {

/// Source of wall-clock milliseconds since the Unix epoch.
///
/// The only non-deterministic input of the clock. Tests substitute a
/// fake that returns a controlled value.
using WallClock = std::function<std::uint64_t()>;

/// The process wall clock (std::chrono::system_clock).
auto system_wall_clock() -> WallClock;

/// Largest value the logical counter may take.
inline constexpr std::uint32_t max_counter = 0xFFFF;

/// Per-replica persisted clock state.
///
/// The checkpoint from which outgoing records are issued and against
/// which incoming records advance the local logical time. Persisted
/// through a ClockStore, outside the replicated tables.
struct ReplicaClock {
    ClientId client_id;         ///< This replica's identity.
    LogicalTimestamp last;      ///< The most recent timestamp issued or observed.

    auto operator==(const ReplicaClock&) const -> bool = default;
};

/// Create the clock for a freshly initialized replica (random client id).
auto make_replica_clock() -> ReplicaClock;

/// Create a clock with a known client id, starting at the null timestamp.
auto make_replica_clock(ClientId client_id) -> ReplicaClock;

/// Advance for a local event.
///
/// millis = max(wall_millis, last.millis). The counter increments when
/// millis is unchanged and resets to 0 otherwise. The result carries
/// last.client_id.
/// @throws ClockError if the counter would exceed max_counter.
auto tick(const LogicalTimestamp& last, std::uint64_t wall_millis) -> LogicalTimestamp;

/// Advance on observing a remote timestamp.
///
/// millis = max(local.millis, remote.millis, wall_millis). If millis
/// equals local.millis the counter is max(local, remote) + 1; if it only
/// equals remote.millis the counter is remote + 1; otherwise 0. The
/// result carries local.client_id and is strictly greater than both
/// inputs' (millis, counter) pairs.
/// @throws ClockError if the counter would exceed max_counter.
auto merge(const LogicalTimestamp& local, const LogicalTimestamp& remote,
           std::uint64_t wall_millis) -> LogicalTimestamp;

/// Drives a ReplicaClock against a wall clock.
///
/// Not thread-safe; one LogicalClock per replica, owned by its
/// SyncSession.
class LogicalClock {
public:
    /// Construct from persisted state and a wall clock source.
    explicit LogicalClock(ReplicaClock state, WallClock wall = system_wall_clock());

    /// Issue a timestamp for a local event and record it as the last.
    auto now() -> LogicalTimestamp;

    /// Merge a remote timestamp into the local state.
    auto receive(const LogicalTimestamp& remote) -> LogicalTimestamp;

    /// The current persisted-form state.
    auto state() const -> const ReplicaClock& { return state_; }

    /// This replica's identity.
    auto client_id() const -> const ClientId& { return state_.client_id; }

    /// Read the injected wall clock.
    auto wall_millis() const -> std::uint64_t { return wall_(); }

private:
    ReplicaClock state_;
    WallClock wall_;
};

}  // namespace ledgersync
