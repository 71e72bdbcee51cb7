#include <ledgersync/clock.hpp>
#include <ledgersync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>

namespace ledgersync {

namespace {

auto checked_counter(std::uint32_t counter) -> std::uint16_t {
    if (counter > max_counter) {
        throw ClockError{"logical counter overflow (" + std::to_string(counter) + ")"};
    }
    return static_cast<std::uint16_t>(counter);
}

}  // anonymous namespace

auto system_wall_clock() -> WallClock {
    return [] {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    };
}

auto make_replica_clock() -> ReplicaClock {
    return make_replica_clock(make_client_id());
}

auto make_replica_clock(ClientId client_id) -> ReplicaClock {
    auto last = LogicalTimestamp{.millis = 0, .counter = 0, .client_id = client_id};
    return ReplicaClock{.client_id = std::move(client_id), .last = std::move(last)};
}

auto tick(const LogicalTimestamp& last, std::uint64_t wall_millis) -> LogicalTimestamp {
    const auto millis = std::max(wall_millis, last.millis);
    const auto counter = (millis == last.millis)
        ? checked_counter(std::uint32_t{last.counter} + 1)
        : std::uint16_t{0};
    return LogicalTimestamp{.millis = millis, .counter = counter, .client_id = last.client_id};
}

auto merge(const LogicalTimestamp& local, const LogicalTimestamp& remote,
           std::uint64_t wall_millis) -> LogicalTimestamp {
    const auto millis = std::max({local.millis, remote.millis, wall_millis});

    auto counter = std::uint32_t{0};
    if (millis == local.millis) {
        counter = std::uint32_t{std::max(local.counter, remote.counter)} + 1;
    } else if (millis == remote.millis) {
        counter = std::uint32_t{remote.counter} + 1;
    }

    if (remote.millis > wall_millis) {
        SPDLOG_DEBUG("clock skew absorbed: remote {} is {} ms ahead of wall clock",
                     remote.client_id, remote.millis - wall_millis);
    }

    return LogicalTimestamp{
        .millis = millis,
        .counter = checked_counter(counter),
        .client_id = local.client_id,
    };
}

LogicalClock::LogicalClock(ReplicaClock state, WallClock wall)
    : state_{std::move(state)}, wall_{std::move(wall)} {
    // Timestamps issued from here on must carry this replica's identity.
    state_.last.client_id = state_.client_id;
}

auto LogicalClock::now() -> LogicalTimestamp {
    state_.last = tick(state_.last, wall_());
    return state_.last;
}

auto LogicalClock::receive(const LogicalTimestamp& remote) -> LogicalTimestamp {
    state_.last = merge(state_.last, remote, wall_());
    return state_.last;
}

}  // namespace ledgersync
