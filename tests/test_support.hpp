// In-memory collaborators shared by the tests.

#pragma once

#include <ledgersync/clock.hpp>
#include <ledgersync/error.hpp>
#include <ledgersync/reconcile.hpp>
#include <ledgersync/transport.hpp>
#include <ledgersync/types.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ledgersync::testing {

inline const ClientId client_a = "aaaaaaaaaaaaaaaa";
inline const ClientId client_b = "bbbbbbbbbbbbbbbb";
inline const ClientId client_c = "cccccccccccccccc";

/// Controllable wall clock. Every read advances it by step.
struct FakeWallClock {
    std::uint64_t now = 1'700'000'000'000;
    std::uint64_t step = 0;

    auto source() -> WallClock {
        return [this] {
            auto t = now;
            now += step;
            return t;
        };
    }
};

/// Relay that keeps every change set. It serves a client the whole
/// backlog of other clients on every fetch, relying on the applier to
/// ignore what was already applied.
class InMemoryRelay : public RelayTransport {
public:
    struct Entry {
        std::string group_id;
        std::optional<std::string> key_id;
        WirePayload payload;
        ClientId sender;
    };

    void send_change_set(const std::string& group_id, const std::optional<std::string>& key_id,
                         const WirePayload& payload) override {
        if (fail_sends) throw TransportError{"relay unreachable"};
        auto ts = parse_timestamp(payload.timestamp);
        if (!ts) throw TransportError{"relay rejected timestamp " + payload.timestamp};
        entries.push_back(Entry{group_id, key_id, payload, ts->client_id});
    }

    auto fetch_backlog(const std::string& group_id, const LogicalTimestamp& since)
        -> std::vector<WirePayload> override {
        if (fail_fetches) throw TransportError{"relay timed out"};
        fetch_cursors.push_back(since);
        auto result = std::vector<WirePayload>{};
        for (const auto& entry : entries) {
            if (entry.group_id != group_id || entry.sender == since.client_id) continue;
            result.push_back(entry.payload);
        }
        return result;
    }

    std::vector<Entry> entries;
    std::vector<LogicalTimestamp> fetch_cursors;
    bool fail_sends = false;
    bool fail_fetches = false;
};

/// Key registry held in a map.
class InMemoryKeyRegistry : public KeyRegistry {
public:
    void create_key(const std::string& file_id, const KeyInfo& key) override {
        keys.insert_or_assign(file_id, key);
    }

    auto get_key(const std::string& file_id) -> std::optional<KeyInfo> override {
        auto it = keys.find(file_id);
        if (it == keys.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, KeyInfo> keys;
};

/// Bank feed returning a fixed result, filtered by start date.
class InMemoryBankFeed : public BankFeed {
public:
    auto fetch(const Entity& /*account*/, DateInt start_date) -> FeedResult override {
        requested_start_dates.push_back(start_date);
        auto out = result;
        std::erase_if(out.transactions, [&](const ExternalTransaction& t) {
            return t.date < start_date;
        });
        return out;
    }

    FeedResult result;
    std::vector<DateInt> requested_start_dates;
};

}  // namespace ledgersync::testing
