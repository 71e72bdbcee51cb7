// replica_demo: two replicas syncing an encrypted ledger through a relay
//
// Demonstrates: SyncSession, ChangeBuffer, enable_encryption, SqliteStore,
//               JsonFileMetadataStore, concurrent edits resolving by timestamp
//
// Build: cmake --build build
// Run:   ./build/replica_demo [--verbose]

#include <ledgersync/ledgersync.hpp>

#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ls = ledgersync;

// A relay that keeps every change set in memory and hands each replica the
// change sets of the others.
class LoopbackRelay : public ls::RelayTransport {
public:
    void send_change_set(const std::string& group_id, const std::optional<std::string>&,
                         const ls::WirePayload& payload) override {
        auto ts = ls::parse_timestamp(payload.timestamp);
        if (!ts) throw ls::TransportError{"bad timestamp " + payload.timestamp};
        log_.push_back({group_id, ts->client_id, payload});
    }

    auto fetch_backlog(const std::string& group_id, const ls::LogicalTimestamp& since)
        -> std::vector<ls::WirePayload> override {
        auto out = std::vector<ls::WirePayload>{};
        for (const auto& [group, sender, payload] : log_) {
            if (group == group_id && sender != since.client_id) out.push_back(payload);
        }
        return out;
    }

private:
    struct Entry {
        std::string group;
        ls::ClientId sender;
        ls::WirePayload payload;
    };
    std::vector<Entry> log_;
};

class LoopbackKeys : public ls::KeyRegistry {
public:
    void create_key(const std::string& file_id, const ls::KeyInfo& key) override {
        keys_.insert_or_assign(file_id, key);
    }
    auto get_key(const std::string& file_id) -> std::optional<ls::KeyInfo> override {
        auto it = keys_.find(file_id);
        if (it == keys_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, ls::KeyInfo> keys_;
};

static void print_amount(const char* label, const ls::LocalStore& store, const std::string& row) {
    auto entity = store.get("transactions", row);
    auto amount = entity ? ls::get_scalar<std::int64_t>(entity->get("amount")) : std::nullopt;
    if (amount) {
        std::printf("  %s: %s amount = %lld\n", label, row.c_str(),
                    static_cast<long long>(*amount));
    } else {
        std::printf("  %s: %s not present\n", label, row.c_str());
    }
}

int main(int argc, char** argv) {
    spdlog::set_level(argc > 1 && std::string{argv[1]} == "--verbose" ? spdlog::level::debug
                                                                     : spdlog::level::warn);

    namespace fs = std::filesystem;
    const auto dir = fs::temp_directory_path() / "ledgersync_replica_demo";
    fs::remove_all(dir);
    fs::create_directories(dir);

    auto relay = LoopbackRelay{};
    auto keys = LoopbackKeys{};

    auto store_a = ls::SqliteStore{(dir / "a.sqlite").string()};
    auto meta_a = ls::JsonFileMetadataStore{dir / "a.json"};
    meta_a.patch(nlohmann::json{{"cloudFileId", "demo-file"}});
    auto a = ls::SyncSession{store_a, store_a, meta_a, relay};

    auto store_b = ls::SqliteStore{(dir / "b.sqlite").string()};
    auto meta_b = ls::JsonFileMetadataStore{dir / "b.json"};
    meta_b.patch(nlohmann::json{{"cloudFileId", "demo-file"}});

    // --- Scenario 1: replica A creates the key and shares a transaction ---
    std::printf("=== Scenario 1: encrypted one-way sync ===\n");
    a.register_group("demo-group");
    a.enable_encryption("correct horse battery staple", keys);
    std::printf("  A is replica %s with key %s\n", a.client_id().c_str(),
                a.config().key_id->c_str());

    // B learns the key id the way a second device would, from shared metadata.
    meta_b.patch(nlohmann::json{{"groupId", "demo-group"}, {"encryptKeyId", *a.config().key_id}});
    auto b = ls::SyncSession{store_b, store_b, meta_b, relay};
    try {
        b.enable_encryption("wrong password", keys);
    } catch (const ls::KeyDerivationError& e) {
        std::printf("  B rejected a bad password: %s\n", e.what());
    }
    b.enable_encryption("correct horse battery staple", keys);

    auto buffer_a = ls::ChangeBuffer{};
    buffer_a.record_entity("transactions", "coffee", {
        {"amount", std::int64_t{-450}},
        {"notes", std::string{"flat white"}},
        {"tombstone", false},
    });
    a.sync(buffer_a);
    auto stats = b.sync();
    std::printf("  B applied %zu record(s)\n", stats.applied);
    print_amount("A", store_a, "coffee");
    print_amount("B", store_b, "coffee");

    // --- Scenario 2: concurrent edits, the later write wins everywhere ---
    std::printf("\n=== Scenario 2: concurrent edits ===\n");
    auto buffer_b = ls::ChangeBuffer{};
    buffer_a.record("transactions", "coffee", "amount", std::int64_t{-500});
    a.commit(buffer_a);
    buffer_b.record("transactions", "coffee", "amount", std::int64_t{-475});
    b.commit(buffer_b);

    a.sync();
    b.sync();
    print_amount("A", store_a, "coffee");
    print_amount("B", store_b, "coffee");

    // --- Scenario 3: preferences travel to metadata ---
    std::printf("\n=== Scenario 3: preferences ===\n");
    buffer_a.record("prefs", "budgetName", "value", std::string{"Household"});
    a.sync(buffer_a);
    b.sync();
    std::printf("  B metadata: %s\n", meta_b.get().dump().c_str());

    std::printf("\nFiles left in %s\n", dir.string().c_str());
    return 0;
}
