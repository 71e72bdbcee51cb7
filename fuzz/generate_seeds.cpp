// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <ledgersync/codec.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ls = ledgersync;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static auto at(std::uint64_t millis, std::uint16_t counter) -> ls::LogicalTimestamp {
    return ls::LogicalTimestamp{
        .millis = millis, .counter = counter, .client_id = "0123456789abcdef"};
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: empty change set
    write_seed(dir + "/seed_empty.bin", ls::encode_change_set({}));

    // Seed 2: one record of every value kind
    {
        auto records = ls::ChangeSet{
            {.dataset = "transactions", .row = "t1", .column = "amount",
             .value = std::int64_t{-1200}, .timestamp = at(1'700'000'000'000, 0)},
            {.dataset = "transactions", .row = "t1", .column = "notes",
             .value = std::string{"lunch"}, .timestamp = at(1'700'000'000'000, 1)},
            {.dataset = "transactions", .row = "t1", .column = "cleared",
             .value = true, .timestamp = at(1'700'000'000'000, 2)},
            {.dataset = "transactions", .row = "t1", .column = "category",
             .value = ls::Null{}, .timestamp = at(1'700'000'000'000, 3)},
            {.dataset = "prefs", .row = "budgetName", .column = "value",
             .value = std::string{"Household"}, .timestamp = at(1'700'000'000'001, 0)},
        };
        write_seed(dir + "/seed_kinds.bin", ls::encode_change_set(records));
    }

    // Seed 3: compressed body
    {
        auto records = ls::ChangeSet{};
        for (std::uint16_t i = 0; i < 64; ++i) {
            records.push_back({.dataset = "transactions", .row = "t" + std::to_string(i),
                               .column = "amount", .value = std::int64_t{i},
                               .timestamp = at(1'700'000'000'000, i)});
        }
        write_seed(dir + "/seed_compressed.bin",
                   ls::encode_change_set(records, {.compress_threshold = 0}));
    }

    return 0;
}
