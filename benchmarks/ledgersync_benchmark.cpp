// ledgersync benchmarks: throughput of the codec, envelope and applier.

#include <ledgersync/ledgersync.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace ledgersync;

static auto make_records(std::size_t n) -> ChangeSet {
    auto records = ChangeSet{};
    records.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        records.push_back(ChangeRecord{
            .dataset = "transactions",
            .row = "txn-" + std::to_string(i / 4),
            .column = (i % 2 == 0) ? "amount" : "notes",
            .value = (i % 2 == 0) ? ScalarValue{static_cast<std::int64_t>(i)}
                                  : ScalarValue{std::string{"groceries"}},
            .timestamp = LogicalTimestamp{
                .millis = 1'700'000'000'000 + i,
                .counter = 0,
                .client_id = "0123456789abcdef",
            },
        });
    }
    return records;
}

// =============================================================================
// Codec
// =============================================================================

static void bm_encode_change_set(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        auto bytes = encode_change_set(records);
        benchmark::DoNotOptimize(bytes);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_encode_change_set)->Range(8, 4096);

static void bm_decode_change_set(benchmark::State& state) {
    const auto bytes = encode_change_set(make_records(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto records = decode_change_set(bytes);
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_decode_change_set)->Range(8, 4096);

// =============================================================================
// Envelope
// =============================================================================

static void bm_encrypt_change_set(benchmark::State& state) {
    const auto context = EncryptionContext::derive(make_key_id(), make_salt(), "benchmark");
    const auto bytes = encode_change_set(make_records(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto sealed = context.encrypt(bytes);
        benchmark::DoNotOptimize(sealed);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(bytes.size()));
}
BENCHMARK(bm_encrypt_change_set)->Range(8, 4096);

static void bm_decrypt_change_set(benchmark::State& state) {
    const auto context = EncryptionContext::derive(make_key_id(), make_salt(), "benchmark");
    const auto sealed = context.encrypt(
        encode_change_set(make_records(static_cast<std::size_t>(state.range(0)))));
    for (auto _ : state) {
        auto plain = context.decrypt(sealed.value, sealed.meta);
        benchmark::DoNotOptimize(plain);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(sealed.value.size()));
}
BENCHMARK(bm_decrypt_change_set)->Range(8, 4096);

static void bm_derive_key(benchmark::State& state) {
    const auto salt = make_salt();
    for (auto _ : state) {
        auto key = derive_key("benchmark", salt);
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(bm_derive_key);

// =============================================================================
// Merge
// =============================================================================

static void bm_apply_fresh(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        auto store = MemoryStore{};
        auto metadata = MemoryMetadataStore{};
        auto applier = MergeApplier{ledger_schema(), store, metadata};
        state.ResumeTiming();

        auto stats = applier.apply(records);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_fresh)->Range(8, 4096);

// Redelivery: every record is stale and skipped.
static void bm_apply_redelivered(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    auto store = MemoryStore{};
    auto metadata = MemoryMetadataStore{};
    auto applier = MergeApplier{ledger_schema(), store, metadata};
    applier.apply(records);

    for (auto _ : state) {
        auto stats = applier.apply(records);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_redelivered)->Range(8, 4096);

static void bm_sqlite_apply(benchmark::State& state) {
    const auto records = make_records(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        state.PauseTiming();
        auto store = SqliteStore{":memory:"};
        auto metadata = MemoryMetadataStore{};
        auto applier = MergeApplier{ledger_schema(), store, metadata};
        state.ResumeTiming();

        auto stats = applier.apply(records);
        benchmark::DoNotOptimize(stats);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_sqlite_apply)->Range(8, 1024);

BENCHMARK_MAIN();
