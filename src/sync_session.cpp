#include <ledgersync/sync_session.hpp>
#include <ledgersync/codec.hpp>
#include <ledgersync/error.hpp>

#include "util/random.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace ledgersync {

namespace {

inline constexpr std::size_t key_test_size = 32;

}  // anonymous namespace

SyncSession::SyncSession(LocalStore& store, ClockStore& clocks, MetadataStore& metadata,
                         RelayTransport& relay, const Schema& schema, WallClock wall)
    : schema_{schema},
      store_{store},
      clocks_{clocks},
      metadata_{metadata},
      relay_{relay},
      applier_{schema, store, metadata},
      config_{ReplicaConfig::from_metadata(metadata.get())},
      clock_{load_or_create_clock(clocks), std::move(wall)} {
    validate_schema(schema_, store_);
}

// -- Setup --------------------------------------------------------------------

void SyncSession::register_group(std::string group_id) {
    require(SyncState::idle, "register_group");
    config_.group_id = std::move(group_id);
    metadata_.patch(config_.to_metadata());
    SPDLOG_INFO("replica {} joined sync group {}", client_id(), *config_.group_id);
}

void SyncSession::enable_encryption(std::string_view password, KeyRegistry& keys) {
    require(SyncState::idle, "enable_encryption");
    if (password.empty()) {
        throw KeyDerivationError{"ledger is encrypted but no password was provided"};
    }

    if (!config_.key_id) {
        auto context = EncryptionContext::derive(make_key_id(), make_salt(), password);
        auto test = context.encrypt(util::random_bytes(key_test_size));
        keys.create_key(config_.file_id, KeyInfo{
            .key_id = context.key_id(),
            .salt = context.salt(),
            .test = std::move(test),
        });
        config_.key_id = context.key_id();
        metadata_.patch(config_.to_metadata());
        SPDLOG_INFO("created encryption key {}", context.key_id());
        encryption_.emplace(std::move(context));
        return;
    }

    auto info = keys.get_key(config_.file_id);
    if (!info || info->key_id != *config_.key_id) {
        throw KeyDerivationError{"key registry has no key " + *config_.key_id};
    }
    auto context = EncryptionContext::derive(info->key_id, info->salt, password);
    if (info->test) {
        try {
            context.decrypt(info->test->value, info->test->meta);
        } catch (const DecryptionError&) {
            throw KeyDerivationError{"incorrect password for key " + info->key_id};
        }
    }
    SPDLOG_INFO("loaded encryption key {}", context.key_id());
    encryption_.emplace(std::move(context));
}

// -- Local edits --------------------------------------------------------------

auto SyncSession::commit(ChangeBuffer& buffer) -> ChangeSet {
    require(SyncState::idle, "commit");
    auto records = buffer.flush(clock_);
    if (records.empty()) return records;

    if (config_.group_id) {
        applier_.apply_local(records);
    } else {
        applier_.apply(records);
    }
    clocks_.save_clock(clock_.state());
    send();
    return records;
}

// -- Round phases -------------------------------------------------------------

void SyncSession::send(std::span<const ChangeRecord> records) {
    require(SyncState::idle, "send");
    if (!config_.group_id) {
        SPDLOG_DEBUG("replica has no group id; {} record(s) kept local", records.size());
        return;
    }
    if (records.empty()) return;

    state_ = SyncState::sending;
    try {
        push(records);
    } catch (const std::exception& e) {
        fail(e);
        throw;
    }
    state_ = SyncState::idle;
}

auto SyncSession::send() -> std::size_t {
    require(SyncState::idle, "send");
    if (!config_.group_id) return 0;
    auto records = store_.pending_outgoing();
    if (records.empty()) return 0;

    state_ = SyncState::sending;
    try {
        push(records);
        store_.clear_outgoing();
    } catch (const std::exception& e) {
        fail(e);
        throw;
    }
    state_ = SyncState::idle;
    return records.size();
}

auto SyncSession::receive() -> RemoteBatch {
    require(SyncState::idle, "receive");
    state_ = SyncState::awaiting_remote;
    try {
        return pull();
    } catch (const std::exception& e) {
        fail(e);
        throw;
    }
}

auto SyncSession::apply(const RemoteBatch& batch) -> ApplyStats {
    require(SyncState::awaiting_remote, "apply");
    state_ = SyncState::applying;

    auto stats = ApplyStats{};
    try {
        stats = applier_.apply(batch.records);
        if (batch.max_timestamp) {
            clock_.receive(*batch.max_timestamp);
            clocks_.save_clock(clock_.state());
            SPDLOG_INFO("clock advanced to {}", to_string(clock_.state().last));
        }
    } catch (const std::exception& e) {
        fail(e);
        throw;
    }

    state_ = SyncState::idle;
    return stats;
}

void SyncSession::abandon() {
    if (state_ == SyncState::applying || state_ == SyncState::error) {
        throw Error{ErrorKind::invalid_operation,
                    "cannot abandon a round in state " + std::string{to_string_view(state_)}};
    }
    if (state_ != SyncState::idle) {
        SPDLOG_WARN("abandoned sync round in state {}", to_string_view(state_));
    }
    state_ = SyncState::idle;
}

void SyncSession::reset() {
    require(SyncState::error, "reset");
    state_ = SyncState::idle;
}

auto SyncSession::sync(ChangeBuffer& buffer, std::stop_token stop) -> ApplyStats {
    commit(buffer);
    return round(std::move(stop));
}

auto SyncSession::sync(std::stop_token stop) -> ApplyStats {
    return round(std::move(stop));
}

// -- Internals ----------------------------------------------------------------

void SyncSession::require(SyncState expected, std::string_view operation) const {
    if (state_ != expected) {
        throw Error{ErrorKind::invalid_operation,
                    std::string{operation} + " requires state " +
                    std::string{to_string_view(expected)} + ", session is " +
                    std::string{to_string_view(state_)}};
    }
}

void SyncSession::fail(const std::exception& e) {
    SPDLOG_ERROR("sync round failed in state {}: {}", to_string_view(state_), e.what());
    state_ = SyncState::error;
}

void SyncSession::push(std::span<const ChangeRecord> records) {
    auto body = encode_change_set(records, CodecOptions{.compress_threshold = config_.compress_threshold});
    auto payload = WirePayload{.timestamp = to_string(*max_timestamp(records))};
    if (encryption_) {
        auto encrypted = encryption_->encrypt(body);
        payload.content = std::move(encrypted.value);
        payload.meta = std::move(encrypted.meta);
    } else {
        payload.content = std::move(body);
    }

    relay_.send_change_set(*config_.group_id, config_.key_id, payload);
    SPDLOG_INFO("sent {} record(s) to group {}", records.size(), *config_.group_id);
}

auto SyncSession::pull() -> RemoteBatch {
    auto batch = RemoteBatch{};
    if (!config_.group_id) return batch;

    auto payloads = relay_.fetch_backlog(*config_.group_id, clock_.state().last);
    for (const auto& payload : payloads) {
        auto decoded = ChangeSet{};
        if (payload.meta) {
            if (!encryption_) {
                throw DecryptionError{"received encrypted change set but no key is loaded"};
            }
            decoded = decode_change_set(encryption_->decrypt(payload.content, *payload.meta));
        } else {
            decoded = decode_change_set(payload.content);
        }
        batch.records.insert(batch.records.end(),
                             std::make_move_iterator(decoded.begin()),
                             std::make_move_iterator(decoded.end()));
    }

    std::ranges::stable_sort(batch.records, {}, &ChangeRecord::timestamp);
    batch.max_timestamp = max_timestamp(batch.records);
    SPDLOG_INFO("received {} record(s) in {} change set(s)", batch.records.size(),
                payloads.size());
    return batch;
}

auto SyncSession::round(std::stop_token stop) -> ApplyStats {
    if (stop.stop_requested()) return {};
    send();
    auto batch = receive();
    if (stop.stop_requested()) {
        abandon();
        return {};
    }
    return apply(batch);
}

}  // namespace ledgersync
