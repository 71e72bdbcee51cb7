/// @file ledgersync.hpp
/// @brief Umbrella header for the ledgersync library.
///
/// Include this single header for access to all public types:
/// LogicalClock, ChangeRecord, the codec and crypto envelope,
/// ChangeBuffer, the stores, MergeApplier, SyncSession, Ledger,
/// ReconciliationEngine, and Error.

#pragma once

#include <ledgersync/change.hpp>
#include <ledgersync/change_buffer.hpp>
#include <ledgersync/clock.hpp>
#include <ledgersync/codec.hpp>
#include <ledgersync/config.hpp>
#include <ledgersync/crypto.hpp>
#include <ledgersync/date.hpp>
#include <ledgersync/error.hpp>
#include <ledgersync/json.hpp>
#include <ledgersync/ledger.hpp>
#include <ledgersync/memory_store.hpp>
#include <ledgersync/merge_applier.hpp>
#include <ledgersync/metadata.hpp>
#include <ledgersync/reconcile.hpp>
#include <ledgersync/schema.hpp>
#include <ledgersync/sqlite_store.hpp>
#include <ledgersync/store.hpp>
#include <ledgersync/sync_session.hpp>
#include <ledgersync/transport.hpp>
#include <ledgersync/types.hpp>
#include <ledgersync/value.hpp>
