/// @file peersync.hpp
/// @brief Umbrella header for the peersync library.
///
/// Include this single header for access to all public types:
/// SyncEngine, SyncItem, the CRDTs, TransferEngine, the stores, the
/// offline queue, configuration, and Error.

#pragma once

#include <peersync/config.hpp>
#include <peersync/crdt/g_counter.hpp>
#include <peersync/crdt/lww_register.hpp>
#include <peersync/crdt/or_set.hpp>
#include <peersync/crdt_snapshot.hpp>
#include <peersync/encryption.hpp>
#include <peersync/error.hpp>
#include <peersync/json.hpp>
#include <peersync/offline_queue.hpp>
#include <peersync/storage.hpp>
#include <peersync/sync_engine.hpp>
#include <peersync/sync_item.hpp>
#include <peersync/transfer.hpp>
#include <peersync/types.hpp>
#include <peersync/vector_clock.hpp>
