#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/XDROperators.h"
#include "xdr/Stellar-ledger-entries.h"
#include <map>
#include <optional>

namespace preflight
{
class SnapshotSource;

enum class AccessType
{
    READ_ONLY,
    READ_WRITE
};

// Ordered by XDR ordering of the keys so that footprints derived from it are
// deterministic.
using Footprint = std::map<LedgerKey, AccessType>;

// Value of every touched key at the end of execution; nullopt means the
// entry is absent (never existed, or was deleted).
using StorageMap = std::map<LedgerKey, std::optional<LedgerEntry>>;

// Storage view handed to the simulation host. Reads fall through to the
// snapshot the first time a key is touched; writes stay local. Every access
// is recorded in the footprint: reads as READ_ONLY, writes and deletes as
// READ_WRITE. A READ_WRITE classification is never downgraded.
class RecordingStorage
{
    SnapshotSource const& mSnapshot;
    Footprint mFootprint;
    StorageMap mMap;

    std::optional<LedgerEntry> const& load(LedgerKey const& key);
    void recordAccess(LedgerKey const& key, AccessType type);

  public:
    explicit RecordingStorage(SnapshotSource const& snapshot);

    std::optional<LedgerEntry> get(LedgerKey const& key);
    bool has(LedgerKey const& key);

    // Throws InvariantViolation if `entry` is not stored under `key`.
    void put(LedgerKey const& key, LedgerEntry const& entry);
    void del(LedgerKey const& key);

    Footprint const& getFootprint() const;
    StorageMap const& getStorageMap() const;
};
}
