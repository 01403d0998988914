// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/RecordingStorage.h"
#include "ledger/LedgerTypeUtils.h"
#include "ledger/SnapshotSource.h"
#include "preflight/PreflightErrors.h"
#include "util/Logging.h"
#include <Tracy.hpp>
#include <xdrpp/printer.h>

namespace preflight
{

RecordingStorage::RecordingStorage(SnapshotSource const& snapshot)
    : mSnapshot(snapshot)
{
}

std::optional<LedgerEntry> const&
RecordingStorage::load(LedgerKey const& key)
{
    auto it = mMap.find(key);
    if (it == mMap.end())
    {
        ZoneScoped;
        it = mMap.emplace(key, mSnapshot.loadEntry(key)).first;
    }
    return it->second;
}

void
RecordingStorage::recordAccess(LedgerKey const& key, AccessType type)
{
    auto res = mFootprint.emplace(key, type);
    if (!res.second && type == AccessType::READ_WRITE)
    {
        res.first->second = AccessType::READ_WRITE;
    }
}

std::optional<LedgerEntry>
RecordingStorage::get(LedgerKey const& key)
{
    recordAccess(key, AccessType::READ_ONLY);
    return load(key);
}

bool
RecordingStorage::has(LedgerKey const& key)
{
    recordAccess(key, AccessType::READ_ONLY);
    return load(key).has_value();
}

void
RecordingStorage::put(LedgerKey const& key, LedgerEntry const& entry)
{
    if (!(LedgerEntryKey(entry) == key))
    {
        PLOG_ERROR(Preflight, "Mismatched put for key {}",
                   xdr::xdr_to_string(key, "key"));
        throw InvariantViolation(
            "storage put with an entry that does not match its key");
    }
    recordAccess(key, AccessType::READ_WRITE);
    mMap[key] = entry;
}

void
RecordingStorage::del(LedgerKey const& key)
{
    recordAccess(key, AccessType::READ_WRITE);
    mMap[key] = std::nullopt;
}

Footprint const&
RecordingStorage::getFootprint() const
{
    return mFootprint;
}

StorageMap const&
RecordingStorage::getStorageMap() const
{
    return mMap;
}
}
