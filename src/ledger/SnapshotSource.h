#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Stellar-ledger-entries.h"
#include <cstdint>
#include <optional>
#include <vector>

namespace preflight
{

// Read-only, point-lookup view of ledger state at a fixed ledger. Lookups
// may call back into the host process and block on its I/O.
class SnapshotSource
{
  public:
    virtual ~SnapshotSource() = default;

    // Returns the XDR encoding of the entry stored under `key`, or nullopt if
    // the snapshot holds no such entry. An absent entry is not an error.
    // Throws IntegrationError if the lookup itself fails.
    virtual std::optional<std::vector<uint8_t>>
    getEntryXdr(LedgerKey const& key) const = 0;

    // Decoded variant of getEntryXdr. Undecodable bytes, or an entry whose
    // key does not match `key`, are reported as IntegrationError.
    std::optional<LedgerEntry> loadEntry(LedgerKey const& key) const;

    // Missing settings and settings of the wrong variant are both fatal
    // (IntegrationError): the protocol constants are unavailable.
    ConfigSettingEntry loadConfigSetting(ConfigSettingID id) const;

    // Expiration ledger of a contract data or code entry, read from its
    // EXPIRATION entry. nullopt if that entry is absent.
    std::optional<uint32_t> loadExpirationLedger(LedgerKey const& key) const;
};
}
