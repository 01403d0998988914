#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/SnapshotSource.h"
#include "preflight/ResourceFee.h"
#include "util/XDROperators.h"
#include "xdr/Stellar-ledger-entries.h"
#include "xdr/Stellar-transaction.h"
#include <map>
#include <set>
#include <string>

namespace preflight
{
namespace testutil
{

// Values used by initialConfigSettingEntries().
int64_t const TEST_TX_MAX_INSTRUCTIONS = 100000000;
uint32_t const TEST_TX_MEMORY_LIMIT = 40 * 1024 * 1024;
uint32_t const TEST_MAX_ENTRY_EXPIRATION = 6312000;
uint32_t const TEST_MIN_PERSISTENT_EXPIRATION = 4096;
uint32_t const TEST_MIN_TEMP_EXPIRATION = 16;
int64_t const TEST_PERSISTENT_RENT_DENOMINATOR = 252480;
int64_t const TEST_TEMP_RENT_DENOMINATOR = 2524800;

// Rate table the initial config settings yield for an empty bucket list.
FeeConfiguration defaultFeeConfiguration();

// Snapshot held in memory. Entries are stored pre-encoded. Lookups of keys
// marked failing throw IntegrationError, like a host callback that errors.
// Safe for concurrent lookups once populated.
class InMemorySnapshotSource : public SnapshotSource
{
    std::map<LedgerKey, std::vector<uint8_t>> mEntries;
    std::set<LedgerKey> mFailingKeys;

  public:
    std::optional<std::vector<uint8_t>>
    getEntryXdr(LedgerKey const& key) const override;

    void addEntry(LedgerEntry const& entry);
    // Stores raw bytes under `key`, without checking they decode.
    void addRawEntry(LedgerKey const& key, std::vector<uint8_t> const& bytes);
    void removeEntry(LedgerKey const& key);
    void failLookupsOf(LedgerKey const& key);

    // Adds the network config settings plus an expiration entry for every
    // contract data/code entry added later through addSorobanEntry.
    void addInitialConfigSettings();
    void addSorobanEntry(LedgerEntry const& entry, uint32_t expirationLedger);
};

std::vector<LedgerEntry> initialConfigSettingEntries();
LedgerEntry makeConfigSettingEntry(ConfigSettingEntry const& setting);
ContractCostParams makeCostParams(int64_t constTerm, int64_t linearTerm);

Hash makeHash(uint8_t seed);
AccountID makeAccountID(uint8_t seed);
SCAddress makeContractAddress(uint8_t seed);
SCVal makeU32(uint32_t v);
SCVal makeSymbol(std::string const& s);
SCVal makeBytes(size_t size);

LedgerKey makeContractDataKey(uint8_t contractSeed, uint32_t key,
                              ContractDataDurability durability = PERSISTENT);
// Entry for `key` whose value is an SCV_BYTES blob of `valueSize` bytes.
LedgerEntry makeContractDataEntry(LedgerKey const& key, size_t valueSize);
LedgerKey makeContractCodeKey(uint8_t seed);
LedgerEntry makeContractCodeEntry(LedgerKey const& key, size_t codeSize);
LedgerEntry makeExpirationEntry(LedgerKey const& key, uint32_t expiration);
LedgerKey makeAccountKey(uint8_t seed);

InvokeHostFunctionOp makeInvokeContractOp(uint8_t contractSeed,
                                          std::string const& fn);
ContractEvent makeContractEvent(uint8_t contractSeed, size_t dataSize);

template <typename T>
uint32_t
xdrSize(T const& t)
{
    return static_cast<uint32_t>(xdr::xdr_size(t));
}
}
}
