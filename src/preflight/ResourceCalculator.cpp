// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/ResourceCalculator.h"
#include "ledger/LedgerTypeUtils.h"
#include "ledger/NetworkConfig.h"
#include "ledger/SnapshotSource.h"
#include "preflight/PreflightErrors.h"
#include "preflight/TransactionSizeEstimator.h"
#include "util/Logging.h"
#include "util/numeric.h"
#include <Tracy.hpp>
#include <algorithm>
#include <fmt/format.h>
#include <xdrpp/marshal.h>
#include <xdrpp/printer.h>

namespace preflight
{
namespace
{
uint32_t
addBytes(uint32_t total, uint64_t delta)
{
    return saturatingCastToUint32(
        saturatingAdd(static_cast<uint64_t>(total), delta));
}

TransactionDataAndFee
finalizeTransactionData(SorobanResources&& resources,
                        TransactionResources const& txResources,
                        FeeConfiguration const& feeConfig, int64_t rentFee)
{
    auto fees = computeTransactionResourceFee(txResources, feeConfig);

    TransactionDataAndFee res;
    res.transactionData.resources = std::move(resources);
    res.transactionData.refundableFee = saturatingAdd(fees.second, rentFee);
    res.minFee = fees.first;
    PLOG_DEBUG(Fees,
               "Computed fees: minFee={} refundableFee={} (rent {}) for "
               "instructions={} readBytes={} writeBytes={} metadata={} "
               "txSize={}",
               res.minFee, res.transactionData.refundableFee, rentFee,
               txResources.instructions, txResources.readBytes,
               txResources.writeBytes, txResources.metadataSizeBytes,
               txResources.transactionSizeBytes);
    return res;
}

uint32_t
expirationOf(SnapshotSource const& snapshot, LedgerKey const& key)
{
    auto expiration = snapshot.loadExpirationLedger(key);
    if (!expiration)
    {
        throw IntegrationError(
            fmt::format(FMT_STRING("expiration entry not found for {}"),
                        xdr::xdr_to_string(key, "key")));
    }
    return *expiration;
}
}

uint32_t
calculateUnmodifiedLedgerEntryBytes(xdr::xvector<LedgerKey> const& keys,
                                    SnapshotSource const& snapshot)
{
    ZoneScoped;
    uint32_t res = 0;
    for (auto const& key : keys)
    {
        res = addBytes(res, xdr::xdr_size(key));
        auto entryBytes = snapshot.getEntryXdr(key);
        if (entryBytes)
        {
            res = addBytes(res, entryBytes->size());
        }
    }
    return res;
}

uint32_t
calculateModifiedReadWriteLedgerEntryBytes(Footprint const& footprint,
                                           StorageMap const& storage)
{
    ZoneScoped;
    uint32_t res = 0;
    for (auto const& kv : storage)
    {
        auto it = footprint.find(kv.first);
        if (it == footprint.end())
        {
            PLOG_ERROR(Preflight, "Storage key missing from footprint: {}",
                       xdr::xdr_to_string(kv.first, "key"));
            throw InvariantViolation(
                "storage ledger entry not found in footprint");
        }
        if (it->second == AccessType::READ_WRITE && kv.second)
        {
            res = addBytes(res, xdr::xdr_size(*kv.second));
            res = addBytes(res, xdr::xdr_size(kv.first));
        }
    }
    return res;
}

uint32_t
calculateEventSizeBytes(xdr::xvector<DiagnosticEvent> const& events)
{
    uint32_t res = 0;
    for (auto const& e : events)
    {
        res = addBytes(res, xdr::xdr_size(e));
    }
    return res;
}

uint32_t
computeAdjustedInstructions(uint64_t consumedInstructions)
{
    uint64_t withFloor = saturatingAdd(consumedInstructions, uint64_t(50000));
    uint64_t withMargin =
        saturatingMultiply(consumedInstructions, uint64_t(115)) / 100;
    return saturatingCastToUint32(std::max(withFloor, withMargin));
}

LedgerFootprint
storageFootprintToLedgerFootprint(Footprint const& footprint)
{
    LedgerFootprint res;
    for (auto const& kv : footprint)
    {
        if (kv.second == AccessType::READ_ONLY)
        {
            res.readOnly.emplace_back(kv.first);
        }
        else
        {
            res.readWrite.emplace_back(kv.first);
        }
    }
    return res;
}

SorobanResources
calculateSorobanResources(Footprint const& footprint, StorageMap const& storage,
                          SnapshotSource const& snapshot,
                          uint64_t consumedInstructions,
                          xdr::xvector<DiagnosticEvent> const& events)
{
    ZoneScoped;
    SorobanResources res;
    res.footprint = storageFootprintToLedgerFootprint(footprint);

    // readBytes covers both halves of the footprint; the prior state of the
    // read-write half is also part of the metadata.
    uint32_t originalWriteBytes =
        calculateUnmodifiedLedgerEntryBytes(res.footprint.readWrite, snapshot);
    uint32_t readOnlyBytes =
        calculateUnmodifiedLedgerEntryBytes(res.footprint.readOnly, snapshot);
    uint32_t writeBytes =
        calculateModifiedReadWriteLedgerEntryBytes(footprint, storage);

    res.instructions = computeAdjustedInstructions(consumedInstructions);
    res.readBytes = addBytes(readOnlyBytes, originalWriteBytes);
    res.writeBytes = writeBytes;
    res.extendedMetaDataSizeBytes =
        addBytes(addBytes(originalWriteBytes, writeBytes),
                 calculateEventSizeBytes(events));
    return res;
}

TransactionDataAndFee
computeHostFunctionTransactionDataAndMinFee(
    InvokeHostFunctionOp const& op, Footprint const& footprint,
    StorageMap const& storage, SnapshotSource const& snapshot,
    uint64_t consumedInstructions,
    xdr::xvector<DiagnosticEvent> const& events,
    FeeConfiguration const& feeConfig)
{
    ZoneScoped;
    auto resources = calculateSorobanResources(
        footprint, storage, snapshot, consumedInstructions, events);

    OperationBody body(INVOKE_HOST_FUNCTION);
    body.invokeHostFunctionOp() = op;

    auto readWriteEntries =
        static_cast<uint32_t>(resources.footprint.readWrite.size());
    TransactionResources txResources;
    txResources.instructions = resources.instructions;
    txResources.readEntries =
        static_cast<uint32_t>(resources.footprint.readOnly.size()) +
        readWriteEntries;
    txResources.writeEntries = readWriteEntries;
    txResources.readBytes = resources.readBytes;
    txResources.writeBytes = resources.writeBytes;
    txResources.metadataSizeBytes = resources.extendedMetaDataSizeBytes;
    txResources.transactionSizeBytes =
        estimateMaxTransactionSize(body, resources.footprint);

    return finalizeTransactionData(std::move(resources), txResources,
                                   feeConfig, 0);
}

TransactionDataAndFee
computeBumpFootprintExpTransactionDataAndMinFee(
    LedgerFootprint const& footprint, uint32_t ledgersToExpire,
    SnapshotSource const& snapshot, SorobanNetworkConfig const& config,
    uint64_t bucketListSize, uint32_t currentLedgerSeq)
{
    ZoneScoped;
    std::vector<LedgerEntryRentChange> rentChanges;
    uint32_t const newExpiration = saturatingCastToUint32(
        saturatingAdd(static_cast<uint64_t>(currentLedgerSeq),
                      static_cast<uint64_t>(ledgersToExpire)));
    for (auto const& key : footprint.readOnly)
    {
        auto entryBytes = snapshot.getEntryXdr(key);
        if (!entryBytes)
        {
            // Bumping a missing entry is a no-op when applied.
            continue;
        }
        uint32_t oldExpiration = expirationOf(snapshot, key);
        if (oldExpiration < currentLedgerSeq)
        {
            // Expired entries must be restored before they can be bumped.
            continue;
        }
        if (newExpiration <= oldExpiration)
        {
            continue;
        }
        auto size = saturatingCastToUint32(entryBytes->size());
        LedgerEntryRentChange change;
        change.isPersistent = isPersistentEntry(key);
        change.oldSizeBytes = size;
        change.newSizeBytes = size;
        change.oldExpirationLedger = oldExpiration;
        change.newExpirationLedger = newExpiration;
        rentChanges.emplace_back(change);
    }

    SorobanResources resources;
    resources.footprint = footprint;
    resources.instructions = 0;
    resources.readBytes =
        calculateUnmodifiedLedgerEntryBytes(footprint.readOnly, snapshot);
    resources.writeBytes = 0;
    resources.extendedMetaDataSizeBytes = 0;

    OperationBody body(BUMP_FOOTPRINT_EXPIRATION);
    body.bumpFootprintExpirationOp().ledgersToExpire = ledgersToExpire;

    TransactionResources txResources;
    txResources.readEntries =
        static_cast<uint32_t>(footprint.readOnly.size());
    txResources.readBytes = resources.readBytes;
    txResources.transactionSizeBytes =
        estimateMaxTransactionSize(body, footprint);

    int64_t rentFee =
        computeRentFee(rentChanges, config.rentFeeConfiguration(bucketListSize),
                       currentLedgerSeq);
    return finalizeTransactionData(std::move(resources), txResources,
                                   config.feeConfiguration(bucketListSize),
                                   rentFee);
}

TransactionDataAndFee
computeRestoreFootprintTransactionDataAndMinFee(
    LedgerFootprint const& footprint, SnapshotSource const& snapshot,
    SorobanNetworkConfig const& config, uint64_t bucketListSize,
    uint32_t currentLedgerSeq)
{
    ZoneScoped;
    // The restored entry is live for minPersistentEntryExpiration ledgers,
    // counting the current one.
    uint64_t const restoredEnd = saturatingAdd(
        static_cast<uint64_t>(currentLedgerSeq),
        static_cast<uint64_t>(
            config.stateExpirationSettings().minPersistentEntryExpiration));
    uint32_t const restoredExpiration = saturatingCastToUint32(
        restoredEnd > currentLedgerSeq ? restoredEnd - 1 : restoredEnd);

    std::vector<LedgerEntryRentChange> rentChanges;
    for (auto const& key : footprint.readWrite)
    {
        auto entryBytes = snapshot.getEntryXdr(key);
        if (!entryBytes)
        {
            continue;
        }
        uint32_t expiration = expirationOf(snapshot, key);
        if (expiration >= currentLedgerSeq)
        {
            // Still live, nothing to restore.
            continue;
        }
        LedgerEntryRentChange change;
        change.isPersistent = true;
        change.oldSizeBytes = 0;
        change.newSizeBytes = saturatingCastToUint32(entryBytes->size());
        change.oldExpirationLedger = 0;
        change.newExpirationLedger = restoredExpiration;
        rentChanges.emplace_back(change);
    }

    uint32_t entryBytes =
        calculateUnmodifiedLedgerEntryBytes(footprint.readWrite, snapshot);
    SorobanResources resources;
    resources.footprint = footprint;
    resources.instructions = 0;
    resources.readBytes = entryBytes;
    resources.writeBytes = entryBytes;
    resources.extendedMetaDataSizeBytes = 0;

    OperationBody body(RESTORE_FOOTPRINT);

    auto readWriteEntries = static_cast<uint32_t>(footprint.readWrite.size());
    TransactionResources txResources;
    txResources.readEntries = readWriteEntries;
    txResources.writeEntries = readWriteEntries;
    txResources.readBytes = resources.readBytes;
    txResources.writeBytes = resources.writeBytes;
    txResources.transactionSizeBytes =
        estimateMaxTransactionSize(body, footprint);

    int64_t rentFee =
        computeRentFee(rentChanges, config.rentFeeConfiguration(bucketListSize),
                       currentLedgerSeq);
    return finalizeTransactionData(std::move(resources), txResources,
                                   config.feeConfiguration(bucketListSize),
                                   rentFee);
}
}
