#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/RecordingStorage.h"
#include "preflight/ResourceFee.h"
#include "xdr/Stellar-ledger.h"
#include "xdr/Stellar-transaction.h"
#include <cstdint>
#include <vector>

namespace preflight
{
class SnapshotSource;
class SorobanNetworkConfig;

struct TransactionDataAndFee
{
    SorobanTransactionData transactionData;
    // Non-refundable part of the resource fee; the refundable part is in
    // transactionData.refundableFee.
    int64_t minFee{0};
};

// Sum of key sizes plus, for keys present in the snapshot, entry sizes.
// Keys absent from the snapshot are about to be created and contribute only
// their key bytes.
uint32_t
calculateUnmodifiedLedgerEntryBytes(xdr::xvector<LedgerKey> const& keys,
                                    SnapshotSource const& snapshot);

// Key plus entry bytes of every READ_WRITE key still present at the end of
// execution. Throws InvariantViolation for a storage key missing from the
// footprint.
uint32_t calculateModifiedReadWriteLedgerEntryBytes(Footprint const& footprint,
                                                    StorageMap const& storage);

uint32_t
calculateEventSizeBytes(xdr::xvector<DiagnosticEvent> const& events);

// Adds the larger of a 50000 instruction floor and a 15% margin.
uint32_t computeAdjustedInstructions(uint64_t consumedInstructions);

LedgerFootprint storageFootprintToLedgerFootprint(Footprint const& footprint);

SorobanResources
calculateSorobanResources(Footprint const& footprint, StorageMap const& storage,
                          SnapshotSource const& snapshot,
                          uint64_t consumedInstructions,
                          xdr::xvector<DiagnosticEvent> const& events);

TransactionDataAndFee computeHostFunctionTransactionDataAndMinFee(
    InvokeHostFunctionOp const& op, Footprint const& footprint,
    StorageMap const& storage, SnapshotSource const& snapshot,
    uint64_t consumedInstructions,
    xdr::xvector<DiagnosticEvent> const& events,
    FeeConfiguration const& feeConfig);

TransactionDataAndFee computeBumpFootprintExpTransactionDataAndMinFee(
    LedgerFootprint const& footprint, uint32_t ledgersToExpire,
    SnapshotSource const& snapshot, SorobanNetworkConfig const& config,
    uint64_t bucketListSize, uint32_t currentLedgerSeq);

TransactionDataAndFee computeRestoreFootprintTransactionDataAndMinFee(
    LedgerFootprint const& footprint, SnapshotSource const& snapshot,
    SorobanNetworkConfig const& config, uint64_t bucketListSize,
    uint32_t currentLedgerSeq);
}
