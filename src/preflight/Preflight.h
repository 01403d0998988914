#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/SimulationHost.h"
#include "xdr/Stellar-ledger.h"
#include "xdr/Stellar-transaction.h"
#include <cstdint>
#include <optional>

namespace preflight
{
class SnapshotSource;

struct PreflightResult
{
    // Entries to attach to the operation: the recorded ones when the
    // operation carried none, otherwise the supplied ones unchanged.
    xdr::xvector<SorobanAuthorizationEntry> auth;
    // Unset for the footprint expiration operations.
    std::optional<SCVal> result;
    SorobanTransactionData transactionData;
    int64_t minFee{0};
    xdr::xvector<DiagnosticEvent> events;
    uint64_t cpuInstructions{0};
    uint64_t memoryBytes{0};
};

// Simulates `op` against `snapshot` and prices the resources it used.
// Nothing is written back to the snapshot. Throws a PreflightError subclass
// on failure; a contract that merely fails still produces a result.
PreflightResult preflightInvokeHostFunctionOp(
    SimulationHostFactory& factory, SnapshotSource const& snapshot,
    uint64_t bucketListSize, InvokeHostFunctionOp const& op,
    AccountID const& sourceAccount, LedgerInfo const& ledgerInfo);

// Resources and fees for BUMP_FOOTPRINT_EXPIRATION and RESTORE_FOOTPRINT
// bodies over `footprint`. No code is executed. Other body types are
// rejected with EncodingError.
PreflightResult preflightFootprintExpirationOp(SnapshotSource const& snapshot,
                                               uint64_t bucketListSize,
                                               OperationBody const& opBody,
                                               LedgerFootprint const& footprint,
                                               uint32_t currentLedgerSeq);

// Throws InvariantViolation if exactly one of address and nonce is set.
SorobanAuthorizationEntry
recordedAuthPayloadToXdr(RecordedAuthPayload const& payload);

xdr::xvector<DiagnosticEvent>
hostEventsToDiagnosticEvents(std::vector<HostEvent> const& events);
}
