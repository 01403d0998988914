// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/Preflight.h"
#include "ledger/LedgerTypeUtils.h"
#include "ledger/NetworkConfig.h"
#include "ledger/SnapshotSource.h"
#include "preflight/Budget.h"
#include "preflight/PreflightErrors.h"
#include "preflight/RecordingStorage.h"
#include "preflight/ResourceCalculator.h"
#include "util/Logging.h"
#include <Tracy.hpp>
#include <fmt/format.h>
#include <xdrpp/printer.h>

namespace preflight
{
namespace
{
void
checkBumpFootprint(LedgerFootprint const& footprint, uint32_t ledgersToExpire,
                   SorobanNetworkConfig const& config)
{
    if (!footprint.readWrite.empty())
    {
        throw EncodingError(
            "bump footprint expiration requires an empty read-write footprint");
    }
    for (auto const& key : footprint.readOnly)
    {
        if (!isSorobanEntry(key))
        {
            throw EncodingError("bump footprint expiration only applies to "
                                "contract data and code entries");
        }
    }
    uint32_t maxEntryExpiration =
        config.stateExpirationSettings().maxEntryExpiration;
    if (maxEntryExpiration == 0 || ledgersToExpire > maxEntryExpiration - 1)
    {
        throw EncodingError(fmt::format(
            FMT_STRING("ledgersToExpire {} exceeds the network maximum of {}"),
            ledgersToExpire, maxEntryExpiration == 0 ? 0 : maxEntryExpiration - 1));
    }
}

void
checkRestoreFootprint(LedgerFootprint const& footprint)
{
    if (!footprint.readOnly.empty())
    {
        throw EncodingError(
            "restore footprint requires an empty read-only footprint");
    }
    for (auto const& key : footprint.readWrite)
    {
        if (!isPersistentEntry(key))
        {
            throw EncodingError("restore footprint only applies to persistent "
                                "contract data and code entries");
        }
    }
}
}

SorobanAuthorizationEntry
recordedAuthPayloadToXdr(RecordedAuthPayload const& payload)
{
    SorobanAuthorizationEntry entry;
    if (payload.address && payload.nonce)
    {
        entry.credentials.type(SOROBAN_CREDENTIALS_ADDRESS);
        auto& creds = entry.credentials.address();
        creds.address = *payload.address;
        creds.nonce = *payload.nonce;
        // Left for the caller to fill in when signing.
        creds.signatureExpirationLedger = 0;
        creds.signature.type(SCV_VOID);
    }
    else if (!payload.address && !payload.nonce)
    {
        entry.credentials.type(SOROBAN_CREDENTIALS_SOURCE_ACCOUNT);
    }
    else
    {
        throw InvariantViolation(fmt::format(
            FMT_STRING("recorded auth payload has an address and a nonce "
                       "present independently (address: {}, nonce: {})"),
            payload.address ? "set" : "unset",
            payload.nonce ? "set" : "unset"));
    }
    entry.rootInvocation = payload.invocation;
    return entry;
}

xdr::xvector<DiagnosticEvent>
hostEventsToDiagnosticEvents(std::vector<HostEvent> const& events)
{
    xdr::xvector<DiagnosticEvent> res;
    res.reserve(events.size());
    for (auto const& e : events)
    {
        DiagnosticEvent de;
        de.inSuccessfulContractCall = !e.failedCall;
        de.event = e.event;
        res.emplace_back(std::move(de));
    }
    return res;
}

PreflightResult
preflightInvokeHostFunctionOp(SimulationHostFactory& factory,
                              SnapshotSource const& snapshot,
                              uint64_t bucketListSize,
                              InvokeHostFunctionOp const& op,
                              AccountID const& sourceAccount,
                              LedgerInfo const& ledgerInfo)
{
    ZoneScoped;
    auto config = SorobanNetworkConfig::loadFromSnapshot(snapshot);
    RecordingStorage storage(snapshot);
    auto budget = Budget::fromNetworkConfig(config);

    auto host = factory.createHost(storage, budget);
    bool const recordAuth = op.auth.empty();
    if (recordAuth)
    {
        host->switchToRecordingAuth();
    }
    else
    {
        host->setAuthorizationEntries(op.auth);
    }
    host->setDiagnosticLevel(DiagnosticLevel::Debug);
    host->setSourceAccount(sourceAccount);
    host->setLedgerInfo(ledgerInfo);

    InvocationOutcome outcome;
    {
        ZoneNamedN(invokeZone, "invoke host function", true);
        outcome = host->invokeFunction(op.hostFunction);
    }
    if (!outcome.success)
    {
        // The footprint and events of a failed call are still meaningful.
        PLOG_DEBUG(Preflight, "Host function failed: {}",
                   xdr::xdr_to_string(outcome.value, "result"));
    }

    PreflightResult res;
    if (recordAuth)
    {
        for (auto const& payload : host->getRecordedAuthPayloads())
        {
            res.auth.emplace_back(recordedAuthPayloadToXdr(payload));
        }
    }
    else
    {
        res.auth = op.auth;
    }
    res.events = hostEventsToDiagnosticEvents(host->takeEvents());
    res.result = std::move(outcome.value);
    res.cpuInstructions = budget.getCpuInsnsConsumed();
    res.memoryBytes = budget.getMemBytesConsumed();

    // Price the operation as it will be submitted, with its auth entries.
    InvokeHostFunctionOp submitted;
    submitted.hostFunction = op.hostFunction;
    submitted.auth = res.auth;
    auto data = computeHostFunctionTransactionDataAndMinFee(
        submitted, storage.getFootprint(), storage.getStorageMap(), snapshot,
        res.cpuInstructions, res.events,
        config.feeConfiguration(bucketListSize));
    res.transactionData = std::move(data.transactionData);
    res.minFee = data.minFee;

    PLOG_DEBUG(Preflight,
               "Preflight done: success={} cpu={} mem={} auth={} events={} "
               "minFee={}",
               outcome.success, res.cpuInstructions, res.memoryBytes,
               res.auth.size(), res.events.size(), res.minFee);
    return res;
}

PreflightResult
preflightFootprintExpirationOp(SnapshotSource const& snapshot,
                               uint64_t bucketListSize,
                               OperationBody const& opBody,
                               LedgerFootprint const& footprint,
                               uint32_t currentLedgerSeq)
{
    ZoneScoped;
    auto const type = opBody.type();
    if (type != BUMP_FOOTPRINT_EXPIRATION && type != RESTORE_FOOTPRINT)
    {
        auto const* name = xdr::xdr_traits<OperationType>::enum_name(type);
        throw EncodingError(fmt::format(
            FMT_STRING("preflightFootprintExpirationOp: unsupported "
                       "operation type {}"),
            name ? name : "unknown"));
    }

    auto config = SorobanNetworkConfig::loadFromSnapshot(snapshot);
    TransactionDataAndFee data;
    if (type == BUMP_FOOTPRINT_EXPIRATION)
    {
        auto ledgersToExpire =
            opBody.bumpFootprintExpirationOp().ledgersToExpire;
        checkBumpFootprint(footprint, ledgersToExpire, config);
        data = computeBumpFootprintExpTransactionDataAndMinFee(
            footprint, ledgersToExpire, snapshot, config, bucketListSize,
            currentLedgerSeq);
    }
    else
    {
        checkRestoreFootprint(footprint);
        data = computeRestoreFootprintTransactionDataAndMinFee(
            footprint, snapshot, config, bucketListSize, currentLedgerSeq);
    }

    PreflightResult res;
    res.transactionData = std::move(data.transactionData);
    res.minFee = data.minFee;
    return res;
}
}
