#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Stellar-ledger.h"
#include "xdr/Stellar-transaction.h"
#include <memory>
#include <optional>
#include <vector>

namespace preflight
{
class RecordingStorage;
class Budget;

struct LedgerInfo
{
    uint32_t protocolVersion{0};
    uint32_t sequenceNumber{0};
    uint64_t timestamp{0};
    Hash networkID;
    uint32_t baseReserve{0};
    uint32_t minTempEntryExpiration{0};
    uint32_t minPersistentEntryExpiration{0};
    uint32_t maxEntryExpiration{0};
    uint32_t autobumpLedgers{0};
};

enum class DiagnosticLevel
{
    None,
    Debug
};

// Event emitted by the host, tagged with whether the call that emitted it
// eventually failed.
struct HostEvent
{
    ContractEvent event;
    bool failedCall{false};
};

// Authorization the host recorded as required while running in recording
// mode. `address` and `nonce` are either both set (address credentials) or
// both unset (source account credentials).
struct RecordedAuthPayload
{
    std::optional<SCAddress> address;
    std::optional<int64_t> nonce;
    SorobanAuthorizedInvocation invocation;
};

struct InvocationOutcome
{
    // False when the contract returned an error or trapped. The value is
    // then an SCV_ERROR describing the failure.
    bool success{false};
    SCVal value;
};

// The contract virtual machine, seen through the capabilities a preflight
// run needs. A host is bound to one storage view and one budget for its whole
// lifetime and is used by a single thread.
class SimulationHost
{
  public:
    virtual ~SimulationHost() = default;

    virtual void switchToRecordingAuth() = 0;
    virtual void setAuthorizationEntries(
        xdr::xvector<SorobanAuthorizationEntry> const& entries) = 0;
    virtual void setDiagnosticLevel(DiagnosticLevel level) = 0;
    virtual void setSourceAccount(AccountID const& source) = 0;
    virtual void setLedgerInfo(LedgerInfo const& info) = 0;

    // Runs `fn` to completion. Contract-level failures are reported through
    // the outcome; only host faults throw (as EngineFault or HostPanic).
    virtual InvocationOutcome invokeFunction(HostFunction const& fn) = 0;

    virtual std::vector<RecordedAuthPayload> getRecordedAuthPayloads() = 0;

    // Moves out every event emitted so far.
    virtual std::vector<HostEvent> takeEvents() = 0;
};

class SimulationHostFactory
{
  public:
    virtual ~SimulationHostFactory() = default;

    // `storage` and `budget` outlive the returned host.
    virtual std::unique_ptr<SimulationHost>
    createHost(RecordingStorage& storage, Budget& budget) = 0;
};

// Factory used by the C entry points. Defined by the virtual machine
// binding linked into the final library.
SimulationHostFactory& getDefaultSimulationHostFactory();
}
