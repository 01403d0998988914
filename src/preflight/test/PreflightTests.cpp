// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "preflight/Budget.h"
#include "preflight/Preflight.h"
#include "preflight/PreflightErrors.h"
#include "test/TestSimulationHost.h"
#include "test/TestUtils.h"
#include <catch2/catch.hpp>

using namespace preflight;
using namespace preflight::testutil;

namespace
{
uint32_t const CURRENT_LEDGER = 100;

LedgerInfo
makeLedgerInfo()
{
    LedgerInfo info;
    info.protocolVersion = 20;
    info.sequenceNumber = CURRENT_LEDGER;
    info.timestamp = 1000;
    info.networkID = makeHash(9);
    info.baseReserve = 5000000;
    info.minTempEntryExpiration = TEST_MIN_TEMP_EXPIRATION;
    info.minPersistentEntryExpiration = TEST_MIN_PERSISTENT_EXPIRATION;
    info.maxEntryExpiration = TEST_MAX_ENTRY_EXPIRATION;
    return info;
}

HostEvent
makeHostEvent(size_t dataSize)
{
    HostEvent ev;
    ev.event = makeContractEvent(1, dataSize);
    return ev;
}

SorobanAuthorizedInvocation
makeInvocation(std::string const& fn)
{
    SorobanAuthorizedInvocation inv;
    inv.function.type(SOROBAN_AUTHORIZED_FUNCTION_TYPE_CONTRACT_FN);
    auto& args = inv.function.contractFn();
    args.contractAddress = makeContractAddress(1);
    args.functionName.assign(fn);
    return inv;
}

LedgerEntryRentChange
makeRentChange(bool persistent, uint32_t oldSize, uint32_t newSize,
               uint32_t oldExpiration, uint32_t newExpiration)
{
    LedgerEntryRentChange change;
    change.isPersistent = persistent;
    change.oldSizeBytes = oldSize;
    change.newSizeBytes = newSize;
    change.oldExpirationLedger = oldExpiration;
    change.newExpirationLedger = newExpiration;
    return change;
}
}

TEST_CASE("preflight invoke host function", "[preflight]")
{
    InMemorySnapshotSource snapshot;
    snapshot.addInitialConfigSettings();

    auto keyA = makeContractDataKey(1, 1);
    auto entryA = makeContractDataEntry(keyA, 50);
    snapshot.addSorobanEntry(entryA, 1000);
    auto keyB = makeContractDataKey(1, 2);
    auto entryB = makeContractDataEntry(keyB, 20);

    HostScript script;
    script.reads = {keyA};
    script.writes = {entryB};
    script.charges = {{WasmInsnExec, 100}};
    script.events = {makeHostEvent(8)};
    script.value = makeU32(7);

    ScriptedSimulationHostFactory factory;
    auto source = makeAccountID(3);
    auto op = makeInvokeContractOp(1, "store");

    SECTION("recording mode")
    {
        RecordedAuthPayload withAddress;
        withAddress.address = makeContractAddress(5);
        withAddress.nonce = 42;
        withAddress.invocation = makeInvocation("store");
        RecordedAuthPayload sourceAccount;
        sourceAccount.invocation = makeInvocation("other");
        script.recordedAuth = {withAddress, sourceAccount};
        factory.setScript(script);

        auto res = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                 source, makeLedgerInfo());

        REQUIRE(res.result);
        REQUIRE(*res.result == makeU32(7));
        REQUIRE(res.auth.size() == 2);
        auto const& creds = res.auth[0].credentials;
        REQUIRE(creds.type() == SOROBAN_CREDENTIALS_ADDRESS);
        REQUIRE(creds.address().address == makeContractAddress(5));
        REQUIRE(creds.address().nonce == 42);
        REQUIRE(creds.address().signatureExpirationLedger == 0);
        REQUIRE(creds.address().signature.type() == SCV_VOID);
        REQUIRE(res.auth[0].rootInvocation == withAddress.invocation);
        REQUIRE(res.auth[1].credentials.type() ==
                SOROBAN_CREDENTIALS_SOURCE_ACCOUNT);

        auto obs = factory.observations();
        REQUIRE(obs.hostsCreated == 1);
        REQUIRE(obs.recordingAuth);
        REQUIRE(obs.diagnosticLevel == DiagnosticLevel::Debug);
        REQUIRE(obs.sourceAccount == source);
        REQUIRE(obs.ledgerInfo->sequenceNumber == CURRENT_LEDGER);
        REQUIRE(obs.invokedFunction == op.hostFunction);
    }

    SECTION("enforcing mode keeps the supplied entries")
    {
        SorobanAuthorizationEntry supplied;
        supplied.credentials.type(SOROBAN_CREDENTIALS_SOURCE_ACCOUNT);
        supplied.rootInvocation = makeInvocation("store");
        op.auth.emplace_back(supplied);
        factory.setScript(script);

        auto res = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                 source, makeLedgerInfo());
        REQUIRE(res.auth == op.auth);
        auto obs = factory.observations();
        REQUIRE_FALSE(obs.recordingAuth);
        REQUIRE(obs.authEntriesSupplied == 1);
    }

    SECTION("metering and resources")
    {
        factory.setScript(script);
        auto res = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                 source, makeLedgerInfo());

        // cpu model (10, 128) and memory model (1, 64) over an input of 100.
        REQUIRE(res.cpuInstructions == 110);
        REQUIRE(res.memoryBytes == 51);

        auto const& resources = res.transactionData.resources;
        REQUIRE(resources.instructions == 50110);
        REQUIRE(resources.footprint.readOnly.size() == 1);
        REQUIRE(resources.footprint.readOnly[0] == keyA);
        REQUIRE(resources.footprint.readWrite.size() == 1);
        REQUIRE(resources.footprint.readWrite[0] == keyB);
        REQUIRE(resources.readBytes ==
                xdrSize(keyA) + xdrSize(entryA) + xdrSize(keyB));
        REQUIRE(resources.writeBytes == xdrSize(keyB) + xdrSize(entryB));
        REQUIRE(res.minFee > 0);
        REQUIRE(res.transactionData.refundableFee > 0);

        REQUIRE(res.events.size() == 1);
        REQUIRE(res.events[0].inSuccessfulContractCall);
    }

    SECTION("failed invocation still reports resources")
    {
        script.success = false;
        script.value = SCVal(SCV_ERROR);
        script.value.error().type(SCE_CONTRACT);
        script.value.error().contractCode() = 3;
        factory.setScript(script);

        auto res = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                 source, makeLedgerInfo());
        REQUIRE(res.result->type() == SCV_ERROR);
        REQUIRE(res.transactionData.resources.footprint.readWrite.size() == 1);
        REQUIRE(res.events.size() == 1);
        REQUIRE_FALSE(res.events[0].inSuccessfulContractCall);
        REQUIRE(res.minFee > 0);
    }

    SECTION("budget exhaustion is a failed invocation")
    {
        script.charges = {{WasmInsnExec, uint64_t(TEST_TX_MAX_INSTRUCTIONS)}};
        factory.setScript(script);

        auto res = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                 source, makeLedgerInfo());
        REQUIRE(res.result->type() == SCV_ERROR);
        REQUIRE(res.result->error().type() == SCE_BUDGET);
        REQUIRE(res.cpuInstructions > uint64_t(TEST_TX_MAX_INSTRUCTIONS));
    }

    SECTION("host panic propagates")
    {
        script.panicMessage = "wasm trap";
        factory.setScript(script);
        REQUIRE_THROWS_AS(preflightInvokeHostFunctionOp(
                              factory, snapshot, 0, op, source,
                              makeLedgerInfo()),
                          HostPanic);
    }

    SECTION("snapshot failure during execution")
    {
        snapshot.failLookupsOf(keyA);
        factory.setScript(script);
        REQUIRE_THROWS_AS(preflightInvokeHostFunctionOp(
                              factory, snapshot, 0, op, source,
                              makeLedgerInfo()),
                          IntegrationError);
    }

    SECTION("missing network config")
    {
        InMemorySnapshotSource empty;
        factory.setScript(script);
        REQUIRE_THROWS_AS(preflightInvokeHostFunctionOp(factory, empty, 0, op,
                                                        source,
                                                        makeLedgerInfo()),
                          IntegrationError);
        REQUIRE(factory.observations().hostsCreated == 0);
    }

    SECTION("larger bucket list raises the fee")
    {
        factory.setScript(script);
        auto cheap = preflightInvokeHostFunctionOp(factory, snapshot, 0, op,
                                                   source, makeLedgerInfo());
        auto pricey = preflightInvokeHostFunctionOp(
            factory, snapshot, 512LL * 1024 * 1024, op, source,
            makeLedgerInfo());
        REQUIRE(pricey.minFee > cheap.minFee);
    }
}

TEST_CASE("recorded auth conversion", "[preflight]")
{
    RecordedAuthPayload payload;
    payload.invocation = makeInvocation("fn");

    SECTION("address without nonce")
    {
        payload.address = makeContractAddress(1);
        REQUIRE_THROWS_AS(recordedAuthPayloadToXdr(payload),
                          InvariantViolation);
    }
    SECTION("nonce without address")
    {
        payload.nonce = 1;
        REQUIRE_THROWS_AS(recordedAuthPayloadToXdr(payload),
                          InvariantViolation);
    }
}

TEST_CASE("preflight footprint expiration operations", "[preflight]")
{
    InMemorySnapshotSource snapshot;
    snapshot.addInitialConfigSettings();
    auto config = SorobanNetworkConfig::loadFromSnapshot(snapshot);
    auto rentConfig = config.rentFeeConfiguration(0);

    auto liveKey = makeContractDataKey(1, 1);
    auto liveEntry = makeContractDataEntry(liveKey, 100);
    snapshot.addSorobanEntry(liveEntry, 200);

    auto expiredKey = makeContractDataKey(1, 2);
    auto expiredEntry = makeContractDataEntry(expiredKey, 60);
    snapshot.addSorobanEntry(expiredEntry, 50);

    SECTION("unsupported operation type")
    {
        OperationBody body(INVOKE_HOST_FUNCTION);
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, {}, CURRENT_LEDGER),
                          EncodingError);
        REQUIRE_THROWS_WITH(
            preflightFootprintExpirationOp(snapshot, 0, body, {},
                                           CURRENT_LEDGER),
            Catch::Contains("unsupported operation type"));

        OperationBody payment(PAYMENT);
        payment.paymentOp().amount = 10;
        REQUIRE_THROWS_WITH(
            preflightFootprintExpirationOp(snapshot, 0, payment, {},
                                           CURRENT_LEDGER),
            Catch::Contains("unsupported operation type PAYMENT"));
    }

    SECTION("bump")
    {
        OperationBody body(BUMP_FOOTPRINT_EXPIRATION);
        body.bumpFootprintExpirationOp().ledgersToExpire = 1000;
        LedgerFootprint footprint;
        footprint.readOnly.emplace_back(liveKey);

        auto res = preflightFootprintExpirationOp(snapshot, 0, body,
                                                  footprint, CURRENT_LEDGER);
        REQUIRE_FALSE(res.result);
        REQUIRE(res.auth.empty());
        REQUIRE(res.events.empty());
        auto const& resources = res.transactionData.resources;
        REQUIRE(resources.footprint.readOnly == footprint.readOnly);
        REQUIRE(resources.instructions == 0);
        REQUIRE(resources.readBytes == xdrSize(liveKey) + xdrSize(liveEntry));
        REQUIRE(resources.writeBytes == 0);

        auto expectedRent = computeRentFee(
            {makeRentChange(true, xdrSize(liveEntry), xdrSize(liveEntry), 200,
                            CURRENT_LEDGER + 1000)},
            rentConfig, CURRENT_LEDGER);
        REQUIRE(expectedRent > 0);
        REQUIRE(res.transactionData.refundableFee == expectedRent);
        REQUIRE(res.minFee > 0);

        SECTION("entries already expiring later are not charged")
        {
            body.bumpFootprintExpirationOp().ledgersToExpire = 50;
            auto noop = preflightFootprintExpirationOp(
                snapshot, 0, body, footprint, CURRENT_LEDGER);
            REQUIRE(noop.transactionData.refundableFee == 0);
        }
        SECTION("expired entries are not charged")
        {
            LedgerFootprint expired;
            expired.readOnly.emplace_back(expiredKey);
            auto noop = preflightFootprintExpirationOp(
                snapshot, 0, body, expired, CURRENT_LEDGER);
            REQUIRE(noop.transactionData.refundableFee == 0);

            expired.readOnly.emplace_back(liveKey);
            auto mixed = preflightFootprintExpirationOp(
                snapshot, 0, body, expired, CURRENT_LEDGER);
            REQUIRE(mixed.transactionData.refundableFee == expectedRent);
        }
        SECTION("missing entries are skipped")
        {
            LedgerFootprint missing;
            missing.readOnly.emplace_back(makeContractDataKey(1, 99));
            auto noop = preflightFootprintExpirationOp(
                snapshot, 0, body, missing, CURRENT_LEDGER);
            REQUIRE(noop.transactionData.refundableFee == 0);
        }
        SECTION("entry without expiration")
        {
            auto orphanKey = makeContractDataKey(1, 3);
            snapshot.addEntry(makeContractDataEntry(orphanKey, 10));
            LedgerFootprint orphan;
            orphan.readOnly.emplace_back(orphanKey);
            REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                                  snapshot, 0, body, orphan, CURRENT_LEDGER),
                              IntegrationError);
        }
    }

    SECTION("expiration ledgers saturate at the end of the ledger range")
    {
        uint32_t const lateLedger = UINT32_MAX - 10;
        auto lateKey = makeContractDataKey(1, 4);
        auto lateEntry = makeContractDataEntry(lateKey, 40);
        snapshot.addSorobanEntry(lateEntry, UINT32_MAX - 5);

        OperationBody bump(BUMP_FOOTPRINT_EXPIRATION);
        bump.bumpFootprintExpirationOp().ledgersToExpire = 1000;
        LedgerFootprint bumpFootprint;
        bumpFootprint.readOnly.emplace_back(lateKey);
        auto bumped = preflightFootprintExpirationOp(
            snapshot, 0, bump, bumpFootprint, lateLedger);
        auto bumpRent = computeRentFee(
            {makeRentChange(true, xdrSize(lateEntry), xdrSize(lateEntry),
                            UINT32_MAX - 5, UINT32_MAX)},
            rentConfig, lateLedger);
        REQUIRE(bumpRent > 0);
        REQUIRE(bumped.transactionData.refundableFee == bumpRent);

        OperationBody restore(RESTORE_FOOTPRINT);
        LedgerFootprint restoreFootprint;
        restoreFootprint.readWrite.emplace_back(expiredKey);
        auto restored = preflightFootprintExpirationOp(
            snapshot, 0, restore, restoreFootprint, lateLedger);
        auto restoreRent = computeRentFee(
            {makeRentChange(true, 0, xdrSize(expiredEntry), 0, UINT32_MAX)},
            rentConfig, lateLedger);
        REQUIRE(restored.transactionData.refundableFee == restoreRent);
    }

    SECTION("bump validation")
    {
        OperationBody body(BUMP_FOOTPRINT_EXPIRATION);
        body.bumpFootprintExpirationOp().ledgersToExpire = 10;

        LedgerFootprint readWrite;
        readWrite.readWrite.emplace_back(liveKey);
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, readWrite, CURRENT_LEDGER),
                          EncodingError);

        LedgerFootprint account;
        account.readOnly.emplace_back(makeAccountKey(1));
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, account, CURRENT_LEDGER),
                          EncodingError);

        LedgerFootprint footprint;
        footprint.readOnly.emplace_back(liveKey);
        body.bumpFootprintExpirationOp().ledgersToExpire =
            TEST_MAX_ENTRY_EXPIRATION;
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, footprint, CURRENT_LEDGER),
                          EncodingError);
        body.bumpFootprintExpirationOp().ledgersToExpire =
            TEST_MAX_ENTRY_EXPIRATION - 1;
        REQUIRE_NOTHROW(preflightFootprintExpirationOp(
            snapshot, 0, body, footprint, CURRENT_LEDGER));
    }

    SECTION("restore")
    {
        OperationBody body(RESTORE_FOOTPRINT);
        LedgerFootprint footprint;
        footprint.readWrite.emplace_back(expiredKey);

        auto res = preflightFootprintExpirationOp(snapshot, 0, body,
                                                  footprint, CURRENT_LEDGER);
        uint32_t entryBytes = xdrSize(expiredKey) + xdrSize(expiredEntry);
        auto const& resources = res.transactionData.resources;
        REQUIRE(resources.readBytes == entryBytes);
        REQUIRE(resources.writeBytes == entryBytes);
        REQUIRE(resources.footprint.readWrite == footprint.readWrite);

        auto expectedRent = computeRentFee(
            {makeRentChange(true, 0, xdrSize(expiredEntry), 0,
                            CURRENT_LEDGER + TEST_MIN_PERSISTENT_EXPIRATION -
                                1)},
            rentConfig, CURRENT_LEDGER);
        REQUIRE(res.transactionData.refundableFee == expectedRent);
        REQUIRE(res.minFee > 0);

        SECTION("live entries cost no rent")
        {
            LedgerFootprint live;
            live.readWrite.emplace_back(liveKey);
            auto noop = preflightFootprintExpirationOp(snapshot, 0, body, live,
                                                       CURRENT_LEDGER);
            REQUIRE(noop.transactionData.refundableFee == 0);
        }
    }

    SECTION("restore validation")
    {
        OperationBody body(RESTORE_FOOTPRINT);

        LedgerFootprint readOnly;
        readOnly.readOnly.emplace_back(expiredKey);
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, readOnly, CURRENT_LEDGER),
                          EncodingError);

        LedgerFootprint temporary;
        temporary.readWrite.emplace_back(makeContractDataKey(1, 5, TEMPORARY));
        REQUIRE_THROWS_AS(preflightFootprintExpirationOp(
                              snapshot, 0, body, temporary, CURRENT_LEDGER),
                          EncodingError);
    }
}
