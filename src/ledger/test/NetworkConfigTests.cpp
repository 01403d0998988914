// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTypeUtils.h"
#include "ledger/NetworkConfig.h"
#include "preflight/PreflightErrors.h"
#include "test/TestUtils.h"
#include <catch2/catch.hpp>
#include <xdrpp/marshal.h>

using namespace preflight;
using namespace preflight::testutil;

namespace
{
LedgerKey
configSettingKey(ConfigSettingID id)
{
    LedgerKey key(CONFIG_SETTING);
    key.configSetting().configSettingID = id;
    return key;
}
}

TEST_CASE("network config loading", "[networkconfig]")
{
    InMemorySnapshotSource snapshot;
    snapshot.addInitialConfigSettings();

    SECTION("initial settings")
    {
        auto config = SorobanNetworkConfig::loadFromSnapshot(snapshot);
        REQUIRE(config.txMaxInstructions() == TEST_TX_MAX_INSTRUCTIONS);
        REQUIRE(config.txMemoryLimit() == TEST_TX_MEMORY_LIMIT);
        REQUIRE(config.cpuCostParams().size() == ChaCha20DrawBytes + 1);
        REQUIRE(config.stateExpirationSettings().minPersistentEntryExpiration ==
                TEST_MIN_PERSISTENT_EXPIRATION);

        auto fees = config.feeConfiguration(0);
        auto expected = defaultFeeConfiguration();
        REQUIRE(fees.feePerInstructionIncrement ==
                expected.feePerInstructionIncrement);
        REQUIRE(fees.feePerReadEntry == expected.feePerReadEntry);
        REQUIRE(fees.feePerWriteEntry == expected.feePerWriteEntry);
        REQUIRE(fees.feePerRead1KB == expected.feePerRead1KB);
        REQUIRE(fees.feePerWrite1KB == expected.feePerWrite1KB);
        REQUIRE(fees.feePerHistorical1KB == expected.feePerHistorical1KB);
        REQUIRE(fees.feePerMetadata1KB == expected.feePerMetadata1KB);
        REQUIRE(fees.feePerPropagate1KB == expected.feePerPropagate1KB);

        auto rent = config.rentFeeConfiguration(0);
        REQUIRE(rent.feePerWrite1KB == 4000);
        REQUIRE(rent.feePerWriteEntry == 20000);
        REQUIRE(rent.persistentRentRateDenominator ==
                TEST_PERSISTENT_RENT_DENOMINATOR);
        REQUIRE(rent.temporaryRentRateDenominator ==
                TEST_TEMP_RENT_DENOMINATOR);
    }

    SECTION("write fee follows the bucket list size")
    {
        auto config = SorobanNetworkConfig::loadFromSnapshot(snapshot);
        REQUIRE(config.feeConfiguration(512LL * 1024 * 1024).feePerWrite1KB ==
                7000);
        REQUIRE(config.feeConfiguration(1024LL * 1024 * 1024).feePerWrite1KB ==
                10000);
        REQUIRE(config.feeConfiguration(2048LL * 1024 * 1024).feePerWrite1KB ==
                16000);
    }

    SECTION("missing setting")
    {
        snapshot.removeEntry(
            configSettingKey(CONFIG_SETTING_CONTRACT_BANDWIDTH_V0));
        REQUIRE_THROWS_AS(SorobanNetworkConfig::loadFromSnapshot(snapshot),
                          IntegrationError);
        REQUIRE_THROWS_WITH(
            SorobanNetworkConfig::loadFromSnapshot(snapshot),
            Catch::Contains("CONFIG_SETTING_CONTRACT_BANDWIDTH_V0") &&
                Catch::Contains("not found"));
    }

    SECTION("setting stored under the wrong id")
    {
        ConfigSettingEntry historical(
            CONFIG_SETTING_CONTRACT_HISTORICAL_DATA_V0);
        historical.contractHistoricalData().feeHistorical1KB = 100;
        auto bytes = xdr::xdr_to_opaque(makeConfigSettingEntry(historical));
        snapshot.addRawEntry(
            configSettingKey(CONFIG_SETTING_CONTRACT_META_DATA_V0),
            std::vector<uint8_t>(bytes.begin(), bytes.end()));
        REQUIRE_THROWS_AS(SorobanNetworkConfig::loadFromSnapshot(snapshot),
                          IntegrationError);
    }

    SECTION("negative fee rate")
    {
        ConfigSettingEntry historical(
            CONFIG_SETTING_CONTRACT_HISTORICAL_DATA_V0);
        historical.contractHistoricalData().feeHistorical1KB = -1;
        snapshot.addEntry(makeConfigSettingEntry(historical));
        REQUIRE_THROWS_AS(SorobanNetworkConfig::loadFromSnapshot(snapshot),
                          IntegrationError);
    }

    SECTION("negative cost term")
    {
        ConfigSettingEntry mem(
            CONFIG_SETTING_CONTRACT_COST_PARAMS_MEMORY_BYTES);
        mem.contractCostParamsMemBytes() = makeCostParams(1, -64);
        snapshot.addEntry(makeConfigSettingEntry(mem));
        REQUIRE_THROWS_AS(SorobanNetworkConfig::loadFromSnapshot(snapshot),
                          IntegrationError);
    }
}

TEST_CASE("ledger key classification", "[networkconfig]")
{
    auto persistent = makeContractDataKey(1, 1);
    auto temporary = makeContractDataKey(1, 1, TEMPORARY);
    auto code = makeContractCodeKey(2);
    auto account = makeAccountKey(3);

    REQUIRE(isSorobanEntry(persistent));
    REQUIRE(isSorobanEntry(temporary));
    REQUIRE(isSorobanEntry(code));
    REQUIRE_FALSE(isSorobanEntry(account));

    REQUIRE(isTemporaryEntry(temporary));
    REQUIRE_FALSE(isTemporaryEntry(persistent));
    REQUIRE(isPersistentEntry(persistent));
    REQUIRE(isPersistentEntry(code));
    REQUIRE_FALSE(isPersistentEntry(temporary));
    REQUIRE_FALSE(isPersistentEntry(account));

    auto expKey = getExpirationKey(persistent);
    REQUIRE(expKey.type() == EXPIRATION);
    REQUIRE(expKey == getExpirationKey(persistent));
    REQUIRE_FALSE(expKey == getExpirationKey(temporary));

    auto entry = makeContractDataEntry(persistent, 4);
    REQUIRE(LedgerEntryKey(entry) == persistent);
    REQUIRE(LedgerEntryKey(makeExpirationEntry(persistent, 10)) == expKey);
}
