// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/NetworkConfig.h"
#include "ledger/SnapshotSource.h"
#include "preflight/PreflightErrors.h"
#include "util/Logging.h"
#include "util/numeric.h"
#include <Tracy.hpp>
#include <fmt/format.h>

namespace preflight
{
namespace
{
void
checkNonNegative(int64_t v, char const* name)
{
    if (v < 0)
    {
        throw IntegrationError(fmt::format(
            FMT_STRING("network config setting {} is negative: {}"), name, v));
    }
}

void
checkCostParams(ContractCostParams const& params, char const* name)
{
    for (size_t i = 0; i < params.size(); ++i)
    {
        if (params[i].constTerm < 0 || params[i].linearTerm < 0)
        {
            throw IntegrationError(fmt::format(
                FMT_STRING("{} has a negative term for cost type {}"), name,
                i));
        }
    }
}
}

SorobanNetworkConfig
SorobanNetworkConfig::loadFromSnapshot(SnapshotSource const& snapshot)
{
    ZoneScoped;
    SorobanNetworkConfig config;
    config.loadComputeSettings(snapshot);
    config.loadLedgerAccessSettings(snapshot);
    config.loadHistoricalSettings(snapshot);
    config.loadMetaDataSettings(snapshot);
    config.loadBandwidthSettings(snapshot);
    config.loadCpuCostParams(snapshot);
    config.loadMemCostParams(snapshot);
    config.loadStateExpirationSettings(snapshot);
    PLOG_DEBUG(Ledger,
               "Loaded network config: txMaxInstructions={} "
               "txMemoryLimit={} cpuCostTypes={} memCostTypes={}",
               config.mTxMaxInstructions, config.mTxMemoryLimit,
               config.mCpuCostParams.size(), config.mMemCostParams.size());
    return config;
}

void
SorobanNetworkConfig::loadComputeSettings(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting =
        snapshot.loadConfigSetting(CONFIG_SETTING_CONTRACT_COMPUTE_V0);
    auto const& compute = setting.contractCompute();
    checkNonNegative(compute.txMaxInstructions, "txMaxInstructions");
    checkNonNegative(compute.feeRatePerInstructionsIncrement,
                     "feeRatePerInstructionsIncrement");
    mTxMaxInstructions = compute.txMaxInstructions;
    mFeeRatePerInstructionsIncrement = compute.feeRatePerInstructionsIncrement;
    mTxMemoryLimit = compute.txMemoryLimit;
}

void
SorobanNetworkConfig::loadLedgerAccessSettings(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting =
        snapshot.loadConfigSetting(CONFIG_SETTING_CONTRACT_LEDGER_COST_V0);
    auto const& cost = setting.contractLedgerCost();
    checkNonNegative(cost.feeReadLedgerEntry, "feeReadLedgerEntry");
    checkNonNegative(cost.feeWriteLedgerEntry, "feeWriteLedgerEntry");
    checkNonNegative(cost.feeRead1KB, "feeRead1KB");
    checkNonNegative(cost.bucketListTargetSizeBytes,
                     "bucketListTargetSizeBytes");
    checkNonNegative(cost.writeFee1KBBucketListLow, "writeFee1KBBucketListLow");
    checkNonNegative(cost.writeFee1KBBucketListHigh,
                     "writeFee1KBBucketListHigh");
    mFeeReadLedgerEntry = cost.feeReadLedgerEntry;
    mFeeWriteLedgerEntry = cost.feeWriteLedgerEntry;
    mFeeRead1KB = cost.feeRead1KB;
    mBucketListTargetSizeBytes = cost.bucketListTargetSizeBytes;
    mWriteFee1KBBucketListLow = cost.writeFee1KBBucketListLow;
    mWriteFee1KBBucketListHigh = cost.writeFee1KBBucketListHigh;
    mBucketListWriteFeeGrowthFactor = cost.bucketListWriteFeeGrowthFactor;
}

void
SorobanNetworkConfig::loadHistoricalSettings(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting =
        snapshot.loadConfigSetting(CONFIG_SETTING_CONTRACT_HISTORICAL_DATA_V0);
    mFeeHistorical1KB = setting.contractHistoricalData().feeHistorical1KB;
    checkNonNegative(mFeeHistorical1KB, "feeHistorical1KB");
}

void
SorobanNetworkConfig::loadMetaDataSettings(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting =
        snapshot.loadConfigSetting(CONFIG_SETTING_CONTRACT_META_DATA_V0);
    mFeeExtendedMetaData1KB = setting.contractMetaData().feeExtendedMetaData1KB;
    checkNonNegative(mFeeExtendedMetaData1KB, "feeExtendedMetaData1KB");
}

void
SorobanNetworkConfig::loadBandwidthSettings(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting =
        snapshot.loadConfigSetting(CONFIG_SETTING_CONTRACT_BANDWIDTH_V0);
    mFeePropagateData1KB = setting.contractBandwidth().feePropagateData1KB;
    checkNonNegative(mFeePropagateData1KB, "feePropagateData1KB");
}

void
SorobanNetworkConfig::loadCpuCostParams(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting = snapshot.loadConfigSetting(
        CONFIG_SETTING_CONTRACT_COST_PARAMS_CPU_INSTRUCTIONS);
    mCpuCostParams = setting.contractCostParamsCpuInsns();
    checkCostParams(mCpuCostParams, "cpu cost params");
}

void
SorobanNetworkConfig::loadMemCostParams(SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting = snapshot.loadConfigSetting(
        CONFIG_SETTING_CONTRACT_COST_PARAMS_MEMORY_BYTES);
    mMemCostParams = setting.contractCostParamsMemBytes();
    checkCostParams(mMemCostParams, "memory cost params");
}

void
SorobanNetworkConfig::loadStateExpirationSettings(
    SnapshotSource const& snapshot)
{
    ZoneScoped;
    auto setting = snapshot.loadConfigSetting(CONFIG_SETTING_STATE_EXPIRATION);
    mStateExpirationSettings = setting.stateExpirationSettings();
    checkNonNegative(mStateExpirationSettings.persistentRentRateDenominator,
                     "persistentRentRateDenominator");
    checkNonNegative(mStateExpirationSettings.tempRentRateDenominator,
                     "tempRentRateDenominator");
}

int64_t
SorobanNetworkConfig::txMaxInstructions() const
{
    return mTxMaxInstructions;
}

int64_t
SorobanNetworkConfig::feeRatePerInstructionsIncrement() const
{
    return mFeeRatePerInstructionsIncrement;
}

uint32_t
SorobanNetworkConfig::txMemoryLimit() const
{
    return mTxMemoryLimit;
}

int64_t
SorobanNetworkConfig::feeReadLedgerEntry() const
{
    return mFeeReadLedgerEntry;
}

int64_t
SorobanNetworkConfig::feeWriteLedgerEntry() const
{
    return mFeeWriteLedgerEntry;
}

int64_t
SorobanNetworkConfig::feeRead1KB() const
{
    return mFeeRead1KB;
}

int64_t
SorobanNetworkConfig::feeHistorical1KB() const
{
    return mFeeHistorical1KB;
}

int64_t
SorobanNetworkConfig::feeExtendedMetaData1KB() const
{
    return mFeeExtendedMetaData1KB;
}

int64_t
SorobanNetworkConfig::feePropagateData1KB() const
{
    return mFeePropagateData1KB;
}

ContractCostParams const&
SorobanNetworkConfig::cpuCostParams() const
{
    return mCpuCostParams;
}

ContractCostParams const&
SorobanNetworkConfig::memCostParams() const
{
    return mMemCostParams;
}

StateExpirationSettings const&
SorobanNetworkConfig::stateExpirationSettings() const
{
    return mStateExpirationSettings;
}

WriteFeeConfiguration
SorobanNetworkConfig::writeFeeConfiguration() const
{
    WriteFeeConfiguration res;
    res.bucketListTargetSizeBytes = mBucketListTargetSizeBytes;
    res.writeFee1KBBucketListLow = mWriteFee1KBBucketListLow;
    res.writeFee1KBBucketListHigh = mWriteFee1KBBucketListHigh;
    res.bucketListWriteFeeGrowthFactor = mBucketListWriteFeeGrowthFactor;
    return res;
}

FeeConfiguration
SorobanNetworkConfig::feeConfiguration(uint64_t bucketListSize) const
{
    FeeConfiguration res;
    res.feePerInstructionIncrement = mFeeRatePerInstructionsIncrement;
    res.feePerReadEntry = mFeeReadLedgerEntry;
    res.feePerWriteEntry = mFeeWriteLedgerEntry;
    res.feePerRead1KB = mFeeRead1KB;
    res.feePerWrite1KB = computeWriteFeePer1KB(
        saturatingCastToInt64(bucketListSize), writeFeeConfiguration());
    res.feePerHistorical1KB = mFeeHistorical1KB;
    res.feePerMetadata1KB = mFeeExtendedMetaData1KB;
    res.feePerPropagate1KB = mFeePropagateData1KB;
    return res;
}

RentFeeConfiguration
SorobanNetworkConfig::rentFeeConfiguration(uint64_t bucketListSize) const
{
    RentFeeConfiguration res;
    res.feePerWriteEntry = mFeeWriteLedgerEntry;
    res.feePerWrite1KB = computeWriteFeePer1KB(
        saturatingCastToInt64(bucketListSize), writeFeeConfiguration());
    res.persistentRentRateDenominator =
        mStateExpirationSettings.persistentRentRateDenominator;
    res.temporaryRentRateDenominator =
        mStateExpirationSettings.tempRentRateDenominator;
    return res;
}
}
