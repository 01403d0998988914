#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/ResourceFee.h"
#include "xdr/Stellar-contract-config-setting.h"
#include <cstdint>

namespace preflight
{
class SnapshotSource;

// Network parameters that drive metering and pricing, loaded from the
// CONFIG_SETTING entries of a snapshot. One instance per preflight call.
class SorobanNetworkConfig
{
  public:
    // Throws IntegrationError if any required setting is missing, carries
    // the wrong variant, or holds a negative fee rate or cost term.
    static SorobanNetworkConfig loadFromSnapshot(SnapshotSource const& snapshot);

    // Compute settings
    int64_t txMaxInstructions() const;
    int64_t feeRatePerInstructionsIncrement() const;
    uint32_t txMemoryLimit() const;

    // Ledger access settings
    int64_t feeReadLedgerEntry() const;
    int64_t feeWriteLedgerEntry() const;
    int64_t feeRead1KB() const;

    // Historical data, metadata and bandwidth settings
    int64_t feeHistorical1KB() const;
    int64_t feeExtendedMetaData1KB() const;
    int64_t feePropagateData1KB() const;

    ContractCostParams const& cpuCostParams() const;
    ContractCostParams const& memCostParams() const;
    StateExpirationSettings const& stateExpirationSettings() const;

    WriteFeeConfiguration writeFeeConfiguration() const;

    // Rate table used by computeTransactionResourceFee. The write rate
    // depends on the current bucket list size.
    FeeConfiguration feeConfiguration(uint64_t bucketListSize) const;
    RentFeeConfiguration rentFeeConfiguration(uint64_t bucketListSize) const;

  private:
    void loadComputeSettings(SnapshotSource const& snapshot);
    void loadLedgerAccessSettings(SnapshotSource const& snapshot);
    void loadHistoricalSettings(SnapshotSource const& snapshot);
    void loadMetaDataSettings(SnapshotSource const& snapshot);
    void loadBandwidthSettings(SnapshotSource const& snapshot);
    void loadCpuCostParams(SnapshotSource const& snapshot);
    void loadMemCostParams(SnapshotSource const& snapshot);
    void loadStateExpirationSettings(SnapshotSource const& snapshot);

    // Compute settings
    int64_t mTxMaxInstructions{};
    int64_t mFeeRatePerInstructionsIncrement{};
    uint32_t mTxMemoryLimit{};

    // Ledger access settings
    int64_t mFeeReadLedgerEntry{};
    int64_t mFeeWriteLedgerEntry{};
    int64_t mFeeRead1KB{};
    int64_t mBucketListTargetSizeBytes{};
    int64_t mWriteFee1KBBucketListLow{};
    int64_t mWriteFee1KBBucketListHigh{};
    uint32_t mBucketListWriteFeeGrowthFactor{};

    int64_t mFeeHistorical1KB{};
    int64_t mFeeExtendedMetaData1KB{};
    int64_t mFeePropagateData1KB{};

    ContractCostParams mCpuCostParams;
    ContractCostParams mMemCostParams;
    StateExpirationSettings mStateExpirationSettings;
};
}
