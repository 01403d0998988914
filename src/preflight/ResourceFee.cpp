// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/ResourceFee.h"
#include "util/Logging.h"
#include "util/numeric.h"
#include <Tracy.hpp>
#include <algorithm>

namespace preflight
{
namespace
{
int64_t
computeFeePerIncrement(uint32_t resourceValue, int64_t feeRate,
                       int64_t increment)
{
    int64_t value = resourceValue;
    return ceilDivide(saturatingMultiply(value, feeRate),
                      std::max<int64_t>(increment, 1));
}

int64_t
rentFeeForSizeAndLedgers(bool isPersistent, uint32_t entrySize,
                         uint32_t rentLedgers,
                         RentFeeConfiguration const& feeConfig)
{
    int64_t num = saturatingMultiply(
        saturatingMultiply(static_cast<int64_t>(entrySize),
                           feeConfig.feePerWrite1KB),
        static_cast<int64_t>(rentLedgers));
    int64_t storageCoef = isPersistent
                              ? feeConfig.persistentRentRateDenominator
                              : feeConfig.temporaryRentRateDenominator;
    int64_t denom = saturatingMultiply(DATA_SIZE_1KB_INCREMENT, storageCoef);
    return ceilDivide(num, std::max<int64_t>(denom, 1));
}

int64_t
rentFeePerEntryChange(LedgerEntryRentChange const& change,
                      RentFeeConfiguration const& feeConfig,
                      uint32_t currentLedgerSeq)
{
    int64_t fee = 0;
    // Rent for the newly covered ledgers, at the new size. Already expired
    // entries are charged from the current ledger on.
    if (change.oldExpirationLedger < change.newExpirationLedger)
    {
        uint32_t paidUntil =
            std::max(change.oldExpirationLedger,
                     currentLedgerSeq > 0 ? currentLedgerSeq - 1 : 0);
        fee = saturatingAdd(
            fee, rentFeeForSizeAndLedgers(
                     change.isPersistent, change.newSizeBytes,
                     change.newExpirationLedger - paidUntil, feeConfig));
    }
    // Growth of a live entry is charged for the remainder of its already
    // paid lifetime.
    if (change.newSizeBytes > change.oldSizeBytes &&
        change.oldExpirationLedger >= currentLedgerSeq)
    {
        fee = saturatingAdd(
            fee, rentFeeForSizeAndLedgers(
                     change.isPersistent,
                     change.newSizeBytes - change.oldSizeBytes,
                     change.oldExpirationLedger - currentLedgerSeq + 1,
                     feeConfig));
    }
    return fee;
}
}

std::pair<int64_t, int64_t>
computeTransactionResourceFee(TransactionResources const& resources,
                              FeeConfiguration const& feeConfig)
{
    ZoneScoped;
    int64_t computeFee =
        computeFeePerIncrement(resources.instructions,
                               feeConfig.feePerInstructionIncrement,
                               INSTRUCTIONS_INCREMENT);
    int64_t readEntryFee = saturatingMultiply(
        feeConfig.feePerReadEntry, static_cast<int64_t>(resources.readEntries));
    int64_t writeEntryFee =
        saturatingMultiply(feeConfig.feePerWriteEntry,
                           static_cast<int64_t>(resources.writeEntries));
    int64_t readBytesFee = computeFeePerIncrement(
        resources.readBytes, feeConfig.feePerRead1KB, DATA_SIZE_1KB_INCREMENT);
    int64_t writeBytesFee =
        computeFeePerIncrement(resources.writeBytes, feeConfig.feePerWrite1KB,
                               DATA_SIZE_1KB_INCREMENT);

    uint32_t historicalSize =
        resources.transactionSizeBytes > UINT32_MAX - TX_BASE_RESULT_SIZE
            ? UINT32_MAX
            : resources.transactionSizeBytes + TX_BASE_RESULT_SIZE;
    int64_t historicalFee =
        computeFeePerIncrement(historicalSize, feeConfig.feePerHistorical1KB,
                               DATA_SIZE_1KB_INCREMENT);
    int64_t bandwidthFee = computeFeePerIncrement(
        resources.transactionSizeBytes, feeConfig.feePerPropagate1KB,
        DATA_SIZE_1KB_INCREMENT);

    int64_t refundableFee = computeFeePerIncrement(
        resources.metadataSizeBytes, feeConfig.feePerMetadata1KB,
        DATA_SIZE_1KB_INCREMENT);

    int64_t nonRefundableFee = computeFee;
    nonRefundableFee = saturatingAdd(nonRefundableFee, readEntryFee);
    nonRefundableFee = saturatingAdd(nonRefundableFee, writeEntryFee);
    nonRefundableFee = saturatingAdd(nonRefundableFee, readBytesFee);
    nonRefundableFee = saturatingAdd(nonRefundableFee, writeBytesFee);
    nonRefundableFee = saturatingAdd(nonRefundableFee, historicalFee);
    nonRefundableFee = saturatingAdd(nonRefundableFee, bandwidthFee);

    PLOG_TRACE(Fees,
               "Resource fee: compute={} readEntries={} writeEntries={} "
               "readBytes={} writeBytes={} historical={} bandwidth={} "
               "metadata={}",
               computeFee, readEntryFee, writeEntryFee, readBytesFee,
               writeBytesFee, historicalFee, bandwidthFee, refundableFee);
    return std::make_pair(nonRefundableFee, refundableFee);
}

int64_t
computeRentFee(std::vector<LedgerEntryRentChange> const& changes,
               RentFeeConfiguration const& feeConfig, uint32_t currentLedgerSeq)
{
    ZoneScoped;
    int64_t fee = 0;
    int64_t extendedEntries = 0;
    for (auto const& change : changes)
    {
        fee = saturatingAdd(
            fee, rentFeePerEntryChange(change, feeConfig, currentLedgerSeq));
        if (change.oldExpirationLedger < change.newExpirationLedger)
        {
            ++extendedEntries;
        }
    }
    // Every extension rewrites the entry's EXPIRATION entry.
    fee = saturatingAdd(
        fee, saturatingMultiply(feeConfig.feePerWriteEntry, extendedEntries));
    uint64_t expirationBytes = saturatingMultiply(
        static_cast<uint64_t>(EXPIRATION_ENTRY_SIZE),
        static_cast<uint64_t>(extendedEntries));
    fee = saturatingAdd(
        fee, computeFeePerIncrement(saturatingCastToUint32(expirationBytes),
                                    feeConfig.feePerWrite1KB,
                                    DATA_SIZE_1KB_INCREMENT));
    PLOG_TRACE(Fees, "Rent fee for {} changes ({} extended): {}",
               changes.size(), extendedEntries, fee);
    return fee;
}

int64_t
computeWriteFeePer1KB(int64_t bucketListSizeBytes,
                      WriteFeeConfiguration const& feeConfig)
{
    int64_t feeRateMultiplier = saturatingSubtract(
        feeConfig.writeFee1KBBucketListHigh, feeConfig.writeFee1KBBucketListLow);
    int64_t targetSize =
        std::max<int64_t>(feeConfig.bucketListTargetSizeBytes, 1);
    int64_t writeFeePer1KB;
    if (bucketListSizeBytes < feeConfig.bucketListTargetSizeBytes)
    {
        writeFeePer1KB = ceilDivide(
            saturatingMultiply(feeRateMultiplier, bucketListSizeBytes),
            targetSize);
        writeFeePer1KB =
            saturatingAdd(writeFeePer1KB, feeConfig.writeFee1KBBucketListLow);
    }
    else
    {
        writeFeePer1KB = feeConfig.writeFee1KBBucketListHigh;
        int64_t sizeAfterTarget = saturatingSubtract(
            bucketListSizeBytes, feeConfig.bucketListTargetSizeBytes);
        int64_t postTargetFee = ceilDivide(
            saturatingMultiply(
                saturatingMultiply(feeRateMultiplier, sizeAfterTarget),
                static_cast<int64_t>(feeConfig.bucketListWriteFeeGrowthFactor)),
            targetSize);
        writeFeePer1KB = saturatingAdd(writeFeePer1KB, postTargetFee);
    }
    return std::max(writeFeePer1KB, MINIMUM_WRITE_FEE_PER_1KB);
}
}
