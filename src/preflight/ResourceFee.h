#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Resource fee formulas. These must agree bit for bit with the computation
// validators perform when charging a transaction, including the order in
// which values are rounded and saturated.

#include <cstdint>
#include <utility>
#include <vector>

namespace preflight
{

int64_t const INSTRUCTIONS_INCREMENT = 10000;
int64_t const DATA_SIZE_1KB_INCREMENT = 1024;
// Approximate size of the transaction result stored in history.
uint32_t const TX_BASE_RESULT_SIZE = 300;
int64_t const MINIMUM_WRITE_FEE_PER_1KB = 1000;
// Size of an EXPIRATION ledger entry written whenever an entry is bumped.
uint32_t const EXPIRATION_ENTRY_SIZE = 48;

// Resources a transaction is charged for.
struct TransactionResources
{
    uint32_t instructions{0};
    uint32_t readEntries{0};
    uint32_t writeEntries{0};
    uint32_t readBytes{0};
    uint32_t writeBytes{0};
    uint32_t metadataSizeBytes{0};
    uint32_t transactionSizeBytes{0};
};

// Per-resource rate table, in stroops.
struct FeeConfiguration
{
    int64_t feePerInstructionIncrement{0};
    int64_t feePerReadEntry{0};
    int64_t feePerWriteEntry{0};
    int64_t feePerRead1KB{0};
    int64_t feePerWrite1KB{0};
    int64_t feePerHistorical1KB{0};
    int64_t feePerMetadata1KB{0};
    int64_t feePerPropagate1KB{0};
};

// Parameters of the write fee curve over the bucket list size.
struct WriteFeeConfiguration
{
    int64_t bucketListTargetSizeBytes{0};
    int64_t writeFee1KBBucketListLow{0};
    int64_t writeFee1KBBucketListHigh{0};
    uint32_t bucketListWriteFeeGrowthFactor{0};
};

struct RentFeeConfiguration
{
    int64_t feePerWrite1KB{0};
    int64_t feePerWriteEntry{0};
    int64_t persistentRentRateDenominator{0};
    int64_t temporaryRentRateDenominator{0};
};

// Size and expiration of a single entry before and after a transaction.
struct LedgerEntryRentChange
{
    bool isPersistent{false};
    uint32_t oldSizeBytes{0};
    uint32_t newSizeBytes{0};
    uint32_t oldExpirationLedger{0};
    uint32_t newExpirationLedger{0};
};

// Returns (non-refundable fee, refundable fee).
std::pair<int64_t, int64_t>
computeTransactionResourceFee(TransactionResources const& resources,
                              FeeConfiguration const& feeConfig);

// Fee for extending the lifetime (and covering size growth) of the given
// entries, as of `currentLedgerSeq`. Fully refundable.
int64_t computeRentFee(std::vector<LedgerEntryRentChange> const& changes,
                       RentFeeConfiguration const& feeConfig,
                       uint32_t currentLedgerSeq);

// Write fee per 1KB for a bucket list of the given size: grows linearly from
// the low to the high rate until the target size, then keeps growing at
// `bucketListWriteFeeGrowthFactor` times that slope. Never below
// MINIMUM_WRITE_FEE_PER_1KB.
int64_t computeWriteFeePer1KB(int64_t bucketListSizeBytes,
                              WriteFeeConfiguration const& feeConfig);
}
