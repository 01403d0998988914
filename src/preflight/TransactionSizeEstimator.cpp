// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/TransactionSizeEstimator.h"
#include "util/numeric.h"
#include <Tracy.hpp>
#include <xdrpp/marshal.h>

namespace preflight
{
namespace
{
size_t const MAX_MEMO_TEXT_SIZE = 28;
size_t const MAX_SIGNATURES = 20;

MuxedAccount
makeZeroMuxedAccount()
{
    MuxedAccount source(KEY_TYPE_MUXED_ED25519);
    source.med25519().id = 0;
    source.med25519().ed25519.fill(0);
    return source;
}
}

uint32_t
estimateMaxTransactionSize(OperationBody const& opBody,
                           LedgerFootprint const& footprint)
{
    ZoneScoped;
    auto source = makeZeroMuxedAccount();

    TransactionV1Envelope envelope;
    auto& tx = envelope.tx;
    tx.sourceAccount = source;
    tx.fee = 0;
    tx.seqNum = 0;
    tx.cond.type(PRECOND_NONE);
    tx.memo.type(MEMO_TEXT);
    tx.memo.text().assign(MAX_MEMO_TEXT_SIZE, '\0');

    Operation op;
    op.sourceAccount.activate() = source;
    op.body = opBody;
    tx.operations.emplace_back(op);

    tx.ext.v(1);
    auto& sorobanData = tx.ext.sorobanData();
    sorobanData.resources.footprint = footprint;
    sorobanData.resources.instructions = 0;
    sorobanData.resources.readBytes = 0;
    sorobanData.resources.writeBytes = 0;
    sorobanData.resources.extendedMetaDataSizeBytes = 0;
    sorobanData.refundableFee = 0;

    envelope.signatures.resize(MAX_SIGNATURES);
    for (auto& sig : envelope.signatures)
    {
        sig.hint.fill(0);
        sig.signature.clear();
    }

    uint64_t envelopeSize = xdr::xdr_size(envelope);
    return saturatingCastToUint32(envelopeSize * 115 / 100);
}
}
