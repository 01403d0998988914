// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/LedgerTypeUtils.h"
#include "crypto/SHA.h"
#include "util/GlobalChecks.h"
#include <stdexcept>

namespace preflight
{

bool
isSorobanEntry(LedgerKey const& key)
{
    return key.type() == CONTRACT_DATA || key.type() == CONTRACT_CODE;
}

bool
isTemporaryEntry(LedgerKey const& key)
{
    return key.type() == CONTRACT_DATA &&
           key.contractData().durability == TEMPORARY;
}

bool
isPersistentEntry(LedgerKey const& key)
{
    return key.type() == CONTRACT_CODE ||
           (key.type() == CONTRACT_DATA &&
            key.contractData().durability == PERSISTENT);
}

LedgerKey
getExpirationKey(LedgerKey const& key)
{
    releaseAssertOrThrow(isSorobanEntry(key));
    LedgerKey k(EXPIRATION);
    k.expiration().keyHash = xdrSha256(key);
    return k;
}

LedgerKey
LedgerEntryKey(LedgerEntry const& e)
{
    auto const& d = e.data;
    LedgerKey k(d.type());
    switch (d.type())
    {
    case ACCOUNT:
        k.account().accountID = d.account().accountID;
        break;
    case TRUSTLINE:
        k.trustLine().accountID = d.trustLine().accountID;
        k.trustLine().asset = d.trustLine().asset;
        break;
    case OFFER:
        k.offer().sellerID = d.offer().sellerID;
        k.offer().offerID = d.offer().offerID;
        break;
    case DATA:
        k.data().accountID = d.data().accountID;
        k.data().dataName = d.data().dataName;
        break;
    case CLAIMABLE_BALANCE:
        k.claimableBalance().balanceID = d.claimableBalance().balanceID;
        break;
    case LIQUIDITY_POOL:
        k.liquidityPool().liquidityPoolID =
            d.liquidityPool().liquidityPoolID;
        break;
    case CONTRACT_DATA:
        k.contractData().contract = d.contractData().contract;
        k.contractData().key = d.contractData().key;
        k.contractData().durability = d.contractData().durability;
        break;
    case CONTRACT_CODE:
        k.contractCode().hash = d.contractCode().hash;
        break;
    case CONFIG_SETTING:
        k.configSetting().configSettingID =
            d.configSetting().configSettingID();
        break;
    case EXPIRATION:
        k.expiration().keyHash = d.expiration().keyHash;
        break;
    default:
        throw std::runtime_error("unknown ledger entry type");
    }
    return k;
}
}
