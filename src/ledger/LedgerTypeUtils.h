#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Stellar-ledger-entries.h"

namespace preflight
{

// Contract data and contract code entries carry an expiration ledger.
bool isSorobanEntry(LedgerKey const& key);

bool isTemporaryEntry(LedgerKey const& key);

// Contract code is always persistent.
bool isPersistentEntry(LedgerKey const& key);

LedgerKey getExpirationKey(LedgerKey const& key);

LedgerKey LedgerEntryKey(LedgerEntry const& e);
}
