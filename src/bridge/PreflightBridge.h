#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "bridge/CPreflight.h"
#include "preflight/Preflight.h"
#include <string>

namespace preflight
{
class SnapshotSource;
class SimulationHostFactory;

// Bodies of the C entry points, with the host factory and snapshot supplied
// by the caller. Never throw: every failure is returned as an error-only
// result. The returned record is released with free_preflight_result.
CPreflightResult* runPreflightInvokeHfOp(SimulationHostFactory& factory,
                                         SnapshotSource const& snapshot,
                                         uint64_t bucketListSize,
                                         char const* invokeHfOp,
                                         char const* sourceAccount,
                                         CLedgerInfo const& ledgerInfo);

CPreflightResult* runPreflightFootprintExpirationOp(
    SnapshotSource const& snapshot, uint64_t bucketListSize,
    char const* opBody, char const* footprint, uint32_t currentLedgerSeq);

// Throws EncodingError if the passphrase is null.
LedgerInfo toLedgerInfo(CLedgerInfo const& info);

// Owned, NUL terminated copy of `s`, allocated with new[].
char* toOwnedCString(std::string const& s);
}
