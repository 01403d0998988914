#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Stellar-transaction.h"
#include <cstdint>

namespace preflight
{

// Upper bound on the encoded size of a signed envelope carrying `opBody`
// with the given footprint, including a 15% margin. The envelope is built
// with a muxed source account, the longest text memo and the maximum number
// of signatures.
uint32_t estimateMaxTransactionSize(OperationBody const& opBody,
                                    LedgerFootprint const& footprint);
}
