#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/SnapshotSource.h"
#include <cstdint>

namespace preflight
{

// Snapshot backed by the host process through SnapshotSourceGet and
// FreeSnapshotSourceEntry. Holds no state besides the opaque handle, so
// concurrent calls with distinct handles are independent.
class CallbackSnapshotSource : public SnapshotSource
{
    uintptr_t const mHandle;

  public:
    explicit CallbackSnapshotSource(uintptr_t handle);

    std::optional<std::vector<uint8_t>>
    getEntryXdr(LedgerKey const& key) const override;
};
}
