// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "bridge/CallbackSnapshotSource.h"
#include "bridge/CPreflight.h"
#include "preflight/PreflightErrors.h"
#include "util/Decoder.h"
#include "util/Logging.h"
#include <Tracy.hpp>
#include <memory>

namespace preflight
{
namespace
{
struct HostEntryDeleter
{
    void
    operator()(char* entry) const
    {
        FreeSnapshotSourceEntry(entry);
    }
};
}

CallbackSnapshotSource::CallbackSnapshotSource(uintptr_t handle)
    : mHandle(handle)
{
}

std::optional<std::vector<uint8_t>>
CallbackSnapshotSource::getEntryXdr(LedgerKey const& key) const
{
    ZoneScoped;
    auto keyB64 = decoder::xdrToBase64(key);
    char* rawEntry = nullptr;
    auto status = SnapshotSourceGet(mHandle, keyB64.c_str(), &rawEntry);
    std::unique_ptr<char, HostEntryDeleter> entry(rawEntry);

    switch (status)
    {
    case SNAPSHOT_SOURCE_FOUND:
        break;
    case SNAPSHOT_SOURCE_NOT_FOUND:
        return std::nullopt;
    case SNAPSHOT_SOURCE_ERROR:
        PLOG_WARNING(Bridge, "Snapshot lookup failed for key {}", keyB64);
        throw IntegrationError("snapshot source lookup failed");
    default:
        throw IntegrationError("snapshot source returned an unknown status");
    }

    if (!entry)
    {
        throw IntegrationError("snapshot source reported a found entry "
                               "without returning it");
    }
    try
    {
        return decoder::decode_b64(entry.get());
    }
    catch (EncodingError const& e)
    {
        throw IntegrationError(
            std::string("snapshot source returned a malformed entry: ") +
            e.what());
    }
}
}
