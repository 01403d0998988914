// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "ledger/SnapshotSource.h"
#include "ledger/LedgerTypeUtils.h"
#include "preflight/PreflightErrors.h"
#include "util/Logging.h"
#include "util/XDROperators.h"
#include <Tracy.hpp>
#include <fmt/format.h>
#include <xdrpp/marshal.h>

namespace preflight
{

std::optional<LedgerEntry>
SnapshotSource::loadEntry(LedgerKey const& key) const
{
    ZoneScoped;
    auto bytes = getEntryXdr(key);
    if (!bytes)
    {
        return std::nullopt;
    }

    LedgerEntry le;
    try
    {
        xdr::xdr_from_opaque(*bytes, le);
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        throw IntegrationError(
            fmt::format(FMT_STRING("snapshot returned malformed ledger entry "
                                   "for key of type {}: {}"),
                        xdr::xdr_traits<LedgerEntryType>::enum_name(
                            key.type()),
                        e.what()));
    }
    if (!(LedgerEntryKey(le) == key))
    {
        throw IntegrationError(
            "snapshot returned a ledger entry that does not match its key");
    }
    return le;
}

ConfigSettingEntry
SnapshotSource::loadConfigSetting(ConfigSettingID id) const
{
    ZoneScoped;
    auto const* name = xdr::xdr_traits<ConfigSettingID>::enum_name(id);
    LedgerKey key(CONFIG_SETTING);
    key.configSetting().configSettingID = id;

    auto le = loadEntry(key);
    if (!le)
    {
        PLOG_ERROR(Ledger, "Config setting {} missing from snapshot", name);
        throw IntegrationError(fmt::format(
            FMT_STRING("config setting {} not found in snapshot"), name));
    }
    // loadEntry already matched the key, so the entry is a config setting
    // carrying the requested id.
    auto const& setting = le->data.configSetting();
    if (setting.configSettingID() != id)
    {
        throw IntegrationError(fmt::format(
            FMT_STRING("unexpected config setting entry for {}"), name));
    }
    return setting;
}

std::optional<uint32_t>
SnapshotSource::loadExpirationLedger(LedgerKey const& key) const
{
    releaseAssertOrThrow(isSorobanEntry(key));
    auto le = loadEntry(getExpirationKey(key));
    if (!le)
    {
        return std::nullopt;
    }
    return le->data.expiration().expirationLedgerSeq;
}
}
