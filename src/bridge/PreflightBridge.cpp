// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "bridge/PreflightBridge.h"
#include "bridge/CallbackSnapshotSource.h"
#include "crypto/SHA.h"
#include "preflight/PreflightErrors.h"
#include "util/Decoder.h"
#include "util/Logging.h"
#include <Tracy.hpp>
#include <cstring>
#include <memory>
#include <new>
#include <sodium.h>

namespace preflight
{
namespace
{
struct ResultDeleter
{
    void
    operator()(CPreflightResult* result) const
    {
        free_preflight_result(result);
    }
};

// Owns a result record while it is being filled in, so that a throw halfway
// through releases whatever was already allocated.
using ResultHolder = std::unique_ptr<CPreflightResult, ResultDeleter>;

ResultHolder
newResult()
{
    return ResultHolder(new CPreflightResult{});
}

CPreflightResult*
preflightError(std::string const& msg)
{
    auto res = newResult();
    res->error = toOwnedCString(msg);
    return res.release();
}

// Returned when not even an error result can be allocated. Shared by every
// caller and never released.
char gOutOfMemoryMessage[] = "panic during preflight() call: out of memory";
CPreflightResult gOutOfMemoryResult{gOutOfMemoryMessage, nullptr, nullptr,
                                    nullptr, 0, nullptr, 0, 0};

void
freeCStringArray(char** array)
{
    if (array == nullptr)
    {
        return;
    }
    for (char** it = array; *it != nullptr; ++it)
    {
        delete[] *it;
    }
    delete[] array;
}

// `field` is attached before any element is allocated and the array is
// zero-filled, so it stays NULL terminated (and releasable) at every step.
template <typename T>
void
fillBase64Array(char**& field, xdr::xvector<T> const& items)
{
    field = new char*[items.size() + 1]();
    for (size_t i = 0; i < items.size(); ++i)
    {
        field[i] = toOwnedCString(decoder::xdrToBase64(items[i]));
    }
}

char const*
checkArg(char const* arg, char const* name)
{
    if (arg == nullptr)
    {
        throw EncodingError(std::string("null argument: ") + name);
    }
    return arg;
}

void
initCrypto()
{
    if (sodium_init() < 0)
    {
        throw EngineFault("could not initialize libsodium");
    }
}

// Runs `op` and converts every escaping exception into an error-only result.
// Nothing may unwind into the foreign caller, including a bad_alloc thrown
// while the error result itself is built.
template <typename Op>
CPreflightResult*
catchPreflightPanic(Op&& op) noexcept
{
    try
    {
        try
        {
            return op();
        }
        catch (EngineFault const& e)
        {
            PLOG_ERROR(Bridge, "Fault during preflight: {}", e.what());
            return preflightError(
                std::string("panic during preflight() call: ") + e.what());
        }
        catch (std::bad_alloc const&)
        {
            throw;
        }
        catch (std::exception const& e)
        {
            PLOG_DEBUG(Bridge, "Preflight failed: {}", e.what());
            return preflightError(e.what());
        }
        catch (...)
        {
            PLOG_ERROR(Bridge, "Unknown fault during preflight");
            return preflightError(
                "panic during preflight() call: unknown cause");
        }
    }
    catch (std::bad_alloc const&)
    {
        return &gOutOfMemoryResult;
    }
}
}

char*
toOwnedCString(std::string const& s)
{
    auto res = new char[s.size() + 1];
    std::memcpy(res, s.c_str(), s.size() + 1);
    return res;
}

LedgerInfo
toLedgerInfo(CLedgerInfo const& info)
{
    LedgerInfo res;
    res.protocolVersion = info.protocol_version;
    res.sequenceNumber = info.sequence_number;
    res.timestamp = info.timestamp;
    res.networkID =
        sha256(std::string(checkArg(info.network_passphrase,
                                    "ledger_info.network_passphrase")));
    res.baseReserve = info.base_reserve;
    res.minTempEntryExpiration = info.min_temp_entry_expiration;
    res.minPersistentEntryExpiration = info.min_persistent_entry_expiration;
    res.maxEntryExpiration = info.max_entry_expiration;
    res.autobumpLedgers = info.autobump_ledgers;
    return res;
}

CPreflightResult*
runPreflightInvokeHfOp(SimulationHostFactory& factory,
                       SnapshotSource const& snapshot, uint64_t bucketListSize,
                       char const* invokeHfOp, char const* sourceAccount,
                       CLedgerInfo const& ledgerInfo)
{
    return catchPreflightPanic([&]() {
        ZoneScoped;
        initCrypto();
        InvokeHostFunctionOp op;
        decoder::xdrFromBase64(checkArg(invokeHfOp, "invoke_hf_op"), op,
                               "InvokeHostFunctionOp");
        AccountID source;
        decoder::xdrFromBase64(checkArg(sourceAccount, "source_account"),
                               source, "AccountID");
        auto info = toLedgerInfo(ledgerInfo);

        auto pr = preflightInvokeHostFunctionOp(factory, snapshot,
                                                bucketListSize, op, source, info);

        auto res = newResult();
        fillBase64Array(res->auth, pr.auth);
        if (pr.result)
        {
            res->result = toOwnedCString(decoder::xdrToBase64(*pr.result));
        }
        res->transaction_data =
            toOwnedCString(decoder::xdrToBase64(pr.transactionData));
        res->min_fee = pr.minFee;
        fillBase64Array(res->events, pr.events);
        res->cpu_instructions = pr.cpuInstructions;
        res->memory_bytes = pr.memoryBytes;
        return res.release();
    });
}

CPreflightResult*
runPreflightFootprintExpirationOp(SnapshotSource const& snapshot,
                                  uint64_t bucketListSize, char const* opBody,
                                  char const* footprint,
                                  uint32_t currentLedgerSeq)
{
    return catchPreflightPanic([&]() {
        ZoneScoped;
        initCrypto();
        OperationBody body;
        decoder::xdrFromBase64(checkArg(opBody, "op_body"), body,
                               "OperationBody");
        LedgerFootprint fp;
        decoder::xdrFromBase64(checkArg(footprint, "footprint"), fp,
                               "LedgerFootprint");

        auto pr = preflightFootprintExpirationOp(snapshot, bucketListSize,
                                                 body, fp, currentLedgerSeq);

        auto res = newResult();
        res->transaction_data =
            toOwnedCString(decoder::xdrToBase64(pr.transactionData));
        res->min_fee = pr.minFee;
        return res.release();
    });
}
}

using namespace preflight;

extern "C" CPreflightResult*
preflight_invoke_hf_op(uintptr_t handle, uint64_t bucket_list_size,
                       const char* invoke_hf_op, const char* source_account,
                       CLedgerInfo ledger_info)
{
    CallbackSnapshotSource snapshot(handle);
    return runPreflightInvokeHfOp(getDefaultSimulationHostFactory(), snapshot,
                                  bucket_list_size, invoke_hf_op,
                                  source_account, ledger_info);
}

extern "C" CPreflightResult*
preflight_footprint_expiration_op(uintptr_t handle, uint64_t bucket_list_size,
                                  const char* op_body, const char* footprint,
                                  uint32_t current_ledger_seq)
{
    CallbackSnapshotSource snapshot(handle);
    return runPreflightFootprintExpirationOp(
        snapshot, bucket_list_size, op_body, footprint, current_ledger_seq);
}

extern "C" void
free_preflight_result(CPreflightResult* result)
{
    if (result == nullptr || result == &gOutOfMemoryResult)
    {
        return;
    }
    delete[] result->error;
    freeCStringArray(result->auth);
    delete[] result->result;
    delete[] result->transaction_data;
    freeCStringArray(result->events);
    delete result;
}

extern "C" int
preflight_set_log_level(const char* partition, const char* level)
{
    if (level == nullptr)
    {
        return -1;
    }
    try
    {
        auto ll = Logging::getLLfromString(level);
        if (!Logging::setLogLevel(ll, partition))
        {
            return -1;
        }
        PLOG_INFO(Bridge, "Log level of {} set to {}",
                  partition ? partition : "all partitions",
                  Logging::getStringFromLL(ll));
        return 0;
    }
    catch (std::invalid_argument const& e)
    {
        PLOG_WARNING(Bridge, "Rejected log level change: {}", e.what());
        return -1;
    }
}
