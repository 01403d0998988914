#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// C interface of the preflight library. Every XDR payload crossing this
// boundary is base64 encoded (standard alphabet, padded) and NUL terminated.

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct CLedgerInfo
{
    uint32_t protocol_version;
    uint32_t sequence_number;
    uint64_t timestamp;
    const char* network_passphrase;
    uint32_t base_reserve;
    uint32_t min_temp_entry_expiration;
    uint32_t min_persistent_entry_expiration;
    uint32_t max_entry_expiration;
    uint32_t autobump_ledgers;
} CLedgerInfo;

// Either `error` is set and every other field is null/zero, or `error` is
// null and the success fields are populated. Arrays are NULL terminated.
// Each result must be released exactly once with free_preflight_result.
// When memory runs out the returned record is a shared static one carrying
// only an error; freeing it is a no-op.
typedef struct CPreflightResult
{
    char* error;
    char** auth;            // SorobanAuthorizationEntry
    char* result;           // SCVal
    char* transaction_data; // SorobanTransactionData
    int64_t min_fee;
    char** events; // DiagnosticEvent
    uint64_t cpu_instructions;
    uint64_t memory_bytes;
} CPreflightResult;

CPreflightResult* preflight_invoke_hf_op(uintptr_t handle,
                                         uint64_t bucket_list_size,
                                         const char* invoke_hf_op,
                                         const char* source_account,
                                         CLedgerInfo ledger_info);

// `op_body` is an OperationBody, `footprint` a LedgerFootprint.
CPreflightResult* preflight_footprint_expiration_op(uintptr_t handle,
                                                    uint64_t bucket_list_size,
                                                    const char* op_body,
                                                    const char* footprint,
                                                    uint32_t current_ledger_seq);

// Null-safe.
void free_preflight_result(CPreflightResult* result);

// `partition` may be null to set every partition. `level` is one of trace,
// debug, info, warning, error, fatal, none. Returns 0 on success.
int preflight_set_log_level(const char* partition, const char* level);

// Implemented by the host process.
typedef enum SnapshotSourceStatus
{
    SNAPSHOT_SOURCE_FOUND = 0,
    SNAPSHOT_SOURCE_NOT_FOUND = 1,
    SNAPSHOT_SOURCE_ERROR = 2
} SnapshotSourceStatus;

// Looks up the base64 LedgerKey `ledger_key` in the snapshot identified by
// `handle`. On SNAPSHOT_SOURCE_FOUND, `*entry` receives a base64 LedgerEntry
// owned by the host, released through FreeSnapshotSourceEntry.
SnapshotSourceStatus SnapshotSourceGet(uintptr_t handle, const char* ledger_key,
                                       char** entry);
void FreeSnapshotSourceEntry(char* entry);

#ifdef __cplusplus
}
#endif
