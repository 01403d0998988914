#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>

namespace preflight
{
// Saturating arithmetic: on overflow the result is clamped to the bound of
// the type in the direction of the overflow.
int64_t saturatingAdd(int64_t a, int64_t b);
int64_t saturatingSubtract(int64_t a, int64_t b);
int64_t saturatingMultiply(int64_t a, int64_t b);
uint64_t saturatingAdd(uint64_t a, uint64_t b);
uint64_t saturatingMultiply(uint64_t a, uint64_t b);

// Rounds towards positive infinity. Requires `den > 0`.
int64_t ceilDivide(int64_t num, int64_t den);

uint32_t saturatingCastToUint32(uint64_t v);
int64_t saturatingCastToInt64(uint64_t v);
}
