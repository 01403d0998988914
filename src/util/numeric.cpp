// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/numeric.h"
#include "util/GlobalChecks.h"
#include <limits>

namespace preflight
{

int64_t
saturatingAdd(int64_t a, int64_t b)
{
    int64_t res;
    if (__builtin_add_overflow(a, b, &res))
    {
        return a > 0 ? std::numeric_limits<int64_t>::max()
                     : std::numeric_limits<int64_t>::min();
    }
    return res;
}

int64_t
saturatingSubtract(int64_t a, int64_t b)
{
    int64_t res;
    if (__builtin_sub_overflow(a, b, &res))
    {
        return b < 0 ? std::numeric_limits<int64_t>::max()
                     : std::numeric_limits<int64_t>::min();
    }
    return res;
}

int64_t
saturatingMultiply(int64_t a, int64_t b)
{
    int64_t res;
    if (__builtin_mul_overflow(a, b, &res))
    {
        return ((a < 0) != (b < 0)) ? std::numeric_limits<int64_t>::min()
                                    : std::numeric_limits<int64_t>::max();
    }
    return res;
}

uint64_t
saturatingAdd(uint64_t a, uint64_t b)
{
    uint64_t res;
    if (__builtin_add_overflow(a, b, &res))
    {
        return std::numeric_limits<uint64_t>::max();
    }
    return res;
}

uint64_t
saturatingMultiply(uint64_t a, uint64_t b)
{
    uint64_t res;
    if (__builtin_mul_overflow(a, b, &res))
    {
        return std::numeric_limits<uint64_t>::max();
    }
    return res;
}

int64_t
ceilDivide(int64_t num, int64_t den)
{
    releaseAssertOrThrow(den > 0);
    int64_t q = num / den;
    int64_t r = num % den;
    // C++ division truncates towards zero, which is already the ceiling for
    // negative quotients.
    if (r > 0)
    {
        ++q;
    }
    return q;
}

uint32_t
saturatingCastToUint32(uint64_t v)
{
    if (v > std::numeric_limits<uint32_t>::max())
    {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(v);
}

int64_t
saturatingCastToInt64(uint64_t v)
{
    if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    {
        return std::numeric_limits<int64_t>::max();
    }
    return static_cast<int64_t>(v);
}
}
