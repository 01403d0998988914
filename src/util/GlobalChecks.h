#pragma once

// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

namespace preflight
{
// The engine runs inside a foreign host process and must never abort it, so
// failed checks always throw.
[[noreturn]] void printAssertFailureAndThrow(char const* s1, char const* file,
                                             int line);
}

// Checks an internal invariant in every build type and throws
// std::runtime_error when it does not hold.
#define releaseAssertOrThrow(e)                                                \
    (static_cast<bool>(e)                                                      \
         ? void(0)                                                             \
         : preflight::printAssertFailureAndThrow(#e, __FILE__, __LINE__))
