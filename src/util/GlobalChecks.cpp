// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include <fmt/format.h>
#include <stdexcept>

namespace preflight
{
[[noreturn]] void
printAssertFailureAndThrow(char const* s1, char const* file, int line)
{
    auto msg = fmt::format(FMT_STRING("{} at {}:{}"), s1, file, line);
    PLOG_ERROR(Preflight, "Assertion failure: {}", msg);
    throw std::runtime_error(msg);
}
}
