#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "xdr/Stellar-types.h"
#include <string>
#include <xdrpp/marshal.h>

namespace preflight
{

// Plain SHA256
Hash sha256(uint8_t const* data, size_t len);
Hash sha256(std::string const& bin);

// SHA256 of the XDR encoding of `t`.
template <typename T>
Hash
xdrSha256(T const& t)
{
    auto opaque = xdr::xdr_to_opaque(t);
    return sha256(opaque.data(), opaque.size());
}
}
