// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/SHA.h"
#include <Tracy.hpp>
#include <sodium.h>
#include <stdexcept>

namespace preflight
{

Hash
sha256(uint8_t const* data, size_t len)
{
    ZoneScoped;
    Hash out;
    if (crypto_hash_sha256(out.data(), data, len) != 0)
    {
        throw std::runtime_error("error from crypto_hash_sha256");
    }
    return out;
}

Hash
sha256(std::string const& bin)
{
    return sha256(reinterpret_cast<uint8_t const*>(bin.data()), bin.size());
}
}
