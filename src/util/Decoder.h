#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "preflight/PreflightErrors.h"
#include <string>
#include <vector>
#include <xdrpp/marshal.h>

namespace preflight
{
namespace decoder
{
// Standard alphabet, padded base64 (RFC 4648 section 4) through libsodium.
std::string encode_b64(std::vector<uint8_t> const& v);
std::string encode_b64(uint8_t const* data, size_t len);

// Throws EncodingError on malformed input.
std::vector<uint8_t> decode_b64(std::string const& encoded);

template <typename T>
std::string
xdrToBase64(T const& t)
{
    auto opaque = xdr::xdr_to_opaque(t);
    return encode_b64(opaque.data(), opaque.size());
}

// Decodes a base64 XDR payload, reporting either layer's failure as an
// EncodingError naming `what`.
template <typename T>
void
xdrFromBase64(std::string const& encoded, T& out, char const* what)
{
    std::vector<uint8_t> bytes;
    try
    {
        bytes = decode_b64(encoded);
    }
    catch (EncodingError const& e)
    {
        throw EncodingError(std::string("invalid base64 for ") + what + ": " +
                            e.what());
    }
    try
    {
        xdr::xdr_from_opaque(bytes, out);
    }
    catch (xdr::xdr_runtime_error const& e)
    {
        throw EncodingError(std::string("invalid XDR for ") + what + ": " +
                            e.what());
    }
}
}
}
