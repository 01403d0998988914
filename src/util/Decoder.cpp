// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Decoder.h"
#include <sodium.h>

namespace preflight
{
namespace decoder
{

std::string
encode_b64(uint8_t const* data, size_t len)
{
    if (len == 0)
    {
        return {};
    }
    size_t const encodedLen =
        sodium_base64_encoded_len(len, sodium_base64_VARIANT_ORIGINAL);
    // encodedLen includes the trailing NUL.
    std::string res(encodedLen, '\0');
    sodium_bin2base64(&res[0], encodedLen, data, len,
                      sodium_base64_VARIANT_ORIGINAL);
    res.resize(encodedLen - 1);
    return res;
}

std::string
encode_b64(std::vector<uint8_t> const& v)
{
    return encode_b64(v.data(), v.size());
}

std::vector<uint8_t>
decode_b64(std::string const& encoded)
{
    std::vector<uint8_t> res(encoded.size() / 4 * 3 + 3);
    size_t binLen = 0;
    char const* end = nullptr;
    if (sodium_base642bin(res.data(), res.size(), encoded.data(),
                          encoded.size(), nullptr, &binLen, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != encoded.data() + encoded.size())
    {
        throw EncodingError("malformed base64 string");
    }
    res.resize(binLen);
    return res;
}
}
}
