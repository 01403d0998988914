// Copyright 2023 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Decoder.h"
#include "util/XDROperators.h"
#include "util/numeric.h"
#include "xdr/Stellar-ledger-entries.h"
#include <catch2/catch.hpp>
#include <limits>

using namespace preflight;

TEST_CASE("saturating arithmetic", "[numeric]")
{
    auto const maxI = std::numeric_limits<int64_t>::max();
    auto const minI = std::numeric_limits<int64_t>::min();
    auto const maxU = std::numeric_limits<uint64_t>::max();

    REQUIRE(saturatingAdd(int64_t(2), int64_t(3)) == 5);
    REQUIRE(saturatingAdd(maxI, int64_t(1)) == maxI);
    REQUIRE(saturatingAdd(minI, int64_t(-1)) == minI);
    REQUIRE(saturatingSubtract(minI, int64_t(1)) == minI);
    REQUIRE(saturatingSubtract(int64_t(5), int64_t(7)) == -2);
    REQUIRE(saturatingMultiply(maxI, int64_t(2)) == maxI);
    REQUIRE(saturatingMultiply(maxI, int64_t(-2)) == minI);
    REQUIRE(saturatingAdd(maxU, uint64_t(1)) == maxU);
    REQUIRE(saturatingMultiply(maxU, uint64_t(3)) == maxU);

    REQUIRE(saturatingCastToUint32(uint64_t(1) << 40) ==
            std::numeric_limits<uint32_t>::max());
    REQUIRE(saturatingCastToUint32(17) == 17);
    REQUIRE(saturatingCastToInt64(maxU) == maxI);
}

TEST_CASE("ceiling division", "[numeric]")
{
    REQUIRE(ceilDivide(0, 1024) == 0);
    REQUIRE(ceilDivide(1, 1024) == 1);
    REQUIRE(ceilDivide(1024, 1024) == 1);
    REQUIRE(ceilDivide(1025, 1024) == 2);
    REQUIRE_THROWS(ceilDivide(1, 0));
}

TEST_CASE("base64 helpers", "[decoder]")
{
    std::vector<uint8_t> bytes{0, 1, 2, 250, 251};
    auto encoded = decoder::encode_b64(bytes);
    REQUIRE(encoded == "AAEC+vs=");
    REQUIRE(decoder::decode_b64(encoded) == bytes);
    REQUIRE(decoder::decode_b64("").empty());
    REQUIRE_THROWS_AS(decoder::decode_b64("AAEC+vs"), EncodingError);
    REQUIRE_THROWS_AS(decoder::decode_b64("AA-C"), EncodingError);

    LedgerKey key(CONTRACT_CODE);
    key.contractCode().hash.fill(7);
    LedgerKey decoded;
    decoder::xdrFromBase64(decoder::xdrToBase64(key), decoded, "LedgerKey");
    REQUIRE(decoded == key);

    LedgerEntry entry;
    REQUIRE_THROWS_WITH(decoder::xdrFromBase64("AAAA", entry, "LedgerEntry"),
                        Catch::StartsWith("invalid XDR for LedgerEntry"));
    REQUIRE_THROWS_WITH(decoder::xdrFromBase64("!", entry, "LedgerEntry"),
                        Catch::StartsWith("invalid base64 for LedgerEntry"));
}
