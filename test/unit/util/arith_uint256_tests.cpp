// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Unit tests for util/arith_uint256.cpp

#include "util/arith_uint256.hpp"
#include "util/uint.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace strata;

TEST_CASE("arith_uint256 - decimal formatting", "[arith_uint256]") {
    CHECK(arith_uint256().ToString() == "0");
    CHECK(arith_uint256(7).ToString() == "7");
    CHECK(arith_uint256(1000000000).ToString() == "1000000000");
    CHECK(arith_uint256(18446744073709551615ULL).ToString() == "18446744073709551615");

    arith_uint256 big = 1;
    for (int i = 0; i < 30; ++i) {
        big *= 10;
    }
    CHECK(big.ToString() == "1000000000000000000000000000000");
}

TEST_CASE("arith_uint256 - arithmetic beyond 64 bits", "[arith_uint256]") {
    const arith_uint256 a = arith_uint256(1) << 100;
    const arith_uint256 b = arith_uint256(3) << 98;

    CHECK(a + b - b == a);
    CHECK((a * arith_uint256(5)) / arith_uint256(5) == a);
    CHECK(a % arith_uint256(10000) == arith_uint256(a - (a / arith_uint256(10000)) * arith_uint256(10000)));
    CHECK(a > b);
    CHECK(b < a);
    CHECK((a >> 100) == arith_uint256(1));
    CHECK(a.bits() == 101);
}

TEST_CASE("arith_uint256 - modulo rounds to share multiples", "[arith_uint256]") {
    const arith_uint256 tax(15600123);
    const arith_uint256 shares(10000);
    CHECK(tax - tax % shares == arith_uint256(15600000));
    CHECK((arith_uint256(15600000) % shares).IsZero());
}

TEST_CASE("arith_uint256 - big-endian conversion from uint256", "[arith_uint256]") {
    uint256 raw;
    raw.data()[31] = 0x01;
    CHECK(UintToArith256(raw) == arith_uint256(1));

    uint256 top;
    top.data()[0] = 0x80;
    CHECK(UintToArith256(top) == (arith_uint256(1) << 255));

    const arith_uint256 value = (arith_uint256(0xdeadbeef) << 64) + arith_uint256(42);
    CHECK(UintToArith256(ArithToUint256(value)) == value);
    CHECK(ArithToUint256(value).GetHex() == value.GetHex());
}

TEST_CASE("arith_uint256 - low 64 bits", "[arith_uint256]") {
    const arith_uint256 v = (arith_uint256(1) << 80) + arith_uint256(0x1122334455667788ULL);
    CHECK(v.GetLow64() == 0x1122334455667788ULL);
}
