#include "catch2/catch.hpp"

#include "floatconv.h"

#include <cmath>
#include <limits>

using floatconv::Real;
using floatconv::Status;

static Real Pow10(unsigned exponent)
{
    Real result = 0;
    const Status status = floatconv::Pow10(exponent, result);
    CHECK(status == Status::ok);
    return result;
}

TEST_CASE("Pow10 - Table")
{
    constexpr int NumPowers = sizeof(floatconv::impl::kPowersOfTen) / sizeof(floatconv::impl::kPowersOfTen[0]);
    STATIC_REQUIRE(NumPowers == 9);
    STATIC_REQUIRE(floatconv::Pow10Limit == 512);

    CHECK(floatconv::impl::kPowersOfTen[0] == 10);

    // The squares are exact up to 10^16.
    for (int k = 1; k <= 4; ++k)
    {
        CAPTURE(k);
        const Real prev = floatconv::impl::kPowersOfTen[k - 1];
        CHECK(floatconv::impl::kPowersOfTen[k] == prev * prev);
    }

    for (int k = 5; k < NumPowers; ++k)
    {
        CAPTURE(k);
        const Real prev = floatconv::impl::kPowersOfTen[k - 1];
        const Real curr = floatconv::impl::kPowersOfTen[k];
        if (curr > std::numeric_limits<Real>::max())
            continue;
        CHECK(std::abs(curr - prev * prev) <= 4 * std::numeric_limits<Real>::epsilon() * curr);
    }
}

TEST_CASE("Pow10 - Powers of two")
{
    CHECK(Pow10(0) == 1);

    for (int k = 0; k < 9; ++k)
    {
        CAPTURE(k);
        CHECK(Pow10(1u << k) == floatconv::impl::kPowersOfTen[k]);
    }
}

TEST_CASE("Pow10 - Small exponents are exact")
{
    Real expected = 1;
    for (unsigned e = 0; e <= 27; ++e)
    {
        CAPTURE(e);
        // 10^e = 2^e * 5^e is exact as long as 5^e fits into the significand.
        if (e > 22 && std::numeric_limits<Real>::digits <= 53)
            break;
        CHECK(Pow10(e) == expected);
        expected *= 10;
    }
}

TEST_CASE("Pow10 - Range")
{
    Real result = 0;
    CHECK(floatconv::Pow10(511, result) == Status::ok);
    if (std::numeric_limits<Real>::max_exponent10 > 511)
    {
        CHECK(std::isfinite(result));
        CHECK(result > Pow10(510));
    }

    result = 123;
    CHECK(floatconv::Pow10(512, result) == Status::exponent_too_large);
    CHECK(result == 123);
    CHECK(floatconv::Pow10(1000, result) == Status::exponent_too_large);
    CHECK(floatconv::Pow10(std::numeric_limits<unsigned>::max(), result) == Status::exponent_too_large);
    CHECK(result == 123);
}

TEST_CASE("Pow10 - Sum of exponents")
{
    const unsigned max_exponent = static_cast<unsigned>(std::numeric_limits<Real>::max_exponent10) < 511
        ? static_cast<unsigned>(std::numeric_limits<Real>::max_exponent10)
        : 511;

    for (unsigned a = 0; a <= max_exponent; a += 7)
    {
        for (unsigned b = 0; a + b <= max_exponent; b += 13)
        {
            CAPTURE(a);
            CAPTURE(b);
            const Real expected = Pow10(a + b);
            const Real product = Pow10(a) * Pow10(b);
            CHECK(std::abs(product - expected) <= 64 * std::numeric_limits<Real>::epsilon() * expected);
        }
    }
}
