#include "catch2/catch.hpp"

#include "integer.h"

#include <cstdint>
#include <limits>
#include <string>

using namespace floatconv;

static integer::TrimResult<char> Trim(const std::string& str, int radix = 0)
{
    return integer::Trim(str.data(), str.data() + str.size(), radix);
}

static int TrimLength(const std::string& str, int radix = 0)
{
    return static_cast<int>(Trim(str, radix).next - str.data());
}

TEST_CASE("Trim - Blanks and sign")
{
    CHECK(TrimLength("") == 0);
    CHECK(TrimLength("42") == 0);
    CHECK(TrimLength("  42") == 2);
    CHECK(TrimLength(" \t-42") == 3);
    CHECK(TrimLength("+42") == 1);
    CHECK(TrimLength("-") == 1);
    CHECK(TrimLength("\n42") == 0);

    CHECK(Trim("-42").negative);
    CHECK(!Trim("+42").negative);
    CHECK(!Trim("42").negative);
    CHECK(Trim(" -").negative);

    CHECK(Trim("42").radix == 10);
    CHECK(Trim("42", 8).radix == 8);
}

TEST_CASE("Trim - Radix prefix")
{
    CHECK(Trim("0x1F").radix == 16);
    CHECK(TrimLength("0x1F") == 2);
    CHECK(Trim("0X1f").radix == 16);
    CHECK(Trim("0o17").radix == 8);
    CHECK(Trim("0O17").radix == 8);
    CHECK(Trim("0b101").radix == 2);
    CHECK(Trim("0B101").radix == 2);
    CHECK(Trim("-0x10").radix == 16);
    CHECK(TrimLength("-0x10") == 3);
    CHECK(Trim("-0x10").negative);

    // A prefix requires a digit.
    CHECK(Trim("0x").radix == 10);
    CHECK(TrimLength("0x") == 0);
    CHECK(Trim("0xg").radix == 10);
    CHECK(Trim("0b2").radix == 10);
    CHECK(Trim("0o8").radix == 10);
    CHECK(Trim("0.5").radix == 10);
    CHECK(Trim("0e5").radix == 10);

    // An explicit radix must match the prefix.
    CHECK(Trim("0x1F", 16).radix == 16);
    CHECK(TrimLength("0x1F", 16) == 2);
    CHECK(Trim("0x1F", 10).radix == 10);
    CHECK(TrimLength("0x1F", 10) == 0);
}

TEST_CASE("ScanDigits")
{
    const std::string str = "1234xyz";

    uint64_t magnitude = 0;
    bool overflow = true;
    const char* next = integer::ScanDigits(str.data(), str.data() + str.size(), 10, magnitude, overflow);
    CHECK(next - str.data() == 4);
    CHECK(magnitude == 1234);
    CHECK(!overflow);

    next = integer::ScanDigits(str.data(), str.data() + str.size(), 36, magnitude, overflow);
    CHECK(next == str.data() + str.size());
    CHECK(!overflow);

    next = integer::ScanDigits(str.data(), str.data() + str.size(), 2, magnitude, overflow);
    CHECK(next - str.data() == 1);
    CHECK(magnitude == 1);
}

static integer::IntegerResult<char> ParseInteger(const std::string& str, int radix = 0)
{
    return integer::ParseInteger(str.data(), str.data() + str.size(), radix);
}

static int ParsedLength(const std::string& str, int radix = 0)
{
    return static_cast<int>(ParseInteger(str, radix).next - str.data());
}

TEST_CASE("ParseInteger")
{
    CHECK(ParseInteger("0").Value() == 0);
    CHECK(ParseInteger("123abc").Value() == 123);
    CHECK(ParsedLength("123abc") == 3);
    CHECK(ParseInteger("  +7").Value() == 7);
    CHECK(ParsedLength("  +7") == 4);
    CHECK(ParseInteger("-42").Value() == -42);
    CHECK(ParseInteger("-0x10").Value() == -16);
    CHECK(ParsedLength("-0x10") == 5);
    CHECK(ParseInteger("0b1010").Value() == 10);
    CHECK(ParseInteger("0o777").Value() == 511);
    CHECK(ParseInteger("zz", 36).Value() == 35 * 36 + 35);
    CHECK(ParseInteger("0x1F", 10).Value() == 0);
    CHECK(ParsedLength("0x1F", 10) == 1);
}

TEST_CASE("ParseInteger - No digits")
{
    static const struct {
        const char* str;
        int consumed;
    } kInputs[] = {
        {"", 0},
        {"x", 0},
        {"-", 1},
        {"  ", 2},
        {" +", 2},
        {"-.5", 1},
        {" \t-e", 3},
    };

    for (const auto& input : kInputs)
    {
        CAPTURE(input.str);
        const std::string str = input.str;
        const auto res = ParseInteger(str);
        CHECK(res.next - str.data() == input.consumed);
        CHECK(res.magnitude == 0);
        CHECK(res.Value() == 0);
        CHECK(!res.overflow);
    }
}

TEST_CASE("ParseInteger - Overflow")
{
    auto res = ParseInteger("18446744073709551615");
    CHECK(!res.overflow);
    CHECK(res.magnitude == std::numeric_limits<uint64_t>::max());

    res = ParseInteger("0xFFFFFFFFFFFFFFFF");
    CHECK(!res.overflow);
    CHECK(res.magnitude == std::numeric_limits<uint64_t>::max());
    CHECK(res.Value() == -1);

    res = ParseInteger("18446744073709551616");
    CHECK(res.overflow);
    CHECK(res.magnitude == std::numeric_limits<uint64_t>::max());
    CHECK(ParsedLength("18446744073709551616") == 20);

    res = ParseInteger("-9223372036854775808");
    CHECK(!res.overflow);
    CHECK(res.Value() == std::numeric_limits<int64_t>::min());
}

TEST_CASE("ParseInteger - Wide characters")
{
    const std::u16string s16 = u" -12";
    const auto r16 = integer::ParseInteger(s16.data(), s16.data() + s16.size());
    CHECK(r16.Value() == -12);
    CHECK(r16.next == s16.data() + s16.size());

    const std::u32string s32 = U"0xff!";
    const auto r32 = integer::ParseInteger(s32.data(), s32.data() + s32.size());
    CHECK(r32.Value() == 255);
    CHECK(r32.next - s32.data() == 4);
}
