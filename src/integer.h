// Copyright 2019 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <cstdint>
#include <cstring>
#include <limits>

namespace floatconv {
namespace integer {

//==================================================================================================
// Integer scanning
//
// Recognizes the prefix of a numeral (blanks, sign, radix marker) and scans integers in radix
// 2 to 36. Used by the floating-point parser for the sign, for exponent digits and for the raw
// bit patterns of non-decimal numerals.
//==================================================================================================

template <typename CharT>
inline bool IsDigit(CharT ch)
{
    return '0' <= ch && ch <= '9';
}

// Returns the value of ch as a base-36 digit, or 36 if ch is not a digit in any radix.
template <typename CharT>
inline int DigitValue(CharT ch)
{
    if ('0' <= ch && ch <= '9')
        return static_cast<int>(ch - '0');
    if ('a' <= ch && ch <= 'z')
        return static_cast<int>(ch - 'a') + 10;
    if ('A' <= ch && ch <= 'Z')
        return static_cast<int>(ch - 'A') + 10;
    return 36;
}

template <typename CharT>
struct TrimResult
{
    const CharT* next;
    bool negative;
    int radix;
};

namespace impl {

template <typename CharT>
inline int RadixFromMarker(CharT ch)
{
    switch (ch)
    {
    case 'x':
    case 'X':
        return 16;
    case 'o':
    case 'O':
        return 8;
    case 'b':
    case 'B':
        return 2;
    default:
        return 0;
    }
}

} // namespace impl

// Skips blanks, an optional sign and a radix prefix ("0x", "0o" or "0b").
//
// A prefix is only taken when it is followed by at least one digit valid in its radix, so "0x"
// on its own is the decimal numeral "0" followed by an 'x'.
// If radix is 0, the radix of the prefix is returned (or 10 if there is none). Otherwise the
// prefix is skipped only if it matches the requested radix.
template <typename CharT>
inline TrimResult<CharT> Trim(const CharT* next, const CharT* last, int radix = 0)
{
    while (next != last && (*next == ' ' || *next == '\t'))
        ++next;

    bool negative = false;
    if (next != last && (*next == '-' || *next == '+'))
    {
        negative = (*next == '-');
        ++next;
    }

    if (last - next >= 3 && *next == '0')
    {
        const int prefix_radix = impl::RadixFromMarker(next[1]);
        if (prefix_radix != 0 && DigitValue(next[2]) < prefix_radix && (radix == 0 || radix == prefix_radix))
        {
            return {next + 2, negative, prefix_radix};
        }
    }

    return {next, negative, radix == 0 ? 10 : radix};
}

// Accumulates the digits valid in the given radix.
// Returns a pointer past the last digit. If the value does not fit into 64 bits, magnitude
// saturates at UINT64_MAX and overflow is set.
template <typename CharT>
inline const CharT* ScanDigits(const CharT* next, const CharT* last, int radix, uint64_t& magnitude, bool& overflow)
{
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();

    magnitude = 0;
    overflow = false;

    for ( ; next != last; ++next)
    {
        const int digit = DigitValue(*next);
        if (digit >= radix)
            break;

        const uint64_t d = static_cast<uint64_t>(digit);
        const uint64_t r = static_cast<uint64_t>(radix);
        if (overflow || magnitude > (kMax - d) / r)
        {
            magnitude = kMax;
            overflow = true;
        }
        else
        {
            magnitude = magnitude * r + d;
        }
    }

    return next;
}

template <typename CharT>
struct IntegerResult
{
    const CharT* next;
    uint64_t magnitude;
    bool negative;
    bool overflow;

    // Two's complement value of the (saturated) magnitude, with the sign applied.
    int64_t Value() const
    {
        const uint64_t bits = negative ? (0 - magnitude) : magnitude;
        int64_t value;
        std::memcpy(&value, &bits, sizeof(bits));
        return value;
    }
};

// Parses an optionally signed integer. See Trim() for the meaning of radix.
// Blanks and a sign are consumed even if no digits follow; the value is 0 then.
template <typename CharT>
inline IntegerResult<CharT> ParseInteger(const CharT* first, const CharT* last, int radix = 0)
{
    const auto trim = Trim(first, last, radix);

    uint64_t magnitude = 0;
    bool overflow = false;
    const CharT* const end = ScanDigits(trim.next, last, trim.radix, magnitude, overflow);

    return {end, magnitude, trim.negative, overflow};
}

} // namespace integer
} // namespace floatconv
