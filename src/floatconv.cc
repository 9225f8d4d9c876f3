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

#include "floatconv.h"

#include "ieee.h"
#include "integer.h"

#include <cmath>
#include <cstdint>
#include <limits>

using namespace floatconv;

//==================================================================================================
// Pow10
//==================================================================================================

Status floatconv::Pow10(unsigned exponent, Real& result)
{
    if (exponent >= Pow10Limit)
        return Status::exponent_too_large;

    Real mult = 1;
    for (const Real power : impl::kPowersOfTen)
    {
        if (exponent & 1)
            mult *= power;
        if ((exponent >>= 1) == 0)
            break;
    }

    result = mult;
    return Status::ok;
}

namespace {

// Computes value * 10^exponent.
// If 10^|exponent| is not representable (which happens for subnormals if the working type is
// double), the scaling is done in two steps.
Status ScaleByPow10(Real& value, int exponent)
{
    const unsigned n = static_cast<unsigned>(exponent < 0 ? -exponent : exponent);

    Real scale = 1;
    Status status = Pow10(n, scale);
    if (status != Status::ok)
        return status;

    if (scale <= std::numeric_limits<Real>::max())
    {
        if (exponent < 0)
            value /= scale;
        else
            value *= scale;
        return Status::ok;
    }

    Real lo = 1;
    Real hi = 1;
    if ((status = Pow10(n / 2, lo)) != Status::ok)
        return status;
    if ((status = Pow10(n - n / 2, hi)) != Status::ok)
        return status;

    if (exponent < 0)
    {
        value /= lo;
        value /= hi;
    }
    else
    {
        value *= lo;
        value *= hi;
    }
    return Status::ok;
}

} // namespace

//==================================================================================================
// Parse
//==================================================================================================

namespace {

template <typename CharT>
bool StartsWith(const CharT* next, const CharT* last, const char* token)
{
    for ( ; *token != '\0'; ++next, ++token)
    {
        if (next == last || *next != *token)
            return false;
    }
    return true;
}

template <typename CharT>
ParseResult<CharT> ParseImpl(const CharT* first, const CharT* last, Real& value)
{
    FLOATCONV_ASSERT(first <= last);

    const auto trim = integer::Trim(first, last);
    const CharT* next = trim.next;

    if (trim.radix != 10)
    {
        // Not a conversion: the digits are the raw bits of an IEEE double.
        // More than 64 bits of digits do not describe a double.
        uint64_t bits = 0;
        bool overflow = false;
        next = integer::ScanDigits(next, last, trim.radix, bits, overflow);
        if (overflow)
            return {first, Status::invalid_number};

        value = IEEE<double>(bits).Value();
        if (trim.negative)
            value = -value;

        return {next, Status::ok};
    }

    const CharT* const begin = next;

    Real mantissa = 0;
    int64_t exponent = 0;

    // Leading zeros are simply multiplied away.
    for ( ; next != last && integer::IsDigit(*next); ++next)
    {
        mantissa = mantissa * 10 + integer::DigitValue(*next);
    }

    if (next != last && *next == '.')
        ++next;

    // All fractional digits are accumulated. Very long inputs lose some accuracy.
    for ( ; next != last && integer::IsDigit(*next); ++next)
    {
        mantissa = mantissa * 10 + integer::DigitValue(*next);
        --exponent;
    }

    if (mantissa != 0)
    {
        // An 'e' is always consumed, even if no exponent digits follow.
        if (next != last && (*next == 'e' || *next == 'E'))
        {
            const auto parsed = integer::ParseInteger(next + 1, last, 10);

            if (parsed.overflow || parsed.magnitude > static_cast<uint64_t>(std::numeric_limits<int32_t>::max()))
                return {first, Status::exponent_too_large};

            exponent += parsed.Value();
            next = parsed.next;
        }

        // The exponent already includes the number of fractional digits.
        if (exponent <= -static_cast<int64_t>(Pow10Limit) || exponent >= static_cast<int64_t>(Pow10Limit))
            return {first, Status::exponent_too_large};

        const Status status = ScaleByPow10(mantissa, static_cast<int>(exponent));
        if (status != Status::ok)
            return {first, status};
    }
    else if (next == begin)
    {
        if (StartsWith(next, last, "inf"))
        {
            mantissa = std::numeric_limits<Real>::infinity();
            next += 3;
        }
        else if (StartsWith(next, last, "nan"))
        {
            mantissa = std::numeric_limits<Real>::quiet_NaN();
            next += 3;
        }
    }

    value = trim.negative ? -mantissa : mantissa;
    return {next, Status::ok};
}

template <typename CharT>
Status ParseStrictImpl(const CharT* first, const CharT* last, Real& value)
{
    const auto res = ParseImpl(first, last, value);
    if (res.status != Status::ok)
        return res.status;
    if (res.next != last)
        return Status::invalid_number;
    return Status::ok;
}

} // namespace

ParseResult<char> floatconv::Parse(const char* first, const char* last, Real& value)
{
    return ParseImpl(first, last, value);
}

ParseResult<char16_t> floatconv::Parse(const char16_t* first, const char16_t* last, Real& value)
{
    return ParseImpl(first, last, value);
}

ParseResult<char32_t> floatconv::Parse(const char32_t* first, const char32_t* last, Real& value)
{
    return ParseImpl(first, last, value);
}

Status floatconv::ParseStrict(const char* first, const char* last, Real& value)
{
    return ParseStrictImpl(first, last, value);
}

Status floatconv::ParseStrict(const char16_t* first, const char16_t* last, Real& value)
{
    return ParseStrictImpl(first, last, value);
}

Status floatconv::ParseStrict(const char32_t* first, const char32_t* last, Real& value)
{
    return ParseStrictImpl(first, last, value);
}

//==================================================================================================
// Format
//==================================================================================================

namespace {

// Digits beyond this count are not reliable and are output as '0'.
// (-1 because the last digit is not always storable.)
constexpr int kMaxDigits = std::numeric_limits<Real>::digits10 - 1;

// Removes the leading digit from a normalized mantissa (1 <= m < 10) and shifts the remaining
// digits to the left.
inline int ExtractDigit(Real& mantissa, int& count)
{
    if (++count > kMaxDigits)
        return 0;

    const int digit = static_cast<int>(mantissa);
    mantissa = (mantissa - digit) * 10;
    return digit;
}

template <typename CharT>
inline CharT* EmitString(CharT* next, const char* str)
{
    for ( ; *str != '\0'; ++str)
        *next++ = static_cast<CharT>(*str);
    return next;
}

template <typename CharT>
inline CharT* EmitDigit(CharT* next, int digit)
{
    *next++ = static_cast<CharT>('0' + digit);
    return next;
}

// Computes m and e with value = m * 10^e and 1 <= m < 10.
inline Status Normalize(Real& value, int& exponent)
{
    // log10 only needs to be close; the loops below fix the estimate.
    exponent = static_cast<int>(std::log10(value));

    const Status status = ScaleByPow10(value, -exponent);
    if (status != Status::ok)
        return status;

    while (value >= 10)
    {
        value /= 10;
        ++exponent;
    }
    while (value < 1)
    {
        value *= 10;
        --exponent;
    }

    return Status::ok;
}

template <typename CharT>
FormatResult<CharT> FormatImpl(CharT* first, CharT* last, Real value, unsigned decimals, bool scientific)
{
    FLOATCONV_ASSERT(last - first >= FormatMinBufferLength);

    const bool sign = SignBit(value);
    if (sign)
        value = -value;

    CharT* next = first;

    if (value != value)
        return {EmitString(next, sign ? "-nan" : "nan"), Status::ok};

    if (value == std::numeric_limits<Real>::infinity())
        return {EmitString(next, sign ? "-inf" : "inf"), Status::ok};

    const int64_t length = last - first;
    const int64_t num_sign = sign ? 1 : 0;

    int exponent = 0;

    // Zero is not scaled.
    if (value > 0)
    {
        Real scale = 1;
        Status status = Pow10(decimals, scale);
        if (status != Status::ok)
            return {first, status};

        // Half a unit in the last requested decimal. Ties are always rounded up.
        value += Real(0.5) / scale;

        status = Normalize(value, exponent);
        if (status != Status::ok)
            return {first, status};

        // Switch to scientific notation if the fixed form does not fit.
        const int64_t width = exponent < 0 ? -static_cast<int64_t>(exponent) : exponent;
        const int64_t num_int_digits = exponent < 0 ? 1 : exponent + 1;
        if (width + FormatMinBufferLength > length || num_sign + num_int_digits + 1 + decimals > length)
            scientific = true;
    }

    // d.ddd[e+NNN]. Zero is formatted the same way in both notations.
    if (scientific || value == 0)
    {
        const int64_t num_exponent_chars = exponent != 0 ? 5 : 0;
        if (num_sign + 2 + decimals + num_exponent_chars > length)
            return {first, Status::buffer_too_small};
    }

    int count = 0;

    if (sign)
        *next++ = '-';

    if (scientific)
    {
        next = EmitDigit(next, ExtractDigit(value, count));
        *next++ = '.';

        for ( ; decimals > 0; --decimals)
            next = EmitDigit(next, ExtractDigit(value, count));

        if (exponent != 0)
        {
            *next++ = 'e';
            *next++ = exponent < 0 ? '-' : '+';

            int e = exponent < 0 ? -exponent : exponent;
            if (e >= 100)
            {
                next = EmitDigit(next, e / 100);
                e %= 100;
            }
            next = EmitDigit(next, e / 10);
            next = EmitDigit(next, e % 10);
        }
    }
    else
    {
        if (exponent < 0)
        {
            *next++ = '0';
        }
        else
        {
            for ( ; exponent >= 0; --exponent)
                next = EmitDigit(next, ExtractDigit(value, count));
        }

        *next++ = '.';

        // Leading zeros of a pure fraction.
        for (++exponent; exponent < 0 && decimals > 0; --decimals, ++exponent)
            *next++ = '0';

        // ExtractDigit also produces the trailing zeros.
        for ( ; decimals > 0; --decimals)
            next = EmitDigit(next, ExtractDigit(value, count));
    }

    return {next, Status::ok};
}

template <typename StringT>
Status ToStringImpl(StringT& str, Real value, unsigned decimals, bool scientific)
{
    using CharT = typename StringT::value_type;

    CharT buf[64];
    const auto res = FormatImpl(buf, buf + 64, value, decimals, scientific);
    if (res.status != Status::ok)
        return res.status;

    str.assign(buf, res.next);
    return Status::ok;
}

} // namespace

FormatResult<char> floatconv::Format(char* first, char* last, Real value, unsigned decimals, bool scientific)
{
    return FormatImpl(first, last, value, decimals, scientific);
}

FormatResult<char16_t> floatconv::Format(char16_t* first, char16_t* last, Real value, unsigned decimals, bool scientific)
{
    return FormatImpl(first, last, value, decimals, scientific);
}

FormatResult<char32_t> floatconv::Format(char32_t* first, char32_t* last, Real value, unsigned decimals, bool scientific)
{
    return FormatImpl(first, last, value, decimals, scientific);
}

Status floatconv::ToString(std::string& str, Real value, unsigned decimals, bool scientific)
{
    return ToStringImpl(str, value, decimals, scientific);
}

Status floatconv::ToU16String(std::u16string& str, Real value, unsigned decimals, bool scientific)
{
    return ToStringImpl(str, value, decimals, scientific);
}

Status floatconv::ToU32String(std::u32string& str, Real value, unsigned decimals, bool scientific)
{
    return ToStringImpl(str, value, decimals, scientific);
}
