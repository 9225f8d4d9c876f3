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

#include <cassert>
#include <string>
#include <type_traits>

#ifndef FLOATCONV_ASSERT
#define FLOATCONV_ASSERT(X) assert(X)
#endif

// Use long double as the working type for all conversions.
// If 0, or if long double is not wider than double, conversions are done in double precision.
#ifndef FLOATCONV_USE_LONG_DOUBLE
#define FLOATCONV_USE_LONG_DOUBLE 1
#endif

#if FLOATCONV_USE_LONG_DOUBLE
#define FLOATCONV_REAL_LITERAL(X) X##L
#else
#define FLOATCONV_REAL_LITERAL(X) X
#endif

namespace floatconv {

#if FLOATCONV_USE_LONG_DOUBLE
using Real = long double;
#else
using Real = double;
#endif

enum class Status {
    ok,
    invalid_number,     // trailing input (ParseStrict), or a bit pattern wider than 64 bits
    exponent_too_large, // a power of ten >= 10^512 was required
    buffer_too_small,   // Format: the requested number of decimals does not fit into the buffer
};

namespace impl {

// 10^(2^k) for k = 0,...,8.
constexpr Real kPowersOfTen[] = {
    FLOATCONV_REAL_LITERAL(1.0e1),
    FLOATCONV_REAL_LITERAL(1.0e2),
    FLOATCONV_REAL_LITERAL(1.0e4),
    FLOATCONV_REAL_LITERAL(1.0e8),
    FLOATCONV_REAL_LITERAL(1.0e16),
    FLOATCONV_REAL_LITERAL(1.0e32),
    FLOATCONV_REAL_LITERAL(1.0e64),
    FLOATCONV_REAL_LITERAL(1.0e128),
    FLOATCONV_REAL_LITERAL(1.0e256),
};

} // namespace impl

// Exponents passed to Pow10 must be less than this.
constexpr unsigned Pow10Limit = 1u << (sizeof(impl::kPowersOfTen) / sizeof(impl::kPowersOfTen[0]));

// Status status = Pow10(exponent, result);
//
// Computes 10^exponent by multiplying the table entries selected by the binary digits of the
// exponent.
// Returns Status::exponent_too_large if exponent >= 512. In this case result is not modified.
Status Pow10(unsigned exponent, Real& result);

//--------------------------------------------------------------------------------------------------
// Parse
//--------------------------------------------------------------------------------------------------

template <typename CharT>
struct ParseResult
{
    const CharT* next;
    Status status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == Status::ok;
    }
};

// ParseResult<char> res = Parse(first, last, value);
//
// Converts the longest prefix of [first, last) which looks like a floating-point number.
// The input may start with blanks and a sign and is one of
//  - a decimal number: digits, an optional point and digits, and an exponent "e[+-]ddd" (the
//    exponent is only recognized if the digits are not all zero; an 'e' is then consumed even
//    if no exponent digits follow, so "1e" is 1),
//  - "inf" or "nan",
//  - a radix prefix ("0x", "0o" or "0b") and digits. These are NOT converted numerically: the
//    digits form a 64-bit integer whose bit pattern is reinterpreted as an IEEE double, e.g.
//    "0x3FF0000000000000" is 1.0 and "0x7FF0000000000000" is +infinity.
//
// res.next points past the last character consumed. Trailing characters are not an error.
// Long digit sequences are accumulated in full, and lose accuracy once they exceed the
// precision of the working type.
//
// Returns Status::exponent_too_large if the decimal exponent is out of range for Pow10, and
// Status::invalid_number if the digits of a radix-prefixed numeral do not fit into 64 bits.
ParseResult<char> Parse(const char* first, const char* last, Real& value);
ParseResult<char16_t> Parse(const char16_t* first, const char16_t* last, Real& value);
ParseResult<char32_t> Parse(const char32_t* first, const char32_t* last, Real& value);

// Status status = ParseStrict(first, last, value);
//
// Like Parse, but returns Status::invalid_number unless the whole input was consumed.
Status ParseStrict(const char* first, const char* last, Real& value);
Status ParseStrict(const char16_t* first, const char16_t* last, Real& value);
Status ParseStrict(const char32_t* first, const char32_t* last, Real& value);

template <typename CharT, typename Float>
inline Status ParseStrict(const std::basic_string<CharT>& str, Float& value)
{
    static_assert(std::is_floating_point<Float>::value, "floating-point type required");

    Real x = 0;
    const Status status = ParseStrict(str.data(), str.data() + str.size(), x);
    if (status == Status::ok)
        value = static_cast<Float>(x);
    return status;
}

//--------------------------------------------------------------------------------------------------
// Format
//--------------------------------------------------------------------------------------------------

constexpr int FormatMinBufferLength = 32;

template <typename CharT>
struct FormatResult
{
    CharT* next;
    Status status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == Status::ok;
    }
};

// FormatResult<char> res = Format(first, last, value, decimals, scientific);
//
// Converts the given value into decimal form with exactly `decimals` fractional digits and stores
// the result in [first, res.next).
//
// The buffer must be large enough, i.e. >= FormatMinBufferLength.
// The output is _not_ null-terminated.
//
// The value is rounded half-up at the last requested decimal, i.e. 0.5 * 10^-decimals is added
// before the value is split into mantissa and exponent. Digits beyond the precision of the
// working type are output as zeros.
// Fixed notation ("123.45") is replaced by scientific notation ("1.23e+02") if the fixed form of
// the value would not fit into the buffer. NaNs and infinities are output as "nan", "-nan",
// "inf" and "-inf".
//
// Returns Status::exponent_too_large if decimals >= 512, and Status::buffer_too_small if the
// value with the requested number of decimals does not fit into the buffer at all.
FormatResult<char> Format(char* first, char* last, Real value, unsigned decimals = 2, bool scientific = false);
FormatResult<char16_t> Format(char16_t* first, char16_t* last, Real value, unsigned decimals = 2, bool scientific = false);
FormatResult<char32_t> Format(char32_t* first, char32_t* last, Real value, unsigned decimals = 2, bool scientific = false);

// Format into a 64-character temporary and copy the result into str.
// On failure, str is not modified.
Status ToString(std::string& str, Real value, unsigned decimals = 2, bool scientific = false);
Status ToU16String(std::u16string& str, Real value, unsigned decimals = 2, bool scientific = false);
Status ToU32String(std::u32string& str, Real value, unsigned decimals = 2, bool scientific = false);

} // namespace floatconv
