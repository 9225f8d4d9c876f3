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

namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

template <int Precision> struct BitsType;
template <> struct BitsType<24> { using type = uint32_t; };
template <> struct BitsType<53> { using type = uint64_t; };

} // namespace impl

template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr bits_type SignMask = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(impl::ReinterpretBits<bits_type>(value)) {}

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    value_type Value() const {
        return impl::ReinterpretBits<value_type>(bits);
    }
};

namespace impl {

// The sign bit sits at a different place for each storage layout:
// bit 31 of a binary32, bit 63 of a binary64, the top bit of byte 9 of an x87
// 80-bit extended value, and the top bit of byte 15 of a binary128.

template <typename Float, int Digits = std::numeric_limits<Float>::digits>
struct SignBitOf;

template <typename Float>
struct SignBitOf<Float, 24>
{
    static bool Get(Float value) { return IEEE<float>(static_cast<float>(value)).SignBit(); }
};

template <typename Float>
struct SignBitOf<Float, 53>
{
    static bool Get(Float value) { return IEEE<double>(static_cast<double>(value)).SignBit(); }
};

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
constexpr bool kBigEndian = true;
#else
constexpr bool kBigEndian = false;
#endif

template <typename Float>
struct SignBitOf<Float, 64>
{
    static_assert(sizeof(Float) >= 10, "x87 extended precision layout required");

    static bool Get(Float value)
    {
        unsigned char bytes[sizeof(Float)];
        std::memcpy(bytes, &value, sizeof(Float));
        return (bytes[kBigEndian ? 0 : 9] & 0x80) != 0;
    }
};

template <typename Float>
struct SignBitOf<Float, 113>
{
    static_assert(sizeof(Float) == 16, "IEEE-754 quadruple precision layout required");

    static bool Get(Float value)
    {
        unsigned char bytes[sizeof(Float)];
        std::memcpy(bytes, &value, sizeof(Float));
        return (bytes[kBigEndian ? 0 : 15] & 0x80) != 0;
    }
};

} // namespace impl

// Returns the sign bit of the given value, read from its storage.
// Unlike a comparison against zero, this distinguishes -0 from +0 and
// negative from positive NaNs.
template <typename Float>
inline bool SignBit(Float value)
{
    return impl::SignBitOf<Float>::Get(value);
}

} // namespace floatconv
