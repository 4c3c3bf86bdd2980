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

namespace floatview {

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

// Raw view of an IEEE-754 binary32 or binary64 encoding.
//
//  | sign | biased exponent | physical significand |
//     1      ExponentSize      SignificandSize - 1
template <typename Float>
struct IEEE
{
    static_assert(std::numeric_limits<Float>::is_iec559 &&
                  ((std::numeric_limits<Float>::digits == 24 && std::numeric_limits<Float>::max_exponent == 128) ||
                   (std::numeric_limits<Float>::digits == 53 && std::numeric_limits<Float>::max_exponent == 1024)),
        "IEEE-754 single- or double-precision implementation required");

    using value_type = Float;
    using bits_type = typename floatview::impl::BitsType<std::numeric_limits<Float>::digits>::type;

    static constexpr int       TotalSize               = static_cast<int>(sizeof(bits_type)) * 8;
    static constexpr int       SignificandSize         = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr int       PhysicalSignificandSize = SignificandSize - 1;                     // = p-1 (stored bits)
    static constexpr int       ExponentSize            = TotalSize - 1 - PhysicalSignificandSize;
    static constexpr int       ExponentBias            = std::numeric_limits<value_type>::max_exponent - 1;
    static constexpr int       MinNormalExponent       = 1 - ExponentBias;
    static constexpr bits_type MaxBiasedExponent       = (bits_type{1} << ExponentSize) - 1;
    static constexpr bits_type HiddenBit               = bits_type{1} << PhysicalSignificandSize;  // = 2^(p-1)
    static constexpr bits_type SignificandMask         = HiddenBit - 1;                            // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask            = MaxBiasedExponent << PhysicalSignificandSize;
    static constexpr bits_type SignMask                = ~(~bits_type{0} >> 1);

    bits_type bits;

    explicit IEEE(bits_type bits_) : bits(bits_) {}
    explicit IEEE(value_type value) : bits(floatview::impl::ReinterpretBits<bits_type>(value)) {}

    // Assembles an encoding from its three fields.
    // The fields must be in range; excess bits are masked off.
    static IEEE FromFields(bits_type sign_bit, bits_type biased_exponent, bits_type significand)
    {
        return IEEE(((sign_bit << (TotalSize - 1)) & SignMask)
                  | ((biased_exponent << PhysicalSignificandSize) & ExponentMask)
                  | (significand & SignificandMask));
    }

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> PhysicalSignificandSize;
    }

    bits_type SignBit() const {
        return bits >> (TotalSize - 1);
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool IsSubnormal() const {
        return (bits & ExponentMask) == 0 && (bits & SignificandMask) != 0;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    value_type Value() const {
        return floatview::impl::ReinterpretBits<value_type>(bits);
    }
};

} // namespace floatview
