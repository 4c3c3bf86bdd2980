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
#include <optional>
#include <string>

namespace floatview {

// Derived from the exponent and significand bit patterns only.
enum class FloatKind {
    zero,
    subnormal,
    normal,
    infinity,
    nan,
};

// "Zero", "Subnormal", "Normal", "Infinity" or "NaN".
char const* KindName(FloatKind kind);

//==================================================================================================
// Float32Fields
//
//  bit  31 | 30 .. 23 | 22 .. 0
//     sign | exponent | mantissa
//==================================================================================================

struct Float32Fields
{
    FloatKind kind = FloatKind::zero;
    uint32_t sign_bit = 0;                 // 0 or 1
    uint32_t exponent_bits = 0;            // biased, 0..255
    uint32_t mantissa_bits = 0;            // 0..2^23-1
    std::optional<int> exponent_unbiased;  // Normal and Subnormal only
    std::string hex;                       // 8 lowercase hex digits
    std::string bits;                      // 32 binary digits

    // "3f 80 00 00"
    std::string HexGrouped() const;
    // "00111111 10000000 00000000 00000000"
    std::string BitsGrouped8() const;

    std::string SignBitString() const;
    std::string ExponentBitString() const;
    std::string MantissaBitString() const;

    // 4+4
    std::string ExponentGrouped4() const;
    // 4x5+3, cut from the left
    std::string MantissaGrouped4() const;

    // The NaN payload is the mantissa. It only carries meaning for FloatKind::nan.
    uint32_t PayloadBits() const { return mantissa_bits; }
    std::string PayloadGrouped4() const { return MantissaGrouped4(); }
    // 6 hex digits
    std::string PayloadHexPadded() const;
};

//==================================================================================================
// Float64Fields
//
//  bit  63 | 62 .. 52 | 51 .. 32      | 31 .. 0
//     sign | exponent | mantissa_high | mantissa_low
//==================================================================================================

struct Float64Fields
{
    FloatKind kind = FloatKind::zero;
    uint32_t sign_bit = 0;                 // 0 or 1
    uint32_t exponent_bits = 0;            // biased, 0..2047
    uint32_t mantissa_high = 0;            // top 20 bits of the mantissa
    uint32_t mantissa_low = 0;             // bottom 32 bits of the mantissa
    std::optional<int> exponent_unbiased;  // Normal and Subnormal only
    std::string hex;                       // 16 lowercase hex digits
    std::string bits;                      // 64 binary digits

    std::string HexGrouped() const;
    std::string BitsGrouped8() const;

    std::string SignBitString() const;
    std::string ExponentBitString() const;
    std::string MantissaBitString() const;

    // 3+4+4, cut from the right
    std::string ExponentGrouped4() const;
    // 4x13
    std::string MantissaGrouped4() const;

    uint64_t Mantissa() const { return (uint64_t{mantissa_high} << 32) | mantissa_low; }

    uint32_t PayloadHigh() const { return mantissa_high; }
    uint32_t PayloadLow() const { return mantissa_low; }
    std::string PayloadGrouped4() const { return MantissaGrouped4(); }
    // 13 hex digits
    std::string PayloadHexPadded() const;
};

// Fields of `value` once narrowed to binary32 (round-to-nearest-even).
Float32Fields ToFloat32Fields(double value);

// Fields of `value` as binary64.
Float64Fields ToFloat64Fields(double value);

// Reassemble the encoded value from sign, exponent and mantissa.
// The string members are not consulted.
float ToFloat(Float32Fields const& fields);
double ToDouble(Float64Fields const& fields);

} // namespace floatview
