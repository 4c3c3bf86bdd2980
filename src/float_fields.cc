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

#include "float_fields.h"

#include "bit_strings.h"
#include "ieee.h"

using namespace floatview;
using floatview::impl::GroupFromLeft;
using floatview::impl::GroupFromRight;
using floatview::impl::ToBinaryString;
using floatview::impl::ToHexString;

//==================================================================================================
//
//==================================================================================================

template <typename Float>
static FloatKind ClassifyBits(IEEE<Float> const& ieee)
{
    if (ieee.IsZero())
        return FloatKind::zero;
    if (ieee.IsSubnormal())
        return FloatKind::subnormal;
    if (ieee.IsInf())
        return FloatKind::infinity;
    if (ieee.IsNaN())
        return FloatKind::nan;
    return FloatKind::normal;
}

template <typename Float>
static std::optional<int> UnbiasedExponent(IEEE<Float> const& ieee, FloatKind kind)
{
    using Ieee = IEEE<Float>;

    switch (kind)
    {
    case FloatKind::normal:
        return static_cast<int>(ieee.PhysicalExponent()) - Ieee::ExponentBias;
    case FloatKind::subnormal:
        // Subnormals share the exponent of the smallest normal number.
        return Ieee::MinNormalExponent;
    case FloatKind::zero:
    case FloatKind::infinity:
    case FloatKind::nan:
        break;
    }

    return std::nullopt;
}

// Slices of the full binary string.
template <typename Float>
struct BitSlices
{
    using Ieee = IEEE<Float>;

    static std::string Sign(std::string const& bits) {
        return bits.substr(0, 1);
    }

    static std::string Exponent(std::string const& bits) {
        return bits.substr(1, Ieee::ExponentSize);
    }

    static std::string Mantissa(std::string const& bits) {
        return bits.substr(1 + Ieee::ExponentSize);
    }
};

static std::string HexBytes(std::string const& hex)
{
    return GroupFromLeft(hex, 2);
}

static std::string BitBytes(std::string const& bits)
{
    return GroupFromLeft(bits, 8);
}

//==================================================================================================
// FloatKind
//==================================================================================================

char const* floatview::KindName(FloatKind kind)
{
    switch (kind)
    {
    case FloatKind::zero:
        return "Zero";
    case FloatKind::subnormal:
        return "Subnormal";
    case FloatKind::normal:
        return "Normal";
    case FloatKind::infinity:
        return "Infinity";
    case FloatKind::nan:
        return "NaN";
    }

    return "?";
}

//==================================================================================================
// Float32Fields
//==================================================================================================

using Single = IEEE<float>;
using Double = IEEE<double>;

static_assert(Single::ExponentSize == 8, "");
static_assert(Single::PhysicalSignificandSize == 23, "");
static_assert(Double::ExponentSize == 11, "");
static_assert(Double::PhysicalSignificandSize == 52, "");

std::string floatview::Float32Fields::HexGrouped() const
{
    return HexBytes(hex);
}

std::string floatview::Float32Fields::BitsGrouped8() const
{
    return BitBytes(bits);
}

std::string floatview::Float32Fields::SignBitString() const
{
    return BitSlices<float>::Sign(bits);
}

std::string floatview::Float32Fields::ExponentBitString() const
{
    return BitSlices<float>::Exponent(bits);
}

std::string floatview::Float32Fields::MantissaBitString() const
{
    return BitSlices<float>::Mantissa(bits);
}

std::string floatview::Float32Fields::ExponentGrouped4() const
{
    return GroupFromRight(ExponentBitString(), 4);
}

std::string floatview::Float32Fields::MantissaGrouped4() const
{
    return GroupFromLeft(MantissaBitString(), 4);
}

std::string floatview::Float32Fields::PayloadHexPadded() const
{
    // ceil(23/4)
    return ToHexString(mantissa_bits, (Single::PhysicalSignificandSize + 3) / 4);
}

Float32Fields floatview::ToFloat32Fields(double value)
{
    // Narrowing rounds to nearest, ties to even.
    Single const ieee(static_cast<float>(value));

    Float32Fields fields;
    fields.kind              = ClassifyBits(ieee);
    fields.sign_bit          = ieee.SignBit();
    fields.exponent_bits     = ieee.PhysicalExponent();
    fields.mantissa_bits     = ieee.PhysicalSignificand();
    fields.exponent_unbiased = UnbiasedExponent(ieee, fields.kind);
    fields.hex               = ToHexString(ieee.bits, Single::TotalSize / 4);
    fields.bits              = ToBinaryString(ieee.bits, Single::TotalSize);
    return fields;
}

float floatview::ToFloat(Float32Fields const& fields)
{
    return Single::FromFields(fields.sign_bit, fields.exponent_bits, fields.mantissa_bits).Value();
}

//==================================================================================================
// Float64Fields
//==================================================================================================

std::string floatview::Float64Fields::HexGrouped() const
{
    return HexBytes(hex);
}

std::string floatview::Float64Fields::BitsGrouped8() const
{
    return BitBytes(bits);
}

std::string floatview::Float64Fields::SignBitString() const
{
    return BitSlices<double>::Sign(bits);
}

std::string floatview::Float64Fields::ExponentBitString() const
{
    return BitSlices<double>::Exponent(bits);
}

std::string floatview::Float64Fields::MantissaBitString() const
{
    return BitSlices<double>::Mantissa(bits);
}

std::string floatview::Float64Fields::ExponentGrouped4() const
{
    // 11 bits do not split evenly: the leading group holds the 3 top bits.
    return GroupFromRight(ExponentBitString(), 4);
}

std::string floatview::Float64Fields::MantissaGrouped4() const
{
    return GroupFromLeft(MantissaBitString(), 4);
}

std::string floatview::Float64Fields::PayloadHexPadded() const
{
    return ToHexString(Mantissa(), Double::PhysicalSignificandSize / 4);
}

Float64Fields floatview::ToFloat64Fields(double value)
{
    Double const ieee(value);

    uint64_t const significand = ieee.PhysicalSignificand();

    Float64Fields fields;
    fields.kind              = ClassifyBits(ieee);
    fields.sign_bit          = static_cast<uint32_t>(ieee.SignBit());
    fields.exponent_bits     = static_cast<uint32_t>(ieee.PhysicalExponent());
    fields.mantissa_high     = static_cast<uint32_t>(significand >> 32);
    fields.mantissa_low      = static_cast<uint32_t>(significand);
    fields.exponent_unbiased = UnbiasedExponent(ieee, fields.kind);
    fields.hex               = ToHexString(ieee.bits, Double::TotalSize / 4);
    fields.bits              = ToBinaryString(ieee.bits, Double::TotalSize);
    return fields;
}

double floatview::ToDouble(Float64Fields const& fields)
{
    return Double::FromFields(fields.sign_bit, fields.exponent_bits, fields.Mantissa()).Value();
}
