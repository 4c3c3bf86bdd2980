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

#include "format_view.h"

#include <cstdint>
#include <optional>

using namespace floatview;

static void AppendLine(std::string& out, char const* key, std::string const& value)
{
    out += key;
    out += ": ";
    out += value;
    out += '\n';
}

static std::string ExponentString(std::optional<int> const& exponent)
{
    return exponent ? std::to_string(*exponent) : std::string("-");
}

template <typename Fields>
static void AppendCommon(std::string& out, Fields const& f)
{
    AppendLine(out, "kind", KindName(f.kind));
    AppendLine(out, "hex (bytes)", f.HexGrouped());
    AppendLine(out, "bits (bytes)", f.BitsGrouped8());
    AppendLine(out, "s", f.SignBitString());
    AppendLine(out, "e", f.ExponentGrouped4());
    AppendLine(out, "m", f.MantissaGrouped4());
    AppendLine(out, "exponent (bits)", std::to_string(f.exponent_bits));
    AppendLine(out, "exponent (unbiased)", ExponentString(f.exponent_unbiased));
}

template <typename Fields>
static void AppendPayload(std::string& out, Fields const& f)
{
    if (f.kind != FloatKind::nan)
        return;

    AppendLine(out, "NaN payload (bits)", f.PayloadGrouped4());
    AppendLine(out, "NaN payload (hex)", f.PayloadHexPadded());
}

static void AppendFields(std::string& out, Float32Fields const& f)
{
    AppendCommon(out, f);
    AppendLine(out, "mantissa (uint)", std::to_string(f.mantissa_bits));
    AppendPayload(out, f);
}

static void AppendFields(std::string& out, Float64Fields const& f)
{
    AppendCommon(out, f);
    AppendLine(out, "mantissa high (20)", std::to_string(f.mantissa_high));
    AppendLine(out, "mantissa low (32)", std::to_string(f.mantissa_low));
    AppendPayload(out, f);
}

bool floatview::IsInputChar(char ch)
{
    if ('0' <= ch && ch <= '9')
        return true;

    switch (ch)
    {
    case '.':
    case '+':
    case '-':
    case 'e': case 'E':
    case 'a': case 'A':
    case 'i': case 'I':
    case 'n': case 'N':
    case 'f': case 'F':
    case 't': case 'T':
    case 'y': case 'Y':
        return true;
    default:
        return false;
    }
}

std::string floatview::FilterInput(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char const ch : text)
    {
        if (IsInputChar(ch))
            out += ch;
    }
    return out;
}

std::string floatview::FormatView(ViewResult const& view)
{
    std::string out;

    if (auto const* incomplete = std::get_if<Incomplete>(&view))
    {
        AppendLine(out, "state", "Incomplete");
        AppendLine(out, "reason", incomplete->reason);
        return out;
    }

    if (auto const* invalid = std::get_if<Invalid>(&view))
    {
        AppendLine(out, "state", "Invalid");
        AppendLine(out, "reason", invalid->reason);
        return out;
    }

    auto const& valid = std::get<ValidView>(view);

    AppendLine(out, "state", "Valid");
    AppendLine(out, "precision", PrecisionName(valid.precision));
    AppendLine(out, "normalized", valid.normalized_text);
    std::visit([&](auto const& fields) { AppendFields(out, fields); }, valid.fields);

    return out;
}
