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

#include "classify.h"

#include <double-conversion/double-conversion.h>

#include <climits>
#include <cmath>
#include <limits>
#include <optional>

using namespace floatview;

//==================================================================================================
//
//==================================================================================================

static bool IsDigit(char ch)
{
    return '0' <= ch && ch <= '9';
}

static bool IsAlpha(char ch)
{
    return ('a' <= ch && ch <= 'z') || ('A' <= ch && ch <= 'Z');
}

static bool IsSpace(char ch)
{
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

static bool IsSign(char ch)
{
    return ch == '+' || ch == '-';
}

static bool IsAlphaOnly(std::string_view str)
{
    if (str.empty())
        return false;

    for (char const ch : str)
    {
        if (!IsAlpha(ch))
            return false;
    }
    return true;
}

static std::string ToLower(std::string_view str)
{
    std::string out(str);
    for (char& ch : out)
    {
        if ('A' <= ch && ch <= 'Z')
            ch = static_cast<char>(ch - 'A' + 'a');
    }
    return out;
}

static bool StartsWith(std::string_view str, std::string_view prefix)
{
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

static std::string_view Trim(std::string_view str)
{
    while (!str.empty() && IsSpace(str.front()))
        str.remove_prefix(1);
    while (!str.empty() && IsSpace(str.back()))
        str.remove_suffix(1);
    return str;
}

// Scans
//
//      [+-]? (digits ('.' digits?)? | '.' digits)
//
// and returns the position after the mantissa, or nullptr if there is no mantissa at `next`.
static char const* ScanMantissa(char const* next, char const* last)
{
    if (next != last && IsSign(*next))
        ++next;

    if (next == last)
        return nullptr;

    if (IsDigit(*next))
    {
        for (++next; next != last && IsDigit(*next); ++next)
        {
        }

        if (next != last && *next == '.')
        {
            for (++next; next != last && IsDigit(*next); ++next)
            {
            }
        }

        return next;
    }

    if (*next == '.')
    {
        ++next;
        if (next == last || !IsDigit(*next))
            return nullptr;

        for (++next; next != last && IsDigit(*next); ++next)
        {
        }

        return next;
    }

    return nullptr;
}

// Scans
//
//      [eE] [+-]? digits
//
// and returns the position after the exponent, or nullptr if there is no exponent at `next`.
static char const* ScanExponent(char const* next, char const* last)
{
    if (next == last || (*next != 'e' && *next != 'E'))
        return nullptr;

    ++next;
    if (next != last && IsSign(*next))
        ++next;

    if (next == last || !IsDigit(*next))
        return nullptr;

    for (++next; next != last && IsDigit(*next); ++next)
    {
    }

    return next;
}

static bool IsDecimalLiteral(std::string_view text)
{
    char const* const last = text.data() + text.size();

    char const* next = ScanMantissa(text.data(), last);
    if (next == nullptr)
        return false;

    if (next == last)
        return true;

    next = ScanExponent(next, last);
    return next == last;
}

//==================================================================================================
// Special tokens
//==================================================================================================

static std::optional<ParseOutcome> ClassifySpecial(std::string_view text, ParseOptions const& options)
{
    std::string_view sign;
    std::string_view body = text;
    if (IsSign(body.front()))
    {
        sign = body.substr(0, 1);
        body.remove_prefix(1);
    }

    bool const fold = options.case_insensitive_specials;
    std::string const cmp = fold ? ToLower(body) : std::string(body);

    if (options.allow_nan)
    {
        if (cmp == (fold ? "nan" : "NaN"))
        {
            // The sign is kept in the text only, the value is always the default quiet NaN.
            return ParseOutcome{Valid{std::numeric_limits<double>::quiet_NaN(), std::string(sign) + "NaN"}};
        }

        // Prefix detection is only done for case-insensitive tokens.
        if (fold && cmp.size() < 3 && StartsWith("nan", cmp) && IsAlphaOnly(body))
        {
            return ParseOutcome{Incomplete{reason::kIncompleteNaN, std::string(text)}};
        }
    }

    if (options.allow_infinity_synonyms)
    {
        bool const is_token = fold ? (cmp == "inf" || cmp == "infinity")
                                   : (cmp == "Inf" || cmp == "Infinity");
        if (is_token)
        {
            double const inf = std::numeric_limits<double>::infinity();
            return ParseOutcome{Valid{sign == "-" ? -inf : inf, std::string(sign) + "Infinity"}};
        }

        // "i", "in" and "infi".."infinit".
        // "inf" itself is a complete token and has been handled above.
        if (fold && cmp.size() < 8 && StartsWith("infinity", cmp) && IsAlphaOnly(body))
        {
            return ParseOutcome{Incomplete{reason::kIncompleteInfinity, std::string(text)}};
        }
    }

    return std::nullopt;
}

//==================================================================================================
// Incomplete numbers
//==================================================================================================

static char const* IncompleteNumberReason(std::string_view text, ParseOptions const& options)
{
    if (text == "-" || (options.allow_leading_plus && text == "+"))
        return reason::kSignOnly;

    if (text == "." || text == "-." || (options.allow_leading_plus && text == "+."))
        return reason::kDotOnly;

    char const* const last = text.data() + text.size();

    char const* const next = ScanMantissa(text.data(), last);
    if (next == nullptr || next == last || (*next != 'e' && *next != 'E'))
        return nullptr;

    if (next + 1 == last)
        return reason::kExponentMarkerOnly;

    if (next + 2 == last && IsSign(next[1]))
        return reason::kExponentSignOnly;

    return nullptr;
}

//==================================================================================================
// Conversion
//==================================================================================================

static double StringToDouble(std::string_view text)
{
    using double_conversion::StringToDoubleConverter;

    // The syntax has been checked. Anything the converter rejects yields NaN.
    StringToDoubleConverter const conv(StringToDoubleConverter::NO_FLAGS,
                                       0.0,
                                       std::numeric_limits<double>::quiet_NaN(),
                                       nullptr,
                                       nullptr);

    int processed_characters_count = 0;
    return conv.StringToDouble(text.data(), static_cast<int>(text.size()), &processed_characters_count);
}

//==================================================================================================
// Classify
//==================================================================================================

ParseOutcome floatview::Classify(std::string_view input, ParseOptions const& options)
{
    std::string_view const text = Trim(input);

    if (text.empty())
        return Incomplete{reason::kEmpty, ""};

    if (!options.allow_leading_plus && text.front() == '+')
        return Invalid{reason::kLeadingPlus, std::string(text)};

    if (auto special = ClassifySpecial(text, options))
        return std::move(*special);

    if (char const* why = IncompleteNumberReason(text, options))
        return Incomplete{why, std::string(text)};

    // The converter takes an int length.
    if (!IsDecimalLiteral(text) || text.size() > static_cast<size_t>(INT_MAX))
        return Invalid{reason::kInvalidSyntax, std::string(text)};

    double const value = StringToDouble(text);

    if (std::isnan(value))
        return Invalid{reason::kParsedToNaN, std::string(text)};

    if (!options.allow_infinity_synonyms && std::isinf(value))
        return Invalid{reason::kInfinityNotAllowed, std::string(text)};

    std::string_view normalized = text;
    if (options.allow_leading_plus && normalized.front() == '+')
        normalized.remove_prefix(1);

    return Valid{value, std::string(normalized)};
}
