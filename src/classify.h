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

#include <string>
#include <string_view>
#include <variant>

namespace floatview {

struct ParseOptions
{
    bool allow_leading_plus = true;         // "+1"
    bool allow_infinity_synonyms = true;    // "Inf", "Infinity" and overflowing literals
    bool allow_nan = true;                  // "NaN"
    bool case_insensitive_specials = true;  // "nan", "INF", ...
};

// The input is a proper prefix of a literal, e.g. "-", "1e+" or "na".
struct Incomplete
{
    std::string reason;
    std::string normalized_text;
};

// The input does not match the grammar.
struct Invalid
{
    std::string reason;
    std::string normalized_text;
};

struct Valid
{
    double value;
    std::string normalized_text;
};

using ParseOutcome = std::variant<Incomplete, Invalid, Valid>;

// Reasons reported with Incomplete and Invalid outcomes.
namespace reason {
    constexpr char const* kEmpty                  = "empty";
    constexpr char const* kLeadingPlus            = "leading plus is not allowed";
    constexpr char const* kIncompleteNaN          = "incomplete NaN token";
    constexpr char const* kIncompleteInfinity     = "incomplete Infinity token";
    constexpr char const* kSignOnly               = "sign only";
    constexpr char const* kDotOnly                = "dot only";
    constexpr char const* kExponentMarkerOnly     = "exponent marker only";
    constexpr char const* kExponentSignOnly       = "exponent sign only";
    constexpr char const* kInvalidSyntax          = "invalid numeric syntax";
    constexpr char const* kParsedToNaN            = "parsed to NaN";
    constexpr char const* kInfinityNotAllowed     = "infinity is not allowed";
} // namespace reason

// ParseOutcome outcome = Classify(text, options);
//
// Classifies the given text as a complete floating-point literal, as a prefix of one which is
// still being typed, or as invalid input.
//
// Accepted grammar (surrounding whitespace is ignored):
//
//      literal  := [+-]? mantissa exponent?
//      mantissa := digits ('.' digits?)? | '.' digits
//      exponent := [eE] [+-]? digits
//      special  := [+-]? ('NaN' | 'Inf' | 'Infinity')
//
// Valid literals are converted to the nearest double (round-to-nearest-even). Literals outside
// the double range become +-Infinity, e.g. "1e400".
//
// The function never fails; every input maps to exactly one outcome.
ParseOutcome Classify(std::string_view text, ParseOptions const& options = ParseOptions{});

inline bool IsIncomplete(ParseOutcome const& outcome) { return std::holds_alternative<Incomplete>(outcome); }
inline bool IsInvalid(ParseOutcome const& outcome) { return std::holds_alternative<Invalid>(outcome); }
inline bool IsValid(ParseOutcome const& outcome) { return std::holds_alternative<Valid>(outcome); }

} // namespace floatview
