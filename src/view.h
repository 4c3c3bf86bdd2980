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

#include "classify.h"
#include "float_fields.h"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace floatview {

enum class Precision {
    float32,
    float64,
};

// "float32" or "float64".
char const* PrecisionName(Precision precision);

// Accepts "float32" and "float" for binary32, "float64" and "double" for binary64.
std::optional<Precision> ParsePrecision(std::string_view name);

struct ValidView
{
    double value;
    std::string normalized_text;
    Precision precision;
    // Holds Float32Fields iff precision == float32.
    std::variant<Float32Fields, Float64Fields> fields;
};

// Incomplete and Invalid outcomes are passed through from Classify unchanged.
using ViewResult = std::variant<Incomplete, Invalid, ValidView>;

// ViewResult view = BuildView(text, precision);
//
// Classifies `text` and, if it is a valid literal, decomposes the parsed value at the requested
// width. Float32 fields are always derived from the parsed double by narrowing, so the binary32 and
// binary64 views of the same text are consistent.
ViewResult BuildView(std::string_view text, Precision precision, ParseOptions const& options = ParseOptions{});

} // namespace floatview
