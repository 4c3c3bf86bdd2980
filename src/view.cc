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

#include "view.h"

#include <utility>

using namespace floatview;

char const* floatview::PrecisionName(Precision precision)
{
    switch (precision)
    {
    case Precision::float32:
        return "float32";
    case Precision::float64:
        return "float64";
    }

    return "?";
}

std::optional<Precision> floatview::ParsePrecision(std::string_view name)
{
    if (name == "float32" || name == "float")
        return Precision::float32;
    if (name == "float64" || name == "double")
        return Precision::float64;

    return std::nullopt;
}

ViewResult floatview::BuildView(std::string_view text, Precision precision, ParseOptions const& options)
{
    ParseOutcome outcome = Classify(text, options);

    if (auto* incomplete = std::get_if<Incomplete>(&outcome))
        return std::move(*incomplete);

    if (auto* invalid = std::get_if<Invalid>(&outcome))
        return std::move(*invalid);

    auto& valid = std::get<Valid>(outcome);

    ValidView view{valid.value, std::move(valid.normalized_text), precision, Float32Fields{}};
    switch (precision)
    {
    case Precision::float32:
        view.fields = ToFloat32Fields(valid.value);
        break;
    case Precision::float64:
        view.fields = ToFloat64Fields(valid.value);
        break;
    }

    return view;
}
