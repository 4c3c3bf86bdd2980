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

#include "view.h"

#include <string>
#include <string_view>

namespace floatview {

// Returns true for characters which may appear somewhere in a decimal literal or in one of the
// tokens NaN, Inf, Infinity: 0-9 . + - e E and the letters of "nan" and "infinity" in either case.
//
// This is a keystroke filter only. Classify performs the actual syntax check.
bool IsInputChar(char ch);

// Removes all characters for which IsInputChar returns false.
std::string FilterInput(std::string_view text);

// Renders the view as "key: value" lines, one per line, each terminated by '\n'.
//
//  state: Valid
//  normalized: 1.0
//  kind: Normal
//  hex (bytes): 3f 80 00 00
//  ...
std::string FormatView(ViewResult const& view);

} // namespace floatview
