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

#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>

namespace floatview {
namespace impl {

// Writes the lowest `width` bits of `value`, most significant first.
inline std::string ToBinaryString(uint64_t value, int width)
{
    assert(width >= 1 && width <= 64);

    std::string str(static_cast<size_t>(width), '0');
    for (int i = width - 1; i >= 0; --i)
    {
        if (value & 1)
            str[static_cast<size_t>(i)] = '1';
        value >>= 1;
    }
    return str;
}

// Lowercase, zero-padded to exactly `num_digits` digits.
inline std::string ToHexString(uint64_t value, int num_digits)
{
    static constexpr char const* kDigits = "0123456789abcdef";

    assert(num_digits >= 1 && num_digits <= 16);

    std::string str(static_cast<size_t>(num_digits), '0');
    for (int i = num_digits - 1; i >= 0; --i)
    {
        str[static_cast<size_t>(i)] = kDigits[value & 0xF];
        value >>= 4;
    }
    return str;
}

// "abcdefghij", 4 => "abcd efgh ij"
// Chunks are cut from the left; the last chunk holds the remainder.
inline std::string GroupFromLeft(std::string_view str, size_t chunk)
{
    assert(chunk > 0);

    std::string out;
    out.reserve(str.size() + str.size() / chunk);
    for (size_t i = 0; i < str.size(); ++i)
    {
        if (i != 0 && i % chunk == 0)
            out += ' ';
        out += str[i];
    }
    return out;
}

// "abcdefghij", 4 => "ab cdef ghij"
// Chunks are cut from the right; the first chunk holds the remainder.
inline std::string GroupFromRight(std::string_view str, size_t chunk)
{
    assert(chunk > 0);

    size_t const head = str.size() % chunk;

    std::string out;
    out.reserve(str.size() + str.size() / chunk);
    for (size_t i = 0; i < str.size(); ++i)
    {
        if (i != 0 && (i + chunk - head) % chunk == 0)
            out += ' ';
        out += str[i];
    }
    return out;
}

} // namespace impl
} // namespace floatview
