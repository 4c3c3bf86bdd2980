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

// floatview [literal...]
//
// Prints the binary32 and binary64 layout of each literal.
// Without arguments, literals are read from stdin, one per line.

#include "format_view.h"

#include <cstdio>
#include <iostream>
#include <string>
#include <variant>

using namespace floatview;

static bool Show(std::string const& text)
{
    printf("input: \"%s\"\n", text.c_str());

    bool valid = true;
    for (Precision const precision : {Precision::float32, Precision::float64})
    {
        ViewResult const view = BuildView(text, precision);
        valid = valid && std::holds_alternative<ValidView>(view);

        printf("\n[%s]\n", PrecisionName(precision));
        fputs(FormatView(view).c_str(), stdout);
    }

    printf("\n");
    return valid;
}

int main(int argc, char** argv)
{
    bool all_valid = true;

    if (argc > 1)
    {
        for (int i = 1; i < argc; ++i)
        {
            all_valid = Show(argv[i]) && all_valid;
        }
    }
    else
    {
        std::string line;
        while (std::getline(std::cin, line))
        {
            std::string const filtered = FilterInput(line);
            if (filtered.size() != line.size())
            {
                fprintf(stderr, "floatview: dropped %zu unexpected character(s)\n", line.size() - filtered.size());
            }
            all_valid = Show(filtered) && all_valid;
        }
    }

    return all_valid ? 0 : 1;
}
