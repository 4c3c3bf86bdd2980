#include "benchmark/benchmark.h"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "classify.h"
#include "view.h"

#define BENCH_CLASSIFY()            1
#define BENCH_BUILD_VIEW()          1
#define BENCH_STD_STRTOD()          0
#define BENCH_DOUBLE_CONVERSION()   0

static constexpr int NumFloats = 1 << 14;

#if BENCH_CLASSIFY()
struct S2DClassify
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        auto const outcome = floatview::Classify(str);
        auto const* valid = std::get_if<floatview::Valid>(&outcome);
        return valid != nullptr ? valid->value : 0.0;
    }
};
#endif

#if BENCH_BUILD_VIEW()
template <floatview::Precision P>
struct S2DBuildView
{
    using value_type = size_t;

    value_type operator()(std::string const& str) const
    {
        auto const view = floatview::BuildView(str, P);
        return view.index();
    }
};
#endif

#if BENCH_STD_STRTOD()
struct S2DStdStrtod
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        value_type flt = std::strtod(str.c_str(), nullptr);
        return flt;
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
#include "double-conversion/double-conversion.h"
struct S2DDoubleConversion
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        double_conversion::StringToDoubleConverter s2d(0, 0.0, 1.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2d.StringToDouble(str.data(), static_cast<int>(str.size()), &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index]) );
        index = (index + 1) & (numbers.size() - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(char const* name, std::vector<std::string> const& numbers)
{
    // BenchIt wraps around with a mask.
    assert((numbers.size() & (numbers.size() - 1)) == 0);

    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<Converter>, numbers);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom random;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return strdup(buf); // leak...
}

static void RegisterAll(char const* name, std::vector<std::string> const& numbers)
{
#if BENCH_CLASSIFY()
    RegisterBenchmarks<S2DClassify                                  >(StrPrintf("%s Classify          ", name), numbers);
#endif
#if BENCH_BUILD_VIEW()
    RegisterBenchmarks<S2DBuildView<floatview::Precision::float32>  >(StrPrintf("%s BuildView float32 ", name), numbers);
    RegisterBenchmarks<S2DBuildView<floatview::Precision::float64>  >(StrPrintf("%s BuildView float64 ", name), numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks<S2DStdStrtod                                 >(StrPrintf("%s std::strtod       ", name), numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<S2DDoubleConversion                          >(StrPrintf("%s double_conversion ", name), numbers);
#endif
}

static inline void RegisterUniform_double(char const* name, double min, double max)
{
    std::vector<std::string> numbers(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);

    std::generate(numbers.begin(), numbers.end(), [&] {
        char buf[128];
        int const len = std::snprintf(buf, 128, "%.17g", gen(random));
        return std::string(buf, static_cast<size_t>(len));
    });

    RegisterAll(name, numbers);
}

// Every prefix of the literals, as produced while typing them.
static inline void RegisterTyping(char const* name, std::vector<std::string> const& literals)
{
    std::vector<std::string> numbers;
    for (auto const& literal : literals)
    {
        for (size_t len = 0; len <= literal.size(); ++len)
        {
            numbers.push_back(literal.substr(0, len));
        }
    }

    size_t size = 1;
    while (size < numbers.size())
        size *= 2;
    for (size_t i = 0; numbers.size() < size; ++i)
    {
        std::string const repeat = numbers[i];
        numbers.push_back(repeat);
    }

    RegisterAll(name, numbers);
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    RegisterUniform_double("warm up", 0, 1);

    RegisterUniform_double("uniform [0,1]", 0.0, 1.0);
    RegisterUniform_double("uniform [1,2]", 1.0, 2.0);
    RegisterUniform_double("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform_double("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform_double("uniform [0,max]", 0.0, std::numeric_limits<double>::max());

    RegisterTyping("typing", {"-1.25", "3.14159e-10", "+6.02214076E+23", ".5", "Infinity", "-NaN"});

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
