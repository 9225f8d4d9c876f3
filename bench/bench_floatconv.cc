#include "benchmark/benchmark.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "floatconv.h"

#include "../lib/double-conversion.h"

#define BENCH_FLOATCONV()           1
#define BENCH_STD_STRTOD()          1
#define BENCH_DOUBLE_CONVERSION()   1

static constexpr int NumFloats = 1 << 14;

//==================================================================================================
// Parse
//==================================================================================================

#if BENCH_FLOATCONV()
struct ParseFloatconv
{
    using value_type = floatconv::Real;

    value_type operator()(std::string const& str) const
    {
        value_type flt = 0;
        const auto res = floatconv::Parse(str.data(), str.data() + str.size(), flt);
        if (!res)
            std::abort();
        return flt;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct ParseStdStrtod
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        return std::strtod(str.c_str(), nullptr);
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
struct ParseDoubleConversion
{
    using value_type = double;

    value_type operator()(std::string const& str) const
    {
        int processed_characters_count = 0;
        return double_conversion_Strtod(str.data(), static_cast<int>(str.size()), processed_characters_count);
    }
};
#endif

//==================================================================================================
// Format
//==================================================================================================

static constexpr int FormatDecimals = 6;

#if BENCH_FLOATCONV()
struct FormatFloatconv
{
    char* operator()(char* buf, int buflen, double value) const
    {
        const auto res = floatconv::Format(buf, buf + buflen, value, FormatDecimals);
        if (!res)
            std::abort();
        return res.next;
    }
};
#endif

#if BENCH_STD_STRTOD()
struct FormatStdSnprintf
{
    char* operator()(char* buf, int buflen, double value) const
    {
        return buf + std::snprintf(buf, static_cast<size_t>(buflen), "%.*f", FormatDecimals, value);
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
struct FormatDoubleConversion
{
    char* operator()(char* buf, int buflen, double value) const
    {
        return double_conversion_Fixed(buf, buflen, value, FormatDecimals);
    }
};
#endif

template <typename Converter>
static void BenchParse(benchmark::State& state, std::vector<std::string> const& numbers)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Converter>
static void BenchFormat(benchmark::State& state, std::vector<double> const& numbers)
{
    Converter convert;

    char buf[512];

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(buf, static_cast<int>(sizeof(buf)), numbers[index]) );
        index = (index + 1) & (NumFloats - 1);
    }
}

template <typename Benchmark, typename Numbers>
static void RegisterBenchmarks(char const* name, Benchmark bench_fn, Numbers const& numbers)
{
    auto* bench = benchmark::RegisterBenchmark(name, bench_fn, numbers);

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

static JenkinsRandom rng;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return strdup(buf); // leak...
}

static inline void RegisterUniform(char const* name, double min, double max)
{
    std::vector<double> values(NumFloats);

    std::uniform_real_distribution<double> gen(min, max);
    std::generate(values.begin(), values.end(), [&] { return gen(rng); });

    std::vector<std::string> numbers(NumFloats);
    std::transform(values.begin(), values.end(), numbers.begin(), [](double value) {
        std::string str;
        if (floatconv::ToString(str, value, 17, true) != floatconv::Status::ok)
            std::abort();
        return str;
    });

#if BENCH_FLOATCONV()
    RegisterBenchmarks(StrPrintf("parse  %s floatconv         ", name), BenchParse<ParseFloatconv>, numbers);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks(StrPrintf("parse  %s std::strtod       ", name), BenchParse<ParseStdStrtod>, numbers);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks(StrPrintf("parse  %s double_conversion ", name), BenchParse<ParseDoubleConversion>, numbers);
#endif

#if BENCH_FLOATCONV()
    RegisterBenchmarks(StrPrintf("format %s floatconv         ", name), BenchFormat<FormatFloatconv>, values);
#endif
#if BENCH_STD_STRTOD()
    RegisterBenchmarks(StrPrintf("format %s std::snprintf     ", name), BenchFormat<FormatStdSnprintf>, values);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks(StrPrintf("format %s double_conversion ", name), BenchFormat<FormatDoubleConversion>, values);
#endif
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
    printf("floatconv working type: %s\n", sizeof(floatconv::Real) > sizeof(double) ? "long double" : "double");

    RegisterUniform("warm up", 0, 1);

    RegisterUniform("uniform [0,1]", 0.0, 1.0);
    RegisterUniform("uniform [1,2]", 1.0, 2.0);
    RegisterUniform("uniform [8,2^10]", 8.0, 1ll << 10);
    RegisterUniform("uniform [2^10,2^20]", 1ll << 10, 1ll << 20);
    RegisterUniform("uniform [2^20,2^50]", 1ll << 20, 1ll << 50);
    RegisterUniform("uniform [0,1e300]", 0.0, 1e300);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}
