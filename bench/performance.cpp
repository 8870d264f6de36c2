#include <benchmark/benchmark.h>

#include <limits>
#include <string>

#include <dlimb/dlimb.h>

using dlimb::Int128;
using dlimb::UInt128;

template <typename Int>
static void BM_Addition(benchmark::State & state)
{
    Int a = 123456789;
    Int b = 987654321;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a += b);
    }
}

template <typename Int>
static void BM_Subtraction(benchmark::State & state)
{
    Int a = std::numeric_limits<Int>::max();
    Int b = 123456789;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a -= b);
    }
}

template <typename Int>
static void BM_Multiplication(benchmark::State & state)
{
    Int a(0x0123456789ABCDEFLL, 0x1111111111111111ULL);
    Int b = 987654321;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto c = a * b;
        benchmark::DoNotOptimize(c);
    }
}

template <typename Int>
static void BM_Division(benchmark::State & state)
{
    Int a(0x0123456789ABCDEFLL, 987654321);
    Int b = 123456;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto c = a / b;
        benchmark::DoNotOptimize(c);
    }
}

BENCHMARK_TEMPLATE(BM_Addition, UInt128);
BENCHMARK_TEMPLATE(BM_Addition, Int128);
BENCHMARK_TEMPLATE(BM_Subtraction, UInt128);
BENCHMARK_TEMPLATE(BM_Subtraction, Int128);
BENCHMARK_TEMPLATE(BM_Multiplication, UInt128);
BENCHMARK_TEMPLATE(BM_Multiplication, Int128);
BENCHMARK_TEMPLATE(BM_Division, UInt128);
BENCHMARK_TEMPLATE(BM_Division, Int128);

// Two-limb divisor, goes through the normalized 3-by-2 step
template <typename Int>
static void BM_DivisionTwoLimbDivisor(benchmark::State & state)
{
    Int a = (Int{1} << 126) + Int{123456789};
    Int b = (Int{1} << 80) + Int{12345};
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto c = a / b;
        benchmark::DoNotOptimize(c);
    }
}

template <typename Int>
static void BM_DivisionNegative(benchmark::State & state)
{
    Int a = -((Int{1} << 120) + Int{7777777});
    Int b = Int{-314159265};
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto qr = a.quotient_and_remainder(b);
        benchmark::DoNotOptimize(qr);
    }
}

BENCHMARK_TEMPLATE(BM_DivisionTwoLimbDivisor, UInt128);
BENCHMARK_TEMPLATE(BM_DivisionTwoLimbDivisor, Int128);
BENCHMARK_TEMPLATE(BM_DivisionNegative, Int128);

template <typename Int>
static void BM_MultipliedFullWidth(benchmark::State & state)
{
    Int a(0x7EDCBA9876543210LL, 0x0123456789ABCDEFULL);
    Int b(0x1111111111111111LL, 0xFFFFFFFFFFFFFFFFULL);
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto p = a.multiplied_full_width(b);
        benchmark::DoNotOptimize(p);
    }
}

template <typename Int>
static void BM_DividingFullWidth(benchmark::State & state)
{
    const Int divisor(0x4000000000000000LL, 0x00000000DEADBEEFULL);
    dlimb::full_width<Int> dividend{Int(0x0FFFFFFFFFFFFFFFLL, 0x1234), UInt128(0xAAAAAAAAAAAAAAAAULL, 42)};
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(dividend);
        auto qr = divisor.dividing_full_width(dividend);
        benchmark::DoNotOptimize(qr);
    }
}

BENCHMARK_TEMPLATE(BM_MultipliedFullWidth, UInt128);
BENCHMARK_TEMPLATE(BM_MultipliedFullWidth, Int128);
BENCHMARK_TEMPLATE(BM_DividingFullWidth, UInt128);
BENCHMARK_TEMPLATE(BM_DividingFullWidth, Int128);

template <typename Int>
static void BM_ToString(benchmark::State & state)
{
    Int a = (Int{1} << 126) + 123456789;
    const int radix = static_cast<int>(state.range(0));
    for (auto _ : state)
    {
        auto s = dlimb::to_string(a, radix);
        benchmark::DoNotOptimize(s);
        a += Int{1};
    }
}

template <typename Int>
static void BM_Parse(benchmark::State & state)
{
    const int radix = static_cast<int>(state.range(0));
    const std::string text = dlimb::to_string(std::numeric_limits<Int>::max(), radix);
    Int out;
    for (auto _ : state)
    {
        bool ok = dlimb::parse(text, out, radix);
        benchmark::DoNotOptimize(ok);
        benchmark::DoNotOptimize(out);
    }
}

BENCHMARK_TEMPLATE(BM_ToString, UInt128)->Arg(10)->Arg(16)->Arg(36);
BENCHMARK_TEMPLATE(BM_ToString, Int128)->Arg(10);
BENCHMARK_TEMPLATE(BM_Parse, UInt128)->Arg(10)->Arg(16)->Arg(36);
BENCHMARK_TEMPLATE(BM_Parse, Int128)->Arg(10);

BENCHMARK_MAIN();
