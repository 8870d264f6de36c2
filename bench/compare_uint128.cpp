#include <benchmark/benchmark.h>
#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstdlib>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <dlimb/dlimb.h>

using DUInt = dlimb::UInt128;
using DInt = dlimb::Int128;
using BUInt = boost::multiprecision::uint128_t;
using BInt = boost::multiprecision::int128_t;
#if DLIMB_HAS_INT128
using NUInt = unsigned __int128;
using NInt = __int128;
#endif

namespace
{

constexpr size_t kDataN = 256; // small deterministic dataset per case
constexpr uint64_t kSeedBase = 0x9E3779B97F4A7C15ull;

template <typename Int>
inline Int assemble_u128(uint64_t w0, uint64_t w1)
{
    Int x = Int{0};
    x |= Int{w0};
    x |= (Int{w1} << 64);
    return x;
}

template <typename Int, typename Op>
inline void run_pairs(benchmark::State & state, const std::array<std::pair<Int, Int>, kDataN> & data, Op op)
{
    size_t i = 0;
    for (auto _ : state)
    {
        const auto & p = data[i++ & (kDataN - 1)];
        Int a = p.first;
        Int b = p.second;
        benchmark::DoNotOptimize(a);
        benchmark::DoNotOptimize(b);
        auto c = op(a, b);
        benchmark::DoNotOptimize(c);
    }
}

} // namespace

// -------- Addition --------
template <typename Int>
static void Add_NoCarry(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xA55A'AA55'1234'5678ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            // top bit clear so the checked dlimb operator never throws
            Int a = assemble_u128<Int>(rng(), rng() >> 1);
            Int b = Int{uint32_t(rng())};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a + b); });
}

template <typename Int>
static void Add_CarryChain64(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xCC55'DDAA'9988'7766ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(~0ULL, rng() >> 1); // low limb all 1s
            d[i] = {a, Int{1}};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a + b); });
}

// -------- Subtraction --------
template <typename Int>
static void Sub_NoBorrow(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xBEEF'FACE'CAFEBABEull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng() | (1ULL << 31), rng());
            Int b = Int{uint32_t(rng() & 0x7FFF'FFFFu)};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a - b); });
}

template <typename Int>
static void Sub_BorrowChain64(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x1122'3344'5566'7788ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(0, rng() | 1); // low limb zero
            d[i] = {a, Int{1}};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a - b); });
}

// -------- Multiplication --------
template <typename Int>
static void Mul_U64xU64(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x0F0F'F0F0'AAAA'5555ull);
        for (size_t i = 0; i < kDataN; ++i)
            d[i] = {Int{uint64_t(rng())}, Int{uint64_t(rng())}};
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a * b); });
}

template <typename Int>
static void Mul_U32xWide(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x55AA'AA55'55AA'AA55ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            // 96-bit by 32-bit always fits
            Int a = assemble_u128<Int>(rng(), uint32_t(rng()));
            Int b = Int{uint32_t(rng())};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a * b); });
}

// -------- Division --------
template <typename Int>
static void Div_SmallDivisor32(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x1357'9BDF'2468'ACE0ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng(), rng());
            Int b = Int{uint32_t(rng() | 1)};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a / b); });
}

template <typename Int>
static void Div_SmallDivisor64(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x2468'ACE0'1357'9BDFull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng(), rng());
            Int b = Int{uint64_t(rng() | (1ULL << 63))};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a / b); });
}

template <typename Int>
static void Div_Pow2Divisor(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xDEAD'BEEF'0BAD'F00Dull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng(), rng());
            Int b = Int{1} << int(rng() % 127);
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a / b); });
}

// Two-limb divisors: the normalized 3-by-2 step
template <typename Int>
static void Div_TwoLimbDivisor(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x0123'4567'89AB'CDEFull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng(), rng() | (1ULL << 63));
            int s = 64 + int(rng() % 48);
            Int b = (Int{1} << s) + Int{uint32_t(rng())};
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a / b); });
}

template <typename Int>
static void Mod_TwoLimbDivisor(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0xFEDC'BA98'7654'3210ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = assemble_u128<Int>(rng(), rng());
            Int b = assemble_u128<Int>(rng(), rng() >> 8 | 1);
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a % b); });
}

// Signed division, operand signs drawn at random
template <typename Int>
static void Div_Signed(benchmark::State & state)
{
    static std::array<std::pair<Int, Int>, kDataN> data = []
    {
        std::array<std::pair<Int, Int>, kDataN> d{};
        std::mt19937_64 rng(kSeedBase ^ 0x7777'3333'1111'9999ull);
        for (size_t i = 0; i < kDataN; ++i)
        {
            Int a = Int{int64_t(rng() >> 1)} * Int{int64_t(rng() >> 2)};
            Int b = Int{int64_t(rng() >> 3) + 1};
            if (rng() & 1)
                a = -a;
            if (rng() & 1)
                b = -b;
            d[i] = {a, b};
        }
        return d;
    }();
    run_pairs(state, data, [](const Int & a, const Int & b) { return Int(a / b); });
}

static bool parse_full_matrix_flag(int & argc, char **& argv)
{
    bool full = false;
    if (const char * env = std::getenv("DLIMB_BENCH_FULL"))
        full = (std::string(env) == "1" || std::string(env) == "true");
    // strip custom flag(s) from argv so Google Benchmark doesn't see them
    static std::vector<char *> new_argv;
    new_argv.clear();
    new_argv.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i)
    {
        std::string s = argv[i] ? argv[i] : "";
        if (s == "--dlimb_full" || s == "--dlimb-full")
        {
            full = true;
            continue;
        }
        new_argv.push_back(argv[i]);
    }
    argv = new_argv.data();
    argc = static_cast<int>(new_argv.size());
    return full;
}

#if DLIMB_HAS_INT128
#    define REG_CASE(Base, Func) \
        do \
        { \
            benchmark::RegisterBenchmark(Base "/dlimb", &Func<DUInt>); \
            benchmark::RegisterBenchmark(Base "/native", &Func<NUInt>); \
            benchmark::RegisterBenchmark(Base "/Boost", &Func<BUInt>); \
        } while (false)
#    define REG_SIGNED_CASE(Base, Func) \
        do \
        { \
            benchmark::RegisterBenchmark(Base "/dlimb", &Func<DInt>); \
            benchmark::RegisterBenchmark(Base "/native", &Func<NInt>); \
            benchmark::RegisterBenchmark(Base "/Boost", &Func<BInt>); \
        } while (false)
#else
#    define REG_CASE(Base, Func) \
        do \
        { \
            benchmark::RegisterBenchmark(Base "/dlimb", &Func<DUInt>); \
            benchmark::RegisterBenchmark(Base "/Boost", &Func<BUInt>); \
        } while (false)
#    define REG_SIGNED_CASE(Base, Func) \
        do \
        { \
            benchmark::RegisterBenchmark(Base "/dlimb", &Func<DInt>); \
            benchmark::RegisterBenchmark(Base "/Boost", &Func<BInt>); \
        } while (false)
#endif

int main(int argc, char ** argv)
{
    bool full_matrix = parse_full_matrix_flag(argc, argv);
    // Addition
    REG_CASE("Add/NoCarry", Add_NoCarry);

    // Subtraction
    REG_CASE("Sub/NoBorrow", Sub_NoBorrow);

    // Multiplication
    REG_CASE("Mul/U64xU64", Mul_U64xU64);

    // Division
    REG_CASE("Div/SmallDivisor32", Div_SmallDivisor32);
    REG_CASE("Div/SmallDivisor64", Div_SmallDivisor64);
    REG_CASE("Div/TwoLimbDivisor", Div_TwoLimbDivisor);
    REG_SIGNED_CASE("Div/Signed", Div_Signed);

    if (full_matrix)
    {
        REG_CASE("Add/CarryChain64", Add_CarryChain64);
        REG_CASE("Sub/BorrowChain64", Sub_BorrowChain64);
        REG_CASE("Mul/U32xWide", Mul_U32xWide);
        REG_CASE("Div/Pow2Divisor", Div_Pow2Divisor);
        REG_CASE("Mod/TwoLimbDivisor", Mod_TwoLimbDivisor);
    }

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    return 0;
}
