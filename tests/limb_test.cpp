#include <dlimb/dlimb.h>
#include <gtest/gtest.h>

#include <cstdint>

using dlimb::detail::limb_t;
using dlimb::detail::wide2;
using dlimb::detail::wide4;

namespace
{
struct xorshift64
{
    uint64_t state;

    uint64_t operator()()
    {
        state ^= state << 13;
        state ^= state >> 7;
        state ^= state << 17;
        return state;
    }
};

// Biased towards the limb values that break carry and normalization logic.
uint64_t edgy_limb(xorshift64 & rng)
{
    static const uint64_t edges[] = {0, 1, 2, ~0ULL, ~0ULL - 1, 1ULL << 63, (1ULL << 63) - 1, 1ULL << 32, (1ULL << 32) - 1};
    const uint64_t pick = rng();
    if ((pick & 3) != 0)
        return edges[(pick >> 2) % (sizeof(edges) / sizeof(edges[0]))];
    return rng();
}

unsigned __int128 join(const wide2 & w)
{
    return (static_cast<unsigned __int128>(w.hi) << 64) | w.lo;
}

wide2 split(unsigned __int128 v)
{
    wide2 w = {static_cast<limb_t>(v >> 64), static_cast<limb_t>(v)};
    return w;
}
} // namespace

TEST(LimbPrimitives, AddCarryChain)
{
    limb_t carry = 0;
    EXPECT_EQ(dlimb::detail::add_carry(~0ULL, 1, carry), 0u);
    EXPECT_EQ(carry, 1u);
    EXPECT_EQ(dlimb::detail::add_carry(~0ULL, ~0ULL, carry), ~0ULL);
    EXPECT_EQ(carry, 1u);
    EXPECT_EQ(dlimb::detail::add_carry(5, 6, carry), 12u);
    EXPECT_EQ(carry, 0u);
}

TEST(LimbPrimitives, SubBorrowChain)
{
    limb_t borrow = 0;
    EXPECT_EQ(dlimb::detail::sub_borrow(0, 1, borrow), ~0ULL);
    EXPECT_EQ(borrow, 1u);
    EXPECT_EQ(dlimb::detail::sub_borrow(0, ~0ULL, borrow), 0u);
    EXPECT_EQ(borrow, 1u);
    EXPECT_EQ(dlimb::detail::sub_borrow(10, 3, borrow), 6u);
    EXPECT_EQ(borrow, 0u);
}

TEST(LimbPrimitives, AccumulateCountsCarries)
{
    limb_t c = 0;
    limb_t s = dlimb::detail::accumulate(~0ULL, ~0ULL, c);
    s = dlimb::detail::accumulate(s, ~0ULL, c);
    s = dlimb::detail::accumulate(s, 3, c);
    EXPECT_EQ(c, 3u);
    EXPECT_EQ(s, 0u);
}

TEST(LimbPrimitives, BitQueries)
{
    EXPECT_EQ(dlimb::detail::clz(0), 64);
    EXPECT_EQ(dlimb::detail::clz(1), 63);
    EXPECT_EQ(dlimb::detail::clz(1ULL << 63), 0);
    EXPECT_EQ(dlimb::detail::ctz(0), 64);
    EXPECT_EQ(dlimb::detail::ctz(1ULL << 40), 40);
    EXPECT_EQ(dlimb::detail::popcount(~0ULL), 64);
    EXPECT_EQ(dlimb::detail::popcount(0x0F0F), 8);
    EXPECT_EQ(dlimb::detail::bswap(0x0102030405060708ULL), 0x0807060504030201ULL);
}

TEST(LimbPrimitives, MulFullMatchesNative)
{
    xorshift64 rng = {0x9E3779B97F4A7C15ULL};
    for (int i = 0; i < 2000; ++i)
    {
        const uint64_t a = edgy_limb(rng);
        const uint64_t b = edgy_limb(rng);
        const wide2 p = dlimb::detail::mul_full(a, b);
        EXPECT_EQ(join(p), static_cast<unsigned __int128>(a) * b) << a << " * " << b;
    }
}

TEST(LimbPrimitives, Div2By1MatchesNative)
{
    xorshift64 rng = {0x2545F4914F6CDD1DULL};
    for (int i = 0; i < 2000; ++i)
    {
        uint64_t v = edgy_limb(rng);
        if (v == 0)
            v = 3;
        const uint64_t u1 = edgy_limb(rng) % v;
        const uint64_t u0 = edgy_limb(rng);
        limb_t rem = 0;
        const limb_t q = dlimb::detail::div_2by1(u1, u0, v, rem);
        const unsigned __int128 n = (static_cast<unsigned __int128>(u1) << 64) | u0;
        EXPECT_EQ(q, static_cast<uint64_t>(n / v));
        EXPECT_EQ(rem, static_cast<uint64_t>(n % v));
    }
}

TEST(LimbPrimitives, DivLimbsByLimbInPlace)
{
    limb_t u[3] = {7, 0, 5};
    const limb_t rem = dlimb::detail::div_limbs_by_limb(u, 3, 2, u);
    // (5 * 2^128 + 7) / 2
    EXPECT_EQ(u[2], 2u);
    EXPECT_EQ(u[1], 1ULL << 63);
    EXPECT_EQ(u[0], 3u);
    EXPECT_EQ(rem, 1u);
}

TEST(LimbPrimitives, LeftShiftLimbs)
{
    limb_t src[2] = {1ULL << 63, 0xF000000000000001ULL};
    limb_t dst[2] = {0, 0};
    EXPECT_EQ(dlimb::detail::lshift_limbs_to(src, 2, dst, 4), 0xFu);
    EXPECT_EQ(dst[0], 0u);
    EXPECT_EQ(dst[1], 0x18u);
    EXPECT_EQ(dlimb::detail::lshift_limbs_to(src, 2, src, 0), 0u);
    EXPECT_EQ(src[0], 1ULL << 63);
}

TEST(WideKernel, ShiftsAcrossLimbBoundary)
{
    const wide2 one = {0, 1};
    EXPECT_EQ(join(dlimb::detail::wide_shl(one, 64)), static_cast<unsigned __int128>(1) << 64);
    EXPECT_EQ(join(dlimb::detail::wide_shl(one, 127)), static_cast<unsigned __int128>(1) << 127);
    EXPECT_EQ(join(dlimb::detail::wide_shl(one, 128)), 1u);
    EXPECT_EQ(join(dlimb::detail::wide_shl(one, 129)), 2u);

    const wide2 top = {1ULL << 63, 0};
    EXPECT_EQ(join(dlimb::detail::wide_shr(top, 127)), 1u);
    EXPECT_EQ(join(dlimb::detail::wide_shr(top, 64)), static_cast<unsigned __int128>(1ULL << 63));
    EXPECT_EQ(join(dlimb::detail::wide_sar(top, 127)), ~static_cast<unsigned __int128>(0));

    const wide2 neg = {0x8000000000000000ULL, 0x10};
    const wide2 r = dlimb::detail::wide_sar(neg, 68);
    EXPECT_EQ(r.hi, ~0ULL);
    EXPECT_EQ(r.lo, 0xF800000000000000ULL);
    const wide2 r0 = dlimb::detail::wide_sar(neg, 0);
    EXPECT_EQ(r0.hi, neg.hi);
    EXPECT_EQ(r0.lo, neg.lo);
}

TEST(WideKernel, MulFullSquaresOfMaximum)
{
    const wide2 max = {~0ULL, ~0ULL};
    const wide4 p = dlimb::detail::wide_mul_full(max, max);
    EXPECT_EQ(p.hi.hi, ~0ULL);
    EXPECT_EQ(p.hi.lo, ~0ULL - 1);
    EXPECT_EQ(p.lo.hi, 0u);
    EXPECT_EQ(p.lo.lo, 1u);

    // (2^64 + 5)(2^64 + 7) = 2^128 + 12 * 2^64 + 35
    const wide2 a = {1, 5};
    const wide2 b = {1, 7};
    const wide4 q = dlimb::detail::wide_mul_full(a, b);
    EXPECT_EQ(q.hi.hi, 0u);
    EXPECT_EQ(q.hi.lo, 1u);
    EXPECT_EQ(q.lo.hi, 12u);
    EXPECT_EQ(q.lo.lo, 35u);
}

TEST(WideKernel, MulLowMatchesNative)
{
    xorshift64 rng = {0xD1B54A32D192ED03ULL};
    for (int i = 0; i < 2000; ++i)
    {
        const wide2 a = {edgy_limb(rng), edgy_limb(rng)};
        const wide2 b = {edgy_limb(rng), edgy_limb(rng)};
        EXPECT_EQ(join(dlimb::detail::wide_mul_low(a, b)), join(a) * join(b));
        const wide4 p = dlimb::detail::wide_mul_full(a, b);
        EXPECT_EQ(join(p.lo), join(a) * join(b));
    }
}

TEST(WideKernel, DivmodMatchesNative)
{
    xorshift64 rng = {0x853C49E6748FEA9BULL};
    for (int i = 0; i < 5000; ++i)
    {
        const wide2 u = {edgy_limb(rng), edgy_limb(rng)};
        wide2 v = {edgy_limb(rng), edgy_limb(rng)};
        if (dlimb::detail::wide_is_zero(v))
            v.lo = 1;
        wide2 rem = {0, 0};
        const wide2 q = dlimb::detail::wide_divmod(u, v, rem);
        EXPECT_EQ(join(q), join(u) / join(v));
        EXPECT_EQ(join(rem), join(u) % join(v));
    }
}

TEST(WideKernel, DivmodEstimateNeedsCorrection)
{
    // The first estimate from the top limbs is one too large.
    const wide2 u = {0xFFFFFFFFFFFFFFFEULL, 0x7FFFFFFFFFFFFFFFULL};
    const wide2 v = {0x7FFFFFFFFFFFFFFFULL, 0x7FFFFFFFFFFFFFFFULL};
    wide2 rem = {0, 0};
    const wide2 q = dlimb::detail::wide_divmod(u, v, rem);
    EXPECT_EQ(q.hi, 0u);
    EXPECT_EQ(q.lo, 1u);
    EXPECT_EQ(rem.hi, 0x7FFFFFFFFFFFFFFFULL);
    EXPECT_EQ(rem.lo, 0u);
}

TEST(WideKernel, DivmodFullTwoCorrections)
{
    // The low quotient digit is estimated two too large.
    const wide4 u = {{0x2ULL, 0x7FFFFFFFFFFFFFFFULL}, {0xFFFFFFFFFFFFFFFEULL, 0xFFFFFFFFFFFFFFFFULL}};
    const wide2 v = {0x52D31E1B8C0D0033ULL, 0xFFFFFFFFFFFFFFFEULL};
    wide2 rem = {0, 0};
    const wide2 q = dlimb::detail::wide_divmod_full(u, v, rem);
    EXPECT_EQ(q.hi, 0x7ULL);
    EXPECT_EQ(q.lo, 0xBA27858DD48FAF1CULL);
    EXPECT_EQ(rem.hi, 0x49C5C02D9E646E5EULL);
    EXPECT_EQ(rem.lo, 0x744F0B1BA91F5E37ULL);
}

TEST(WideKernel, DivmodFullOneCorrection)
{
    const wide4 u = {{0x00000000FFFFFFFFULL, 0x8000000000000001ULL}, {0x72E6CC3ABABCED20ULL, 0x0000000000000001ULL}};
    const wide2 v = {0xFFFFFFFFFFFFFFFFULL, 0xC7A2EA20B2F14C94ULL};
    wide2 rem = {0, 0};
    const wide2 q = dlimb::detail::wide_divmod_full(u, v, rem);
    EXPECT_EQ(q.hi, 0x00000000FFFFFFFFULL);
    EXPECT_EQ(q.lo, 0x80000000385D15E0ULL);
    EXPECT_EQ(rem.hi, 0xA3C6F4B7209E6ED4ULL);
    EXPECT_EQ(rem.lo, 0xBF38AA4C6FD0DA81ULL);
}

TEST(WideKernel, DivmodFullReconstructsDividend)
{
    xorshift64 rng = {0x6A09E667F3BCC909ULL};
    for (int i = 0; i < 3000; ++i)
    {
        wide2 v = {edgy_limb(rng), edgy_limb(rng)};
        if (dlimb::detail::wide_is_zero(v))
            v.lo = 7;
        // Build a dividend whose high half is below v: q * v + r.
        const wide2 q_in = {edgy_limb(rng), edgy_limb(rng)};
        const wide2 r_raw = {edgy_limb(rng), edgy_limb(rng)};
        const unsigned __int128 r_in = join(r_raw) % join(v);
        wide4 u = dlimb::detail::wide_mul_full(q_in, v);
        limb_t carry = 0;
        const wide2 lo = dlimb::detail::wide_add(u.lo, split(r_in), carry);
        u.lo = lo;
        const wide2 one = {0, carry};
        u.hi = dlimb::detail::wide_add(u.hi, one, carry);
        ASSERT_EQ(carry, 0u);

        wide2 rem = {0, 0};
        const wide2 q = dlimb::detail::wide_divmod_full(u, v, rem);
        EXPECT_EQ(join(q), join(q_in));
        EXPECT_EQ(join(rem), r_in);
    }
}
