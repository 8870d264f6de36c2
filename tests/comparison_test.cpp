#include <dlimb/dlimb.h>
#include <gtest/gtest.h>

#include <functional>
#include <limits>
#include <unordered_set>

using dlimb::Int128;
using dlimb::UInt128;

TEST(Int128Comparison, UnsignedLexicographic)
{
    const UInt128 a(1, 0);
    const UInt128 b(0, ~0ULL);
    EXPECT_TRUE(b < a);
    EXPECT_TRUE(a > b);
    EXPECT_TRUE(a >= a);
    EXPECT_TRUE(b <= a);
    EXPECT_TRUE(a != b);
    EXPECT_FALSE(a == b);
    EXPECT_TRUE(UInt128(5, 1) < UInt128(5, 2));
}

TEST(Int128Comparison, SignedUsesHighLimbSign)
{
    const Int128 minus_one = -1;
    const Int128 one = 1;
    EXPECT_TRUE(minus_one < one);
    EXPECT_TRUE(std::numeric_limits<Int128>::min() < minus_one);
    EXPECT_TRUE(std::numeric_limits<Int128>::max() > one);
    EXPECT_TRUE(Int128(-1, 0) < Int128(0, ~0ULL));

    // Same bits, opposite order as unsigned.
    EXPECT_TRUE(UInt128(minus_one) > UInt128(one));
}

TEST(Int128Comparison, MixedNativeOperands)
{
    const Int128 v = -3;
    EXPECT_TRUE(v == -3);
    EXPECT_TRUE(-3 == v);
    EXPECT_TRUE(v < 0);
    EXPECT_TRUE(0 > v);
    EXPECT_TRUE(v <= -3);
    EXPECT_TRUE(v >= -3LL);
    EXPECT_TRUE(v != 3u);

    const UInt128 big(1, 0);
    EXPECT_TRUE(big > ~0ULL);
    EXPECT_TRUE(~0ULL < big);
}

TEST(Int128Comparison, ConstexprComparison)
{
    constexpr UInt128 a(0, 10);
    constexpr UInt128 b(0, 20);
    static_assert(a < b, "constexpr less");
    static_assert(b >= a, "constexpr greater-equal");
    static_assert(a != b, "constexpr inequality");
    (void)a;
    (void)b;
}

TEST(Int128Hash, EqualValuesHashEqual)
{
    std::hash<UInt128> h;
    EXPECT_EQ(h(UInt128(7, 9)), h(UInt128(7, 9)));
    EXPECT_NE(h(UInt128(7, 9)), h(UInt128(9, 7)));
    EXPECT_NE(h(UInt128(0, 1)), h(UInt128(1, 0)));
}

TEST(Int128Hash, UnorderedContainer)
{
    std::unordered_set<Int128> seen;
    for (int i = -50; i < 50; ++i)
        seen.insert(Int128(i) << 64);
    EXPECT_EQ(seen.size(), 100u);
    EXPECT_EQ(seen.count(Int128(-7) << 64), 1u);
    EXPECT_EQ(seen.count(Int128(-7)), 0u);
}
