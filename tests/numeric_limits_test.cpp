#include <dlimb/dlimb.h>
#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <string>

using dlimb::Int128;
using dlimb::UInt128;

namespace
{
const char kUInt128Max[] = "340282366920938463463374607431768211455";
const char kInt128Max[] = "170141183460469231731687303715884105727";
const char kInt128Min[] = "-170141183460469231731687303715884105728";
} // namespace

TEST(Int128NumericLimits, BoundsMatchText)
{
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<UInt128>::max()), kUInt128Max);
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<UInt128>::min()), "0");
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<Int128>::max()), kInt128Max);
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<Int128>::min()), kInt128Min);

    EXPECT_EQ(dlimb::from_string<UInt128>(kUInt128Max), std::numeric_limits<UInt128>::max());
    EXPECT_EQ(dlimb::from_string<Int128>(kInt128Max), std::numeric_limits<Int128>::max());
    EXPECT_EQ(dlimb::from_string<Int128>(kInt128Min), std::numeric_limits<Int128>::min());
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<Int128>::min(), 16), "-80000000000000000000000000000000");
}

TEST(Int128NumericLimits, BoundsAsLimbs)
{
    EXPECT_EQ(std::numeric_limits<UInt128>::max(), UInt128(~0ULL, ~0ULL));
    EXPECT_EQ(std::numeric_limits<Int128>::max(), Int128(std::numeric_limits<int64_t>::max(), ~0ULL));
    EXPECT_EQ(std::numeric_limits<Int128>::min(), Int128(std::numeric_limits<int64_t>::min(), 0));
    EXPECT_EQ(std::numeric_limits<Int128>::min().magnitude(), UInt128(1ULL << 63, 0));
    EXPECT_EQ(std::numeric_limits<Int128>::max().magnitude() + 1, std::numeric_limits<Int128>::min().magnitude());
    EXPECT_EQ(std::numeric_limits<Int128>::lowest(), std::numeric_limits<Int128>::min());
}

TEST(Int128NumericLimits, TrapsOnOverflow)
{
    static_assert(std::numeric_limits<UInt128>::traps && std::numeric_limits<Int128>::traps, "checked operators trap");
    static_assert(!std::numeric_limits<UInt128>::is_modulo && !std::numeric_limits<Int128>::is_modulo, "checked operators do not wrap");

    EXPECT_THROW(std::numeric_limits<UInt128>::max() + 1, std::overflow_error);
    EXPECT_THROW(std::numeric_limits<UInt128>::min() - 1, std::overflow_error);
    EXPECT_THROW(std::numeric_limits<Int128>::max() + 1, std::overflow_error);
    EXPECT_THROW(std::numeric_limits<Int128>::min() - 1, std::overflow_error);

    // The wrapping forms are the modulo arithmetic.
    EXPECT_EQ(std::numeric_limits<Int128>::max().wrapping_add(1), std::numeric_limits<Int128>::min());
    EXPECT_EQ(std::numeric_limits<UInt128>::max().wrapping_add(1), UInt128(0));
}

TEST(Int128NumericLimits, DigitCounts)
{
    static_assert(std::numeric_limits<UInt128>::digits == 128, "UInt128 value bits");
    static_assert(std::numeric_limits<Int128>::digits == 127, "Int128 value bits");
    static_assert(std::numeric_limits<UInt128>::digits10 == 38, "UInt128 decimal digits");
    static_assert(std::numeric_limits<Int128>::digits10 == 38, "Int128 decimal digits");
    static_assert(std::numeric_limits<UInt128>::is_signed == UInt128::is_signed, "signedness");
    static_assert(std::numeric_limits<Int128>::is_signed == Int128::is_signed, "signedness");

    // Every value of digits10 nines fits; one more digit does not.
    const std::string nines(38, '9');
    UInt128 u;
    Int128 s;
    EXPECT_TRUE(dlimb::parse(nines, u));
    EXPECT_TRUE(dlimb::parse(nines, s));
    EXPECT_TRUE(dlimb::parse("-" + nines, s));
    EXPECT_FALSE(dlimb::parse(nines + "9", u));
    EXPECT_EQ(dlimb::to_string(std::numeric_limits<Int128>::max()).size(), 39u);
}

TEST(Int128NumericLimits, Constexpr)
{
    constexpr UInt128 umax = std::numeric_limits<UInt128>::max();
    static_assert(umax.low() == ~0ULL && umax.high() == ~0ULL, "constexpr max");
    constexpr Int128 smin = std::numeric_limits<Int128>::min();
    static_assert(smin.is_negative() && smin.low() == 0, "constexpr min");
    (void)umax;
    (void)smin;
}
