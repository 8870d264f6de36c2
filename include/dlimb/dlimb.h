#pragma once

#include <climits>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

#ifdef DLIMB_ENABLE_FMT
#    include <fmt/format.h>
#endif

#if defined(__GNUC__) || defined(__clang__)
#    define DLIMB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#    define DLIMB_LIKELY(x) __builtin_expect(!!(x), 1)
#    define DLIMB_FORCE_INLINE inline __attribute__((always_inline))
#else
#    define DLIMB_UNLIKELY(x) (x)
#    define DLIMB_LIKELY(x) (x)
#    define DLIMB_FORCE_INLINE inline
#endif

#if __cplusplus >= 201402L
#    define DLIMB_CONSTEXPR14 constexpr
#else
#    define DLIMB_CONSTEXPR14
#endif

// Native 128-bit arithmetic is only a shortcut for the 64x64->128 product and
// the 128/64 quotient. Define DLIMB_NO_INT128 to force the portable
// half-limb code everywhere.
#if defined(__SIZEOF_INT128__) && !defined(DLIMB_NO_INT128)
#    define DLIMB_HAS_INT128 1
#else
#    define DLIMB_HAS_INT128 0
#endif

#define DLIMB_CHECK(cond, exception, msg) \
    do \
    { \
        if (DLIMB_UNLIKELY(cond)) \
            throw exception(msg); \
    } while (false)
#define DLIMB_OVERFLOW_CHECK(cond) DLIMB_CHECK(cond, std::overflow_error, "arithmetic overflow")
#define DLIMB_DIVZERO_CHECK(cond) DLIMB_CHECK(cond, std::domain_error, "division by zero")
#define DLIMB_MODZERO_CHECK(cond) DLIMB_CHECK(cond, std::domain_error, "modulo by zero")

namespace dlimb
{
namespace detail
{
//=== Limbs ==================================================================
using limb_t = uint64_t;

constexpr int limb_bits = 64;
constexpr limb_t half_mask = 0xFFFFFFFFULL;

// Two limbs, most significant first. Used as scratch for one row of a
// product or one step of a division, and as the storage view of a 128-bit
// value inside the kernel.
struct wide2
{
    limb_t hi;
    limb_t lo;
};

//=== Carry / borrow chains ===================================================

// Returns a + b + carry (carry is 0 or 1 on input) and stores the carry out.
DLIMB_CONSTEXPR14 inline limb_t add_carry(limb_t a, limb_t b, limb_t & carry) noexcept
{
    limb_t s = a + carry;
    limb_t c = s < a;
    s += b;
    carry = c + (s < b);
    return s;
}

// Returns a - b - borrow (borrow is 0 or 1 on input) and stores the borrow out.
DLIMB_CONSTEXPR14 inline limb_t sub_borrow(limb_t a, limb_t b, limb_t & borrow) noexcept
{
    limb_t d = a - b;
    limb_t out = a < b;
    limb_t r = d - borrow;
    out |= d < borrow;
    borrow = out;
    return r;
}

// Adds b into a and bumps the carry counter c on wrap-around. Chaining
// several calls sums three or four limbs while counting the carries.
DLIMB_CONSTEXPR14 inline limb_t accumulate(limb_t a, limb_t b, limb_t & c) noexcept
{
    limb_t s = a + b;
    c += (s < a);
    return s;
}

//=== Bit queries =============================================================

DLIMB_CONSTEXPR14 inline int clz(limb_t x) noexcept
{
    if (x == 0)
        return limb_bits;
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_clzll(x);
#else
    int n = 0;
    while (!(x >> 63))
    {
        x <<= 1;
        ++n;
    }
    return n;
#endif
}

DLIMB_CONSTEXPR14 inline int ctz(limb_t x) noexcept
{
    if (x == 0)
        return limb_bits;
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_ctzll(x);
#else
    int n = 0;
    while (!(x & 1))
    {
        x >>= 1;
        ++n;
    }
    return n;
#endif
}

DLIMB_CONSTEXPR14 inline int popcount(limb_t x) noexcept
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_popcountll(x);
#else
    x = x - ((x >> 1) & 0x5555555555555555ULL);
    x = (x & 0x3333333333333333ULL) + ((x >> 2) & 0x3333333333333333ULL);
    x = (x + (x >> 4)) & 0x0F0F0F0F0F0F0F0FULL;
    return static_cast<int>((x * 0x0101010101010101ULL) >> 56);
#endif
}

DLIMB_CONSTEXPR14 inline limb_t bswap(limb_t x) noexcept
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_bswap64(x);
#else
    limb_t r = 0;
    for (int i = 0; i < 8; ++i)
    {
        r = (r << 8) | (x & 0xFF);
        x >>= 8;
    }
    return r;
#endif
}

//=== Full-width product and 2-by-1 division ==================================

// 64x64 -> 128-bit product.
DLIMB_FORCE_INLINE wide2 mul_full(limb_t a, limb_t b) noexcept
{
#if DLIMB_HAS_INT128
    const unsigned __int128 p = static_cast<unsigned __int128>(a) * b;
    wide2 r = {static_cast<limb_t>(p >> 64), static_cast<limb_t>(p)};
    return r;
#else
    // Schoolbook on 32-bit halves; the middle column holds at most
    // three 32-bit terms so it cannot overflow a limb.
    const limb_t a0 = a & half_mask;
    const limb_t a1 = a >> 32;
    const limb_t b0 = b & half_mask;
    const limb_t b1 = b >> 32;
    const limb_t p00 = a0 * b0;
    const limb_t p01 = a0 * b1;
    const limb_t p10 = a1 * b0;
    const limb_t p11 = a1 * b1;
    const limb_t mid = (p00 >> 32) + (p01 & half_mask) + (p10 & half_mask);
    wide2 r = {p11 + (p01 >> 32) + (p10 >> 32) + (mid >> 32), (mid << 32) | (p00 & half_mask)};
    return r;
#endif
}

// Divides the two-limb value (u1, u0) by v. Requires u1 < v so the quotient
// fits one limb. The remainder is stored in rem.
inline limb_t div_2by1(limb_t u1, limb_t u0, limb_t v, limb_t & rem) noexcept
{
#if DLIMB_HAS_INT128
    const unsigned __int128 n = (static_cast<unsigned __int128>(u1) << 64) | u0;
    const limb_t q = static_cast<limb_t>(n / v);
    rem = static_cast<limb_t>(n - static_cast<unsigned __int128>(q) * v);
    return q;
#else
    // Knuth D on 32-bit digits: normalize v, then produce two half-limb
    // quotient digits, each estimated from the top digits and corrected.
    const limb_t b = limb_t(1) << 32;
    const int s = clz(v);
    v <<= s;
    const limb_t vn1 = v >> 32;
    const limb_t vn0 = v & half_mask;
    const limb_t un32 = s ? (u1 << s) | (u0 >> (limb_bits - s)) : u1;
    const limb_t un10 = u0 << s;
    const limb_t un1 = un10 >> 32;
    const limb_t un0 = un10 & half_mask;

    limb_t q1 = un32 / vn1;
    limb_t rhat = un32 - q1 * vn1;
    while (q1 >= b || q1 * vn0 > b * rhat + un1)
    {
        --q1;
        rhat += vn1;
        if (rhat >= b)
            break;
    }

    const limb_t un21 = un32 * b + un1 - q1 * v;
    limb_t q0 = un21 / vn1;
    rhat = un21 - q0 * vn1;
    while (q0 >= b || q0 * vn0 > b * rhat + un0)
    {
        --q0;
        rhat += vn1;
        if (rhat >= b)
            break;
    }

    rem = (un21 * b + un0 - q0 * v) >> s;
    return q1 * b + q0;
#endif
}

// Divides the n-limb little-endian array u by the single limb v, writing the
// quotient limbs to q (which may alias u) and returning the remainder.
inline limb_t div_limbs_by_limb(const limb_t * u, size_t n, limb_t v, limb_t * q) noexcept
{
    limb_t rem = 0;
    for (size_t i = n; i-- > 0;)
        q[i] = div_2by1(rem, u[i], v, rem);
    return rem;
}

// Left-shift n limbs by 'shift' bits (0..63) into dst, returning the carry-out
// limb. The source and destination may alias.
inline limb_t lshift_limbs_to(const limb_t * src, size_t n, limb_t * dst, int shift) noexcept
{
    if (shift == 0)
    {
        for (size_t i = n; i-- > 0;)
            dst[i] = src[i];
        return 0;
    }
    const limb_t carry = src[n - 1] >> (limb_bits - shift);
    for (size_t i = n; i-- > 1;)
        dst[i] = (src[i] << shift) | (src[i - 1] >> (limb_bits - shift));
    dst[0] = src[0] << shift;
    return carry;
}

//=== Two-limb kernel ========================================================

// A 256-bit value as two double limbs: the exact product of two 128-bit
// operands, or the dividend of a full-width division.
struct wide4
{
    wide2 hi;
    wide2 lo;
};

constexpr int wide_bits = 2 * limb_bits;

DLIMB_CONSTEXPR14 inline bool wide_is_zero(const wide2 & a) noexcept
{
    return (a.hi | a.lo) == 0;
}

DLIMB_CONSTEXPR14 inline bool wide_less(const wide2 & a, const wide2 & b) noexcept
{
    return a.hi != b.hi ? a.hi < b.hi : a.lo < b.lo;
}

//=== Shifts ==================================================================
// Counts are taken modulo 128. A native shift by the full limb width is never
// issued: a count of zero returns early and counts of 64 or more move one
// limb wholesale into the other.

DLIMB_CONSTEXPR14 inline wide2 wide_shl(const wide2 & a, unsigned n) noexcept
{
    n &= wide_bits - 1;
    wide2 r = a;
    if (n >= limb_bits)
    {
        r.hi = a.lo << (n - limb_bits);
        r.lo = 0;
    }
    else if (n != 0)
    {
        r.hi = (a.hi << n) | (a.lo >> (limb_bits - n));
        r.lo = a.lo << n;
    }
    return r;
}

// Logical right shift (zero fill).
DLIMB_CONSTEXPR14 inline wide2 wide_shr(const wide2 & a, unsigned n) noexcept
{
    n &= wide_bits - 1;
    wide2 r = a;
    if (n >= limb_bits)
    {
        r.lo = a.hi >> (n - limb_bits);
        r.hi = 0;
    }
    else if (n != 0)
    {
        r.lo = (a.lo >> n) | (a.hi << (limb_bits - n));
        r.hi = a.hi >> n;
    }
    return r;
}

// Arithmetic right shift: vacated bits copy bit 127.
DLIMB_CONSTEXPR14 inline wide2 wide_sar(const wide2 & a, unsigned n) noexcept
{
    const limb_t fill = (a.hi >> 63) ? ~limb_t(0) : limb_t(0);
    n &= wide_bits - 1;
    wide2 r = wide_shr(a, n);
    if (fill && n != 0)
    {
        if (n >= limb_bits)
        {
            r.hi = fill;
            if (n > limb_bits)
                r.lo |= fill << (wide_bits - n);
        }
        else
        {
            r.hi |= fill << (limb_bits - n);
        }
    }
    return r;
}

//=== Addition and subtraction ================================================

DLIMB_CONSTEXPR14 inline wide2 wide_add(const wide2 & a, const wide2 & b, limb_t & carry) noexcept
{
    carry = 0;
    wide2 r = {0, 0};
    r.lo = add_carry(a.lo, b.lo, carry);
    r.hi = add_carry(a.hi, b.hi, carry);
    return r;
}

DLIMB_CONSTEXPR14 inline wide2 wide_sub(const wide2 & a, const wide2 & b, limb_t & borrow) noexcept
{
    borrow = 0;
    wide2 r = {0, 0};
    r.lo = sub_borrow(a.lo, b.lo, borrow);
    r.hi = sub_borrow(a.hi, b.hi, borrow);
    return r;
}

// Two's complement overflow of the top limb: both operands share a sign the
// result does not have.
constexpr bool signed_add_overflow(limb_t a_hi, limb_t b_hi, limb_t r_hi) noexcept
{
    return (((a_hi ^ r_hi) & (b_hi ^ r_hi)) >> 63) != 0;
}

// Operands differ in sign and the result took the subtrahend's sign.
constexpr bool signed_sub_overflow(limb_t a_hi, limb_t b_hi, limb_t r_hi) noexcept
{
    return (((a_hi ^ b_hi) & (a_hi ^ r_hi)) >> 63) != 0;
}

DLIMB_CONSTEXPR14 inline wide2 wide_negate(const wide2 & a) noexcept
{
    const wide2 zero = {0, 0};
    limb_t borrow = 0;
    return wide_sub(zero, a, borrow);
}

inline wide4 wide4_negate(const wide4 & a) noexcept
{
    limb_t limbs[4] = {~a.lo.lo, ~a.lo.hi, ~a.hi.lo, ~a.hi.hi};
    limb_t carry = 1;
    for (size_t i = 0; i < 4; ++i)
        limbs[i] = add_carry(limbs[i], 0, carry);
    wide4 r = {{limbs[3], limbs[2]}, {limbs[1], limbs[0]}};
    return r;
}

//=== Multiplication ==========================================================

// Exact 128x128 -> 256-bit product from the four 64x64 partial products
//
//                     [ a.lo*b.lo ]
//           [ a.lo*b.hi ]
//           [ a.hi*b.lo ]
//   [ a.hi*b.hi ]
//
// Column 1 sums three limbs and column 2 four (three partials plus the
// column-1 carries), so each column keeps a carry counter rather than a bit.
inline wide4 wide_mul_full(const wide2 & a, const wide2 & b) noexcept
{
    const wide2 ll = mul_full(a.lo, b.lo);
    const wide2 lh = mul_full(a.lo, b.hi);
    const wide2 hl = mul_full(a.hi, b.lo);
    const wide2 hh = mul_full(a.hi, b.hi);

    limb_t c1 = 0;
    limb_t r1 = accumulate(ll.hi, lh.lo, c1);
    r1 = accumulate(r1, hl.lo, c1);

    limb_t c2 = 0;
    limb_t r2 = accumulate(hh.lo, lh.hi, c2);
    r2 = accumulate(r2, hl.hi, c2);
    r2 = accumulate(r2, c1, c2);

    // The full product is below 2^256, so this cannot wrap.
    const limb_t r3 = hh.hi + c2;

    wide4 r = {{r3, r2}, {r1, ll.lo}};
    return r;
}

// Low 128 bits of the product.
inline wide2 wide_mul_low(const wide2 & a, const wide2 & b) noexcept
{
    wide2 r = mul_full(a.lo, b.lo);
    r.hi += a.lo * b.hi + a.hi * b.lo;
    return r;
}

//=== Division (Knuth, TAOCP vol. 2, 4.3.1, Algorithm D) ======================

// One quotient digit of Algorithm D with a two-limb divisor: divides the
// three-limb window (u2, u1, u0) by d. Requires d.hi to have its top bit set
// and (u2, u1) < d, so the digit fits one limb. Stores the remainder (< d).
inline limb_t div_3by2(limb_t u2, limb_t u1, limb_t u0, const wide2 & d, wide2 & rem) noexcept
{
    // D3: estimate from the top two limbs and the divisor's top limb.
    limb_t qhat = 0;
    limb_t rhat = 0;
    bool rhat_overflow = false;
    if (u2 == d.hi)
    {
        qhat = ~limb_t(0);
        rhat = u1 + d.hi;
        rhat_overflow = rhat < u1;
    }
    else
    {
        qhat = div_2by1(u2, u1, d.hi, rhat);
    }

    // While qhat * d.lo > (rhat, u0) the estimate is too large. Once rhat
    // no longer fits a limb the test cannot hold.
    while (!rhat_overflow)
    {
        const wide2 window = {rhat, u0};
        if (!wide_less(window, mul_full(qhat, d.lo)))
            break;
        --qhat;
        const limb_t prev = rhat;
        rhat += d.hi;
        rhat_overflow = rhat < prev;
    }

    // D4: multiply and subtract qhat * d from the window.
    const wide2 p_lo = mul_full(qhat, d.lo);
    const wide2 p_hi = mul_full(qhat, d.hi);
    limb_t carry = 0;
    const limb_t t1 = add_carry(p_lo.hi, p_hi.lo, carry);
    const limb_t t2 = p_hi.hi + carry;

    limb_t borrow = 0;
    limb_t r0 = sub_borrow(u0, p_lo.lo, borrow);
    limb_t r1 = sub_borrow(u1, t1, borrow);
    sub_borrow(u2, t2, borrow);

    // D5/D6: add back. Unreachable with a two-limb divisor, where the test
    // above already leaves qhat exact.
    if (borrow)
    {
        --qhat;
        carry = 0;
        r0 = add_carry(r0, d.lo, carry);
        r1 = add_carry(r1, d.hi, carry);
    }

    rem.hi = r1;
    rem.lo = r0;
    return qhat;
}

// 128 / 128-bit division. Requires v != 0.
inline wide2 wide_divmod(const wide2 & u, const wide2 & v, wide2 & rem) noexcept
{
    wide2 q = {0, 0};
    if (wide_less(u, v))
    {
        rem = u;
        return q;
    }

    if (v.hi == 0)
    {
        // Single-limb divisor: running remainder over the dividend limbs.
        limb_t num[2] = {u.lo, u.hi};
        limb_t quo[2] = {0, 0};
        rem.hi = 0;
        rem.lo = div_limbs_by_limb(num, 2, v.lo, quo);
        q.hi = quo[1];
        q.lo = quo[0];
        return q;
    }

    // D1: normalize so the divisor's top bit is set. The dividend spills
    // into a third limb; the quotient is a single digit because v >= 2^64.
    const int s = clz(v.hi);
    const wide2 vn = wide_shl(v, static_cast<unsigned>(s));
    const wide2 un = wide_shl(u, static_cast<unsigned>(s));
    const limb_t u2 = s ? u.hi >> (limb_bits - s) : 0;

    wide2 r = {0, 0};
    q.lo = div_3by2(u2, un.hi, un.lo, vn, r);

    // D8: undo the normalization on the remainder.
    rem = wide_shr(r, static_cast<unsigned>(s));
    return q;
}

// 256 / 128-bit division. Requires v != 0 and u.hi < v so that the quotient
// fits 128 bits.
inline wide2 wide_divmod_full(const wide4 & u, const wide2 & v, wide2 & rem) noexcept
{
    if (wide_is_zero(u.hi))
        return wide_divmod(u.lo, v, rem);

    limb_t num[4] = {u.lo.lo, u.lo.hi, u.hi.lo, u.hi.hi};
    wide2 q = {0, 0};

    if (v.hi == 0)
    {
        // u.hi < v leaves the top two quotient limbs zero.
        limb_t quo[4] = {0, 0, 0, 0};
        rem.hi = 0;
        rem.lo = div_limbs_by_limb(num, 4, v.lo, quo);
        q.hi = quo[1];
        q.lo = quo[0];
        return q;
    }

    // D1: normalize divisor and dividend. u.hi < v guarantees nothing is
    // shifted out of the top limb, so the dividend stays four limbs wide.
    const int s = clz(v.hi);
    const wide2 vn = wide_shl(v, static_cast<unsigned>(s));
    lshift_limbs_to(num, 4, num, s);

    // D2-D7: two quotient digits, most significant first, each dividing a
    // three-limb window of the running remainder.
    wide2 r = {0, 0};
    q.hi = div_3by2(num[3], num[2], num[1], vn, r);
    q.lo = div_3by2(r.hi, r.lo, num[0], vn, r);

    rem = wide_shr(r, static_cast<unsigned>(s));
    return q;
}

//=== Radix conversion =======================================================
// Largest power of a radix that fits one limb, and how many digits it spans.
struct radix_chunk
{
    limb_t power;
    unsigned digits;
};

DLIMB_CONSTEXPR14 inline radix_chunk chunk_for_radix(unsigned radix) noexcept
{
    radix_chunk chunk = {radix, 1};
    while (chunk.power <= ~limb_t(0) / radix)
    {
        chunk.power *= radix;
        ++chunk.digits;
    }
    return chunk;
}

// Digit value of c in radix 36, or 36 when c is not a digit at all.
constexpr unsigned digit_value(char c) noexcept
{
    return (c >= '0' && c <= '9') ? static_cast<unsigned>(c - '0')
        : (c >= 'a' && c <= 'z')  ? static_cast<unsigned>(c - 'a') + 10
        : (c >= 'A' && c <= 'Z')  ? static_cast<unsigned>(c - 'A') + 10
                                  : 36u;
}

enum class parse_status
{
    ok,
    invalid,
    out_of_range
};

// Appends the digits of m in the given radix (2..36). Each limb-sized chunk
// of digits costs one 128/64 division; every chunk below the most
// significant one is zero-padded to the full chunk width.
inline void format_magnitude(const wide2 & m, unsigned radix, bool uppercase, std::string & out)
{
    static const char lower[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static const char upper[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    const char * digits = uppercase ? upper : lower;

    if (wide_is_zero(m))
    {
        out.push_back('0');
        return;
    }

    // chunk.power exceeds 2^58 for every radix, so 128 bits need at most
    // three chunks.
    const radix_chunk chunk = chunk_for_radix(radix);
    limb_t chunks[4] = {};
    size_t count = 0;
    limb_t value[2] = {m.lo, m.hi};
    while ((value[0] | value[1]) != 0)
        chunks[count++] = div_limbs_by_limb(value, 2, chunk.power, value);

    char buf[limb_bits];
    for (size_t i = count; i-- > 0;)
    {
        limb_t x = chunks[i];
        const unsigned width = (i + 1 == count) ? 0u : chunk.digits;
        size_t idx = sizeof(buf);
        unsigned written = 0;
        while (x != 0 || written < width)
        {
            buf[--idx] = digits[x % radix];
            x /= radix;
            ++written;
        }
        out.append(buf + idx, sizeof(buf) - idx);
    }
}

// Parses [first, last) as an unsigned magnitude in the given radix (2..36).
// Only digits are accepted; at least one is required.
inline parse_status parse_magnitude(const char * first, const char * last, unsigned radix, wide2 & out) noexcept
{
    if (first == last)
        return parse_status::invalid;
    for (const char * p = first; p != last; ++p)
    {
        if (digit_value(*p) >= radix)
            return parse_status::invalid;
    }
    while (first != last && *first == '0')
        ++first;

    // Powers radix^0 .. radix^digits for the current radix only.
    const radix_chunk chunk = chunk_for_radix(radix);
    limb_t powers[limb_bits] = {};
    powers[0] = 1;
    for (unsigned i = 1; i <= chunk.digits; ++i)
        powers[i] = powers[i - 1] * radix;

    wide2 acc = {0, 0};
    while (first != last)
    {
        const size_t remaining = static_cast<size_t>(last - first);
        const size_t len = remaining < chunk.digits ? remaining : chunk.digits;
        limb_t value = 0;
        for (size_t i = 0; i < len; ++i)
            value = value * radix + digit_value(first[i]);
        first += len;

        const wide2 scale = {0, powers[len]};
        const wide4 scaled = wide_mul_full(acc, scale);
        if (!wide_is_zero(scaled.hi))
            return parse_status::out_of_range;
        const wide2 addend = {0, value};
        limb_t carry = 0;
        acc = wide_add(scaled.lo, addend, carry);
        if (carry)
            return parse_status::out_of_range;
    }
    out = acc;
    return parse_status::ok;
}

} // namespace detail
} // namespace dlimb

namespace dlimb
{

//=== Forward declarations & type aliases ====================================
template <typename Signed>
class integer128;

using Int128 = integer128<signed>;
using UInt128 = integer128<unsigned>;

template <typename Signed>
std::string to_string(const integer128<Signed> & value, int radix = 10, bool uppercase = false);

template <typename Signed>
std::ostream & operator<<(std::ostream & out, const integer128<Signed> & value);

//=== Result carriers ========================================================

// A possibly truncated result and whether the true result was representable.
template <typename T>
struct overflow_result
{
    T partial_value;
    bool overflow;
};

template <typename T>
struct quotient_remainder
{
    T quotient;
    T remainder;
};

// A value twice the width of T; the low half is always unsigned.
template <typename T>
struct full_width
{
    T high;
    typename T::magnitude_type low;
};

namespace detail
{
//=== Native integer traits ==================================================
template <typename T>
struct is_integral : std::is_integral<T>
{
};

template <typename T>
struct is_signed : std::is_signed<T>
{
};

#if defined(__SIZEOF_INT128__)
template <>
struct is_integral<__int128> : std::true_type
{
};

template <>
struct is_integral<unsigned __int128> : std::true_type
{
};

template <>
struct is_signed<__int128> : std::true_type
{
};

template <>
struct is_signed<unsigned __int128> : std::false_type
{
};
#endif

template <typename T>
struct wider_than_limb : std::integral_constant<bool, (sizeof(T) > sizeof(limb_t))>
{
};

// Sign extension of a native value into the upper limb.
template <typename T>
constexpr limb_t extension_limb(T v, std::true_type) noexcept
{
    return v < 0 ? ~limb_t(0) : limb_t(0);
}

template <typename T>
constexpr limb_t extension_limb(T, std::false_type) noexcept
{
    return 0;
}

template <typename T>
constexpr limb_t upper_limb(T v, std::false_type) noexcept
{
    return extension_limb(v, std::integral_constant<bool, is_signed<T>::value>());
}

template <typename T>
constexpr limb_t lower_limb(T v, std::false_type) noexcept
{
    return static_cast<limb_t>(v);
}

template <typename T>
constexpr T narrow_limbs(limb_t, limb_t lo, std::false_type) noexcept
{
    return static_cast<T>(lo);
}

#if defined(__SIZEOF_INT128__)
template <typename T>
constexpr limb_t upper_limb(T v, std::true_type) noexcept
{
    return static_cast<limb_t>(static_cast<unsigned __int128>(v) >> 64);
}

template <typename T>
constexpr limb_t lower_limb(T v, std::true_type) noexcept
{
    return static_cast<limb_t>(static_cast<unsigned __int128>(v));
}

template <typename T>
constexpr T narrow_limbs(limb_t hi, limb_t lo, std::true_type) noexcept
{
    return static_cast<T>((static_cast<unsigned __int128>(hi) << 64) | lo);
}
#endif

#if defined(__BYTE_ORDER__) && defined(__ORDER_BIG_ENDIAN__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
constexpr bool host_is_little_endian = false;
#else
constexpr bool host_is_little_endian = true;
#endif

} // namespace detail

//=== Core integer type ======================================================
template <typename Signed>
class integer128
{
public:
    using limb_type = detail::limb_t;
    using high_type = typename std::conditional<std::is_same<Signed, signed>::value, int64_t, uint64_t>::type;
    using magnitude_type = integer128<unsigned>;
    static_assert(std::is_same<Signed, signed>::value || std::is_same<Signed, unsigned>::value, "Signed must be 'signed' or 'unsigned'.");

    static constexpr bool is_signed = std::is_same<Signed, signed>::value;
    static constexpr int bit_width = detail::wide_bits;

    template <typename>
    friend class integer128;

    // Constructors
    constexpr integer128() noexcept = default;
    constexpr integer128(const integer128 &) noexcept = default;
    constexpr integer128(integer128 &&) noexcept = default;

    DLIMB_CONSTEXPR14 integer128 & operator=(const integer128 &) noexcept = default;
    DLIMB_CONSTEXPR14 integer128 & operator=(integer128 &&) noexcept = default;

    constexpr integer128(high_type high, limb_type low) noexcept
        : data_{low, static_cast<limb_type>(high)}
    {
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    constexpr integer128(T v) noexcept
        : data_{detail::lower_limb(v, detail::wider_than_limb<T>()), detail::upper_limb(v, detail::wider_than_limb<T>())}
    {
    }

    // Reinterprets the bit pattern of the other signedness.
    template <typename Other, typename std::enable_if<!std::is_same<Other, Signed>::value, int>::type = 0>
    constexpr explicit integer128(const integer128<Other> & other) noexcept
        : data_{other.data_[0], other.data_[1]}
    {
    }

    // Conversion operators (truncating, like the native conversions)
    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    constexpr explicit operator T() const noexcept
    {
        return detail::narrow_limbs<T>(data_[1], data_[0], detail::wider_than_limb<T>());
    }

    constexpr explicit operator bool() const noexcept { return !is_zero(); }

    // Limb access
    constexpr high_type high() const noexcept { return static_cast<high_type>(data_[1]); }
    constexpr limb_type low() const noexcept { return data_[0]; }

    constexpr bool is_zero() const noexcept { return (data_[0] | data_[1]) == 0; }
    constexpr bool is_negative() const noexcept { return is_signed && (data_[1] >> 63) != 0; }

    // Absolute value as UInt128; the magnitude of Int128's minimum is 2^127.
    DLIMB_CONSTEXPR14 magnitude_type magnitude() const noexcept
    {
        return magnitude_type::from_wide(is_negative() ? detail::wide_negate(wide()) : wide());
    }

    //=== Overflow-reporting arithmetic =======================================

    DLIMB_CONSTEXPR14 overflow_result<integer128> adding_reporting_overflow(const integer128 & rhs) const noexcept
    {
        limb_type carry = 0;
        const detail::wide2 sum = detail::wide_add(wide(), rhs.wide(), carry);
        const bool overflow = is_signed ? detail::signed_add_overflow(data_[1], rhs.data_[1], sum.hi) : carry != 0;
        overflow_result<integer128> res = {from_wide(sum), overflow};
        return res;
    }

    DLIMB_CONSTEXPR14 overflow_result<integer128> subtracting_reporting_overflow(const integer128 & rhs) const noexcept
    {
        limb_type borrow = 0;
        const detail::wide2 diff = detail::wide_sub(wide(), rhs.wide(), borrow);
        const bool overflow = is_signed ? detail::signed_sub_overflow(data_[1], rhs.data_[1], diff.hi) : borrow != 0;
        overflow_result<integer128> res = {from_wide(diff), overflow};
        return res;
    }

    // The truncated product and whether it differs from the exact one. Signed
    // operands multiply as magnitudes; the low half is then negated when the
    // signs differ.
    overflow_result<integer128> multiplied_reporting_overflow(const integer128 & rhs) const noexcept
    {
        const detail::wide4 p = detail::wide_mul_full(magnitude().wide(), rhs.magnitude().wide());
        const bool negative = is_negative() != rhs.is_negative();
        const bool overflow = !detail::wide_is_zero(p.hi) || !magnitude_fits(p.lo, negative);
        overflow_result<integer128> res = {apply_sign(p.lo, negative), overflow};
        return res;
    }

    // A zero divisor, or Int128 min / -1, reports overflow with *this.
    overflow_result<integer128> divided_reporting_overflow(const integer128 & rhs) const noexcept
    {
        overflow_result<integer128> res = {*this, true};
        if (rhs.is_zero())
            return res;
        integer128 q;
        integer128 r;
        if (!divmod(rhs, q, r))
            return res;
        res.partial_value = q;
        res.overflow = false;
        return res;
    }

    // A zero divisor reports overflow with *this; Int128 min % -1 reports
    // overflow with 0.
    overflow_result<integer128> remainder_reporting_overflow(const integer128 & rhs) const noexcept
    {
        overflow_result<integer128> res = {*this, true};
        if (rhs.is_zero())
            return res;
        integer128 q;
        integer128 r;
        if (!divmod(rhs, q, r))
        {
            res.partial_value = integer128();
            return res;
        }
        res.partial_value = r;
        res.overflow = false;
        return res;
    }

    // Exact 256-bit product.
    full_width<integer128> multiplied_full_width(const integer128 & rhs) const noexcept
    {
        detail::wide4 p = detail::wide_mul_full(magnitude().wide(), rhs.magnitude().wide());
        if (is_negative() != rhs.is_negative())
            p = detail::wide4_negate(p);
        full_width<integer128> res = {from_wide(p.hi), magnitude_type::from_wide(p.lo)};
        return res;
    }

    // Divides the 256-bit dividend by *this. Throws std::domain_error for a
    // zero divisor and std::overflow_error when the quotient does not fit.
    quotient_remainder<integer128> dividing_full_width(const full_width<integer128> & dividend) const
    {
        DLIMB_DIVZERO_CHECK(is_zero());
        const bool dividend_negative = dividend.high.is_negative();
        detail::wide4 u = {dividend.high.wide(), dividend.low.wide()};
        if (dividend_negative)
            u = detail::wide4_negate(u);
        const detail::wide2 v = magnitude().wide();
        DLIMB_OVERFLOW_CHECK(!detail::wide_less(u.hi, v));

        detail::wide2 rem = {0, 0};
        const detail::wide2 quo = detail::wide_divmod_full(u, v, rem);
        const bool quotient_negative = dividend_negative != is_negative();
        DLIMB_OVERFLOW_CHECK(!magnitude_fits(quo, quotient_negative));
        quotient_remainder<integer128> res = {apply_sign(quo, quotient_negative), apply_sign(rem, dividend_negative)};
        return res;
    }

    quotient_remainder<integer128> quotient_and_remainder(const integer128 & rhs) const
    {
        DLIMB_DIVZERO_CHECK(rhs.is_zero());
        quotient_remainder<integer128> res = {integer128(), integer128()};
        DLIMB_OVERFLOW_CHECK(!divmod(rhs, res.quotient, res.remainder));
        return res;
    }

    //=== Wrapping arithmetic ================================================

    DLIMB_CONSTEXPR14 integer128 wrapping_add(const integer128 & rhs) const noexcept
    {
        return adding_reporting_overflow(rhs).partial_value;
    }

    DLIMB_CONSTEXPR14 integer128 wrapping_sub(const integer128 & rhs) const noexcept
    {
        return subtracting_reporting_overflow(rhs).partial_value;
    }

    integer128 wrapping_mul(const integer128 & rhs) const noexcept
    {
        return from_wide(detail::wide_mul_low(wide(), rhs.wide()));
    }

    DLIMB_CONSTEXPR14 integer128 wrapping_neg() const noexcept { return from_wide(detail::wide_negate(wide())); }

    //=== Bit queries ========================================================

    DLIMB_CONSTEXPR14 int leading_zero_bit_count() const noexcept
    {
        return data_[1] ? detail::clz(data_[1]) : detail::limb_bits + detail::clz(data_[0]);
    }

    DLIMB_CONSTEXPR14 int trailing_zero_bit_count() const noexcept
    {
        return data_[0] ? detail::ctz(data_[0]) : detail::limb_bits + detail::ctz(data_[1]);
    }

    DLIMB_CONSTEXPR14 int nonzero_bit_count() const noexcept { return detail::popcount(data_[0]) + detail::popcount(data_[1]); }

    DLIMB_CONSTEXPR14 integer128 byte_swapped() const noexcept
    {
        const detail::wide2 swapped = {detail::bswap(data_[0]), detail::bswap(data_[1])};
        return from_wide(swapped);
    }

    DLIMB_CONSTEXPR14 integer128 big_endian() const noexcept { return detail::host_is_little_endian ? byte_swapped() : *this; }
    DLIMB_CONSTEXPR14 integer128 little_endian() const noexcept { return detail::host_is_little_endian ? *this : byte_swapped(); }

    static DLIMB_CONSTEXPR14 integer128 from_big_endian(const integer128 & value) noexcept { return value.big_endian(); }
    static DLIMB_CONSTEXPR14 integer128 from_little_endian(const integer128 & value) noexcept { return value.little_endian(); }

    //=== Compound assignment ================================================

    integer128 & operator+=(const integer128 & rhs) { return *this = *this + rhs; }
    integer128 & operator-=(const integer128 & rhs) { return *this = *this - rhs; }
    integer128 & operator*=(const integer128 & rhs) { return *this = *this * rhs; }
    integer128 & operator/=(const integer128 & rhs) { return *this = *this / rhs; }
    integer128 & operator%=(const integer128 & rhs) { return *this = *this % rhs; }

    DLIMB_CONSTEXPR14 integer128 & operator&=(const integer128 & rhs) noexcept
    {
        data_[0] &= rhs.data_[0];
        data_[1] &= rhs.data_[1];
        return *this;
    }

    DLIMB_CONSTEXPR14 integer128 & operator|=(const integer128 & rhs) noexcept
    {
        data_[0] |= rhs.data_[0];
        data_[1] |= rhs.data_[1];
        return *this;
    }

    DLIMB_CONSTEXPR14 integer128 & operator^=(const integer128 & rhs) noexcept
    {
        data_[0] ^= rhs.data_[0];
        data_[1] ^= rhs.data_[1];
        return *this;
    }

    DLIMB_CONSTEXPR14 integer128 & operator<<=(int n) noexcept { return *this = shift_left(*this, n); }
    DLIMB_CONSTEXPR14 integer128 & operator>>=(int n) noexcept { return *this = shift_right(*this, n); }

    // Increment / decrement (checked)
    integer128 & operator++() { return *this += integer128(1); }

    integer128 operator++(int)
    {
        integer128 tmp = *this;
        ++(*this);
        return tmp;
    }

    integer128 & operator--() { return *this -= integer128(1); }

    integer128 operator--(int)
    {
        integer128 tmp = *this;
        --(*this);
        return tmp;
    }

    //=== Unary operators ====================================================

    constexpr integer128 operator+() const noexcept { return *this; }

    template <typename S = Signed, typename std::enable_if<std::is_same<S, signed>::value, int>::type = 0>
    integer128 operator-() const
    {
        DLIMB_OVERFLOW_CHECK(data_[1] == (limb_type(1) << 63) && data_[0] == 0);
        return wrapping_neg();
    }

    friend constexpr integer128 operator~(const integer128 & v) noexcept { return integer128(static_cast<high_type>(~v.data_[1]), ~v.data_[0]); }

    //=== Checked arithmetic =================================================

    friend integer128 operator+(const integer128 & lhs, const integer128 & rhs)
    {
        const overflow_result<integer128> r = lhs.adding_reporting_overflow(rhs);
        DLIMB_OVERFLOW_CHECK(r.overflow);
        return r.partial_value;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator+(const integer128 & lhs, T rhs)
    {
        return lhs + integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator+(T lhs, const integer128 & rhs)
    {
        return integer128(lhs) + rhs;
    }

    friend integer128 operator-(const integer128 & lhs, const integer128 & rhs)
    {
        const overflow_result<integer128> r = lhs.subtracting_reporting_overflow(rhs);
        DLIMB_OVERFLOW_CHECK(r.overflow);
        return r.partial_value;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator-(const integer128 & lhs, T rhs)
    {
        return lhs - integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator-(T lhs, const integer128 & rhs)
    {
        return integer128(lhs) - rhs;
    }

    friend integer128 operator*(const integer128 & lhs, const integer128 & rhs)
    {
        const overflow_result<integer128> r = lhs.multiplied_reporting_overflow(rhs);
        DLIMB_OVERFLOW_CHECK(r.overflow);
        return r.partial_value;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator*(const integer128 & lhs, T rhs)
    {
        return lhs * integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator*(T lhs, const integer128 & rhs)
    {
        return integer128(lhs) * rhs;
    }

    friend integer128 operator/(const integer128 & lhs, const integer128 & rhs)
    {
        DLIMB_DIVZERO_CHECK(rhs.is_zero());
        integer128 q;
        integer128 r;
        DLIMB_OVERFLOW_CHECK(!lhs.divmod(rhs, q, r));
        return q;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator/(const integer128 & lhs, T rhs)
    {
        return lhs / integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator/(T lhs, const integer128 & rhs)
    {
        return integer128(lhs) / rhs;
    }

    friend integer128 operator%(const integer128 & lhs, const integer128 & rhs)
    {
        DLIMB_MODZERO_CHECK(rhs.is_zero());
        integer128 q;
        integer128 r;
        DLIMB_OVERFLOW_CHECK(!lhs.divmod(rhs, q, r));
        return r;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator%(const integer128 & lhs, T rhs)
    {
        return lhs % integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend integer128 operator%(T lhs, const integer128 & rhs)
    {
        return integer128(lhs) % rhs;
    }

    //=== Bitwise ============================================================

    friend constexpr integer128 operator&(const integer128 & lhs, const integer128 & rhs) noexcept
    {
        return integer128(static_cast<high_type>(lhs.data_[1] & rhs.data_[1]), lhs.data_[0] & rhs.data_[0]);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator&(const integer128 & lhs, T rhs) noexcept
    {
        return lhs & integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator&(T lhs, const integer128 & rhs) noexcept
    {
        return integer128(lhs) & rhs;
    }

    friend constexpr integer128 operator|(const integer128 & lhs, const integer128 & rhs) noexcept
    {
        return integer128(static_cast<high_type>(lhs.data_[1] | rhs.data_[1]), lhs.data_[0] | rhs.data_[0]);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator|(const integer128 & lhs, T rhs) noexcept
    {
        return lhs | integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator|(T lhs, const integer128 & rhs) noexcept
    {
        return integer128(lhs) | rhs;
    }

    friend constexpr integer128 operator^(const integer128 & lhs, const integer128 & rhs) noexcept
    {
        return integer128(static_cast<high_type>(lhs.data_[1] ^ rhs.data_[1]), lhs.data_[0] ^ rhs.data_[0]);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator^(const integer128 & lhs, T rhs) noexcept
    {
        return lhs ^ integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr integer128 operator^(T lhs, const integer128 & rhs) noexcept
    {
        return integer128(lhs) ^ rhs;
    }

    //=== Shifts =============================================================
    // A negative count shifts the other way; counts of 128 or more clear the
    // value (or fill it with the sign of a negative Int128 on >>).

    friend DLIMB_CONSTEXPR14 integer128 operator<<(const integer128 & lhs, int n) noexcept { return shift_left(lhs, n); }
    friend DLIMB_CONSTEXPR14 integer128 operator>>(const integer128 & lhs, int n) noexcept { return shift_right(lhs, n); }

    // Shifts by n modulo 128.
    friend DLIMB_CONSTEXPR14 integer128 masked_shl(const integer128 & v, uint64_t n) noexcept
    {
        return from_wide(detail::wide_shl(v.wide(), static_cast<unsigned>(n & (bit_width - 1))));
    }

    friend DLIMB_CONSTEXPR14 integer128 masked_shr(const integer128 & v, uint64_t n) noexcept
    {
        const unsigned count = static_cast<unsigned>(n & (bit_width - 1));
        return from_wide(is_signed ? detail::wide_sar(v.wide(), count) : detail::wide_shr(v.wide(), count));
    }

    //=== Comparison =========================================================

    friend constexpr bool operator==(const integer128 & lhs, const integer128 & rhs) noexcept
    {
        return lhs.data_[0] == rhs.data_[0] && lhs.data_[1] == rhs.data_[1];
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator==(const integer128 & lhs, T rhs) noexcept
    {
        return lhs == integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator==(T lhs, const integer128 & rhs) noexcept
    {
        return integer128(lhs) == rhs;
    }

    friend constexpr bool operator!=(const integer128 & lhs, const integer128 & rhs) noexcept { return !(lhs == rhs); }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator!=(const integer128 & lhs, T rhs) noexcept
    {
        return !(lhs == integer128(rhs));
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator!=(T lhs, const integer128 & rhs) noexcept
    {
        return !(integer128(lhs) == rhs);
    }

    // Lexicographic on (high, low); the high limb compares signed for Int128.
    friend constexpr bool operator<(const integer128 & lhs, const integer128 & rhs) noexcept
    {
        return lhs.data_[1] != rhs.data_[1] ? (is_signed ? static_cast<int64_t>(lhs.data_[1]) < static_cast<int64_t>(rhs.data_[1])
                                                         : lhs.data_[1] < rhs.data_[1])
                                            : lhs.data_[0] < rhs.data_[0];
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator<(const integer128 & lhs, T rhs) noexcept
    {
        return lhs < integer128(rhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator<(T lhs, const integer128 & rhs) noexcept
    {
        return integer128(lhs) < rhs;
    }

    friend constexpr bool operator>(const integer128 & lhs, const integer128 & rhs) noexcept { return rhs < lhs; }
    friend constexpr bool operator<=(const integer128 & lhs, const integer128 & rhs) noexcept { return !(rhs < lhs); }
    friend constexpr bool operator>=(const integer128 & lhs, const integer128 & rhs) noexcept { return !(lhs < rhs); }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator>(const integer128 & lhs, T rhs) noexcept
    {
        return integer128(rhs) < lhs;
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator>(T lhs, const integer128 & rhs) noexcept
    {
        return rhs < integer128(lhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator<=(const integer128 & lhs, T rhs) noexcept
    {
        return !(integer128(rhs) < lhs);
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator<=(T lhs, const integer128 & rhs) noexcept
    {
        return !(rhs < integer128(lhs));
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator>=(const integer128 & lhs, T rhs) noexcept
    {
        return !(lhs < integer128(rhs));
    }

    template <typename T, typename std::enable_if<detail::is_integral<T>::value, int>::type = 0>
    friend constexpr bool operator>=(T lhs, const integer128 & rhs) noexcept
    {
        return !(integer128(lhs) < rhs);
    }

private:
    constexpr detail::wide2 wide() const noexcept { return detail::wide2{data_[1], data_[0]}; }

    static constexpr integer128 from_wide(const detail::wide2 & w) noexcept { return integer128(static_cast<high_type>(w.hi), w.lo); }

    // Whether a magnitude with the given sign is representable.
    static constexpr bool magnitude_fits(const detail::wide2 & m, bool negative) noexcept
    {
        return !is_signed ? (!negative || detail::wide_is_zero(m))
            : negative    ? (m.hi < (limb_type(1) << 63) || (m.hi == (limb_type(1) << 63) && m.lo == 0))
                          : m.hi < (limb_type(1) << 63);
    }

    static DLIMB_CONSTEXPR14 integer128 apply_sign(const detail::wide2 & m, bool negative) noexcept
    {
        return from_wide(negative ? detail::wide_negate(m) : m);
    }

    // Truncating division of non-zero rhs on magnitudes. The remainder takes
    // the dividend's sign. Returns false when the quotient is not
    // representable, which only happens for Int128 min / -1.
    bool divmod(const integer128 & rhs, integer128 & quotient, integer128 & remainder) const noexcept
    {
        const bool lhs_negative = is_negative();
        detail::wide2 rem = {0, 0};
        const detail::wide2 quo = detail::wide_divmod(magnitude().wide(), rhs.magnitude().wide(), rem);
        const bool quotient_negative = lhs_negative != rhs.is_negative();
        if (!magnitude_fits(quo, quotient_negative))
            return false;
        quotient = apply_sign(quo, quotient_negative);
        remainder = apply_sign(rem, lhs_negative);
        return true;
    }

    static DLIMB_CONSTEXPR14 integer128 shift_left(const integer128 & v, long long n) noexcept
    {
        if (n < 0)
            return shift_right(v, -n);
        if (n >= bit_width)
            return integer128();
        return from_wide(detail::wide_shl(v.wide(), static_cast<unsigned>(n)));
    }

    static DLIMB_CONSTEXPR14 integer128 shift_right(const integer128 & v, long long n) noexcept
    {
        if (n < 0)
            return shift_left(v, -n);
        if (n >= bit_width)
            return v.is_negative() ? ~integer128() : integer128();
        const unsigned count = static_cast<unsigned>(n);
        return from_wide(is_signed ? detail::wide_sar(v.wide(), count) : detail::wide_shr(v.wide(), count));
    }

    limb_type data_[2] = {};
};

template <typename Signed>
constexpr bool integer128<Signed>::is_signed;

template <typename Signed>
constexpr int integer128<Signed>::bit_width;

} // namespace dlimb

namespace std
{
template <typename Signed>
class numeric_limits<dlimb::integer128<Signed>>
{
    typedef dlimb::integer128<Signed> T;

public:
    static const bool is_specialized = true;
    static const bool is_signed = T::is_signed;
    static const bool is_integer = true;
    static const bool is_exact = true;
    static const bool has_infinity = false;
    static const bool has_quiet_NaN = false;
    static const bool has_signaling_NaN = false;
    static const bool has_denorm_loss = false;
    static const std::float_round_style round_style = std::round_toward_zero;
    static const bool is_iec559 = false;
    static const bool is_bounded = true;
    static const bool is_modulo = false;
    static const int digits = 128 - (is_signed ? 1 : 0);
    static const int digits10 = digits * 30103 / 100000;
    static const int max_digits10 = 0;
    static const int radix = 2;
    static const int min_exponent = 0;
    static const int min_exponent10 = 0;
    static const int max_exponent = 0;
    static const int max_exponent10 = 0;
    static const bool traps = true;
    static const bool tinyness_before = false;

    static constexpr T min() noexcept
    {
        return is_signed ? T(static_cast<typename T::high_type>(uint64_t(1) << 63), 0) : T();
    }

    static constexpr T max() noexcept
    {
        return is_signed ? T(static_cast<typename T::high_type>(~uint64_t(0) >> 1), ~uint64_t(0))
                         : T(static_cast<typename T::high_type>(~uint64_t(0)), ~uint64_t(0));
    }

    static constexpr T lowest() noexcept { return min(); }
    static constexpr T epsilon() noexcept { return T(); }
    static constexpr T round_error() noexcept { return T(); }
    static constexpr T infinity() noexcept { return T(); }
    static constexpr T quiet_NaN() noexcept { return T(); }
    static constexpr T signaling_NaN() noexcept { return T(); }
    static constexpr T denorm_min() noexcept { return T(); }
};

template <typename Signed>
struct hash<dlimb::integer128<Signed>>
{
    size_t operator()(const dlimb::integer128<Signed> & value) const noexcept
    {
        // splitmix64 finalizer over both limbs
        uint64_t h = value.low() ^ (static_cast<uint64_t>(value.high()) * 0x9E3779B97F4A7C15ULL);
        h ^= h >> 30;
        h *= 0xBF58476D1CE4E5B9ULL;
        h ^= h >> 27;
        h *= 0x94D049BB133111EBULL;
        h ^= h >> 31;
        return static_cast<size_t>(h);
    }
};
} // namespace std

namespace dlimb
{

//=== Range-checked conversions ==============================================
// Between native integral types and integer128, and between Int128 and
// UInt128. try_convert reports whether the value is representable,
// saturate_cast clamps to the target's range, checked_cast throws.

namespace detail
{
template <typename T>
struct is_integer128 : std::false_type
{
};

template <typename Signed>
struct is_integer128<integer128<Signed>> : std::true_type
{
};

template <typename T>
struct is_convertible_integer : std::integral_constant<bool, is_integral<T>::value || is_integer128<T>::value>
{
};

struct signed_magnitude
{
    bool negative;
    UInt128 magnitude;
};

template <typename T>
inline signed_magnitude split_sign(const T & v, std::false_type) noexcept
{
    const UInt128 bits(v);
    const bool negative = is_signed<T>::value && (bits.high() >> 63) != 0;
    signed_magnitude res = {negative, negative ? bits.wrapping_neg() : bits};
    return res;
}

template <typename T>
inline signed_magnitude split_sign(const T & v, std::true_type) noexcept
{
    signed_magnitude res = {v.is_negative(), v.magnitude()};
    return res;
}

// Value bits of a native type, sign excluded.
template <typename T>
constexpr int native_value_bits() noexcept
{
    return std::is_same<T, bool>::value ? 1 : static_cast<int>(sizeof(T) * CHAR_BIT) - (is_signed<T>::value ? 1 : 0);
}

template <typename T>
inline UInt128 max_magnitude(std::false_type) noexcept
{
    return (UInt128(1) << native_value_bits<T>()).wrapping_sub(1);
}

template <typename T>
inline UInt128 max_magnitude(std::true_type) noexcept
{
    return UInt128(std::numeric_limits<T>::max());
}

template <typename T>
inline UInt128 min_magnitude(std::false_type) noexcept
{
    return is_signed<T>::value ? UInt128(1) << native_value_bits<T>() : UInt128();
}

template <typename T>
inline UInt128 min_magnitude(std::true_type) noexcept
{
    return std::numeric_limits<T>::min().magnitude();
}

template <typename T>
inline UInt128 range_limit(bool negative) noexcept
{
    return negative ? min_magnitude<T>(is_integer128<T>()) : max_magnitude<T>(is_integer128<T>());
}

template <typename To>
inline To join_sign(const signed_magnitude & v) noexcept
{
    return static_cast<To>(v.negative ? v.magnitude.wrapping_neg() : v.magnitude);
}
} // namespace detail

// Stores from in out and returns true when the value is representable in To;
// otherwise returns false and leaves out untouched.
template <typename To, typename From>
inline typename std::enable_if<detail::is_convertible_integer<To>::value && detail::is_convertible_integer<From>::value, bool>::type
try_convert(const From & from, To & out) noexcept
{
    const detail::signed_magnitude v = detail::split_sign(from, detail::is_integer128<From>());
    if (v.magnitude > detail::range_limit<To>(v.negative))
        return false;
    out = detail::join_sign<To>(v);
    return true;
}

// Clamps from to [min, max] of To.
template <typename To, typename From>
inline typename std::enable_if<detail::is_convertible_integer<To>::value && detail::is_convertible_integer<From>::value, To>::type
saturate_cast(const From & from) noexcept
{
    detail::signed_magnitude v = detail::split_sign(from, detail::is_integer128<From>());
    const UInt128 limit = detail::range_limit<To>(v.negative);
    if (v.magnitude > limit)
        v.magnitude = limit;
    return detail::join_sign<To>(v);
}

// Throws std::overflow_error when from is not representable in To.
template <typename To, typename From>
inline typename std::enable_if<detail::is_convertible_integer<To>::value && detail::is_convertible_integer<From>::value, To>::type
checked_cast(const From & from)
{
    To out = To();
    DLIMB_OVERFLOW_CHECK(!try_convert(from, out));
    return out;
}

//=== String and stream definitions =========================================

// Digits of value in radix 2..36, with a leading '-' for negative values.
template <typename Signed>
inline std::string to_string(const integer128<Signed> & value, int radix, bool uppercase)
{
    if (radix < 2 || radix > 36)
        throw std::invalid_argument("radix must be in [2, 36]");
    const UInt128 m = value.magnitude();
    const detail::wide2 bits = {static_cast<detail::limb_t>(m.high()), m.low()};
    std::string out;
    if (value.is_negative())
        out.push_back('-');
    detail::format_magnitude(bits, static_cast<unsigned>(radix), uppercase, out);
    return out;
}

namespace detail
{
template <typename Signed>
parse_status parse_integer(const std::string & text, integer128<Signed> & out, int radix) noexcept
{
    typedef integer128<Signed> T;
    if (radix < 2 || radix > 36)
        return parse_status::invalid;

    const char * first = text.data();
    const char * last = first + text.size();
    bool negative = false;
    if (first != last && (*first == '+' || *first == '-'))
    {
        negative = *first == '-';
        ++first;
    }

    wide2 bits = {0, 0};
    const parse_status status = parse_magnitude(first, last, static_cast<unsigned>(radix), bits);
    if (status != parse_status::ok)
        return status;

    const UInt128 m(bits.hi, bits.lo);
    const UInt128 limit = negative ? std::numeric_limits<T>::min().magnitude() : UInt128(std::numeric_limits<T>::max());
    if (m > limit)
        return parse_status::out_of_range;
    const T value(m);
    out = negative ? value.wrapping_neg() : value;
    return parse_status::ok;
}
} // namespace detail

// Parses an optional sign followed by digits of the radix. Returns false and
// leaves out untouched on malformed text, bad radix or a value out of range.
template <typename Signed>
inline bool parse(const std::string & text, integer128<Signed> & out, int radix = 10) noexcept
{
    return detail::parse_integer(text, out, radix) == detail::parse_status::ok;
}

// Like parse, but throws std::invalid_argument or std::out_of_range.
template <typename T>
inline T from_string(const std::string & text, int radix = 10)
{
    T value;
    switch (detail::parse_integer(text, value, radix))
    {
        case detail::parse_status::ok:
            break;
        case detail::parse_status::out_of_range:
            throw std::out_of_range("value out of range: " + text);
        case detail::parse_status::invalid:
            throw std::invalid_argument("invalid integer: " + text);
    }
    return value;
}

template <typename Signed>
inline std::ostream & operator<<(std::ostream & out, const integer128<Signed> & value)
{
    const std::ios_base::fmtflags flags = out.flags();
    const std::ios_base::fmtflags base = flags & std::ios_base::basefield;
    const int radix = base == std::ios_base::hex ? 16 : base == std::ios_base::oct ? 8 : 10;
    const bool uppercase = (flags & std::ios_base::uppercase) != 0;
    std::string text = to_string(value, radix, uppercase);
    if ((flags & std::ios_base::showbase) && radix != 10 && !value.is_zero())
    {
        const std::string::size_type pos = value.is_negative() ? 1 : 0;
        text.insert(pos, radix == 8 ? "0" : (uppercase ? "0X" : "0x"));
    }
    return out << text;
}

// Reads one whitespace-delimited token in the stream's base; sets failbit
// when it is not a valid value.
template <typename Signed>
inline std::istream & operator>>(std::istream & in, integer128<Signed> & value)
{
    std::string token;
    if (!(in >> token))
        return in;
    const std::ios_base::fmtflags base = in.flags() & std::ios_base::basefield;
    const int radix = base == std::ios_base::hex ? 16 : base == std::ios_base::oct ? 8 : 10;
    if (!parse(token, value, radix))
        in.setstate(std::ios_base::failbit);
    return in;
}

} // namespace dlimb

#ifdef DLIMB_ENABLE_FMT
namespace fmt
{
// Presentation types: d (default), x, X, o, b.
template <typename Signed>
struct formatter<dlimb::integer128<Signed>>
{
    int radix = 10;
    bool uppercase = false;

    template <typename ParseContext>
    constexpr auto parse(ParseContext & ctx) -> typename ParseContext::iterator
    {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}')
        {
            switch (*it)
            {
                case 'd':
                    radix = 10;
                    break;
                case 'x':
                    radix = 16;
                    break;
                case 'X':
                    radix = 16;
                    uppercase = true;
                    break;
                case 'o':
                    radix = 8;
                    break;
                case 'b':
                    radix = 2;
                    break;
                default:
                    throw format_error("invalid format specifier for 128-bit integer");
            }
            ++it;
        }
        if (it != ctx.end() && *it != '}')
            throw format_error("invalid format specifier for 128-bit integer");
        return it;
    }

    template <typename FormatContext>
    auto format(const dlimb::integer128<Signed> & value, FormatContext & ctx) const -> typename FormatContext::iterator
    {
        return fmt::format_to(ctx.out(), "{}", dlimb::to_string(value, radix, uppercase));
    }
};
} // namespace fmt
#endif

//=== Macro cleanup =============================================================

#undef DLIMB_CHECK
#undef DLIMB_OVERFLOW_CHECK
#undef DLIMB_DIVZERO_CHECK
#undef DLIMB_MODZERO_CHECK
