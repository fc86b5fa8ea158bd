#include "rational_angle.hpp"

#include <sleef.h>

#include <numeric>

RationalAngle::RationalAngle(int64_t numer, int64_t denom)
    : num(numer), den(denom)
{
    if (den == 0) {
        num = 0;
        return;
    }
    normalize();
}

void RationalAngle::normalize()
{
    if (den < 0) {
        den = -den;
        num = -num;
    }
    num %= den;
    if (num < 0) num += den;
    const int64_t g = std::gcd(num, den);
    if (g > 1) {
        num /= g;
        den /= g;
    }
}

Cplx RationalAngle::to_circle() const
{
    const Sleef_double2 sc = Sleef_sincos_u10(TAU * to_real());
    return {sc.y, sc.x};
}

RationalAngle RationalAngle::operator+(const RationalAngle& rhs) const
{
    if (!is_valid() || !rhs.is_valid()) return RationalAngle(0, 0);
    const int64_t l = den / std::gcd(den, rhs.den) * rhs.den;
    return RationalAngle(num * (l / den) + rhs.num * (l / rhs.den), l);
}

RationalAngle RationalAngle::operator-(const RationalAngle& rhs) const
{
    return *this + RationalAngle(-rhs.num, rhs.den);
}

// Multiplying by k first reduces k mod den, so the product never overflows
// for denominators that fit in 32 bits.
RationalAngle RationalAngle::operator*(int64_t k) const
{
    if (!is_valid()) return *this;
    int64_t m = k % den;
    if (m < 0) m += den;
    return RationalAngle(num * m, den);
}
