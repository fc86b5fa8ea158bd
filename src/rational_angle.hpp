#pragma once

#include "types.hpp"

#include <cstdint>

// Rational number of turns, kept reduced and in [0, 1). A zero denominator
// gives an invalid angle: is_valid() is false, to_real() is NaN, and
// arithmetic on it stays invalid.
class RationalAngle {
public:
    RationalAngle() = default;
    RationalAngle(int64_t numer, int64_t denom);

    int64_t numer() const { return num; }
    int64_t denom() const { return den; }

    bool is_valid() const { return den != 0; }

    Real to_real() const
    {
        return is_valid() ? static_cast<Real>(num) / static_cast<Real>(den) : std::nan("");
    }

    // exp(2 pi i * angle)
    Cplx to_circle() const;

    RationalAngle operator+(const RationalAngle& rhs) const;
    RationalAngle operator-(const RationalAngle& rhs) const;
    RationalAngle operator*(int64_t k) const;

    bool operator==(const RationalAngle& rhs) const { return num == rhs.num && den == rhs.den; }
    bool operator!=(const RationalAngle& rhs) const { return !(*this == rhs); }

private:
    void normalize();

    int64_t num = 0;
    int64_t den = 1;
};
