#pragma once

#include "types.hpp"

// A value carried together with its derivative along one direction.
// Every orbit computation that needs a derivative (cycle multipliers,
// the preperiodic point locator, ray and equipotential continuation)
// threads one of these through each map application.
struct Dual {
    Cplx value = 0.0;
    Cplx deriv = 0.0;

    Dual() = default;
    Dual(Cplx v, Cplx d) : value(v), deriv(d) {}

    static Dual constant(Cplx v) { return {v, 0.0}; }
    static Dual variable(Cplx v) { return {v, 1.0}; }

    Dual inv() const
    {
        const Cplx r = 1.0 / value;
        return {r, -deriv * r * r};
    }

    bool is_finite() const { return ::is_finite(value) && ::is_finite(deriv); }
};

inline Dual operator+(const Dual& a, const Dual& b) { return {a.value + b.value, a.deriv + b.deriv}; }
inline Dual operator-(const Dual& a, const Dual& b) { return {a.value - b.value, a.deriv - b.deriv}; }
inline Dual operator-(const Dual& a)                { return {-a.value, -a.deriv}; }

inline Dual operator*(const Dual& a, const Dual& b)
{
    return {a.value * b.value, a.value * b.deriv + a.deriv * b.value};
}

inline Dual operator/(const Dual& a, const Dual& b)
{
    return a * b.inv();
}

inline Dual operator*(Cplx s, const Dual& a) { return {s * a.value, s * a.deriv}; }
inline Dual operator*(const Dual& a, Cplx s) { return {s * a.value, s * a.deriv}; }

inline Dual& operator*=(Dual& a, const Dual& b) { a = a * b; return a; }
inline Dual& operator/=(Dual& a, const Dual& b) { a = a / b; return a; }

// Value of a map at a point together with both partial derivatives:
// d_var with respect to the dynamical variable, d_param with respect to the
// parameter (or, for start points, with respect to the image coordinate).
struct Gradient {
    Cplx value   = 0.0;
    Cplx d_var   = 0.0;
    Cplx d_param = 0.0;
};
