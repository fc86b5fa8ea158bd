#pragma once

#include <cmath>
#include <complex>
#include <cstdint>

using Real      = double;
using Cplx      = std::complex<double>;
using Period    = uint32_t;
using IterCount = uint32_t;

static constexpr Real TAU = 6.283185307179586476925286766559;

inline bool is_nan(Cplx z)
{
    return std::isnan(z.real()) || std::isnan(z.imag());
}

inline bool is_finite(Cplx z)
{
    return std::isfinite(z.real()) && std::isfinite(z.imag());
}

// |a - b|^2
inline Real dist_sqr(Cplx a, Cplx b)
{
    return std::norm(a - b);
}

inline Real l1_norm(Cplx z)
{
    return std::abs(z.real()) + std::abs(z.imag());
}
