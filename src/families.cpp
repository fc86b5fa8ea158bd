#include "families.hpp"

#include <cmath>
#include <utility>

const char* family_name(FamilyType type)
{
    switch (type) {
        case FamilyType::Mandelbrot:  return "Mandelbrot";
        case FamilyType::Multibrot:   return "Multibrot";
        case FamilyType::CubicNewton: return "Cubic Newton";
    }
    return "Unknown";
}

std::unique_ptr<Family> make_family(FamilyType type, int degree)
{
    switch (type) {
        case FamilyType::Mandelbrot:  return std::make_unique<Mandelbrot>();
        case FamilyType::Multibrot:   return std::make_unique<Multibrot>(degree);
        case FamilyType::CubicNewton: return std::make_unique<CubicNewton>();
    }
    return std::make_unique<Mandelbrot>();
}

std::unique_ptr<Family> make_julia(std::shared_ptr<const Family> parent, Cplx selection)
{
    const Cplx c = parent->param_map(selection);
    return std::make_unique<JuliaSet>(std::move(parent), c);
}

// -----------------------------------------------------------------------
// Mandelbrot
// -----------------------------------------------------------------------

// Decay estimate for a known attracting cycle: roughly how many periods
// it takes the critical orbit to reach the tolerance.
static Real known_cycle_potential(Real period, Real init_dist, Real mult_norm2, Real tol)
{
    if (!(init_dist > 0.0) || !(mult_norm2 > 0.0)) return 0.0;
    const Real p = -2.0 * period * std::log(init_dist / tol) / std::log(mult_norm2);
    return std::isfinite(p) ? p : 0.0;
}

std::optional<EscapeResult> Mandelbrot::early_bailout(Var, const Param& c) const
{
    // Main cardioid
    const Cplx four_c   = 4.0 * c;
    const Real y2       = four_c.imag() * four_c.imag();
    const Real temp     = four_c.real() - 1.0;
    const Real mu_norm2 = temp * temp + y2;
    const Real a        = mu_norm2 * (mu_norm2 * 0.25 + temp);

    if (a < y2) {
        const Cplx multiplier  = 1.0 - std::sqrt(1.0 - four_c);
        const Cplx fixed_point = 0.5 * multiplier;

        PointInfoKnownPotential info;
        info.period     = 1;
        info.multiplier = multiplier;
        info.potential  = known_cycle_potential(1.0, dist_sqr(c, fixed_point),
                                                std::norm(multiplier), periodicity_tolerance());
        return EscapeResult::known_potential(info);
    }

    // Period-2 disk
    const Cplx mu2 = four_c + 4.0;
    const Real mult_norm2 = std::norm(mu2);
    if (mult_norm2 < 1.0) {
        const Cplx fixed_point = -0.5 - 0.5 * std::sqrt(-four_c - 3.0);

        PointInfoKnownPotential info;
        info.period     = 2;
        info.multiplier = mu2;
        info.potential  = known_cycle_potential(2.0, dist_sqr(c, fixed_point),
                                                mult_norm2, periodicity_tolerance());
        return EscapeResult::known_potential(info);
    }

    return std::nullopt;
}

// -----------------------------------------------------------------------
// Multibrot
// -----------------------------------------------------------------------
Multibrot::Var Multibrot::map(Var z, const Param& c) const
{
    Cplx p = z;
    for (int k = 1; k < d; ++k)
        p *= z;
    return p + c;
}

Dual Multibrot::map_and_multiplier(Var z, const Param& c) const
{
    Cplx p = 1.0;
    for (int k = 1; k < d; ++k)
        p *= z;
    return {p * z + c, static_cast<Real>(d) * p};
}

// -----------------------------------------------------------------------
// CubicNewton
//
// N(z)  = (2z^3 + c) / p'(z),        p'(z) = 3z^2 + c - 1
// N'(z) = 6z p(z) / p'(z)^2
// dN/dc = (3z^2 - 1 - 2z^3) / p'(z)^2
// -----------------------------------------------------------------------
CubicNewton::Var CubicNewton::map(Var z, const Param& c) const
{
    const Cplx z2 = z * z;
    return (2.0 * z2 * z + c) / (3.0 * z2 + c - 1.0);
}

Dual CubicNewton::map_and_multiplier(Var z, const Param& c) const
{
    const Gradient g = gradient(z, c);
    return {g.value, g.d_var};
}

Gradient CubicNewton::gradient(Var z, const Param& c) const
{
    const Cplx z2 = z * z;
    const Cplx z3 = z2 * z;
    const Cplx p  = z3 + (c - 1.0) * z - c;
    const Cplx dp = 3.0 * z2 + c - 1.0;
    const Cplx inv_dp2 = 1.0 / (dp * dp);
    return {(2.0 * z3 + c) / dp,
            6.0 * z * p * inv_dp2,
            (3.0 * z2 - 1.0 - 2.0 * z3) * inv_dp2};
}

std::vector<MarkedPoint> CubicNewton::marked_points(const Cplx& c) const
{
    const Cplx u = std::sqrt(1.0 - 4.0 * c);
    return {
        {Cplx(1.0),         0},
        {0.5 * (-1.0 + u),  1},
        {0.5 * (-1.0 - u),  2},
    };
}

// -----------------------------------------------------------------------
// JuliaSet
// -----------------------------------------------------------------------
JuliaSet::JuliaSet(std::shared_ptr<const Family> parent, Cplx c)
    : parent(std::move(parent)), c(c)
{
    max_iter_ = this->parent->max_iter();
}
