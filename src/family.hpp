#pragma once

#include "dual.hpp"
#include "point_grid.hpp"
#include "point_info.hpp"
#include "rational_angle.hpp"
#include "types.hpp"

#include <cmath>
#include <optional>
#include <vector>

enum class PlaneType {
    Parameter = 0,
    Dynamical = 1,
};

// ---------------------------------------------------------------------------
// DynamicalFamily: a family of maps z -> f(z, c) over an image plane.
//
// Every image coordinate t selects a parameter c = param_map(t) and a start
// point z0 = start_point(t, c). Parameter planes usually start at a critical
// point; dynamical planes fix c and start at t.
// ---------------------------------------------------------------------------
class DynamicalFamily {
public:
    using Var       = Cplx;
    using Param     = Cplx;
    using Deriv     = Cplx;
    using MetaParam = Cplx;

    virtual ~DynamicalFamily() = default;

    virtual const char* name() const = 0;

    virtual Var map(Var z, const Param& c) const = 0;

    // Map together with its derivative in z.
    virtual Dual map_and_multiplier(Var z, const Param& c) const = 0;

    // Map together with both partial derivatives. The default treats c as an
    // additive parameter.
    virtual Gradient gradient(Var z, const Param& c) const
    {
        const Dual fz = map_and_multiplier(z, c);
        return {fz.value, fz.deriv, Deriv(1.0)};
    }

    virtual Var start_point(Cplx point, const Param& c) const = 0;

    // Start point with its partial derivatives in the image coordinate
    // (d_var) and in the parameter (d_param).
    virtual Gradient start_point_d(Cplx point, const Param& c) const
    {
        return {start_point(point, c), Deriv(0.0), Deriv(0.0)};
    }

    virtual Param param_map(Cplx point) const = 0;

    // param_map with its derivative in the image coordinate.
    virtual Dual param_map_d(Cplx point) const
    {
        return {param_map(point), Deriv(1.0)};
    }

    // Classification for analytically known loci, skipping iteration.
    virtual std::optional<EscapeResult> early_bailout(Var /*z0*/, const Param& /*c*/) const
    {
        return std::nullopt;
    }

    // Bound on |z| beyond which an orbit has escaped.
    virtual Real escape_radius() const { return 1e6; }

    // Squared-distance threshold for cycle detection. 0 disables it.
    virtual Real periodicity_tolerance() const { return default_bounds().area() * 1e-14; }

    // Rounds of cycle detection to skip. Useful for families with many
    // parabolic maps, whose orbits linger near-periodic before escaping.
    virtual IterCount min_iter() const { return 0; }

    IterCount max_iter() const { return max_iter_; }
    void      set_max_iter(IterCount n) { max_iter_ = n; }

    virtual Bounds    default_bounds() const = 0;
    virtual PlaneType plane_type() const { return PlaneType::Parameter; }

    virtual MetaParam get_param() const { return MetaParam(0.0); }
    virtual void      set_param(const MetaParam& /*value*/) {}

protected:
    IterCount max_iter_ = 1024;
};

// ---------------------------------------------------------------------------
// MarkedPoints: attracting points with a discrete class, e.g. the roots a
// Newton map converges to.
// ---------------------------------------------------------------------------
struct MarkedPoint {
    Cplx    point;
    uint8_t class_id;
};

class MarkedPoints {
public:
    virtual ~MarkedPoints() = default;

    virtual std::vector<MarkedPoint> marked_points(const Cplx& /*c*/) const { return {}; }
    virtual uint32_t num_marked_point_classes() const { return 0; }

    // Squared distance below which an orbit has reached a marked point.
    virtual Real marked_point_tolerance() const = 0;
};

// ---------------------------------------------------------------------------
// InfinityFirstReturnMap: local behaviour of the first return map of
// infinity, used for smooth potentials and external rays.
// ---------------------------------------------------------------------------
class InfinityFirstReturnMap {
public:
    virtual ~InfinityFirstReturnMap() = default;

    // Local degree at infinity. NaN when infinity is not a periodic
    // superattracting point, in which case rays are unsupported.
    virtual Real degree_real() const { return 2.0; }

    // degree_real() rounded, or 0 if it is not an integer.
    int degree() const
    {
        const Real d = degree_real();
        if (!std::isfinite(d)) return 0;
        const Real r = std::round(d);
        return (std::abs(r - d) < 1e-9) ? static_cast<int>(r) : 0;
    }

    // Period of infinity under the map.
    virtual Period escaping_period() const { return 1; }

    // Map applications before a very large parameter yields a large value.
    virtual Period escaping_phase() const { return 1; }

    // Argument of the value after escaping_phase() steps for a very large
    // parameter of the given argument.
    virtual RationalAngle angle_map_large_param(RationalAngle angle) const { return angle; }

    // Leading coefficient of the first return map at infinity.
    virtual Cplx escape_coeff(const Cplx& /*c*/) const { return 1.0; }
};

// ---------------------------------------------------------------------------
// Family: the combined interface every concrete family implements.
// ---------------------------------------------------------------------------
class Family : public DynamicalFamily,
               public MarkedPoints,
               public InfinityFirstReturnMap {
public:
    Real marked_point_tolerance() const override { return periodicity_tolerance(); }
};

// ---------------------------------------------------------------------------
// Forward-mode helpers shared by the orbit engine, locator and tracer
// ---------------------------------------------------------------------------

// One map application with z and c both carrying derivatives.
inline Dual advance(const DynamicalFamily& family, const Dual& z, const Dual& c)
{
    const Gradient g = family.gradient(z.value, c.value);
    return {g.value, g.d_var * z.deriv + g.d_param * c.deriv};
}

// One map application with c held fixed.
inline Dual advance(const DynamicalFamily& family, const Dual& z, const Cplx& c)
{
    const Dual fz = family.map_and_multiplier(z.value, c);
    return {fz.value, fz.deriv * z.deriv};
}

// Start point as a function of the image coordinate:
// dz/dt = dz/dt|_c + dz/dc * dc/dt.
inline Dual start_dual(const DynamicalFamily& family, Cplx t, const Dual& c)
{
    const Gradient s = family.start_point_d(t, c.value);
    return {s.value, s.d_var + s.d_param * c.deriv};
}

// f^n(z0(t)) and its derivative in t.
inline Dual orbit_dual(const DynamicalFamily& family, Cplx t, Period n)
{
    const Dual c = family.param_map_d(t);
    Dual z = start_dual(family, t, c);
    for (Period i = 0; i < n; ++i)
        z = advance(family, z, c);
    return z;
}
