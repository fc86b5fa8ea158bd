#pragma once

#include "families.hpp"
#include "family.hpp"

#include <memory>

// ---------------------------------------------------------------------------
// CoveringMap: reparametrizes the parameter plane of a base family by a
// map t -> c(t). Only param_map and the bounds change; the dynamics,
// marked points and escape data are the base family's.
// ---------------------------------------------------------------------------
class CoveringMap : public Family {
public:
    // Returns (c(t), dc/dt).
    using CoverFn = Dual (*)(Cplx);

    CoveringMap(std::shared_ptr<const Family> base, CoverFn cover, const Bounds& bounds);

    // Identity cover over the base family's own bounds.
    explicit CoveringMap(std::shared_ptr<const Family> base);

    const Family& base_family() const { return *base; }

    const char* name() const override { return "Covering map"; }

    Param  param_map(Cplx t) const override { return cover(t).value; }
    Dual   param_map_d(Cplx t) const override { return cover(t); }
    Bounds default_bounds() const override { return bounds; }

    Var      map(Var z, const Param& c) const override { return base->map(z, c); }
    Dual     map_and_multiplier(Var z, const Param& c) const override { return base->map_and_multiplier(z, c); }
    Gradient gradient(Var z, const Param& c) const override { return base->gradient(z, c); }

    Var      start_point(Cplx point, const Param& c) const override { return base->start_point(point, c); }
    Gradient start_point_d(Cplx point, const Param& c) const override { return base->start_point_d(point, c); }

    std::optional<EscapeResult> early_bailout(Var z0, const Param& c) const override
    {
        return base->early_bailout(z0, c);
    }

    Real      escape_radius()         const override { return base->escape_radius(); }
    Real      periodicity_tolerance() const override { return base->periodicity_tolerance(); }
    IterCount min_iter()              const override { return base->min_iter(); }
    PlaneType plane_type()            const override { return base->plane_type(); }

    std::vector<MarkedPoint> marked_points(const Cplx& c) const override { return base->marked_points(c); }
    uint32_t num_marked_point_classes() const override { return base->num_marked_point_classes(); }
    Real     marked_point_tolerance()   const override { return base->marked_point_tolerance(); }

    Real          degree_real()     const override { return base->degree_real(); }
    Period        escaping_period() const override { return base->escaping_period(); }
    Period        escaping_phase()  const override { return base->escaping_phase(); }
    RationalAngle angle_map_large_param(RationalAngle a) const override { return base->angle_map_large_param(a); }
    Cplx          escape_coeff(const Cplx& c) const override { return base->escape_coeff(c); }

private:
    std::shared_ptr<const Family> base;
    CoverFn cover;
    Bounds  bounds;
};

// Algebraic curves over the Mandelbrot parameter plane. Unsupported
// periods fall back to the identity cover.
std::unique_ptr<CoveringMap> marked_cycle_curve(std::shared_ptr<const Mandelbrot> base, Period period);
std::unique_ptr<CoveringMap> dynatomic_curve(std::shared_ptr<const Mandelbrot> base, Period period);
std::unique_ptr<CoveringMap> misiurewicz_curve(std::shared_ptr<const Mandelbrot> base,
                                               Period preperiod, Period period);
