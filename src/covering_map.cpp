#include "covering_map.hpp"

#include <cstdio>
#include <utility>

static Dual identity_cover(Cplx t)
{
    return Dual::variable(t);
}

CoveringMap::CoveringMap(std::shared_ptr<const Family> base, CoverFn cover, const Bounds& bounds)
    : base(std::move(base)), cover(cover), bounds(bounds)
{
    max_iter_ = this->base->max_iter();
}

CoveringMap::CoveringMap(std::shared_ptr<const Family> base)
    : CoveringMap(base, identity_cover, base->default_bounds())
{
}

// -----------------------------------------------------------------------
// Mandelbrot curves
// -----------------------------------------------------------------------

// Fixed point z = 1/2 + t marked: c = 1/4 - t^2
static Dual mandelbrot_cycle_1(Cplx t)
{
    return {0.25 - t * t, -2.0 * t};
}

static Dual mandelbrot_cycle_3(Cplx t)
{
    return {-0.25 * (t * t + 7.0), -0.5 * t};
}

static Dual mandelbrot_cycle_4(Cplx t)
{
    const Cplx t2 = t * t;
    return {-0.25 * t2 - 0.75 - 1.0 / t, -0.5 * t + 1.0 / t2};
}

static Dual mandelbrot_dynatomic_2(Cplx t)
{
    const Cplx u = 9.0 / (t * t);
    return {(t - 1.0) * u - 3.0, (2.0 - t) * u / t};
}

static Dual mandelbrot_dynatomic_3(Cplx t)
{
    const Cplx t2 = t * t;

    const Cplx v     = t2 * (t2 - 3.0 * t + 6.0) - 2.0 * t + 2.0;
    const Cplx dv_dt = ((4.0 * t - 9.0) * t + 12.0) * t - 2.0;

    const Cplx w     = 1.0 / (t2 - t);
    const Cplx dw_dt = (1.0 - 2.0 * t) * w * w;

    const Cplx u     = v + w;
    const Cplx du_dt = dv_dt + dw_dt;
    return {-0.25 * u * w, -0.25 * (du_dt * w + u * dw_dt)};
}

// Marks a point of preperiod 2 and period 1
static Dual mandelbrot_misiurewicz_2_1(Cplx t)
{
    const Cplx t2 = t * t;
    const Cplx u  = 1.0 / (t2 - 1.0);
    const Cplx u2 = u * u;
    return {-2.0 * (t2 + 1.0) * u2, 4.0 * t * (t2 + 3.0) * u2 * u};
}

static std::unique_ptr<CoveringMap> fallback_cover(std::shared_ptr<const Mandelbrot> base,
                                                   const char* curve)
{
    fprintf(stderr, "[covering] %s curve not implemented, using base plane\n", curve);
    return std::make_unique<CoveringMap>(std::move(base));
}

std::unique_ptr<CoveringMap> marked_cycle_curve(std::shared_ptr<const Mandelbrot> base, Period period)
{
    switch (period) {
        case 1: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_cycle_1,
                                                     Bounds{-1.8, 1.8, -1.0, 1.0});
        case 3: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_cycle_3,
                                                     Bounds{-2.1, 2.1, -3.5, 3.5});
        case 4: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_cycle_4,
                                                     Bounds{-2.9, 2.1, -3.1, 3.1});
        default: return fallback_cover(std::move(base), "Marked cycle");
    }
}

std::unique_ptr<CoveringMap> dynatomic_curve(std::shared_ptr<const Mandelbrot> base, Period period)
{
    switch (period) {
        case 1: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_cycle_1,
                                                     Bounds{-1.8, 1.8, -1.0, 1.0});
        case 2: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_dynatomic_2,
                                                     Bounds{0.5, 8.3, -2.7, 2.7});
        case 3: return std::make_unique<CoveringMap>(std::move(base), mandelbrot_dynatomic_3,
                                                     Bounds{-2.5, 3.5, -3.0, 3.0});
        default: return fallback_cover(std::move(base), "Dynatomic");
    }
}

std::unique_ptr<CoveringMap> misiurewicz_curve(std::shared_ptr<const Mandelbrot> base,
                                               Period preperiod, Period period)
{
    if (preperiod == 2 && period == 1)
        return std::make_unique<CoveringMap>(std::move(base), mandelbrot_misiurewicz_2_1,
                                             Bounds{-3.5, 3.5, -3.0, 3.0});
    return fallback_cover(std::move(base), "Misiurewicz");
}
