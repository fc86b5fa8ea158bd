#include "ray_tracer.hpp"
#include "newton.hpp"

#include <sleef.h>

#include <cmath>
#include <cstdio>

// exp(u + iv)
static Cplx polar_exp(Real u, Real v)
{
    const Real r = Sleef_exp_u10(u);
    const Sleef_double2 sc = Sleef_sincos_u10(v);
    return {r * sc.y, r * sc.x};
}

// -----------------------------------------------------------------------
// External rays
// -----------------------------------------------------------------------
ExternalRay::ExternalRay(const Family& family, RationalAngle angle, const PointGrid& grid)
    : family(family),
      pixel_width(grid.pixel_width()),
      newton_error(grid.res_x * 1e-8),
      target_angle(family.angle_map_large_param(angle))
{
    const Real d = std::abs(family.degree_real());
    deg               = family.degree();
    escape_radius_log = Sleef_log_u10(16.0) * d;
    factor            = Sleef_exp2_u10(-Sleef_log2_u10(d) / RAY_SHARPNESS);

    // Leading coefficient is assumed constant along the ray.
    const Cplx a = family.escape_coeff(family.param_map(Cplx(1.0)));
    target_shift = Cplx(Sleef_log_u10(std::abs(a)), Sleef_atan2_u10(a.imag(), a.real()))
                 / static_cast<Real>(RAY_SHARPNESS);

    // Seed far out along the angle, well past the escape locus.
    t_curr = 65.0 * angle.to_circle();
}

bool ExternalRay::next(Cplx& point)
{
    while (!done) {
        if (depth >= RAY_DEPTH) {
            done = true;
            break;
        }
        if (sharp == 0) {
            u = escape_radius_log;
            v = target_angle.to_real() * TAU;
        }

        const Period num_iters = depth * family.escaping_period() + family.escaping_phase();
        const Cplx   target    = polar_exp(u, v);
        const NewtonResult res = find_target_newton_err(
            [&](Cplx t) { return orbit_dual(family, t, num_iters); },
            t_curr, target, newton_error);

        u = u * factor - target_shift.real();
        v -= target_shift.imag();
        if (++sharp == RAY_SHARPNESS) {
            sharp = 0;
            ++depth;
            target_angle = target_angle * deg;
        }

        if (res.status == NewtonStatus::NanEncountered || is_nan(res.root)) {
            done = true;
            break;
        }
        if (res.status == NewtonStatus::FailedToConverge)
            continue;

        const Cplx prev = t_curr;
        t_curr = res.root;
        point  = t_curr;
        if (has_prev && std::abs(t_curr - prev) < pixel_width)
            done = true;
        has_prev = true;
        return true;
    }
    return false;
}

std::optional<ExternalRay> trace_external_ray(const Family& family, RationalAngle angle,
                                              const PointGrid& grid)
{
    if (!angle.is_valid() || std::isnan(family.degree_real()) || family.degree() == 0)
        return std::nullopt;
    return ExternalRay(family, angle, grid);
}

void trim_ray(std::vector<Cplx>& ray)
{
    if (ray.size() < 3) return;

    Real prev = l1_norm(ray[1] - ray[0]);
    for (size_t i = 2; i < ray.size(); ++i) {
        const Real dist = l1_norm(ray[i] - ray[i - 1]);
        if (!(dist < prev)) {
            ray.resize(i);
            return;
        }
        prev = dist;
    }
}

std::optional<std::vector<Cplx>> external_ray(const Family& family, RationalAngle angle,
                                              const PointGrid& grid)
{
    auto ray = trace_external_ray(family, angle, grid);
    if (!ray) return std::nullopt;

    std::vector<Cplx> points;
    Cplx t;
    while (ray->next(t))
        points.push_back(t);

    trim_ray(points);
    return points;
}

// -----------------------------------------------------------------------
// Equipotentials
//
// Run t0 until it escapes at step n, then rotate the escaped value in
// small angular steps and solve f^n(t) = target from the previous point.
// f^n winds D^n times around the curve, so that many turns are needed.
// -----------------------------------------------------------------------
std::optional<std::vector<Cplx>> equipotential(const Family& family, Cplx t0)
{
    const Real d = family.degree_real();
    if (!std::isfinite(d) || d <= 1.0) return std::nullopt;

    const Cplx c = family.param_map(t0);
    Cplx z = family.start_point(t0, c);

    IterCount iters = 0;
    while (std::norm(z) <= EQUIPOTENTIAL_ESCAPE_RADIUS) {
        if (iters >= EQUIPOTENTIAL_MAX_ITER || is_nan(z)) return std::nullopt;
        z = family.map(z, c);
        ++iters;
    }
    if (is_nan(z)) return std::nullopt;

    // D^n turns of EQUIPOTENTIAL_STEP each, bounded before anything is allocated
    Real samples = 1.0 / EQUIPOTENTIAL_STEP;
    for (IterCount i = 0; i < iters; ++i) {
        samples *= d;
        if (!(samples <= static_cast<Real>(EQUIPOTENTIAL_MAX_POINTS))) {
            fprintf(stderr, "[equipotential] %s: %u iterations at degree %g exceed %zu points\n",
                    family.name(), iters, d, EQUIPOTENTIAL_MAX_POINTS);
            return std::nullopt;
        }
    }
    const size_t num_points = static_cast<size_t>(samples);
    const Cplx rotate = polar_exp(0.0, TAU * EQUIPOTENTIAL_STEP);

    std::vector<Cplx> curve;
    curve.reserve(num_points + 1);
    curve.push_back(t0);

    Cplx target = z;
    Cplx t      = t0;
    for (size_t i = 0; i < num_points; ++i) {
        target *= rotate;
        const NewtonResult res = find_target_newton_relative(
            [&](Cplx s) { return orbit_dual(family, s, iters); }, t, target);
        if (res.ok()) t = res.root;
        curve.push_back(t);
    }
    return curve;
}
