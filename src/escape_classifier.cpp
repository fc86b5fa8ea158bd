#include "escape_classifier.hpp"

#include <sleef.h>

#include <cmath>

// -----------------------------------------------------------------------
// Smooth potential
//
// Near infinity the first return map behaves like a*z^D, so
// log|z_{n+1}| + q ~= D * (log|z_n| + q) with q = log|a| / (D - 1).
// The fractional part is log_D of how many "levels" separate the final
// value from the escape radius.
// -----------------------------------------------------------------------
Real smooth_potential(const Family& family, Real escape_radius,
                      IterCount iters, Cplx final_value, Cplx c)
{
    const Real n = static_cast<Real>(iters);
    if (is_nan(final_value)) return n - 1.0;

    const Real d = family.degree_real();
    if (!std::isfinite(d) || d <= 1.0) return n;

    const Real a_abs = std::abs(family.escape_coeff(c));
    const Real q     = (a_abs > 0.0 && std::isfinite(a_abs))
        ? Sleef_log_u10(a_abs) / (d - 1.0) : 0.0;

    const Real u = Sleef_log_u10(escape_radius) + q;
    const Real v = Sleef_log_u10(std::abs(final_value)) + q;
    const Real ratio = u / v;
    if (!(ratio > 0.0) || !std::isfinite(ratio)) return n;

    const Real residual = Sleef_log_u10(ratio) / Sleef_log_u10(d);
    return n + static_cast<Real>(family.escaping_period()) * residual;
}

std::optional<MarkedPoint> find_marked_point(const Family& family, Cplx z, Cplx c)
{
    const Real tol = family.marked_point_tolerance();
    for (const MarkedPoint& mp : family.marked_points(c)) {
        if (dist_sqr(z, mp.point) < tol)
            return mp;
    }
    return std::nullopt;
}

PointInfo encode_escape_result(const Family& family, const OrbitParams& params,
                               const EscapeResult& result, Cplx c)
{
    switch (result.kind) {
        case EscapeKind::Escaped:
            return PointInfo::escaping(smooth_potential(family, params.escape_radius,
                                                        result.iters, result.final_value, c));
        case EscapeKind::Periodic:
            if (auto mp = find_marked_point(family, result.final_value, c))
                return PointInfo::marked_point(result.periodic, mp->class_id,
                                               family.num_marked_point_classes());
            return PointInfo::periodic_point(result.periodic);
        case EscapeKind::KnownPotential:
            return PointInfo::known_potential(result.known);
        case EscapeKind::Bounded:
        default:
            return PointInfo::bounded();
    }
}

PointInfo classify_point(const Family& family, Cplx point, const OrbitParams& params)
{
    OrbitEngine engine(family, params);
    engine.reset(point);
    const EscapeResult result = engine.run_until_complete();
    return encode_escape_result(family, params, result, engine.param());
}
