#include "point_locator.hpp"
#include "arithmetic.hpp"
#include "newton.hpp"

#include <vector>

const char* find_point_error_message(FindPointError err)
{
    switch (err) {
        case FindPointError::None:                   return "";
        case FindPointError::PeriodIsZero:           return "Period must be nonzero";
        case FindPointError::NewtonFailedToConverge: return "Newton's method did not converge";
        case FindPointError::NewtonNanEncountered:   return "Newton's method encountered NaN";
    }
    return "Unknown error";
}

Dual schema_residual(const DynamicalFamily& family, const OrbitSchema& schema, Cplx t)
{
    const Period k = schema.preperiod;
    const Period n = schema.period;

    // orbit[i] = f^i(z0(t)) with derivative in t
    const Dual c = family.param_map_d(t);
    std::vector<Dual> orbit;
    orbit.reserve(k + n + 1);
    orbit.push_back(start_dual(family, t, c));
    for (Period i = 0; i < k + n; ++i)
        orbit.push_back(advance(family, orbit.back(), c));

    // Moebius inversion strips the roots of f^{k+m} = f^k for proper
    // divisors m of n.
    Dual result = Dual::constant(1.0);
    for (Period m : divisors(n)) {
        const int mu = moebius(n / m);
        if (mu == 0) continue;
        const Dual diff = orbit[k + m] - orbit[k];
        if (mu > 0) result *= diff;
        else        result /= diff;
    }

    // Points with preperiod < k also satisfy f^{k+n} = f^k.
    if (k > 0)
        result /= (orbit[k + n - 1] - orbit[k - 1]);

    return result;
}

FindPointResult find_nearby_preperiodic_point(const DynamicalFamily& family,
                                              Cplx start, const OrbitSchema& schema)
{
    FindPointResult out;
    if (schema.period == 0) {
        out.error = FindPointError::PeriodIsZero;
        out.point = start;
        return out;
    }

    const NewtonResult res = find_root_newton(
        [&](Cplx t) { return schema_residual(family, schema, t); }, start);

    out.point = res.root;
    switch (res.status) {
        case NewtonStatus::Converged:        out.error = FindPointError::None; break;
        case NewtonStatus::FailedToConverge: out.error = FindPointError::NewtonFailedToConverge; break;
        case NewtonStatus::NanEncountered:   out.error = FindPointError::NewtonNanEncountered; break;
    }
    return out;
}
