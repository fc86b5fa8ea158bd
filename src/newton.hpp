#pragma once

#include "dual.hpp"
#include "types.hpp"

#include <utility>

static constexpr int  NEWTON_MAX_ITERS = 16;
// Step size (squared) below which iteration stops early
static constexpr Real NEWTON_MIN_ERR   = 1e-12;
// Step size (squared) beyond which a solution is rejected at the iteration cap
static constexpr Real NEWTON_MAX_ERR   = 1e-5;

enum class NewtonStatus {
    Converged        = 0,
    FailedToConverge = 1,   // iteration cap hit; root holds the last iterate
    NanEncountered   = 2,   // non-finite value, derivative or iterate
};

struct NewtonResult {
    NewtonStatus status = NewtonStatus::Converged;
    Cplx         root   = 0.0;
    Cplx         value  = 0.0;   // function value at the last evaluated point
    Cplx         deriv  = 0.0;

    bool ok() const { return status == NewtonStatus::Converged; }
};

// Returns empty string for Converged.
const char* newton_status_message(NewtonStatus status);

// Solve f(z) = target with Newton's method. `f_and_df` maps a guess to a
// Dual holding (f(z), f'(z)). Stops when a step is shorter than
// NEWTON_MIN_ERR; after NEWTON_MAX_ITERS steps the last iterate is accepted
// only if its step is shorter than `error`.
template<typename F>
NewtonResult find_target_newton_err(F&& f_and_df, Cplx start, Cplx target, Real error)
{
    NewtonResult res;
    Cplx z     = start;
    Cplx z_old = start;

    for (int i = 0; i < NEWTON_MAX_ITERS; ++i) {
        z_old = z;
        const Dual fz = f_and_df(z);
        res.value = fz.value;
        res.deriv = fz.deriv;
        if (!fz.is_finite()) {
            res.status = NewtonStatus::NanEncountered;
            res.root   = z;
            return res;
        }
        z -= (fz.value - target) / fz.deriv;

        if (!is_finite(z)) {
            res.status = NewtonStatus::NanEncountered;
            res.root   = z;
            return res;
        }
        if (dist_sqr(z, z_old) < NEWTON_MIN_ERR) {
            res.status = NewtonStatus::Converged;
            res.root   = z;
            return res;
        }
    }

    res.root   = z;
    res.status = (dist_sqr(z, z_old) < error) ? NewtonStatus::Converged
                                              : NewtonStatus::FailedToConverge;
    return res;
}

template<typename F>
NewtonResult find_target_newton(F&& f_and_df, Cplx start, Cplx target)
{
    return find_target_newton_err(std::forward<F>(f_and_df), start, target, NEWTON_MAX_ERR);
}

template<typename F>
NewtonResult find_root_newton(F&& f_and_df, Cplx start)
{
    return find_target_newton_err(std::forward<F>(f_and_df), start, Cplx(0.0), NEWTON_MAX_ERR);
}

// Same as find_target_newton, but convergence is judged on the relative
// residual |f(z)/target - 1|^2 instead of the step size. Used where the
// target has a large modulus.
template<typename F>
NewtonResult find_target_newton_relative(F&& f_and_df, Cplx start, Cplx target)
{
    NewtonResult res;
    Cplx z = start;

    for (int i = 0; i < NEWTON_MAX_ITERS; ++i) {
        const Dual fz = f_and_df(z);
        res.value = fz.value;
        res.deriv = fz.deriv;
        res.root  = z;
        if (!fz.is_finite()) {
            res.status = NewtonStatus::NanEncountered;
            return res;
        }
        if (dist_sqr(fz.value / target, 1.0) < NEWTON_MIN_ERR) {
            res.status = NewtonStatus::Converged;
            return res;
        }
        z += (target - fz.value) / fz.deriv;
        if (!is_finite(z)) {
            res.status = NewtonStatus::NanEncountered;
            res.root   = z;
            return res;
        }
    }

    const Dual fz = f_and_df(z);
    res.root  = z;
    res.value = fz.value;
    res.deriv = fz.deriv;
    if (!fz.is_finite())
        res.status = NewtonStatus::NanEncountered;
    else
        res.status = (dist_sqr(fz.value / target, 1.0) < NEWTON_MAX_ERR)
            ? NewtonStatus::Converged : NewtonStatus::FailedToConverge;
    return res;
}
