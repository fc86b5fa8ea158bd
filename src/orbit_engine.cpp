#include "orbit_engine.hpp"
#include "escape_classifier.hpp"
#include "newton.hpp"

#include <cmath>

OrbitParams orbit_params_for(const DynamicalFamily& family)
{
    OrbitParams p;
    p.max_iter              = family.max_iter();
    p.min_iter              = family.min_iter();
    p.periodicity_tolerance = family.periodicity_tolerance();
    p.escape_radius         = family.escape_radius();
    return p;
}

OrbitEngine::OrbitEngine(const DynamicalFamily& family, const OrbitParams& params)
    : family_(family),
      params_(params),
      radius_sqr_(params.escape_radius * params.escape_radius),
      return_tolerance_(std::pow(params.periodicity_tolerance, 0.75))
{
}

void OrbitEngine::reset(Cplx point)
{
    const Param c = family_.param_map(point);
    reset(family_.start_point(point, c), c);
}

void OrbitEngine::reset(Var z0, const Param& c)
{
    param_   = c;
    z_init_  = z0;
    slow_    = Dual::variable(z0);
    fast_    = Dual::variable(z0);
    rounds_  = 0;
    steps_   = 0;
    started_ = false;
    state_.reset();
}

bool OrbitEngine::escaped(const Var& z) const
{
    return is_nan(z) || std::norm(z) > radius_sqr_;
}

// -----------------------------------------------------------------------
// Stepping
//
// Odd steps open a round: the slow orbit moves once, the fast orbit once,
// and only escape is checked. Even steps close it: the fast orbit moves
// again and, past min_iter rounds, the two orbits are compared.
// -----------------------------------------------------------------------
bool OrbitEngine::step()
{
    if (state_) return false;

    if (!started_) {
        started_ = true;
        if (auto early = family_.early_bailout(z_init_, param_)) {
            state_ = *early;
            return false;
        }
        if (escaped(fast_.value)) {
            state_ = EscapeResult::escaped(0, fast_.value);
            return false;
        }
    }

    const bool opens_round = (steps_ % 2 == 0);
    if (opens_round) {
        if (rounds_ >= params_.max_iter) {
            state_ = EscapeResult::bounded(fast_.value);
            return false;
        }
        ++rounds_;
        slow_ = advance(family_, slow_, param_);
    }

    fast_ = advance(family_, fast_, param_);
    ++steps_;

    if (escaped(fast_.value)) {
        state_ = EscapeResult::escaped(steps_, fast_.value);
        return false;
    }

    if (!opens_round)
        check_periodicity();

    return !state_;
}

EscapeResult OrbitEngine::run_until_complete()
{
    while (step()) {}
    return *state_;
}

// -----------------------------------------------------------------------
// Cycle detection
// -----------------------------------------------------------------------
void OrbitEngine::check_periodicity()
{
    // Rescale so |slow'| == 1. fast'/slow' is then the derivative of f^r
    // from the slow point to the fast point, and stays representable.
    const Real s = std::abs(slow_.deriv);
    if (s > 0.0 && std::isfinite(s)) {
        slow_.deriv /= s;
        fast_.deriv /= s;
    }

    const Real tol = params_.periodicity_tolerance;
    if (!(tol > 0.0) || rounds_ < params_.min_iter) return;

    // Distance to the cycle is roughly |fast - slow| / |1 - lambda|; only
    // weakly attracting cycles widen the error.
    Real error = dist_sqr(fast_.value, slow_.value);
    const Cplx lambda = fast_.deriv / slow_.deriv;
    if (is_finite(lambda)) {
        const Real gap = std::norm(1.0 - lambda);
        if (gap > 0.0 && gap < 1.0) error /= gap;
    }
    if (!(error < tol)) return;

    Period period     = 0;
    Cplx   multiplier = 0.0;
    if (!find_cycle(rounds_, period, multiplier)) return;

    PointInfoPeriodic info;
    info.period      = period;
    info.preperiod   = find_preperiod(period);
    info.multiplier  = polish_multiplier(period, multiplier);
    info.final_error = error;
    state_ = EscapeResult::periodic_cycle(info, fast_.value);
}

// Smallest p <= patience with f^p(fast) back within tolerance of fast,
// together with the chained derivative along that loop.
bool OrbitEngine::find_cycle(Period patience, Period& period, Cplx& multiplier) const
{
    Dual w = Dual::variable(fast_.value);
    for (Period i = 1; i <= patience; ++i) {
        w = advance(family_, w, param_);
        if (dist_sqr(w.value, fast_.value) <= return_tolerance_) {
            period     = i;
            multiplier = w.deriv;
            return true;
        }
    }
    return false;
}

// Refine the periodic point with Newton on f^p(z) - z and take the
// multiplier there. Falls back to the raw loop product when Newton fails
// or wanders off (near-parabolic cycles).
Cplx OrbitEngine::polish_multiplier(Period period, Cplx fallback) const
{
    auto cycle_residual = [&](Cplx z) {
        Dual w = Dual::variable(z);
        for (Period i = 0; i < period; ++i)
            w = advance(family_, w, param_);
        return w - Dual::variable(z);
    };

    const NewtonResult res = find_root_newton(cycle_residual, fast_.value);
    if (!res.ok() || dist_sqr(res.root, fast_.value) > return_tolerance_)
        return fallback;

    const Dual at_root = cycle_residual(res.root);
    if (!at_root.is_finite()) return fallback;
    return at_root.deriv + 1.0;
}

// Smallest mu with f^mu(z0) within tolerance of f^(mu + period)(z0).
Period OrbitEngine::find_preperiod(Period period) const
{
    Var a = z_init_;
    Var b = z_init_;
    for (Period i = 0; i < period; ++i)
        b = family_.map(b, param_);

    for (Period mu = 0; mu < rounds_; ++mu) {
        if (dist_sqr(a, b) < return_tolerance_) return mu;
        a = family_.map(a, param_);
        b = family_.map(b, param_);
    }
    return rounds_;
}

// -----------------------------------------------------------------------
// Single-point orbit trace
// -----------------------------------------------------------------------
OrbitTrace trace_orbit(const Family& family, Cplx point, const OrbitParams& params)
{
    OrbitEngine engine(family, params);
    engine.reset(point);

    OrbitTrace trace;
    trace.param = engine.param();
    trace.start = engine.start();
    trace.orbit.push_back(engine.value());

    bool running = true;
    while (running) {
        running = engine.step();
        if (engine.steps() >= trace.orbit.size())
            trace.orbit.push_back(engine.value());
    }

    trace.result = encode_escape_result(family, params, engine.result(), engine.param());
    return trace;
}
