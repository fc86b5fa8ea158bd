#pragma once

#include "dual.hpp"
#include "family.hpp"
#include "point_info.hpp"
#include "types.hpp"

#include <optional>
#include <vector>

// Bounds for a single orbit. Iteration counts are detector rounds: each
// round applies the map once to the slow orbit and twice to the fast one.
struct OrbitParams {
    IterCount max_iter              = 1024;
    IterCount min_iter              = 0;
    Real      periodicity_tolerance = 1e-14;   // squared distance; 0 disables
    Real      escape_radius         = 1e6;     // bound on |z|
};

OrbitParams orbit_params_for(const DynamicalFamily& family);

// ---------------------------------------------------------------------------
// OrbitEngine: Floyd cycle detection with a numeric tolerance.
//
// One instance is reused across many pixels: reset() reseeds it without
// reallocating. Not thread-safe; give each worker its own.
// ---------------------------------------------------------------------------
class OrbitEngine {
public:
    using Var   = DynamicalFamily::Var;
    using Param = DynamicalFamily::Param;

    OrbitEngine(const DynamicalFamily& family, const OrbitParams& params);

    // Seed from an image coordinate.
    void reset(Cplx point);

    // Seed with an explicit start point and parameter.
    void reset(Var z0, const Param& c);

    // Advance the fast orbit by one map application. Returns false once a
    // terminal state has been reached.
    bool step();

    EscapeResult run_until_complete();

    bool                finished() const { return state_.has_value(); }
    const EscapeResult& result()   const { return *state_; }

    const Var&   value()  const { return fast_.value; }
    const Var&   start()  const { return z_init_; }
    const Param& param()  const { return param_; }
    IterCount    rounds() const { return rounds_; }
    IterCount    steps()  const { return steps_; }

    const OrbitParams& params() const { return params_; }

private:
    bool escaped(const Var& z) const;
    void check_periodicity();
    bool find_cycle(Period patience, Period& period, Cplx& multiplier) const;
    Cplx polish_multiplier(Period period, Cplx fallback) const;
    Period find_preperiod(Period period) const;

    const DynamicalFamily& family_;
    OrbitParams            params_;
    Real                   radius_sqr_;
    Real                   return_tolerance_;

    Param param_  = 0.0;
    Var   z_init_ = 0.0;
    Dual  slow_;
    Dual  fast_;

    IterCount rounds_  = 0;
    IterCount steps_   = 0;
    bool      started_ = false;

    std::optional<EscapeResult> state_;
};

// ---------------------------------------------------------------------------
// Single-point inspection
// ---------------------------------------------------------------------------
struct OrbitTrace {
    std::vector<Cplx> orbit;    // z0, f(z0), f^2(z0), ... up to termination
    Cplx              param  = 0.0;
    Cplx              start  = 0.0;
    PointInfo         result;
};

OrbitTrace trace_orbit(const Family& family, Cplx point, const OrbitParams& params);
