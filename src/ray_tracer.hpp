#pragma once

#include "family.hpp"
#include "point_grid.hpp"
#include "rational_angle.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

// Outer rounds; each adds escaping_period() map applications.
static constexpr Period RAY_DEPTH     = 200;
// Continuation steps per round.
static constexpr Period RAY_SHARPNESS = 25;

// Equipotentials: iteration cap, |z|^2 escape threshold, angular step (turns).
static constexpr IterCount EQUIPOTENTIAL_MAX_ITER      = 13;
static constexpr Real      EQUIPOTENTIAL_ESCAPE_RADIUS = 30.0;
static constexpr Real      EQUIPOTENTIAL_STEP          = 0.02;
// Largest curve equipotential() will sample; deeper base points yield nullopt.
static constexpr size_t    EQUIPOTENTIAL_MAX_POINTS    = size_t(1) << 19;

// ---------------------------------------------------------------------------
// ExternalRay: lazy continuation of the external ray at a rational angle.
//
// Each call to next() runs Newton until one more point converges. The
// sequence is finite and cannot be restarted.
// ---------------------------------------------------------------------------
class ExternalRay {
public:
    ExternalRay(const Family& family, RationalAngle angle, const PointGrid& grid);

    // Writes the next point and returns true, or returns false when the
    // ray is exhausted.
    bool next(Cplx& point);

    bool finished() const { return done; }

private:
    const Family& family;

    Real pixel_width;
    Real newton_error;
    Real escape_radius_log;
    Real factor;          // per-step shrink of the log-modulus
    Cplx target_shift;    // log(escape_coeff) / RAY_SHARPNESS
    int  deg;

    RationalAngle target_angle;
    Period depth = 0;
    Period sharp = 0;
    Real   u     = 0.0;   // log|target|
    Real   v     = 0.0;   // arg(target)

    Cplx t_curr   = 0.0;
    bool has_prev = false;
    bool done     = false;
};

// nullopt for an invalid angle or when the family has no integer local
// degree at infinity.
std::optional<ExternalRay> trace_external_ray(const Family& family, RationalAngle angle,
                                              const PointGrid& grid);

// Drains trace_external_ray and trims the tail.
std::optional<std::vector<Cplx>> external_ray(const Family& family, RationalAngle angle,
                                              const PointGrid& grid);

// Keep the longest prefix whose consecutive l1 distances strictly decrease.
void trim_ray(std::vector<Cplx>& ray);

// Level curve of the escape potential through t0, starting and ending
// near t0. nullopt if the degree at infinity is not finite and > 1, if t0
// does not escape within EQUIPOTENTIAL_MAX_ITER steps, or if the curve
// would need more than EQUIPOTENTIAL_MAX_POINTS samples.
std::optional<std::vector<Cplx>> equipotential(const Family& family, Cplx t0);
