/*
 * ORBIT ENGINE TEST
 *
 * Escape counting, cycle detection (period, preperiod, multiplier),
 * min_iter gating, the disabled-periodicity path, early bailout and
 * engine reuse.
 *
 * Usage: ./test_orbit_engine
 */

#include "test_util.hpp"

#include "families.hpp"
#include "orbit_engine.hpp"

#include <cmath>

// f(z) = max(Re z - 1, 0). From z0 = 2 the orbit is 2, 1, 0, 0, ...
class ShiftDown : public DynamicalFamily {
public:
    const char* name() const override { return "ShiftDown"; }

    Var map(Var z, const Param&) const override
    {
        return z.real() > 1.0 ? Cplx(z.real() - 1.0, 0.0) : Cplx(0.0);
    }

    Dual map_and_multiplier(Var z, const Param& c) const override
    {
        return {map(z, c), z.real() > 1.0 ? Cplx(1.0) : Cplx(0.0)};
    }

    Var    start_point(Cplx point, const Param&) const override { return point; }
    Param  param_map(Cplx) const override { return 0.0; }
    Bounds default_bounds() const override { return Bounds::centered_square(2.0); }
};

static OrbitParams make_params(IterCount max_iter, IterCount min_iter, Real tol, Real radius)
{
    OrbitParams p;
    p.max_iter              = max_iter;
    p.min_iter              = min_iter;
    p.periodicity_tolerance = tol;
    p.escape_radius         = radius;
    return p;
}

// c = 1: 0, 1, 2, 5, 26, 677, ...
static void test_escape_counts()
{
    printf("\nTest: Escape iteration counts\n");
    Multibrot quadratic(2);

    OrbitEngine end_of_round(quadratic, make_params(100, 0, 1e-14, 10.0));
    end_of_round.reset(Cplx(0.0), Cplx(1.0));
    EscapeResult r = end_of_round.run_until_complete();
    check(r.kind == EscapeKind::Escaped, "c=1, R=10 escapes");
    check(r.iters == 4, "c=1, R=10 escapes after 4 map applications");
    check(r.final_value == Cplx(26.0), "final value is the first iterate past R");

    OrbitEngine midpoint(quadratic, make_params(100, 0, 1e-14, 4.0));
    midpoint.reset(Cplx(0.0), Cplx(1.0));
    r = midpoint.run_until_complete();
    check(r.kind == EscapeKind::Escaped && r.iters == 3, "c=1, R=4 escapes at the round midpoint");
    check(midpoint.rounds() == 2, "midpoint escape happens in round 2");

    OrbitEngine outside(quadratic, make_params(100, 0, 1e-14, 2.0));
    outside.reset(Cplx(3.0), Cplx(0.0));
    r = outside.run_until_complete();
    check(r.kind == EscapeKind::Escaped && r.iters == 0, "start point beyond R reports 0 iterations");

    OrbitEngine nan_start(quadratic, make_params(100, 0, 1e-14, 2.0));
    nan_start.reset(Cplx(std::nan(""), 0.0), Cplx(0.0));
    r = nan_start.run_until_complete();
    check(r.kind == EscapeKind::Escaped && r.iters == 0, "NaN start point counts as escaped");
}

static void test_attracting_fixed_point()
{
    printf("\nTest: Attracting fixed point\n");
    Multibrot quadratic(2);

    const Real tol     = 1e-10;
    const Cplx c       = 0.2;
    const Cplx z_star  = 0.5 * (1.0 - std::sqrt(Cplx(1.0) - 4.0 * c));
    const Cplx lambda  = 2.0 * z_star;

    OrbitEngine engine(quadratic, make_params(1000, 0, tol, 1e6));
    engine.reset(z_star + 0.01, c);
    const EscapeResult r = engine.run_until_complete();

    check(r.kind == EscapeKind::Periodic, "orbit near z* is periodic");
    check(r.periodic.period == 1, "period is 1");
    check_near(r.periodic.multiplier, lambda, tol, "multiplier matches 2 z*");
    check(r.periodic.final_error < tol, "final error below tolerance");
    check_near(r.final_value, z_star, 1e-4, "final value lies on the fixed point");
}

static void test_period_two_superattracting()
{
    printf("\nTest: c = -1, z0 = 0\n");
    Multibrot quadratic(2);

    OrbitEngine engine(quadratic, make_params(50, 0, 1e-10, 1e6));
    engine.reset(Cplx(0.0), Cplx(-1.0));
    const EscapeResult r = engine.run_until_complete();

    check(r.kind == EscapeKind::Periodic, "periodic");
    check(r.periodic.preperiod == 0, "preperiod 0");
    check(r.periodic.period == 2, "period 2");
    check_near(r.periodic.multiplier, Cplx(0.0), 1e-12, "multiplier 0");
    check_near(r.periodic.final_error, 0.0, 1e-20, "final error 0");
}

static void test_min_iter_gate()
{
    printf("\nTest: min_iter gating\n");
    ShiftDown shift;

    OrbitEngine early(shift, make_params(100, 0, 1e-10, 1e6));
    early.reset(Cplx(2.0), Cplx(0.0));
    EscapeResult r = early.run_until_complete();
    check(r.kind == EscapeKind::Periodic, "synthetic map is periodic");
    check(early.rounds() == 2, "without min_iter, detected in round 2");
    check(r.periodic.period == 1, "fixed point at 0 has period 1");
    check(r.periodic.preperiod == 2, "orbit reaches 0 after 2 steps");

    OrbitEngine gated(shift, make_params(100, 5, 1e-10, 1e6));
    gated.reset(Cplx(2.0), Cplx(0.0));
    bool reported_early = false;
    bool running        = true;
    while (running) {
        running = gated.step();
        if (gated.finished() && gated.rounds() < 5) reported_early = true;
    }
    check(!reported_early, "nothing reported before round 5");
    check(gated.result().kind == EscapeKind::Periodic, "periodic once min_iter is reached");
    check(gated.rounds() == 5, "detected exactly in round 5");
}

static void test_periodicity_disabled()
{
    printf("\nTest: Zero tolerance disables cycle detection\n");
    Multibrot quadratic(2);

    OrbitEngine engine(quadratic, make_params(50, 0, 0.0, 1e6));
    engine.reset(Cplx(0.0), Cplx(-1.0));
    const EscapeResult r = engine.run_until_complete();
    check(r.kind == EscapeKind::Bounded, "bounded instead of periodic");
    check(engine.rounds() == 50, "ran the full max_iter rounds");
    check(engine.steps() == 100, "fast orbit advanced twice per round");
}

static void test_early_bailout()
{
    printf("\nTest: Early bailout\n");
    Mandelbrot mandel;
    OrbitEngine engine(mandel, orbit_params_for(mandel));

    engine.reset(Cplx(0.0));
    EscapeResult r = engine.run_until_complete();
    check(r.kind == EscapeKind::KnownPotential, "c=0 is in the main cardioid");
    check(r.known.period == 1, "cardioid period 1");
    check(engine.steps() == 0, "no iteration performed");

    engine.reset(Cplx(-1.0));
    r = engine.run_until_complete();
    check(r.kind == EscapeKind::KnownPotential, "c=-1 is in the period-2 disk");
    check(r.known.period == 2, "disk period 2");
    check_near(r.known.multiplier, Cplx(0.0), 1e-15, "disk multiplier 4c + 4");

    engine.reset(Cplx(1.0));
    r = engine.run_until_complete();
    check(r.kind == EscapeKind::Escaped, "c=1 escapes");
}

static void test_engine_reuse()
{
    printf("\nTest: Engine reuse\n");
    Multibrot quadratic(2);
    const OrbitParams params = make_params(200, 0, 1e-12, 1e6);

    OrbitEngine reused(quadratic, params);
    reused.reset(Cplx(0.0), Cplx(1.0));
    reused.run_until_complete();
    reused.reset(Cplx(0.0), Cplx(-0.1, 0.65));
    const EscapeResult a = reused.run_until_complete();

    OrbitEngine fresh(quadratic, params);
    fresh.reset(Cplx(0.0), Cplx(-0.1, 0.65));
    const EscapeResult b = fresh.run_until_complete();

    check(a.kind == b.kind, "same kind after reset");
    check(a.final_value == b.final_value, "same final value after reset");
    check(a.periodic.period == b.periodic.period
          && a.periodic.multiplier == b.periodic.multiplier, "same cycle data after reset");
    check(!reused.step(), "step() after completion is a no-op");
}

static void test_trace_orbit()
{
    printf("\nTest: Orbit trace\n");
    Multibrot quadratic(2);

    const OrbitTrace trace = trace_orbit(quadratic, Cplx(1.0), make_params(100, 0, 1e-14, 10.0));
    check(trace.param == Cplx(1.0), "parameter is the traced point");
    check(trace.start == Cplx(0.0), "start point is the critical point");
    check(trace.orbit.size() == 5, "trace holds z0 and 4 iterates");
    check(trace.orbit.size() == 5 && trace.orbit[3] == Cplx(5.0) && trace.orbit[4] == Cplx(26.0),
          "trace follows 0, 1, 2, 5, 26");
    check(trace.result.kind == PointKind::Escaping, "trace is classified as escaping");
}

int main()
{
    print_header("ORBIT ENGINE TEST SUITE");

    test_escape_counts();
    test_attracting_fixed_point();
    test_period_two_superattracting();
    test_min_iter_gate();
    test_periodicity_disabled();
    test_early_bailout();
    test_engine_reuse();
    test_trace_orbit();

    return finish();
}
