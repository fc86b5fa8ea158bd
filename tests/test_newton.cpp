/*
 * NEWTON CORE TEST
 *
 * Convergence, the two failure modes, relative-residual solving and the
 * forward-mode pair arithmetic the solvers consume.
 *
 * Usage: ./test_newton
 */

#include "test_util.hpp"

#include "dual.hpp"
#include "newton.hpp"

#include <cmath>
#include <cstring>

static void test_dual_arithmetic()
{
    printf("\nTest: Forward-mode pairs\n");
    const Dual x = Dual::variable(Cplx(1.5, 0.5));
    const Dual k = Dual::constant(Cplx(2.0));

    // d/dx (x^2 * 2 + x) = 4x + 1
    const Dual p = x * x * k + x;
    check_near(p.deriv, 4.0 * x.value + 1.0, 1e-14, "product and sum rules");

    // d/dx 1/x = -1/x^2
    const Dual r = x.inv();
    check_near(r.deriv, -1.0 / (x.value * x.value), 1e-14, "reciprocal rule");

    // d/dx (x / (x + 2)) = 2 / (x + 2)^2
    const Dual q = x / (x + k);
    check_near(q.deriv, 2.0 / ((x.value + 2.0) * (x.value + 2.0)), 1e-14, "quotient rule");

    check(!Dual(Cplx(std::nan(""), 0.0), 1.0).is_finite(), "NaN value is not finite");
}

static void test_convergence()
{
    printf("\nTest: Convergence\n");
    NewtonResult res = find_root_newton(
        [](Cplx z) { return Dual(z * z - 2.0, 2.0 * z); }, Cplx(1.0));
    check(res.ok(), "z^2 - 2 converges from 1");
    check_near(res.root, Cplx(std::sqrt(2.0)), 1e-12, "root is sqrt(2)");

    res = find_target_newton(
        [](Cplx z) { return Dual(z * z * z, 3.0 * z * z); }, Cplx(1.5, 0.1), Cplx(8.0));
    check(res.ok(), "z^3 = 8 converges from 1.5 + 0.1i");
    check_near(res.root, Cplx(2.0), 1e-12, "target solution is 2");

    res = find_target_newton_relative(
        [](Cplx z) { return Dual(z * z, 2.0 * z); }, Cplx(900.0), Cplx(1e6));
    check(res.ok(), "relative solve of z^2 = 1e6 converges");
    check_near(res.root, Cplx(1000.0), 1e-6, "relative solution is 1000");
}

static void test_failures()
{
    printf("\nTest: Failure modes\n");

    // On the real line Newton for x^2 + 1 never settles: every step has
    // length (x^2 + 1) / 2|x| >= 1.
    NewtonResult res = find_root_newton(
        [](Cplx z) { return Dual(z * z + 1.0, 2.0 * z); }, Cplx(0.5));
    check(res.status == NewtonStatus::FailedToConverge, "x^2 + 1 from 0.5 hits the iteration cap");
    check(is_finite(res.root), "last iterate is reported");

    res = find_root_newton(
        [](Cplx) { return Dual(Cplx(std::nan(""), 0.0), 1.0); }, Cplx(0.0));
    check(res.status == NewtonStatus::NanEncountered, "NaN value is reported as NanEncountered");

    res = find_root_newton(
        [](Cplx z) { return Dual(z * z + 1.0, 0.0); }, Cplx(0.5));
    check(res.status == NewtonStatus::NanEncountered, "zero derivative is reported as NanEncountered");

    check(std::strlen(newton_status_message(NewtonStatus::Converged)) == 0, "success has no message");
    check(std::strlen(newton_status_message(NewtonStatus::FailedToConverge)) > 0,
          "cap exhaustion has a message");
    check(std::strcmp(newton_status_message(NewtonStatus::FailedToConverge),
                      newton_status_message(NewtonStatus::NanEncountered)) != 0,
          "failure messages are distinguishable");
}

int main()
{
    print_header("NEWTON CORE TEST SUITE");

    test_dual_arithmetic();
    test_convergence();
    test_failures();

    return finish();
}
