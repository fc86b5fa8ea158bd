/*
 * RAY / EQUIPOTENTIAL TRACER TEST
 *
 * Usage: ./test_ray_tracer
 */

#include "test_util.hpp"

#include "families.hpp"
#include "ray_tracer.hpp"

#include <cmath>
#include <memory>
#include <vector>

static bool distances_strictly_decrease(const std::vector<Cplx>& ray)
{
    for (size_t i = 2; i < ray.size(); ++i) {
        if (!(l1_norm(ray[i] - ray[i - 1]) < l1_norm(ray[i - 1] - ray[i - 2])))
            return false;
    }
    return true;
}

static void test_trim()
{
    printf("\nTest: Ray trimming\n");
    std::vector<Cplx> ray = {0.0, 10.0, 15.0, 17.0, 20.0, 21.0};
    trim_ray(ray);
    check(ray.size() == 4, "cut at the first non-decreasing step");
    check(distances_strictly_decrease(ray), "remaining steps strictly decrease");

    std::vector<Cplx> short_ray = {0.0, 1.0};
    trim_ray(short_ray);
    check(short_ray.size() == 2, "two points are left alone");
}

static void test_unsupported()
{
    printf("\nTest: Families without rays\n");
    CubicNewton newton;
    const PointGrid grid = PointGrid::with_res_y(newton.default_bounds(), 100);
    check(!trace_external_ray(newton, RationalAngle(1, 3), grid).has_value(), "no ray generator");
    check(!external_ray(newton, RationalAngle(1, 3), grid).has_value(), "no ray");
    check(!equipotential(newton, Cplx(3.0)).has_value(), "no equipotential");

    Mandelbrot mandel;
    check(!trace_external_ray(mandel, RationalAngle(1, 0), grid).has_value(),
          "invalid angle has no ray");
}

static void test_real_ray()
{
    printf("\nTest: Mandelbrot ray at angle 0\n");
    Mandelbrot mandel;
    const PointGrid grid = PointGrid::with_res_y(Bounds::centered_square(2.0), 400);

    const auto ray = external_ray(mandel, RationalAngle(0, 1), grid);
    check(ray.has_value(), "ray computed");
    if (!ray) return;
    const std::vector<Cplx>& t = *ray;

    check(t.size() >= 3, "ray has several points");
    check_near(t.front(), Cplx(256.0), 1e-9, "first point solves c = 256");

    bool real = true, right_of_cusp = true, decreasing = true;
    for (size_t i = 0; i < t.size(); ++i) {
        if (std::abs(t[i].imag()) > 1e-9) real = false;
        if (!(t[i].real() > 0.25)) right_of_cusp = false;
        if (i > 0 && !(t[i].real() < t[i - 1].real())) decreasing = false;
    }
    check(real, "ray stays on the real axis");
    check(right_of_cusp, "ray stays right of c = 1/4");
    check(decreasing, "ray moves toward the set");
    check(distances_strictly_decrease(t), "trimmed distances strictly decrease");
}

static void test_lazy_ray()
{
    printf("\nTest: Lazy ray generator\n");
    Mandelbrot mandel;
    const PointGrid grid = PointGrid::with_res_y(Bounds::centered_square(2.0), 200);

    auto gen = trace_external_ray(mandel, RationalAngle(1, 3), grid);
    check(gen.has_value(), "generator available");
    if (!gen) return;

    Cplx first, second;
    const bool got_two = gen->next(first) && gen->next(second);
    check(got_two, "generator yields points on demand");
    check_near(first, 256.0 * RationalAngle(1, 3).to_circle(), 1e-9,
               "first point lies on the target angle");

    const auto ray = external_ray(mandel, RationalAngle(1, 3), grid);
    check(ray && ray->size() >= 2 && (*ray)[0] == first && (*ray)[1] == second,
          "collected ray starts with the generated points");
    check(ray && distances_strictly_decrease(*ray), "1/3 ray distances strictly decrease");

    Cplx t;
    while (gen->next(t)) {}
    check(gen->finished(), "generator terminates");
    check(!gen->next(t), "exhausted generator stays exhausted");
}

static void test_equipotential()
{
    printf("\nTest: Equipotential through c = 2\n");
    Mandelbrot mandel;

    const auto curve = equipotential(mandel, Cplx(2.0));
    check(curve.has_value(), "c = 2 escapes within the cap");
    if (!curve) return;

    // f^2(0) = c^2 + c first exceeds the threshold: |f^2(0)| = 6 on the curve
    check(curve->size() == 201, "D^n / step + 1 points");
    check(curve->front() == Cplx(2.0), "curve starts at the base point");
    check_near(curve->back(), Cplx(2.0), 1e-4, "curve closes on the base point");

    bool level = true;
    for (const Cplx& c : *curve) {
        if (std::abs(std::abs(c * c + c) / 6.0 - 1.0) > 1e-4) level = false;
    }
    check(level, "every point has |c^2 + c| = 6");

    check(!equipotential(mandel, Cplx(0.0)).has_value(), "bounded base point has no equipotential");

    auto julia = make_julia(std::make_shared<Mandelbrot>(), Cplx(-1.0));
    const auto far = equipotential(*julia, Cplx(10.0));
    check(far.has_value() && far->size() == 51, "escaped base point traces a circle");
}

static void test_equipotential_point_cap()
{
    printf("\nTest: Equipotential size for higher degrees\n");

    // z^3 + 2: f^2(0) = 10 is the first iterate past the threshold
    Multibrot cubic(3);
    const auto curve = equipotential(cubic, Cplx(2.0));
    check(curve.has_value() && curve->size() == 451, "degree 3, two steps: 3^2 / step + 1 points");
    if (curve) {
        check_near(curve->back(), Cplx(2.0), 1e-4, "degree 3 curve closes on the base point");
        bool level = true;
        for (const Cplx& c : *curve) {
            if (std::abs(std::abs(c * c * c + c) / 10.0 - 1.0) > 1e-4) level = false;
        }
        check(level, "every point has |c^3 + c| = 10");
    }

    // z^6 + 0.599 stays below the threshold for 12 steps and crosses it
    // at step 13, which would need 6^13 / step samples
    Multibrot sextic(6);
    check(!equipotential(sextic, Cplx(0.599)).has_value(), "degree 6 at the iteration cap is refused");

    // z^10 + 0.78 crosses at step 5: 10^5 / step is over the limit
    Multibrot deg10(10);
    check(!equipotential(deg10, Cplx(0.78)).has_value(), "degree 10 after five steps is refused");
}

int main()
{
    print_header("RAY TRACER TEST SUITE");

    test_trim();
    test_unsupported();
    test_real_ray();
    test_lazy_ray();
    test_equipotential();
    test_equipotential_point_cap();

    return finish();
}
