#pragma once

#include "family.hpp"

#include <memory>

enum class FamilyType {
    Mandelbrot  = 0,  // z^2 + c, free critical point 0
    Multibrot   = 1,  // z^d + c  (integer d >= 2)
    CubicNewton = 2,  // Newton map of z^3 + (c-1)z - c
};
constexpr int FAMILY_COUNT = 3;

const char* family_name(FamilyType type);

// `degree` only applies to Multibrot.
std::unique_ptr<Family> make_family(FamilyType type, int degree = 3);

// Dynamical plane of `parent` at the parameter selected by `selection`.
std::unique_ptr<Family> make_julia(std::shared_ptr<const Family> parent, Cplx selection);

// ---------------------------------------------------------------------------
// Mandelbrot: parameter plane of z^2 + c
// ---------------------------------------------------------------------------
class Mandelbrot : public Family {
public:
    const char* name() const override { return "Mandelbrot"; }

    Var map(Var z, const Param& c) const override { return z * z + c; }

    Dual map_and_multiplier(Var z, const Param& c) const override
    {
        return {z * z + c, 2.0 * z};
    }

    Var   start_point(Cplx, const Param&) const override { return 0.0; }
    Param param_map(Cplx point) const override { return point; }

    // Main cardioid and period-2 disk
    std::optional<EscapeResult> early_bailout(Var z0, const Param& c) const override;

    Real   escape_radius()  const override { return 1e13; }
    Bounds default_bounds() const override { return Bounds{-2.1, 0.55, -1.25, 1.25}; }
};

// ---------------------------------------------------------------------------
// Multibrot: parameter plane of z^d + c
// ---------------------------------------------------------------------------
class Multibrot : public Family {
public:
    explicit Multibrot(int degree) : d(degree < 2 ? 2 : degree) {}

    const char* name() const override { return "Multibrot"; }

    Var  map(Var z, const Param& c) const override;
    Dual map_and_multiplier(Var z, const Param& c) const override;

    Var   start_point(Cplx, const Param&) const override { return 0.0; }
    Param param_map(Cplx point) const override { return point; }

    Bounds default_bounds() const override { return Bounds::centered_square(2.0); }

    Real degree_real() const override { return static_cast<Real>(d); }

    MetaParam get_param() const override { return MetaParam(static_cast<Real>(d)); }

private:
    int d;
};

// ---------------------------------------------------------------------------
// CubicNewton: Newton's method for p(z) = z^3 + (c-1)z - c, whose roots are
// 1 and the roots of z^2 + z + c. Infinity is repelling, so there are no
// rays and orbits are classified by the root they reach.
// ---------------------------------------------------------------------------
class CubicNewton : public Family {
public:
    const char* name() const override { return "Cubic Newton"; }

    Var      map(Var z, const Param& c) const override;
    Dual     map_and_multiplier(Var z, const Param& c) const override;
    Gradient gradient(Var z, const Param& c) const override;

    Var   start_point(Cplx, const Param&) const override { return 0.0; }
    Param param_map(Cplx point) const override { return point; }

    Real   escape_radius()  const override { return 1e10; }
    Bounds default_bounds() const override { return Bounds::centered_square(2.5); }

    std::vector<MarkedPoint> marked_points(const Cplx& c) const override;
    uint32_t num_marked_point_classes() const override { return 3; }

    Real degree_real() const override { return std::nan(""); }
};

// ---------------------------------------------------------------------------
// JuliaSet: dynamical plane of a parent family at a fixed parameter
// ---------------------------------------------------------------------------
class JuliaSet : public Family {
public:
    JuliaSet(std::shared_ptr<const Family> parent, Cplx c);

    const char* name() const override { return "Julia set"; }

    Var      map(Var z, const Param&) const override { return parent->map(z, c); }
    Dual     map_and_multiplier(Var z, const Param&) const override { return parent->map_and_multiplier(z, c); }
    Gradient gradient(Var z, const Param&) const override { return parent->gradient(z, c); }

    Var      start_point(Cplx point, const Param&) const override { return point; }
    Gradient start_point_d(Cplx point, const Param&) const override { return {point, 1.0, 0.0}; }
    Param    param_map(Cplx) const override { return c; }
    Dual     param_map_d(Cplx) const override { return {c, 0.0}; }

    Real      escape_radius()         const override { return parent->escape_radius(); }
    Real      periodicity_tolerance() const override { return parent->periodicity_tolerance(); }
    IterCount min_iter()              const override { return parent->min_iter(); }
    Bounds    default_bounds()        const override { return Bounds::centered_square(2.2); }
    PlaneType plane_type()            const override { return PlaneType::Dynamical; }

    MetaParam get_param() const override { return c; }
    void      set_param(const MetaParam& value) override { c = value; }

    std::vector<MarkedPoint> marked_points(const Cplx&) const override { return parent->marked_points(c); }
    uint32_t num_marked_point_classes() const override { return parent->num_marked_point_classes(); }

    Real   degree_real()     const override { return parent->degree_real(); }
    Period escaping_period() const override { return parent->escaping_period(); }
    Period escaping_phase()  const override { return 0; }
    Cplx   escape_coeff(const Cplx&) const override { return parent->escape_coeff(c); }

private:
    std::shared_ptr<const Family> parent;
    Cplx c;
};
