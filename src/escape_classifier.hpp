#pragma once

#include "family.hpp"
#include "orbit_engine.hpp"
#include "point_info.hpp"
#include "types.hpp"

#include <optional>

// Continuous escape time: iters plus a fractional correction from how far
// past the escape radius the final value landed.
//   z NaN              -> iters - 1
//   degree not finite  -> iters
Real smooth_potential(const Family& family, Real escape_radius,
                      IterCount iters, Cplx final_value, Cplx c);

// First marked point of `c` within marked_point_tolerance() of z.
std::optional<MarkedPoint> find_marked_point(const Family& family, Cplx z, Cplx c);

// Terminal orbit state -> per-pixel classification. `c` is the parameter
// the orbit ran with.
PointInfo encode_escape_result(const Family& family, const OrbitParams& params,
                               const EscapeResult& result, Cplx c);

// Run one orbit from an image coordinate and classify it.
PointInfo classify_point(const Family& family, Cplx point, const OrbitParams& params);
