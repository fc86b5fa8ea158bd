#pragma once

#include "dual.hpp"
#include "family.hpp"
#include "types.hpp"

// Orbit shape of a point: f^preperiod(z0) lies on a cycle of exact period
// `period`, and no earlier iterate does.
struct OrbitSchema {
    Period preperiod = 0;
    Period period    = 1;
};

enum class FindPointError {
    None                   = 0,
    PeriodIsZero           = 1,
    NewtonFailedToConverge = 2,
    NewtonNanEncountered   = 3,
};

// Returns empty string for None.
const char* find_point_error_message(FindPointError err);

struct FindPointResult {
    FindPointError error = FindPointError::None;
    Cplx           point = 0.0;   // last Newton iterate on failure

    bool ok() const { return error == FindPointError::None; }
};

// prod_{m | n} (f^{k+m}(t) - f^k(t))^mu(n/m), divided by
// f^{k+n-1}(t) - f^{k-1}(t) when k > 0, with its derivative in the image
// coordinate t. Roots are exactly the points of schema (k, n).
Dual schema_residual(const DynamicalFamily& family, const OrbitSchema& schema, Cplx t);

// Newton from `start` on schema_residual. No retries.
FindPointResult find_nearby_preperiodic_point(const DynamicalFamily& family,
                                              Cplx start, const OrbitSchema& schema);
