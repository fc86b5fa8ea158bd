#pragma once

#include "family.hpp"
#include "iter_plane.hpp"
#include "orbit_engine.hpp"
#include "thread_pool.hpp"

#include <memory>

class PlaneComputer {
public:
    PlaneComputer();

    // Classify every pixel of `plane` over plane.grid. A grid with NaN
    // bounds leaves the plane untouched.
    void compute(const Family& family, const OrbitParams& params, IterPlane& plane);

    // Same, with params taken from the family.
    void compute(const Family& family, IterPlane& plane);

    double last_compute_ms = 0.0;
    int    thread_count    = 0;
    int    hw_concurrency  = 0;       // logical CPU count detected at startup
    bool   verbose         = false;   // print one timing line per compute

    // n=0 restores hw_concurrency
    void set_thread_count(int n);

private:
    void compute_rows(OrbitEngine& engine, const Family& family, const OrbitParams& params,
                      IterPlane& plane, int row_begin, int row_end);

    std::unique_ptr<ThreadPool> pool;
};
