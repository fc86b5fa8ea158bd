#include "plane_computer.hpp"
#include "escape_classifier.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------
// Constructor: detect hardware threads, build thread pool
// -----------------------------------------------------------------------
PlaneComputer::PlaneComputer()
{
    int n = static_cast<int>(std::thread::hardware_concurrency());
    if (n < 1) n = 4;
    hw_concurrency = n;
    thread_count   = n;
    pool = std::make_unique<ThreadPool>(n);
}

void PlaneComputer::set_thread_count(int n)
{
    if (n < 1) n = hw_concurrency;
    pool = std::make_unique<ThreadPool>(n);
    thread_count = n;
}

// -----------------------------------------------------------------------
// Row chunk: called from thread pool workers
// -----------------------------------------------------------------------
void PlaneComputer::compute_rows(OrbitEngine& engine, const Family& family,
                                 const OrbitParams& params, IterPlane& plane,
                                 int row_begin, int row_end)
{
    const PointGrid& grid = plane.grid;
    for (int y = row_begin; y < row_end; ++y) {
        PointInfo* row = plane.data.data() + static_cast<size_t>(y) * grid.res_x;
        for (int x = 0; x < grid.res_x; ++x) {
            engine.reset(grid.map_pixel(x, y));
            const EscapeResult result = engine.run_until_complete();
            row[x] = encode_escape_result(family, params, result, engine.param());
        }
    }
}

// -----------------------------------------------------------------------
// Top-level compute: splits rows into chunks and dispatches to the pool
// -----------------------------------------------------------------------
void PlaneComputer::compute(const Family& family, const OrbitParams& params, IterPlane& plane)
{
    if (plane.grid.is_nan()) {
        fprintf(stderr, "[compute] %s: bounds contain NaN, skipping\n", family.name());
        return;
    }

    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();

    const int W = plane.grid.res_x, H = plane.grid.res_y;
    if (W <= 0 || H <= 0) return;
    if (plane.data.size() != static_cast<size_t>(W) * H)
        plane.resize(plane.grid);

    // One engine per worker, reseeded for every pixel
    std::vector<OrbitEngine> engines;
    engines.reserve(pool->size());
    for (int i = 0; i < pool->size(); ++i)
        engines.emplace_back(family, params);

    const int chunk = std::max(1, H / thread_count);
    for (int y0 = 0; y0 < H; y0 += chunk) {
        const int y1 = std::min(y0 + chunk, H);
        pool->submit([this, &engines, &family, &params, &plane, y0, y1](int worker) {
            compute_rows(engines[worker], family, params, plane, y0, y1);
        });
    }
    pool->wait();

    last_compute_ms = std::chrono::duration<double, std::milli>(
                          clock::now() - t0).count();
    if (verbose)
        printf("[compute] %s %dx%d: %.1f ms (%d threads)\n",
               family.name(), W, H, last_compute_ms, thread_count);
}

void PlaneComputer::compute(const Family& family, IterPlane& plane)
{
    compute(family, orbit_params_for(family), plane);
}
