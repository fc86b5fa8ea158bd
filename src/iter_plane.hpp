#pragma once

#include "point_grid.hpp"
#include "point_info.hpp"

#include <vector>

// Per-pixel classifications, row-major, row 0 at the top.
struct IterPlane {
    std::vector<PointInfo> data;
    PointGrid              grid;

    int width()  const { return grid.res_x; }
    int height() const { return grid.res_y; }

    PointInfo&       at(int x, int y)       { return data[static_cast<size_t>(y) * grid.res_x + x]; }
    const PointInfo& at(int x, int y) const { return data[static_cast<size_t>(y) * grid.res_x + x]; }

    // Resets every entry to Bounded.
    void resize(const PointGrid& g)
    {
        grid = g;
        data.assign(static_cast<size_t>(g.res_x) * g.res_y, PointInfo::bounded());
    }

    static IterPlane create(const PointGrid& g)
    {
        IterPlane p;
        p.resize(g);
        return p;
    }
};
