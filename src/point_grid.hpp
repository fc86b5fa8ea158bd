#pragma once

#include "types.hpp"

#include <cmath>

// Rectangle in the complex plane covered by an image.
struct Bounds {
    double min_x = -2.0;
    double max_x =  2.0;
    double min_y = -2.0;
    double max_y =  2.0;

    double width()  const { return max_x - min_x; }
    double height() const { return max_y - min_y; }
    double area()   const { return width() * height(); }
    Cplx   center() const { return {0.5 * (min_x + max_x), 0.5 * (min_y + max_y)}; }

    bool is_nan() const
    {
        return std::isnan(min_x) || std::isnan(max_x)
            || std::isnan(min_y) || std::isnan(max_y);
    }

    static Bounds centered_square(double r)
    {
        return Bounds{-r, r, -r, r};
    }
};

// Pixel -> complex coordinate mapping. Row 0 is the top of the image
// (max_y); pixels are sampled at their top-left corner.
struct PointGrid {
    Bounds bounds;
    int    res_x = 0;
    int    res_y = 0;

    // Grid of the given height whose width follows the aspect ratio of `b`.
    static PointGrid with_res_y(const Bounds& b, int res_y)
    {
        PointGrid g;
        g.bounds = b;
        g.res_y  = res_y;
        g.res_x  = (b.height() > 0.0)
            ? static_cast<int>(std::lround(res_y * b.width() / b.height()))
            : res_y;
        return g;
    }

    PointGrid with_same_height(const Bounds& b) const
    {
        return with_res_y(b, res_y);
    }

    double pixel_width() const
    {
        return (res_x > 0) ? bounds.width() / res_x : 0.0;
    }

    double pixel_height() const
    {
        return (res_y > 0) ? bounds.height() / res_y : 0.0;
    }

    Cplx map_pixel(int x, int y) const
    {
        return {bounds.min_x + x * pixel_width(),
                bounds.max_y - y * pixel_height()};
    }

    bool is_nan() const { return bounds.is_nan(); }
};
