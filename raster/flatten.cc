// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <vector>

#include <raster/flatten.hh>

namespace vellum::raster {
namespace {

struct curve_t {
    point_t p0, p1, p2, p3;
    int depth;
};

} // anonymous

bool
is_flat (
    const point_t& p0, const point_t& p1, const point_t& p2, const point_t& p3,
    double tolerance) {
    const auto dx = p3.x - p0.x;
    const auto dy = p3.y - p0.y;

    const auto d = std::sqrt (dx * dx + dy * dy);

    if (d < 0.001) {
        return true;
    }

    const auto d1 = std::fabs ((p1.x - p0.x) * dy - (p1.y - p0.y) * dx) / d;
    const auto d2 = std::fabs ((p2.x - p0.x) * dy - (p2.y - p0.y) * dx) / d;

    return (std::max) (d1, d2) < tolerance;
}

int
flatten_cubic (
    const point_t& p0, const point_t& p1, const point_t& p2, const point_t& p3,
    double tolerance, int max_depth, std::vector< point_t >& points) {
    int deepest = 0;

    //
    // Explicit work stack; the right half is pushed first so that the left
    // half is emitted first:
    //
    std::vector< curve_t > stack{ { p0, p1, p2, p3, 0 } };

    while (!stack.empty ()) {
        const auto c = stack.back ();
        stack.pop_back ();

        deepest = (std::max) (deepest, c.depth);

        if (c.depth >= max_depth || is_flat (c.p0, c.p1, c.p2, c.p3, tolerance)) {
            points.push_back (c.p3);
            continue;
        }

        //
        // de Casteljau split at t = 1/2:
        //
        const auto p01 = midpoint (c.p0, c.p1);
        const auto p12 = midpoint (c.p1, c.p2);
        const auto p23 = midpoint (c.p2, c.p3);

        const auto p012 = midpoint (p01, p12);
        const auto p123 = midpoint (p12, p23);

        const auto p0123 = midpoint (p012, p123);

        stack.push_back ({ p0123, p123, p23, c.p3, c.depth + 1 });
        stack.push_back ({ c.p0, p01, p012, p0123, c.depth + 1 });
    }

    return deepest;
}

int
flatten_quad (
    const point_t& p0, const point_t& p1, const point_t& p2,
    double tolerance, int max_depth, std::vector< point_t >& points) {
    const auto cp1 = lerp (p0, p1, 2. / 3);
    const auto cp2 = lerp (p2, p1, 2. / 3);

    return flatten_cubic (p0, cp1, cp2, p2, tolerance, max_depth, points);
}

} // namespace vellum::raster
