// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <cmath>

#include <raster/flatten.hh>
#include <raster/math.hh>
#include <raster/xpath.hh>
#include <utils/overload.hh>

#include <range/v3/all.hpp>
using namespace ranges;

namespace vellum::raster {
namespace {

struct builder_t {
    std::vector< polyline_t > polylines;

    std::optional< point_t > current, start;
    bool open = false;

    //
    // Current subpath, started at the current point (or origin) on demand:
    //
    polyline_t& subpath () {
        if (!open) {
            const auto p = current.value_or (point_t{ 0, 0 });

            polylines.push_back ({ { p }, false });
            start = current = p;

            open = true;
        }

        return polylines.back ();
    }

    void move_to (const point_t& p) {
        open = false;
        current = start = p;
    }

    void line_to (const point_t& p) {
        subpath ().points.push_back (p);
        current = p;
    }

    void close () {
        if (open) {
            polylines.back ().closed = true;
        }

        open = false;
        current = start;
    }

    void rect (const rect_t& r) {
        open = false;

        polylines.push_back ({
            { { r.x0, r.y0 }, { r.x1, r.y0 }, { r.x1, r.y1 }, { r.x0, r.y1 } },
            true });

        current = start = point_t{ r.x0, r.y0 };
    }
};

} // anonymous

std::vector< polyline_t >
flatten (const path_t& path, double flatness, int max_depth) {
    builder_t b;

    for (const auto& element : path.elements ()) {
        std::visit (overload_{
                [&](const move_to_t& x) { b.move_to (x.p); },
                [&](const line_to_t& x) { b.line_to (x.p); },
                [&](const quad_to_t& x) {
                    auto& points = b.subpath ().points;
                    const auto p0 = points.back ();

                    flatten_quad (
                        p0, x.p1, x.p2, flatness, max_depth, points);

                    b.current = x.p2;
                },
                [&](const curve_to_t& x) {
                    auto& points = b.subpath ().points;
                    const auto p0 = points.back ();

                    flatten_cubic (
                        p0, x.p1, x.p2, x.p3, flatness, max_depth, points);

                    b.current = x.p3;
                },
                [&](const close_t&) { b.close (); },
                [&](const rectangle_t& x) { b.rect (x.r); }
            }, element);
    }

    return std::move (b.polylines);
}

rect_t
bounds (const std::vector< polyline_t >& xs) {
    auto box = rect_t::empty ();

    for (const auto& x : xs) {
        for (const auto& p : x.points) {
            box = include (box, p);
        }
    }

    return box;
}

std::optional< edge_t >
make_edge (const point_t& a, const point_t& b) {
    int direction;
    point_t p0, p1;

    if (a.y < b.y) {
        p0 = a; p1 = b; direction = 1;
    }
    else if (b.y < a.y) {
        p0 = b; p1 = a; direction = -1;
    }
    else {
        return { };
    }

    const auto dy = p1.y - p0.y;
    const auto dx = std::fabs (dy) > 0.0001 ? (p1.x - p0.x) / dy : 0.;

    //
    // Scan lines are kept within +/- 2^29, so that heights and line
    // offsets fit an int:
    //
    const double limit = 536870912.;

    if (p0.y < -limit) {
        p0.x += (-limit - p0.y) * dx;
        p0.y = -limit;
    }

    if (p1.y > limit) {
        p1.y = limit;
    }

    const int y0 = ifloor (p0.y);
    const int height = ifloor (p1.y) - y0;

    if (height <= 0) {
        return { };
    }

    return edge_t{ p0.x, y0, dx, height, direction };
}

std::vector< edge_t >
make_edges (const std::vector< polyline_t >& xs) {
    std::vector< edge_t > edges;

    for (const auto& x : xs) {
        const auto& points = x.points;

        if (points.size () < 2) {
            continue;
        }

        for (size_t i = 1; i < points.size (); ++i) {
            if (auto edge = make_edge (points [i - 1], points [i])) {
                edges.push_back (*edge);
            }
        }

        if (auto edge = make_edge (points.back (), points.front ())) {
            edges.push_back (*edge);
        }
    }

    sort (edges, [](const auto& lhs, const auto& rhs) { return lhs.y < rhs.y; });

    return edges;
}

} // namespace vellum::raster
