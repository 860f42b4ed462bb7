// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cmath>
#include <limits>
#include <utility>

#include <vellum/geometry.hh>

namespace vellum {
namespace {

int
saturate (double x) {
    constexpr auto lo = double ((std::numeric_limits< int >::min) ());
    constexpr auto hi = double ((std::numeric_limits< int >::max) ());

    if (std::isnan (x)) { return 0; }
    if (x <= lo) { return (std::numeric_limits< int >::min) (); }
    if (x >= hi) { return (std::numeric_limits< int >::max) (); }

    return int (x);
}

//
// Range of k * [lo, hi]; a zero factor contributes nothing, even against an
// unbounded side:
//
std::pair< double, double >
scaled (double k, double lo, double hi) {
    if (0 == k) {
        return { 0., 0. };
    }

    const auto a = k * lo, b = k * hi;
    return a < b ? std::make_pair (a, b) : std::make_pair (b, a);
}

} // anonymous

irect_t
round_out (const rect_t& box) {
    if (box.is_empty ()) {
        return { 0, 0, 0, 0 };
    }

    return {
        saturate (std::floor (box.x0)), saturate (std::floor (box.y0)),
        saturate (std::ceil  (box.x1)), saturate (std::ceil  (box.y1))
    };
}

matrix_t
matrix_t::rotate (double degrees) {
    double s, c;

    //
    // Exact values for the quarter turns:
    //
    while (degrees < 0) { degrees += 360; }
    while (degrees >= 360) { degrees -= 360; }

    if (std::fabs (degrees) < 1e-6) {
        s = 0; c = 1;
    }
    else if (std::fabs (90 - degrees) < 1e-6) {
        s = 1; c = 0;
    }
    else if (std::fabs (180 - degrees) < 1e-6) {
        s = 0; c = -1;
    }
    else if (std::fabs (270 - degrees) < 1e-6) {
        s = -1; c = 0;
    }
    else {
        const auto radians = degrees * M_PI / 180;
        s = std::sin (radians);
        c = std::cos (radians);
    }

    return { c, s, -s, c, 0, 0 };
}

std::optional< matrix_t >
matrix_t::invert () const {
    const auto det = determinant ();

    if (std::fabs (det) < std::numeric_limits< double >::epsilon ()) {
        return { };
    }

    const auto rdet = 1 / det;

    const auto ia =  d * rdet;
    const auto ib = -b * rdet;
    const auto ic = -c * rdet;
    const auto id =  a * rdet;

    return matrix_t{ ia, ib, ic, id, -e * ia - f * ic, -e * ib - f * id };
}

rect_t
transform (const rect_t& box, const matrix_t& m) {
    if (box.x0 > box.x1 || box.y0 > box.y1 || box.is_infinite ()) {
        return box;
    }

    //
    // Per axis, the extent of the linear part over the box, then the
    // translation; this is the box of the four corners when the box is
    // bounded:
    //
    const auto [ ax0, ax1 ] = scaled (m.a, box.x0, box.x1);
    const auto [ cy0, cy1 ] = scaled (m.c, box.y0, box.y1);
    const auto [ bx0, bx1 ] = scaled (m.b, box.x0, box.x1);
    const auto [ dy0, dy1 ] = scaled (m.d, box.y0, box.y1);

    return {
        ax0 + cy0 + m.e, bx0 + dy0 + m.f,
        ax1 + cy1 + m.e, bx1 + dy1 + m.f
    };
}

} // namespace vellum
