// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_GEOMETRY_HH
#define VELLUM_VELLUM_GEOMETRY_HH

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <iostream>
#include <limits>
#include <optional>

namespace vellum {

struct point_t {
    double x, y;
};

inline bool
operator== (const point_t& lhs, const point_t& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

inline bool
operator!= (const point_t& lhs, const point_t& rhs) {
    return !(lhs == rhs);
}

inline point_t
operator+ (const point_t& lhs, const point_t& rhs) {
    return { lhs.x + rhs.x, lhs.y + rhs.y };
}

inline point_t
operator- (const point_t& lhs, const point_t& rhs) {
    return { lhs.x - rhs.x, lhs.y - rhs.y };
}

inline point_t
operator* (const point_t& p, double s) {
    return { p.x * s, p.y * s };
}

inline point_t
lerp (const point_t& lhs, const point_t& rhs, double t) {
    return { lhs.x + (rhs.x - lhs.x) * t, lhs.y + (rhs.y - lhs.y) * t };
}

inline point_t
midpoint (const point_t& lhs, const point_t& rhs) {
    return { (lhs.x + rhs.x) * 0.5, (lhs.y + rhs.y) * 0.5 };
}

inline double
distance (const point_t& lhs, const point_t& rhs) {
    return std::hypot (rhs.x - lhs.x, rhs.y - lhs.y);
}

inline std::ostream&
operator<< (std::ostream& ss, const point_t& p) {
    return ss << p.x << "," << p.y;
}

////////////////////////////////////////////////////////////////////////

//
// Axis-aligned box with `x0 <= x1' and `y0 <= y1'; a box where either
// coordinate pair is inverted, or collapsed, has no area:
//
struct rect_t {
    double x0, y0, x1, y1;

    static rect_t empty () {
        constexpr auto inf = std::numeric_limits< double >::infinity ();
        return { inf, inf, -inf, -inf };
    }

    static rect_t infinite () {
        constexpr auto inf = std::numeric_limits< double >::infinity ();
        return { -inf, -inf, inf, inf };
    }

    static rect_t unit () { return { 0, 0, 1, 1 }; }

    bool is_empty () const { return x0 >= x1 || y0 >= y1; }

    bool is_infinite () const {
        return std::isinf (x0) && x0 < 0 && std::isinf (x1) && x1 > 0 &&
               std::isinf (y0) && y0 < 0 && std::isinf (y1) && y1 > 0;
    }

    double width () const { return is_empty () ? 0 : x1 - x0; }
    double height () const { return is_empty () ? 0 : y1 - y0; }

    bool contains (const point_t& p) const {
        return x0 <= p.x && p.x < x1 && y0 <= p.y && p.y < y1;
    }
};

inline bool
operator== (const rect_t& lhs, const rect_t& rhs) {
    return lhs.x0 == rhs.x0 && lhs.y0 == rhs.y0 &&
           lhs.x1 == rhs.x1 && lhs.y1 == rhs.y1;
}

inline bool
operator!= (const rect_t& lhs, const rect_t& rhs) {
    return !(lhs == rhs);
}

//
// Union; an empty operand contributes nothing:
//
inline rect_t
operator+ (const rect_t& lhs, const rect_t& rhs) {
    if (lhs.is_empty ()) { return rhs; }
    if (rhs.is_empty ()) { return lhs; }

    return {
        (std::min) (lhs.x0, rhs.x0), (std::min) (lhs.y0, rhs.y0),
        (std::max) (lhs.x1, rhs.x1), (std::max) (lhs.y1, rhs.y1)
    };
}

inline rect_t&
operator+= (rect_t& lhs, const rect_t& rhs) {
    return lhs = lhs + rhs;
}

inline rect_t
intersect (const rect_t& lhs, const rect_t& rhs) {
    return {
        (std::max) (lhs.x0, rhs.x0), (std::max) (lhs.y0, rhs.y0),
        (std::min) (lhs.x1, rhs.x1), (std::min) (lhs.y1, rhs.y1)
    };
}

inline rect_t
include (const rect_t& box, const point_t& p) {
    if (box.x0 > box.x1 || box.y0 > box.y1) {
        return { p.x, p.y, p.x, p.y };
    }

    return {
        (std::min) (box.x0, p.x), (std::min) (box.y0, p.y),
        (std::max) (box.x1, p.x), (std::max) (box.y1, p.y)
    };
}

//
// Grows the box by `d' on every side; a degenerate box with no area but with
// ordered corners (e.g. the bounds of a horizontal line) grows as well:
//
inline rect_t
expand (const rect_t& box, double d) {
    if (box.x0 > box.x1 || box.y0 > box.y1) {
        return box;
    }

    return { box.x0 - d, box.y0 - d, box.x1 + d, box.y1 + d };
}

inline std::ostream&
operator<< (std::ostream& ss, const rect_t& box) {
    return ss
        << box.x0 << "," << box.y0 << ","
        << box.x1 << "," << box.y1;
}

////////////////////////////////////////////////////////////////////////

struct irect_t {
    int x0, y0, x1, y1;

    bool is_empty () const { return x0 >= x1 || y0 >= y1; }

    int width () const { return is_empty () ? 0 : x1 - x0; }
    int height () const { return is_empty () ? 0 : y1 - y0; }
};

inline bool
operator== (const irect_t& lhs, const irect_t& rhs) {
    return lhs.x0 == rhs.x0 && lhs.y0 == rhs.y0 &&
           lhs.x1 == rhs.x1 && lhs.y1 == rhs.y1;
}

inline bool
operator!= (const irect_t& lhs, const irect_t& rhs) {
    return !(lhs == rhs);
}

inline irect_t
intersect (const irect_t& lhs, const irect_t& rhs) {
    return {
        (std::max) (lhs.x0, rhs.x0), (std::max) (lhs.y0, rhs.y0),
        (std::min) (lhs.x1, rhs.x1), (std::min) (lhs.y1, rhs.y1)
    };
}

inline std::ostream&
operator<< (std::ostream& ss, const irect_t& box) {
    return ss
        << box.x0 << "," << box.y0 << ","
        << box.x1 << "," << box.y1;
}

//
// Smallest integer box covering `box'; infinities saturate at the int range:
//
irect_t round_out (const rect_t&);

////////////////////////////////////////////////////////////////////////

//
// Affine transform [ a b 0 ; c d 0 ; e f 1 ] acting on row vectors, i.e.,
// x' = a x + c y + e, y' = b x + d y + f:
//
struct matrix_t {
    double a, b, c, d, e, f;

    static matrix_t identity () { return { 1, 0, 0, 1, 0, 0 }; }

    static matrix_t translate (double tx, double ty) {
        return { 1, 0, 0, 1, tx, ty };
    }

    static matrix_t scale (double sx, double sy) {
        return { sx, 0, 0, sy, 0, 0 };
    }

    static matrix_t rotate (double degrees);

    //
    // `A.concat (B)' applies A first, then B:
    //
    matrix_t concat (const matrix_t& m) const {
        return {
            a * m.a + b * m.c,
            a * m.b + b * m.d,
            c * m.a + d * m.c,
            c * m.b + d * m.d,
            e * m.a + f * m.c + m.e,
            e * m.b + f * m.d + m.f
        };
    }

    std::optional< matrix_t > invert () const;

    double determinant () const { return a * d - b * c; }

    double expansion () const { return std::sqrt (std::fabs (determinant ())); }

    bool is_rectilinear () const {
        return (b == 0 && c == 0) || (a == 0 && d == 0);
    }

    bool is_identity () const {
        return a == 1 && b == 0 && c == 0 && d == 1 && e == 0 && f == 0;
    }
};

inline bool
operator== (const matrix_t& lhs, const matrix_t& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c &&
           lhs.d == rhs.d && lhs.e == rhs.e && lhs.f == rhs.f;
}

inline bool
operator!= (const matrix_t& lhs, const matrix_t& rhs) {
    return !(lhs == rhs);
}

inline std::ostream&
operator<< (std::ostream& ss, const matrix_t& m) {
    return ss
        << m.a << "," << m.b << "," << m.c << ","
        << m.d << "," << m.e << "," << m.f;
}

inline point_t
transform (const point_t& p, const matrix_t& m) {
    return { p.x * m.a + p.y * m.c + m.e, p.x * m.b + p.y * m.d + m.f };
}

inline point_t
transform_vector (const point_t& p, const matrix_t& m) {
    return { p.x * m.a + p.y * m.c, p.x * m.b + p.y * m.d };
}

//
// Bounding box of the four transformed corners:
//
rect_t transform (const rect_t&, const matrix_t&);

} // namespace vellum

#endif // VELLUM_VELLUM_GEOMETRY_HH
