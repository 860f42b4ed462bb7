// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_MATH_HH
#define VELLUM_RASTER_MATH_HH

#include <defs.hh>

#include <cmath>

#include <algorithm>
#include <limits>

#include <vellum/geometry.hh>

namespace vellum::raster {

//
// Float to int conversions saturate at the int range, so infinite clip
// rectangles survive the trip to pixel space:
//
inline int
saturate (double x) {
    constexpr auto lo = double ((std::numeric_limits< int >::min) ());
    constexpr auto hi = double ((std::numeric_limits< int >::max) ());

    if (std::isnan (x)) { return 0; }
    if (x <= lo) { return (std::numeric_limits< int >::min) (); }
    if (x >= hi) { return (std::numeric_limits< int >::max) (); }

    return int (x);
}

inline int ifloor (double x) { return saturate (std::floor (x)); }
inline int iceil (double x) { return saturate (std::ceil (x)); }
inline int iround (double x) { return saturate (std::floor (x + 0.5)); }

//
// Pixel rectangle of the pixels whose centers fall inside `box':
//
inline irect_t
iround (const rect_t& box) {
    if (box.is_empty ()) {
        return { 0, 0, 0, 0 };
    }

    return { iround (box.x0), iround (box.y0), iround (box.x1), iround (box.y1) };
}

inline unsigned char
to_byte (double x) {
    return static_cast< unsigned char > (std::clamp (x, 0.0, 1.0) * 255 + 0.5);
}

//
// a * b / 255, rounded:
//
inline unsigned char
mul255 (unsigned a, unsigned b) {
    const unsigned t = a * b + 0x80;
    return static_cast< unsigned char > ((t + (t >> 8)) >> 8);
}

} // namespace vellum::raster

#endif // VELLUM_RASTER_MATH_HH
