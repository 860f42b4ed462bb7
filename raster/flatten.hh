// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_FLATTEN_HH
#define VELLUM_RASTER_FLATTEN_HH

#include <defs.hh>

#include <vector>

#include <vellum/geometry.hh>

namespace vellum::raster {

//
// True if both inner control points lie within `tolerance' of the chord
// p0-p3, or if the chord itself is shorter than 1e-3:
//
bool is_flat (
    const point_t& p0, const point_t& p1, const point_t& p2, const point_t& p3,
    double tolerance);

//
// Appends the end points of the line segments approximating the cubic to
// `points' (p0 itself is not appended). Subdivision stops at `max_depth'.
// Returns the deepest subdivision level that was reached.
//
int flatten_cubic (
    const point_t& p0, const point_t& p1, const point_t& p2, const point_t& p3,
    double tolerance, int max_depth, std::vector< point_t >& points);

//
// Elevates the quadratic to a cubic and flattens that:
//
int flatten_quad (
    const point_t& p0, const point_t& p1, const point_t& p2,
    double tolerance, int max_depth, std::vector< point_t >& points);

} // namespace vellum::raster

#endif // VELLUM_RASTER_FLATTEN_HH
