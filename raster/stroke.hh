// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_STROKE_HH
#define VELLUM_RASTER_STROKE_HH

#include <defs.hh>

#include <vector>

#include <vellum/params.hh>
#include <vellum/path.hh>
#include <raster/xpath.hh>

namespace vellum::raster {

//
// Cuts the polylines into the `on' pieces of the dash pattern. The pattern
// restarts at `dash_phase' with every subpath. A pattern with a negative
// entry, or with a zero total length, leaves the polylines as they are.
//
std::vector< polyline_t >
dash (const std::vector< polyline_t >&, const stroke_state_t&);

//
// Device space fill path equivalent to stroking `path'. The path is
// transformed and flattened first; every device space segment of it (after
// dashing) becomes the quadrilateral
//
//   p0 + n, p0 - n, p1 - n, p1 + n
//
// where n is the segment normal of length linewidth / 2 device pixels. No
// cap or join geometry is added: consecutive quads overlap, and all have the
// same orientation so that a non-zero fill merges them. Dash lengths are
// scaled by the matrix expansion.
//
// Segments shorter than `min_segment_length' device pixels are dropped. A
// zero line width, or any width thinner than a pixel when stroke adjustment
// is on, strokes one device pixel wide.
//
path_t expand_stroke (
    const path_t&, const stroke_state_t&, const matrix_t&, const params_t&);

} // namespace vellum::raster

#endif // VELLUM_RASTER_STROKE_HH
