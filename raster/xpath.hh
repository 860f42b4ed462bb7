// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_XPATH_HH
#define VELLUM_RASTER_XPATH_HH

#include <defs.hh>

#include <optional>
#include <vector>

#include <vellum/geometry.hh>
#include <vellum/path.hh>

namespace vellum::raster {

//
// A flattened subpath:
//
struct polyline_t {
    std::vector< point_t > points;
    bool closed = false;
};

//
// Expands (rectangles to closed subpaths) and flattens (curves to line
// segments) a path that is already in device space. A line or curve without
// a current point starts from the origin; one that follows a close starts a
// new subpath at the start of the closed one.
//
std::vector< polyline_t >
flatten (const path_t&, double flatness, int max_depth);

rect_t bounds (const std::vector< polyline_t >&);

//
// Non-horizontal segment, prepared for scan conversion:
//
//   x         : x at the top end point
//   y         : first scan line, floor of the top end point's y
//   dx        : x increment per scan line
//   height    : number of scan lines spanned
//   direction : +1 if the segment goes down, -1 if it goes up
//
struct edge_t {
    double x;
    int y;
    double dx;
    int height;
    int direction;
};

//
// Empty for horizontal segments and for segments that do not cross a scan
// line boundary:
//
std::optional< edge_t > make_edge (const point_t&, const point_t&);

//
// Edge list of a fill, sorted by first scan line; every subpath is closed
// implicitly:
//
std::vector< edge_t > make_edges (const std::vector< polyline_t >&);

} // namespace vellum::raster

#endif // VELLUM_RASTER_XPATH_HH
