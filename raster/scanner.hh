// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_SCANNER_HH
#define VELLUM_RASTER_SCANNER_HH

#include <defs.hh>

#include <functional>
#include <vector>

#include <raster/xpath.hh>

namespace vellum::raster {

//
// Scan line converter over an edge list (see make_edges). Walks the active
// edges left to right, accumulating the winding number, and reports the
// spans [x0, x1) that are inside under the selected rule:
//
struct scanner_t {
    using span_function_t = std::function< void (int y, int x0, int x1) >;

    scanner_t (std::vector< edge_t > edges, bool even_odd);

    //
    // Scan lines [y_min, y_max) touched by the edges; both zero when there
    // are none:
    //
    int y_min () const { return y_min_; }
    int y_max () const { return y_max_; }

    bool empty () const { return edges_.empty (); }

    //
    // Emits the spans of scan lines [y0, y1) intersected with the edges'
    // range, in increasing y and, within a line, increasing x:
    //
    void scan (int y0, int y1, const span_function_t&) const;

private:
    bool inside (int winding) const {
        return even_odd_ ? (winding % 2) != 0 : winding != 0;
    }

private:
    std::vector< edge_t > edges_;
    bool even_odd_;

    int y_min_ = 0, y_max_ = 0;
};

} // namespace vellum::raster

#endif // VELLUM_RASTER_SCANNER_HH
