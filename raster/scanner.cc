// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <algorithm>
#include <utility>

#include <raster/math.hh>
#include <raster/scanner.hh>

#include <range/v3/all.hpp>
using namespace ranges;

namespace vellum::raster {
namespace {

struct active_edge_t {
    double x, dx;
    int height, direction;
};

struct x_cmp_t {
    //
    // Increasing order of x, then of slope:
    //
    bool operator() (const active_edge_t& lhs, const active_edge_t& rhs) const {
        return lhs.x < rhs.x || (lhs.x == rhs.x && lhs.dx < rhs.dx);
    }
};

} // anonymous

scanner_t::scanner_t (std::vector< edge_t > edges, bool even_odd)
    : edges_ (std::move (edges)), even_odd_ (even_odd) {
    if (edges_.empty ()) {
        return;
    }

    sort (edges_, [](const auto& lhs, const auto& rhs) { return lhs.y < rhs.y; });

    y_min_ = edges_.front ().y;
    y_max_ = y_min_;

    for (const auto& edge : edges_) {
        y_max_ = (std::max) (y_max_, edge.y + edge.height);
    }
}

void
scanner_t::scan (int y0, int y1, const span_function_t& f) const {
    y0 = (std::max) (y0, y_min_);
    y1 = (std::min) (y1, y_max_);

    std::vector< active_edge_t > active;

    auto next = edges_.begin ();

    for (int y = y0; y < y1; ++y) {
        //
        // Activate the edges that start at, or above, this scan line; the
        // ones that started above the first scanned line are advanced to it:
        //
        for (; next != edges_.end () && next->y <= y; ++next) {
            const int skip = y - next->y;

            if (skip < next->height) {
                active.push_back ({
                    next->x + skip * next->dx, next->dx,
                    next->height - skip, next->direction });
            }
        }

        actions::remove_if (active, [](const auto& e) { return e.height <= 0; });

        if (active.empty ()) {
            if (next == edges_.end ()) {
                break;
            }

            continue;
        }

        sort (active, x_cmp_t{ });

        int winding = 0, x_start = 0;
        bool state = false;

        for (const auto& e : active) {
            winding += e.direction;

            const bool new_state = inside (winding);

            if (new_state != state) {
                const int x = ifloor (e.x);

                if (new_state) {
                    x_start = x;
                }
                else if (x_start < x) {
                    f (y, x_start, x);
                }

                state = new_state;
            }
        }

        for (auto& e : active) {
            e.x += e.dx;
            --e.height;
        }
    }
}

} // namespace vellum::raster
