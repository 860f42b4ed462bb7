// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <cmath>

#include <utility>

#include <raster/stroke.hh>

#include <range/v3/all.hpp>
using namespace ranges;

namespace vellum::raster {
namespace {

template< typename F >
void
for_each_segment (const polyline_t& x, F f) {
    const auto& points = x.points;

    for (size_t i = 1; i < points.size (); ++i) {
        f (points [i - 1], points [i]);
    }

    if (x.closed && points.size () > 1) {
        f (points.back (), points.front ());
    }
}

void
expand_segment (
    const point_t& p0, const point_t& p1, double w, double min_length,
    path_t& result) {
    const auto dx = p1.x - p0.x;
    const auto dy = p1.y - p0.y;

    const auto len = std::sqrt (dx * dx + dy * dy);

    if (len < min_length || 0 == len) {
        return;
    }

    const auto n = point_t{ -dy / len * w, dx / len * w };

    result.move_to (p0 + n);
    result.line_to (p0 - n);
    result.line_to (p1 - n);
    result.line_to (p1 + n);
    result.close ();
}

} // anonymous

std::vector< polyline_t >
dash (const std::vector< polyline_t >& xs, const stroke_state_t& stroke) {
    const auto& pattern = stroke.dash_pattern;

    if (pattern.empty () ||
        any_of (pattern, [](auto x) { return x < 0; })) {
        return xs;
    }

    const auto total = accumulate (pattern, 0.);

    if (total <= 0) {
        return xs;
    }

    //
    // Position within the pattern where every subpath starts:
    //
    auto start_phase =
        stroke.dash_phase - std::floor (stroke.dash_phase / total) * total;

    bool start_on = true;
    size_t start_idx = 0;

    while (start_phase >= pattern [start_idx]) {
        start_on = !start_on;
        start_phase -= pattern [start_idx];

        if (++start_idx == pattern.size ()) {
            start_idx = 0;
        }
    }

    std::vector< polyline_t > result;

    polyline_t piece;

    bool on = start_on;
    size_t idx = start_idx;
    double left = 0;

    auto flush = [&]() {
        if (piece.points.size () > 1) {
            result.push_back (std::move (piece));
        }

        piece = { };
    };

    auto toggle = [&]() {
        if (on) {
            flush ();
        }

        on = !on;

        if (++idx == pattern.size ()) {
            idx = 0;
        }

        left = pattern [idx];
    };

    for (const auto& x : xs) {
        on = start_on;
        idx = start_idx;
        left = pattern [idx] - start_phase;

        for_each_segment (x, [&](const point_t& a, const point_t& b) {
            const auto len = distance (a, b);
            double pos = 0;

            if (on && piece.points.empty ()) {
                piece.points.push_back (a);
            }

            while (len - pos > left) {
                pos += left;

                const auto p = lerp (a, b, pos / len);

                if (on) {
                    piece.points.push_back (p);
                }

                toggle ();

                if (on) {
                    piece.points.push_back (p);
                }
            }

            left -= len - pos;

            if (on) {
                piece.points.push_back (b);
            }

            if (left <= 0) {
                toggle ();
            }
        });

        flush ();
    }

    return result;
}

path_t
expand_stroke (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const params_t& params) {
    path_t result;

    if (!ctm.invert ()) {
        return result;
    }

    auto polylines = flatten (
        transform (path, ctm), params.flatness, params.max_curve_depth);

    const auto expansion = ctm.expansion ();

    if (stroke.is_dashed ()) {
        //
        // Dash lengths are in user space:
        //
        auto device_dash = stroke;

        for (auto& x : device_dash.dash_pattern) {
            x *= expansion;
        }

        device_dash.dash_phase *= expansion;

        polylines = dash (polylines, device_dash);
    }

    auto w = stroke.linewidth / 2;

    if (stroke.linewidth <= 0 || (params.stroke_adjust && stroke.linewidth < 1)) {
        w = 0.5;
    }

    for (const auto& x : polylines) {
        for_each_segment (x, [&](const point_t& p0, const point_t& p1) {
            expand_segment (p0, p1, w, params.min_segment_length, result);
        });
    }

    return result;
}

} // namespace vellum::raster
