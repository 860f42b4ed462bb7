// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <algorithm>
#include <cstring>

#include <raster/math.hh>
#include <raster/rasterizer.hh>
#include <raster/scanner.hh>
#include <raster/stroke.hh>
#include <raster/xpath.hh>

namespace vellum::raster {
namespace {

inline int
floor_div (int a, int b) {
    return a / b - (a % b != 0 && (a < 0) != (b < 0));
}

} // anonymous

std::vector< unsigned char >
convert_color (
    const colorspace_t& src, const std::vector< double >& color,
    const colorspace_t& dst, bool alpha_channel, double alpha) {
    auto rgb = src.to_rgb (color);

    for (auto& c : rgb) {
        c = std::clamp (c, 0.0, 1.0);
    }

    std::vector< unsigned char > pixel;

    for (auto c : dst.from_rgb (rgb)) {
        pixel.push_back (to_byte (c));
    }

    if (alpha_channel) {
        pixel.push_back (to_byte (alpha));
    }

    return pixel;
}

void
composite (
    pixmap_t& dest, int y, int x0, int x1, const unsigned char* coverage,
    const std::vector< unsigned char >& pixel) {
    const int n = dest.n ();

    VELLUM_ASSERT (pixel.size () == size_t (n));
    VELLUM_ASSERT (0 <= x0 && x1 <= dest.width ());
    VELLUM_ASSERT (0 <= y && y < dest.height ());

    auto p = dest.row (y) + size_t (x0) * n;

    for (int x = x0; x < x1; ++x, ++coverage, p += n) {
        const unsigned c = *coverage;

        if (255 == c) {
            std::memcpy (p, pixel.data (), n);
        }
        else if (c) {
            for (int i = 0; i < n; ++i) {
                const int d = (int (pixel [i]) - int (p [i])) * int (c) / 255;
                p [i] = static_cast< unsigned char > (p [i] + d);
            }
        }
    }
}

////////////////////////////////////////////////////////////////////////

rasterizer_t::rasterizer_t (const params_t& params)
    : params_ (params), clip_ (rect_t::infinite ()) {
    set_aa_level (params_.aa_level);
}

void
rasterizer_t::set_aa_level (int level) {
    params_.aa_level = std::clamp (level, 1, VELLUM_MAX_AA_LEVEL);
}

irect_t
rasterizer_t::area_of (const pixmap_t& dest, const clip_t* clip) const {
    auto area = intersect (dest.bounds (), iround (clip_));

    if (clip) {
        area = intersect (area, clip->rect ());
    }

    return area;
}

void
rasterizer_t::rasterize (
    const path_t& path, bool even_odd, const irect_t& area,
    const row_function_t& f) const {
    if (area.is_empty () || path.empty ()) {
        return;
    }

    const int s = params_.aa_level;

    auto polylines = flatten (
        s > 1 ? transform (path, matrix_t::scale (s, s)) : path,
        params_.flatness, params_.max_curve_depth);

    scanner_t scanner (make_edges (polylines), even_odd);

    if (scanner.empty ()) {
        return;
    }

    const int width = area.width ();

    std::vector< unsigned char > line (width);
    std::vector< int > counts (s > 1 ? width : 0);

    int current = area.y0 - 1, lo = area.x1, hi = area.x0;

    auto flush = [&]() {
        if (lo >= hi) {
            return;
        }

        if (s > 1) {
            const int max = s * s;

            for (int x = lo; x < hi; ++x) {
                auto& count = counts [x - area.x0];

                line [x - area.x0] = static_cast< unsigned char > (
                    (std::min) (count, max) * 255 / max);

                count = 0;
            }
        }

        f (current, lo, hi, line.data () + (lo - area.x0));

        std::fill (
            line.begin () + (lo - area.x0), line.begin () + (hi - area.x0), 0);

        lo = area.x1;
        hi = area.x0;
    };

    if (1 == s) {
        scanner.scan (area.y0, area.y1, [&](int y, int x0, int x1) {
            if (y != current) {
                flush ();
                current = y;
            }

            x0 = (std::max) (x0, area.x0);
            x1 = (std::min) (x1, area.x1);

            if (x0 >= x1) {
                return;
            }

            std::fill (
                line.begin () + (x0 - area.x0), line.begin () + (x1 - area.x0),
                255);

            lo = (std::min) (lo, x0);
            hi = (std::max) (hi, x1);
        });
    }
    else {
        scanner.scan (area.y0 * s, area.y1 * s, [&](int sy, int sx0, int sx1) {
            const int y = floor_div (sy, s);

            if (y != current) {
                flush ();
                current = y;
            }

            sx0 = (std::max) (sx0, area.x0 * s);
            sx1 = (std::min) (sx1, area.x1 * s);

            if (sx0 >= sx1) {
                return;
            }

            const int x0 = floor_div (sx0, s);
            const int x1 = floor_div (sx1 - 1, s) + 1;

            for (int x = x0; x < x1; ++x) {
                counts [x - area.x0] +=
                    (std::min) (sx1, (x + 1) * s) - (std::max) (sx0, x * s);
            }

            lo = (std::min) (lo, x0);
            hi = (std::max) (hi, x1);
        });
    }

    flush ();
}

void
rasterizer_t::fill_path (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha,
    pixmap_t& dest, const clip_t* clip) const {
    const auto area = area_of (dest, clip);

    if (area.is_empty ()) {
        return;
    }

    const auto pixel = convert_color (
        cs, color, dest.colorspace (), dest.has_alpha (), alpha);

    rasterize (
        transform (path, ctm), even_odd, area,
        [&](int y, int x0, int x1, unsigned char* coverage) {
            if (clip && !clip->clip_span (coverage, y, x0, x1)) {
                return;
            }

            composite (dest, y, x0, x1, coverage, pixel);
        });
}

void
rasterizer_t::stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha,
    pixmap_t& dest, const clip_t* clip) const {
    fill_path (
        expand_stroke (path, stroke, ctm, params_), false,
        matrix_t::identity (), cs, color, alpha, dest, clip);
}

mask_t
rasterizer_t::fill_mask (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const irect_t& area) const {
    const auto clipped = intersect (area, iround (clip_));

    mask_t mask (clipped);

    rasterize (
        transform (path, ctm), even_odd, mask.rect (),
        [&](int y, int x0, int x1, unsigned char* coverage) {
            std::copy (
                coverage, coverage + (x1 - x0),
                mask.row (y) + (x0 - mask.rect ().x0));
        });

    return mask;
}

mask_t
rasterizer_t::stroke_mask (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const irect_t& area) const {
    return fill_mask (
        expand_stroke (path, stroke, ctm, params_), false,
        matrix_t::identity (), area);
}

} // namespace vellum::raster
