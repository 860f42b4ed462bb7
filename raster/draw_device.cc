// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <cmath>

#include <algorithm>

#include <vellum/error.hh>
#include <raster/draw_device.hh>
#include <raster/math.hh>

namespace vellum::raster {
namespace {

//
// Glyph outlines of all spans, in user space:
//
path_t
text_path (const text_t& text) {
    path_t path;

    for (const auto& span : text.spans ()) {
        if (!span.font) {
            continue;
        }

        for (const auto& item : span.items) {
            if (const auto outline = span.font->outline (item.gid)) {
                path.append (transform (*outline, span.glyph_matrix (item)));
            }
        }
    }

    return path;
}

inline rect_t
to_rect (const irect_t& r) {
    return { double (r.x0), double (r.y0), double (r.x1), double (r.y1) };
}

//
// Range of cell indices along one axis for which the cell [lo, hi) shifted
// by i * step meets [area_lo, area_hi):
//
std::pair< int, int >
cell_range (double area_lo, double area_hi, double lo, double hi, double step) {
    if (step < 1e-6) {
        return { 0, 0 };
    }

    return {
        ifloor ((area_lo - hi) / step), iceil ((area_hi - lo) / step)
    };
}

} // anonymous

void
normal_blend (
    blend_mode_t, const unsigned char* src, const unsigned char*,
    unsigned char* result, int n) {
    std::copy (src, src + n, result);
}

struct draw_device_t::mask_state_t {
    std::unique_ptr< pixmap_t > pixmap;
    pixmap_t* previous;
    rect_t area;
    bool luminosity;
};

struct draw_device_t::group_state_t {
    std::unique_ptr< pixmap_t > pixmap;
    pixmap_t* previous;
    rect_t area;
    blend_mode_t blend_mode;
    double alpha;
};

struct draw_device_t::tile_state_t {
    rect_t area, view;
    double xstep, ystep;
    matrix_t ctm;

    list_device_t recorder;

    // begin_tile calls recorded inside this tile and not yet closed
    int nested = 0;
};

////////////////////////////////////////////////////////////////////////

draw_device_t::draw_device_t (pixmap_t& dest, const params_t& params)
    : dest_ (dest), target_ (&dest), rasterizer_ (params),
      blend_ (normal_blend) {
    clips_.emplace_back (dest.bounds ());
}

draw_device_t::~draw_device_t () = default;

list_device_t*
draw_device_t::recorder () {
    return tiles_.empty () ? 0 : &tiles_.back ()->recorder;
}

void
draw_device_t::push_clip (const rect_t& scissor, mask_t mask) {
    auto clip = clips_.back ();

    clip.clip_to_rect (round_out (scissor));
    clip.clip_to_mask (std::make_shared< const mask_t > (std::move (mask)));

    clips_.push_back (std::move (clip));
}

//----- paths

void
draw_device_t::fill_path (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    if (auto p = recorder ()) {
        p->fill_path (path, even_odd, ctm, cs, color, alpha);
        return;
    }

    rasterizer_.fill_path (
        path, even_odd, ctm, cs, color, alpha, *target_, &clips_.back ());
}

void
draw_device_t::stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    if (auto p = recorder ()) {
        p->stroke_path (path, stroke, ctm, cs, color, alpha);
        return;
    }

    rasterizer_.stroke_path (
        path, stroke, ctm, cs, color, alpha, *target_, &clips_.back ());
}

void
draw_device_t::clip_path (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const rect_t& scissor) {
    if (auto p = recorder ()) {
        p->clip_path (path, even_odd, ctm, scissor);
        return;
    }

    push_clip (
        scissor,
        rasterizer_.fill_mask (path, even_odd, ctm, clips_.back ().rect ()));
}

void
draw_device_t::clip_stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const rect_t& scissor) {
    if (auto p = recorder ()) {
        p->clip_stroke_path (path, stroke, ctm, scissor);
        return;
    }

    push_clip (
        scissor,
        rasterizer_.stroke_mask (path, stroke, ctm, clips_.back ().rect ()));
}

//----- text

void
draw_device_t::fill_text (
    const text_t& text, const matrix_t& ctm, const colorspace_t& cs,
    const std::vector< double >& color, double alpha) {
    if (auto p = recorder ()) {
        p->fill_text (text, ctm, cs, color, alpha);
        return;
    }

    rasterizer_.fill_path (
        text_path (text), false, ctm, cs, color, alpha, *target_,
        &clips_.back ());
}

void
draw_device_t::stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    if (auto p = recorder ()) {
        p->stroke_text (text, stroke, ctm, cs, color, alpha);
        return;
    }

    rasterizer_.stroke_path (
        text_path (text), stroke, ctm, cs, color, alpha, *target_,
        &clips_.back ());
}

void
draw_device_t::clip_text (
    const text_t& text, const matrix_t& ctm, const rect_t& scissor) {
    if (auto p = recorder ()) {
        p->clip_text (text, ctm, scissor);
        return;
    }

    push_clip (
        scissor, rasterizer_.fill_mask (
            text_path (text), false, ctm, clips_.back ().rect ()));
}

void
draw_device_t::clip_stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t& ctm,
    const rect_t& scissor) {
    if (auto p = recorder ()) {
        p->clip_stroke_text (text, stroke, ctm, scissor);
        return;
    }

    push_clip (
        scissor, rasterizer_.stroke_mask (
            text_path (text), stroke, ctm, clips_.back ().rect ()));
}

void
draw_device_t::ignore_text (const text_t& text, const matrix_t& ctm) {
    if (auto p = recorder ()) {
        p->ignore_text (text, ctm);
    }
}

//----- images

template< typename F >
void
draw_device_t::for_each_image_pixel (
    const image_t& image, const matrix_t& ctm, F f) const {
    const auto inv = ctm.invert ();

    if (!inv) {
        return;
    }

    const auto& clip = clips_.back ();

    const auto area = intersect (
        rasterizer_.area_of (*target_, &clip),
        round_out (transform (rect_t::unit (), ctm)));

    const int w = image.width (), h = image.height ();

    for (int y = area.y0; y < area.y1; ++y) {
        for (int x = area.x0; x < area.x1; ++x) {
            const auto p = transform (point_t{ x + 0.5, y + 0.5 }, *inv);

            if (p.x < 0 || p.x >= 1 || p.y < 0 || p.y >= 1) {
                continue;
            }

            unsigned char coverage = 255;

            if (!clip.clip_span (&coverage, y, x, x + 1)) {
                continue;
            }

            f (x, y,
               (std::min) (int (p.x * w), w - 1),
               (std::min) (int (p.y * h), h - 1),
               coverage);
        }
    }
}

void
draw_device_t::fill_image (
    const image_t& image, const matrix_t& ctm, double alpha) {
    if (auto p = recorder ()) {
        p->fill_image (image, ctm, alpha);
        return;
    }

    if (image.is_mask ()) {
        fill_image_mask (
            image, ctm, colorspace_t::device_gray (), { 0. }, alpha);
        return;
    }

    const auto& cs = *image.colorspace ();

    for_each_image_pixel (
        image, ctm, [&](int x, int y, int ix, int iy, unsigned char coverage) {
            const auto pixel = convert_color (
                cs, image.sample (ix, iy), target_->colorspace (),
                target_->has_alpha (), alpha);

            composite (*target_, y, x, x + 1, &coverage, pixel);
        });
}

void
draw_device_t::fill_image_mask (
    const image_t& image, const matrix_t& ctm, const colorspace_t& cs,
    const std::vector< double >& color, double alpha) {
    if (auto p = recorder ()) {
        p->fill_image_mask (image, ctm, cs, color, alpha);
        return;
    }

    const auto pixel = convert_color (
        cs, color, target_->colorspace (), target_->has_alpha (), alpha);

    for_each_image_pixel (
        image, ctm, [&](int x, int y, int ix, int iy, unsigned char coverage) {
            if (image.is_set (ix, iy)) {
                composite (*target_, y, x, x + 1, &coverage, pixel);
            }
        });
}

mask_t
draw_device_t::image_mask (
    const image_t& image, const matrix_t& ctm, const irect_t& rect) const {
    const auto inv = ctm.invert ();

    const auto area = inv
        ? intersect (rect, round_out (transform (rect_t::unit (), ctm)))
        : irect_t{ };

    mask_t mask (area);

    const int w = image.width (), h = image.height ();

    for (int y = area.y0; y < area.y1; ++y) {
        auto row = mask.row (y);

        for (int x = area.x0; x < area.x1; ++x) {
            const auto p = transform (point_t{ x + 0.5, y + 0.5 }, *inv);

            if (p.x < 0 || p.x >= 1 || p.y < 0 || p.y >= 1) {
                continue;
            }

            const int ix = (std::min) (int (p.x * w), w - 1);
            const int iy = (std::min) (int (p.y * h), h - 1);

            if (image.is_set (ix, iy)) {
                row [x - area.x0] = 255;
            }
        }
    }

    return mask;
}

void
draw_device_t::clip_image_mask (
    const image_t& image, const matrix_t& ctm, const rect_t& scissor) {
    if (auto p = recorder ()) {
        p->clip_image_mask (image, ctm, scissor);
        return;
    }

    push_clip (scissor, image_mask (image, ctm, clips_.back ().rect ()));
}

//----- clip stack

void
draw_device_t::pop_clip () {
    if (auto p = recorder ()) {
        p->pop_clip ();
        return;
    }

    if (clips_.size () < 2) {
        error (errInternal, "pop_clip without a matching clip");
        return;
    }

    clips_.pop_back ();
}

//----- soft masks

void
draw_device_t::begin_mask (
    const rect_t& area, bool luminosity, const colorspace_t& cs,
    const std::vector< double >& color) {
    if (auto p = recorder ()) {
        p->begin_mask (area, luminosity, cs, color);
        return;
    }

    auto state = std::make_unique< mask_state_t > ();

    state->pixmap = std::make_unique< pixmap_t > (
        colorspace_t::device_gray (), dest_.width (), dest_.height (), true);

    state->previous = target_;
    state->area = area;
    state->luminosity = luminosity;

    auto& pixmap = *state->pixmap;
    pixmap.clear (0);

    if (luminosity) {
        //
        // The backdrop is the luminosity of the backdrop color, everywhere:
        //
        const auto backdrop = convert_color (
            cs, color, pixmap.colorspace (), true, 1.);

        auto& samples = pixmap.samples ();

        for (size_t i = 0; i < samples.size (); i += 2) {
            samples [i] = backdrop [0];
            samples [i + 1] = backdrop [1];
        }
    }

    target_ = state->pixmap.get ();
    masks_.push_back (std::move (state));
}

void
draw_device_t::end_mask () {
    if (auto p = recorder ()) {
        p->end_mask ();
        return;
    }

    if (masks_.empty ()) {
        error (errInternal, "end_mask without a matching begin_mask");
        return;
    }

    auto state = std::move (masks_.back ());
    masks_.pop_back ();

    target_ = state->previous;

    const auto rect = intersect (
        round_out (state->area), clips_.back ().rect ());

    mask_t mask (rect);

    // Gray and alpha are interleaved
    const int channel = state->luminosity ? 0 : 1;

    for (int y = rect.y0; y < rect.y1; ++y) {
        const auto src = state->pixmap->row (y);
        auto dst = mask.row (y);

        for (int x = rect.x0; x < rect.x1; ++x) {
            dst [x - rect.x0] = src [x * 2 + channel];
        }
    }

    push_clip (rect_t::infinite (), std::move (mask));
}

//----- transparency groups

void
draw_device_t::begin_group (
    const rect_t& area, const std::optional< colorspace_t >& cs,
    bool isolated, bool knockout, blend_mode_t blend_mode, double alpha) {
    if (auto p = recorder ()) {
        p->begin_group (area, cs, isolated, knockout, blend_mode, alpha);
        return;
    }

    auto state = std::make_unique< group_state_t > ();

    //
    // The group starts out as a copy of the backdrop, isolated or not; the
    // pixels it changes are composited back at the end:
    //
    state->pixmap = std::make_unique< pixmap_t > (*target_);
    state->previous = target_;
    state->area = area;
    state->blend_mode = blend_mode;
    state->alpha = alpha;

    target_ = state->pixmap.get ();
    groups_.push_back (std::move (state));
}

void
draw_device_t::end_group () {
    if (auto p = recorder ()) {
        p->end_group ();
        return;
    }

    if (groups_.empty ()) {
        error (errInternal, "end_group without a matching begin_group");
        return;
    }

    auto state = std::move (groups_.back ());
    groups_.pop_back ();

    target_ = state->previous;

    const auto rect = intersect (
        round_out (state->area), clips_.back ().rect ());

    const int n = target_->n ();
    const unsigned char coverage = to_byte (state->alpha);

    if (0 == coverage) {
        return;
    }

    std::vector< unsigned char > blended (n);

    for (int y = rect.y0; y < rect.y1; ++y) {
        auto src = state->pixmap->row (y) + size_t (rect.x0) * n;
        auto dst = target_->row (y) + size_t (rect.x0) * n;

        for (int x = rect.x0; x < rect.x1; ++x, src += n, dst += n) {
            if (std::equal (src, src + n, dst)) {
                continue;
            }

            blend_ (state->blend_mode, src, dst, blended.data (), n);
            composite (*target_, y, x, x + 1, &coverage, blended);
        }
    }
}

//----- tiling patterns

int
draw_device_t::begin_tile (
    const rect_t& area, const rect_t& view, double xstep, double ystep,
    const matrix_t& ctm) {
    if (auto p = recorder ()) {
        ++tiles_.back ()->nested;
        return p->begin_tile (area, view, xstep, ystep, ctm);
    }

    auto state = std::make_unique< tile_state_t > ();

    state->area = area;
    state->view = view;
    state->xstep = std::fabs (xstep);
    state->ystep = std::fabs (ystep);
    state->ctm = ctm;

    tiles_.push_back (std::move (state));

    return 0;
}

void
draw_device_t::end_tile () {
    if (tiles_.empty ()) {
        error (errInternal, "end_tile without a matching begin_tile");
        return;
    }

    auto& top = *tiles_.back ();

    if (top.nested) {
        --top.nested;
        top.recorder.end_tile ();
        return;
    }

    auto state = std::move (tiles_.back ());
    tiles_.pop_back ();

    replay_tile (*state);
}

void
draw_device_t::replay_tile (const tile_state_t& tile) {
    const auto& list = tile.recorder.display_list ();

    const auto inv = tile.ctm.invert ();

    if (list.empty () || !inv) {
        return;
    }

    const auto clip_rect = clips_.back ().rect ();

    //
    // Only the part of the pattern area that lands inside the clip:
    //
    const auto area = intersect (tile.area, transform (to_rect (clip_rect), *inv));

    if (area.is_empty ()) {
        return;
    }

    const auto [x0, x1] = cell_range (
        area.x0, area.x1, tile.view.x0, tile.view.x1, tile.xstep);

    const auto [y0, y1] = cell_range (
        area.y0, area.y1, tile.view.y0, tile.view.y1, tile.ystep);

    const int max_count = rasterizer_.params ().max_tile_count;

    int count = 0;

    for (int j = y0; j <= y1; ++j) {
        for (int i = x0; i <= x1; ++i) {
            const double tx = i * tile.xstep, ty = j * tile.ystep;

            const rect_t cell{
                tile.view.x0 + tx, tile.view.y0 + ty,
                tile.view.x1 + tx, tile.view.y1 + ty
            };

            if (intersect (cell, area).is_empty ()) {
                continue;
            }

            if (count++ >= max_count) {
                error (
                    errSyntaxWarning,
                    "tiling pattern exceeds {} cells, remainder skipped",
                    max_count);
                return;
            }

            list.run (
                *this,
                inv->concat (matrix_t::translate (tx, ty)).concat (tile.ctm));
        }
    }
}

void
draw_device_t::close () {
    if (!tiles_.empty () || !masks_.empty () || !groups_.empty () ||
        clips_.size () > 1) {
        error (
            errInternal,
            "unbalanced drawing at close: {} clips, {} masks, {} groups, "
            "{} tiles open",
            clip_depth (), masks_.size (), groups_.size (), tiles_.size ());
    }

    tiles_.clear ();
    masks_.clear ();
    groups_.clear ();

    clips_.erase (clips_.begin () + 1, clips_.end ());

    target_ = &dest_;
}

} // namespace vellum::raster
