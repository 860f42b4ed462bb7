// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_RASTERIZER_HH
#define VELLUM_RASTER_RASTERIZER_HH

#include <defs.hh>

#include <functional>
#include <vector>

#include <vellum/colorspace.hh>
#include <vellum/geometry.hh>
#include <vellum/params.hh>
#include <vellum/path.hh>
#include <vellum/pixmap.hh>

#include <raster/clip.hh>

namespace vellum::raster {

//
// Pixel value of `color' in the destination colorspace, via RGB, with the
// alpha byte appended when the destination has an alpha channel. A color
// with the wrong number of components converts to black.
//
std::vector< unsigned char > convert_color (
    const colorspace_t& src, const std::vector< double >& color,
    const colorspace_t& dst, bool alpha_channel, double alpha);

//
// Writes `pixel' into [x0, x1) of scan line `y'. Full coverage stores the
// pixel as is, partial coverage interpolates between the old value and the
// pixel; `coverage' is indexed from x0.
//
void composite (
    pixmap_t&, int y, int x0, int x1, const unsigned char* coverage,
    const std::vector< unsigned char >& pixel);

//
// Scan line rasterizer. Paths are transformed to device space, flattened,
// turned into an edge list and scan converted with the non-zero or the
// even-odd rule. Without anti-aliasing (the default) a pixel is either
// painted or untouched; with a supersampling factor s each pixel is sampled
// on an s x s grid and painted in proportion to its coverage.
//
// The painted region is the intersection of the rasterizer's clip
// rectangle, the destination bounds and the optional clip region passed to
// each call.
//
struct rasterizer_t {
    explicit rasterizer_t (const params_t& = global_params ());

    const params_t& params () const { return params_; }

    int aa_level () const { return params_.aa_level; }
    void set_aa_level (int);

    const rect_t& clip () const { return clip_; }
    void set_clip (const rect_t& clip) { clip_ = clip; }

    void fill_path (
        const path_t&, bool even_odd, const matrix_t&, const colorspace_t&,
        const std::vector< double >& color, double alpha, pixmap_t& dest,
        const clip_t* = 0) const;

    void stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >& color, double alpha,
        pixmap_t& dest, const clip_t* = 0) const;

    //
    // Coverage of the filled, or stroked, path over `area', subject to the
    // rasterizer clip rectangle:
    //
    mask_t fill_mask (
        const path_t&, bool even_odd, const matrix_t&, const irect_t& area) const;

    mask_t stroke_mask (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const irect_t& area) const;

    //
    // Destination area a call would paint into:
    //
    irect_t area_of (const pixmap_t&, const clip_t* = 0) const;

private:
    using row_function_t = std::function<
        void (int y, int x0, int x1, unsigned char* coverage) >;

    void rasterize (
        const path_t&, bool even_odd, const irect_t& area,
        const row_function_t&) const;

private:
    params_t params_;
    rect_t clip_;
};

} // namespace vellum::raster

#endif // VELLUM_RASTER_RASTERIZER_HH
