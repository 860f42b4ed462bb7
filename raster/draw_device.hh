// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_DRAW_DEVICE_HH
#define VELLUM_RASTER_DRAW_DEVICE_HH

#include <defs.hh>

#include <functional>
#include <memory>
#include <vector>

#include <boost/noncopyable.hpp>

#include <vellum/device.hh>
#include <vellum/display_list.hh>
#include <vellum/params.hh>
#include <vellum/pixmap.hh>

#include <raster/clip.hh>
#include <raster/rasterizer.hh>

namespace vellum::raster {

//
// Computes the blended color of a source and a backdrop pixel, `n' bytes
// each, into `result'. Compositing with the group alpha happens afterwards.
//
using blend_function_t = std::function<
    void (blend_mode_t, const unsigned char* src, const unsigned char* backdrop,
          unsigned char* result, int n) >;

//
// Plain source-over: the source pixel replaces the backdrop.
//
void normal_blend (
    blend_mode_t, const unsigned char*, const unsigned char*, unsigned char*,
    int);

//
// Device painting into a pixmap. Clips form a stack of levels, each one the
// previous level intersected with the clip geometry. Soft masks and
// transparency groups are rendered into offscreen buffers the size of the
// destination; tiles are recorded and replayed once per pattern cell.
//
struct draw_device_t : device_t, boost::noncopyable {
    explicit draw_device_t (pixmap_t&, const params_t& = global_params ());
    ~draw_device_t ();

    rasterizer_t& rasterizer () { return rasterizer_; }
    const rasterizer_t& rasterizer () const { return rasterizer_; }

    const pixmap_t& pixmap () const { return dest_; }

    void set_blend_function (blend_function_t f) { blend_ = std::move (f); }

    //
    // Current clip region and the number of levels pushed on top of the
    // destination bounds:
    //
    const clip_t& clip () const { return clips_.back (); }
    size_t clip_depth () const { return clips_.size () - 1; }

    void fill_path (
        const path_t&, bool, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void clip_path (
        const path_t&, bool, const matrix_t&, const rect_t&) override;

    void clip_stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const rect_t&) override;

    void fill_text (
        const text_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void clip_text (const text_t&, const matrix_t&, const rect_t&) override;

    void clip_stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t&,
        const rect_t&) override;

    void ignore_text (const text_t&, const matrix_t&) override;

    void fill_image (const image_t&, const matrix_t&, double) override;

    void fill_image_mask (
        const image_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void clip_image_mask (
        const image_t&, const matrix_t&, const rect_t&) override;

    void pop_clip () override;

    void begin_mask (
        const rect_t&, bool, const colorspace_t&,
        const std::vector< double >&) override;

    void end_mask () override;

    void begin_group (
        const rect_t&, const std::optional< colorspace_t >&, bool, bool,
        blend_mode_t, double) override;

    void end_group () override;

    int begin_tile (
        const rect_t&, const rect_t&, double, double,
        const matrix_t&) override;

    void end_tile () override;

    void close () override;

private:
    struct mask_state_t;
    struct group_state_t;
    struct tile_state_t;

    //
    // The recorder of the innermost open tile, if any; while a tile is open
    // calls are recorded instead of drawn:
    //
    list_device_t* recorder ();

    void push_clip (const rect_t& scissor, mask_t);

    //
    // Calls f (x, y, ix, iy, coverage) for every pixel whose center maps
    // into the unit square through the inverse of `ctm', with (ix, iy) the
    // nearest image sample:
    //
    template< typename F >
    void for_each_image_pixel (const image_t&, const matrix_t&, F) const;

    mask_t image_mask (const image_t&, const matrix_t&, const irect_t&) const;

    void replay_tile (const tile_state_t&);

private:
    pixmap_t& dest_;
    pixmap_t* target_;

    rasterizer_t rasterizer_;
    blend_function_t blend_;

    std::vector< clip_t > clips_;

    std::vector< std::unique_ptr< mask_state_t > > masks_;
    std::vector< std::unique_ptr< group_state_t > > groups_;
    std::vector< std::unique_ptr< tile_state_t > > tiles_;
};

} // namespace vellum::raster

#endif // VELLUM_RASTER_DRAW_DEVICE_HH
