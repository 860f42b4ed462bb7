// -*- mode: c++; -*-
// Copyright 2005 Glyph & Cog, LLC

#ifndef VELLUM_VELLUM_DEVICE_HH
#define VELLUM_VELLUM_DEVICE_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <vellum/colorspace.hh>
#include <vellum/geometry.hh>
#include <vellum/image.hh>
#include <vellum/path.hh>
#include <vellum/text.hh>

namespace vellum {

enum struct blend_mode_t {
    normal,
    multiply,
    screen,
    overlay,
    darken,
    lighten,
    color_dodge,
    color_burn,
    hard_light,
    soft_light,
    difference,
    exclusion,
    hue,
    saturation,
    color,
    luminosity
};

const char* name_of (blend_mode_t);

//
// Accepts the PDF names, e.g. "Multiply", "ColorDodge":
//
std::optional< blend_mode_t > blend_mode_from_name (const std::string&);

//
// Drawing backend. Every operation takes its geometry by reference; a device
// that keeps the geometry past the call makes its own copy.
//
// Clip operations push one clip level each, removed by a matching pop_clip.
// Masks, groups and tiles come in balanced begin/end pairs.
//
struct device_t {
    virtual ~device_t () = default;

    //----- paths

    virtual void fill_path (
        const path_t&, bool even_odd, const matrix_t& ctm,
        const colorspace_t&, const std::vector< double >& color,
        double alpha) = 0;

    virtual void stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t& ctm,
        const colorspace_t&, const std::vector< double >& color,
        double alpha) = 0;

    virtual void clip_path (
        const path_t&, bool even_odd, const matrix_t& ctm,
        const rect_t& scissor) = 0;

    virtual void clip_stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t& ctm,
        const rect_t& scissor) = 0;

    //----- text

    virtual void fill_text (
        const text_t&, const matrix_t& ctm, const colorspace_t&,
        const std::vector< double >& color, double alpha) = 0;

    virtual void stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t& ctm,
        const colorspace_t&, const std::vector< double >& color,
        double alpha) = 0;

    virtual void clip_text (
        const text_t&, const matrix_t& ctm, const rect_t& scissor) = 0;

    virtual void clip_stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t& ctm,
        const rect_t& scissor) = 0;

    // Invisible text, e.g. rendering mode 3
    virtual void ignore_text (const text_t&, const matrix_t& ctm) = 0;

    //----- images

    // Image space is the unit square, mapped to the page by `ctm'
    virtual void fill_image (
        const image_t&, const matrix_t& ctm, double alpha) = 0;

    virtual void fill_image_mask (
        const image_t&, const matrix_t& ctm, const colorspace_t&,
        const std::vector< double >& color, double alpha) = 0;

    virtual void clip_image_mask (
        const image_t&, const matrix_t& ctm, const rect_t& scissor) = 0;

    //----- clip stack

    virtual void pop_clip () = 0;

    //----- soft masks and transparency groups

    virtual void begin_mask (
        const rect_t& area, bool luminosity, const colorspace_t&,
        const std::vector< double >& color) = 0;

    virtual void end_mask () = 0;

    virtual void begin_group (
        const rect_t& area, const std::optional< colorspace_t >&,
        bool isolated, bool knockout, blend_mode_t, double alpha) = 0;

    virtual void end_group () = 0;

    //----- tiling patterns

    //
    // Returns 0 when the tile content follows and must be drawn, non-zero
    // when the device already has it; either way end_tile closes the tile.
    //
    virtual int begin_tile (
        const rect_t& area, const rect_t& view, double xstep, double ystep,
        const matrix_t& ctm) = 0;

    virtual void end_tile () = 0;

    // End of drawing
    virtual void close () { }
};

} // namespace vellum

#endif // VELLUM_VELLUM_DEVICE_HH
