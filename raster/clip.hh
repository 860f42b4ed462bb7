// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_CLIP_HH
#define VELLUM_RASTER_CLIP_HH

#include <defs.hh>

#include <memory>
#include <vector>

#include <vellum/geometry.hh>

namespace vellum::raster {

//
// Coverage values, one byte per pixel, over a pixel rectangle; pixels
// outside of the rectangle have no coverage:
//
struct mask_t {
    explicit mask_t (const irect_t&);

    const irect_t& rect () const { return rect_; }

    unsigned char at (int x, int y) const;

    //
    // Scan line `y', indexed from rect ().x0:
    //
    unsigned char* row (int y) {
        return data_.data () + size_t (y - rect_.y0) * rect_.width ();
    }

    const unsigned char* row (int y) const {
        return data_.data () + size_t (y - rect_.y0) * rect_.width ();
    }

    bool empty () const { return rect_.is_empty (); }

private:
    irect_t rect_;
    std::vector< unsigned char > data_;
};

using mask_pointer = std::shared_ptr< const mask_t >;

enum struct clip_result_t {
    all_inside, all_outside, partial
};

//
// Clip region: a pixel rectangle intersected with any number of masks.
// Copies share the masks.
//
struct clip_t {
    explicit clip_t (const irect_t&);

    const irect_t& rect () const { return rect_; }

    bool is_empty () const { return rect_.is_empty (); }

    size_t mask_count () const { return masks_.size (); }

    //
    // Intersect the clip with a rectangle:
    //
    void clip_to_rect (const irect_t&);

    //
    // Intersect the clip with a mask:
    //
    void clip_to_mask (mask_pointer);

    clip_result_t test_rect (const irect_t&) const;

    bool test (int x, int y) const;

    //
    // Multiplies coverage [x0, x1) of scan line `y' by the clip values;
    // `line' is indexed from x0. Returns false if nothing survives.
    //
    bool clip_span (unsigned char* line, int y, int x0, int x1) const;

private:
    irect_t rect_;
    std::vector< mask_pointer > masks_;
};

} // namespace vellum::raster

#endif // VELLUM_RASTER_CLIP_HH
