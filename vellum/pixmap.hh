// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_PIXMAP_HH
#define VELLUM_VELLUM_PIXMAP_HH

#include <defs.hh>

#include <iostream>
#include <vector>

#include <vellum/colorspace.hh>
#include <vellum/geometry.hh>

namespace vellum {

//
// Top-down, tightly packed pixel buffer with `n' bytes per pixel: the
// colorspace components followed by an optional alpha byte.
//
struct pixmap_t {
    pixmap_t (const colorspace_t&, int width, int height, bool alpha);

    int width () const { return width_; }
    int height () const { return height_; }

    const colorspace_t& colorspace () const { return colorspace_; }

    bool has_alpha () const { return alpha_; }

    int n () const { return int (colorspace_.n ()) + (alpha_ ? 1 : 0); }
    int stride () const { return width_ * n (); }

    irect_t bounds () const { return { 0, 0, width_, height_ }; }

    std::vector< unsigned char >& samples () { return samples_; }
    const std::vector< unsigned char >& samples () const { return samples_; }

    unsigned char* row (int y) {
        return samples_.data () + size_t (y) * stride ();
    }

    const unsigned char* row (int y) const {
        return samples_.data () + size_t (y) * stride ();
    }

    //
    // Copy of the `n' bytes of pixel (x, y); empty if out of bounds:
    //
    std::vector< unsigned char > pixel (int x, int y) const;

    void clear (unsigned char value = 0);

    //
    // Binary PPM (gray pixmaps as PGM); alpha is dropped, CMYK goes
    // through RGB:
    //
    void write_pnm (std::ostream&) const;

private:
    colorspace_t colorspace_;
    int width_, height_;
    bool alpha_;

    std::vector< unsigned char > samples_;
};

} // namespace vellum

#endif // VELLUM_VELLUM_PIXMAP_HH
