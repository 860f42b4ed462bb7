// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_IMAGE_HH
#define VELLUM_VELLUM_IMAGE_HH

#include <defs.hh>

#include <optional>
#include <vector>

#include <vellum/colorspace.hh>

namespace vellum {

//
// Raw sample image. Rows start on byte boundaries and samples are packed
// most significant bit first. A stencil mask is a one-bit image without a
// colorspace where a set bit marks a painted pixel.
//
struct image_t {
    static image_t from_raw (
        int width, int height, int bpc, const colorspace_t&,
        std::vector< unsigned char > data);

    static image_t from_mask (
        int width, int height, std::vector< unsigned char > data);

    int width () const { return width_; }
    int height () const { return height_; }

    int bpc () const { return bpc_; }
    int n () const { return n_; }

    const std::optional< colorspace_t >& colorspace () const {
        return colorspace_;
    }

    bool is_mask () const { return !colorspace_; }

    const std::vector< unsigned char >& data () const { return data_; }

    size_t stride () const { return (size_t (width_) * n_ * bpc_ + 7) / 8; }

    int xres = 96, yres = 96;
    bool interpolate = false;

    //
    // Components of sample (x, y), each mapped to [0, 1]:
    //
    std::vector< double > sample (int x, int y) const;

    //
    // Whether the stencil paints at (x, y); for color images, whether the
    // first component is non-zero:
    //
    bool is_set (int x, int y) const;

private:
    image_t () = default;

    unsigned value_at (size_t row, size_t index) const;

private:
    int width_ = 0, height_ = 0, bpc_ = 8, n_ = 0;

    std::optional< colorspace_t > colorspace_;
    std::vector< unsigned char > data_;
};

bool operator== (const image_t&, const image_t&);

inline bool
operator!= (const image_t& lhs, const image_t& rhs) {
    return !(lhs == rhs);
}

} // namespace vellum

#endif // VELLUM_VELLUM_IMAGE_HH
