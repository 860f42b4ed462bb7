// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <utility>

#include <vellum/error.hh>
#include <vellum/image.hh>

#include <fmt/format.h>
using fmt::format;

namespace vellum {
namespace {

void
check_dimensions (int width, int height) {
    if (width <= 0 || height <= 0) {
        throw argument_error (
            format ("invalid image dimensions {}x{}", width, height));
    }
}

void
check_size (size_t expected, size_t actual) {
    if (actual < expected) {
        throw argument_error (
            format ("insufficient image data: expected {} bytes, got {}",
                    expected, actual));
    }
}

} // anonymous

image_t
image_t::from_raw (
    int width, int height, int bpc, const colorspace_t& cs,
    std::vector< unsigned char > data) {
    check_dimensions (width, height);

    switch (bpc) {
    case 1: case 2: case 4: case 8: case 16:
        break;

    default:
        throw argument_error (format ("invalid bits per component {}", bpc));
    }

    image_t image;

    image.width_ = width;
    image.height_ = height;
    image.bpc_ = bpc;
    image.n_ = int (cs.n ());
    image.colorspace_ = cs;

    check_size (image.stride () * height, data.size ());
    image.data_ = std::move (data);

    return image;
}

image_t
image_t::from_mask (int width, int height, std::vector< unsigned char > data) {
    check_dimensions (width, height);

    image_t image;

    image.width_ = width;
    image.height_ = height;
    image.bpc_ = 1;
    image.n_ = 1;

    check_size (image.stride () * height, data.size ());
    image.data_ = std::move (data);

    return image;
}

unsigned
image_t::value_at (size_t row, size_t index) const {
    const auto p = data_.data () + row * stride ();

    switch (bpc_) {
    case 8:
        return p [index];

    case 16:
        return (unsigned (p [2 * index]) << 8) | p [2 * index + 1];

    default: {
        const size_t bit = index * bpc_;
        const unsigned shift = 8 - bpc_ - bit % 8;

        return (p [bit / 8] >> shift) & ((1U << bpc_) - 1);
    }
    }
}

std::vector< double >
image_t::sample (int x, int y) const {
    std::vector< double > xs;

    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return xs;
    }

    const double max = double ((1UL << bpc_) - 1);

    for (int i = 0; i < n_; ++i) {
        xs.push_back (value_at (y, size_t (x) * n_ + i) / max);
    }

    return xs;
}

bool
image_t::is_set (int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return false;
    }

    return value_at (y, size_t (x) * n_) != 0;
}

bool
operator== (const image_t& lhs, const image_t& rhs) {
    return lhs.width ()      == rhs.width ()      &&
           lhs.height ()     == rhs.height ()     &&
           lhs.bpc ()        == rhs.bpc ()        &&
           lhs.colorspace () == rhs.colorspace () &&
           lhs.xres          == rhs.xres          &&
           lhs.yres          == rhs.yres          &&
           lhs.interpolate   == rhs.interpolate   &&
           lhs.data ()       == rhs.data ();
}

} // namespace vellum
