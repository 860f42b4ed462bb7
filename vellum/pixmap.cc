// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>

#include <vellum/error.hh>
#include <vellum/pixmap.hh>

#include <fmt/format.h>
using fmt::format;

namespace vellum {

pixmap_t::pixmap_t (const colorspace_t& cs, int width, int height, bool alpha)
    : colorspace_ (cs), width_ (width), height_ (height), alpha_ (alpha) {
    if (width <= 0 || height <= 0) {
        throw argument_error (
            format ("invalid pixmap dimensions {}x{}", width, height));
    }

    samples_.resize (size_t (width) * height * n ());
}

std::vector< unsigned char >
pixmap_t::pixel (int x, int y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        return { };
    }

    const auto p = row (y) + size_t (x) * n ();
    return { p, p + n () };
}

void
pixmap_t::clear (unsigned char value) {
    std::fill (samples_.begin (), samples_.end (), value);
}

void
pixmap_t::write_pnm (std::ostream& out) const {
    const bool gray = colorspace_.type () == color_type_t::gray;

    out << (gray ? "P5" : "P6") << "\n"
        << width_ << " " << height_ << "\n255\n";

    const size_t cn = colorspace_.n ();

    for (int y = 0; y < height_; ++y) {
        auto p = row (y);

        for (int x = 0; x < width_; ++x, p += n ()) {
            switch (colorspace_.type ()) {
            case color_type_t::gray:
            case color_type_t::rgb:
                out.write (reinterpret_cast< const char* > (p), cn);
                break;

            case color_type_t::cmyk: {
                std::vector< double > color (p, p + cn);

                for (auto& c : color) {
                    c /= 255;
                }

                for (auto c : colorspace_.to_rgb (color)) {
                    out.put (char (static_cast< unsigned char > (
                        std::clamp (c, 0.0, 1.0) * 255 + 0.5)));
                }
            }
                break;
            }
        }
    }
}

} // namespace vellum
