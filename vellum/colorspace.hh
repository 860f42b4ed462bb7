// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_COLORSPACE_HH
#define VELLUM_VELLUM_COLORSPACE_HH

#include <defs.hh>

#include <array>
#include <string>
#include <vector>

namespace vellum {

enum struct color_type_t { gray, rgb, cmyk };

using rgb_t = std::array< double, 3 >;

//
// Device colorspace; conversions go through RGB and are not colorimetric:
//
struct colorspace_t {
    explicit colorspace_t (color_type_t type = color_type_t::rgb)
        : type_ (type)
    { }

    static colorspace_t device_gray () { return colorspace_t (color_type_t::gray); }
    static colorspace_t device_rgb  () { return colorspace_t (color_type_t::rgb); }
    static colorspace_t device_cmyk () { return colorspace_t (color_type_t::cmyk); }

    color_type_t type () const { return type_; }

    size_t n () const;
    const char* name () const;

    //
    // A color with the wrong number of components converts to black:
    //
    rgb_t to_rgb (const std::vector< double >&) const;

    std::vector< double > from_rgb (const rgb_t&) const;

private:
    color_type_t type_;
};

inline bool
operator== (const colorspace_t& lhs, const colorspace_t& rhs) {
    return lhs.type () == rhs.type ();
}

inline bool
operator!= (const colorspace_t& lhs, const colorspace_t& rhs) {
    return !(lhs == rhs);
}

} // namespace vellum

#endif // VELLUM_VELLUM_COLORSPACE_HH
