// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>

#include <vellum/colorspace.hh>

namespace vellum {

size_t
colorspace_t::n () const {
    switch (type_) {
    case color_type_t::gray: return 1;
    case color_type_t::rgb:  return 3;
    case color_type_t::cmyk: return 4;
    }

    return 3;
}

const char*
colorspace_t::name () const {
    switch (type_) {
    case color_type_t::gray: return "DeviceGray";
    case color_type_t::rgb:  return "DeviceRGB";
    case color_type_t::cmyk: return "DeviceCMYK";
    }

    return "DeviceRGB";
}

rgb_t
colorspace_t::to_rgb (const std::vector< double >& color) const {
    if (color.size () != n ()) {
        return { 0, 0, 0 };
    }

    switch (type_) {
    case color_type_t::gray:
        return { color [0], color [0], color [0] };

    case color_type_t::rgb:
        return { color [0], color [1], color [2] };

    case color_type_t::cmyk: {
        const auto& [ c, m, y, k ] = std::array< double, 4 >{
            color [0], color [1], color [2], color [3] };

        return { (1 - c) * (1 - k), (1 - m) * (1 - k), (1 - y) * (1 - k) };
    }
    }

    return { 0, 0, 0 };
}

std::vector< double >
colorspace_t::from_rgb (const rgb_t& rgb) const {
    const auto& [ r, g, b ] = rgb;

    switch (type_) {
    case color_type_t::gray:
        return { 0.299 * r + 0.587 * g + 0.114 * b };

    case color_type_t::rgb:
        return { r, g, b };

    case color_type_t::cmyk: {
        const auto k = 1 - (std::max) ({ r, g, b });

        if (k >= 1) {
            return { 0, 0, 0, 1 };
        }

        return {
            (1 - r - k) / (1 - k), (1 - g - k) / (1 - k), (1 - b - k) / (1 - k),
            k
        };
    }
    }

    return { r, g, b };
}

} // namespace vellum
