// -*- mode: c++; -*-
// Copyright 2005 Glyph & Cog, LLC

#include <defs.hh>

#include <vellum/device.hh>

namespace vellum {
namespace {

const char* blend_mode_names [] = {
    "Normal",
    "Multiply",
    "Screen",
    "Overlay",
    "Darken",
    "Lighten",
    "ColorDodge",
    "ColorBurn",
    "HardLight",
    "SoftLight",
    "Difference",
    "Exclusion",
    "Hue",
    "Saturation",
    "Color",
    "Luminosity"
};

constexpr int blend_mode_count =
    sizeof blend_mode_names / sizeof *blend_mode_names;

} // anonymous

const char*
name_of (blend_mode_t mode) {
    const int i = int (mode);
    return 0 <= i && i < blend_mode_count ? blend_mode_names [i] : "Normal";
}

std::optional< blend_mode_t >
blend_mode_from_name (const std::string& s) {
    for (int i = 0; i < blend_mode_count; ++i) {
        if (s == blend_mode_names [i]) {
            return blend_mode_t (i);
        }
    }

    return { };
}

} // namespace vellum
