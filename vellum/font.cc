// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <vellum/font.hh>

namespace vellum {

int
font_t::glyph_index (char32_t c) const {
    return int (c);
}

double
font_t::advance (int gid) const {
    const auto iter = advances_.find (gid);
    return iter == advances_.end () ? default_advance_ : iter->second;
}

std::optional< path_t >
font_t::outline (int) const {
    return { };
}

} // namespace vellum
