// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <algorithm>
#include <cstring>
#include <utility>

#include <raster/clip.hh>
#include <raster/math.hh>

namespace vellum::raster {

mask_t::mask_t (const irect_t& rect)
    : rect_ (rect) {
    if (rect_.is_empty ()) {
        rect_ = { 0, 0, 0, 0 };
    }

    data_.resize (size_t (rect_.width ()) * rect_.height ());
}

unsigned char
mask_t::at (int x, int y) const {
    if (x < rect_.x0 || x >= rect_.x1 || y < rect_.y0 || y >= rect_.y1) {
        return 0;
    }

    return row (y) [x - rect_.x0];
}

////////////////////////////////////////////////////////////////////////

clip_t::clip_t (const irect_t& rect)
    : rect_ (rect)
{ }

void
clip_t::clip_to_rect (const irect_t& rect) {
    rect_ = intersect (rect_, rect);
}

void
clip_t::clip_to_mask (mask_pointer mask) {
    VELLUM_ASSERT (mask);

    rect_ = intersect (rect_, mask->rect ());
    masks_.push_back (std::move (mask));
}

clip_result_t
clip_t::test_rect (const irect_t& rect) const {
    const auto overlap = intersect (rect_, rect);

    if (overlap.is_empty ()) {
        return clip_result_t::all_outside;
    }

    if (overlap == rect && masks_.empty ()) {
        return clip_result_t::all_inside;
    }

    return clip_result_t::partial;
}

bool
clip_t::test (int x, int y) const {
    if (x < rect_.x0 || x >= rect_.x1 || y < rect_.y0 || y >= rect_.y1) {
        return false;
    }

    for (const auto& mask : masks_) {
        if (0 == mask->at (x, y)) {
            return false;
        }
    }

    return true;
}

bool
clip_t::clip_span (unsigned char* line, int y, int x0, int x1) const {
    VELLUM_ASSERT (x0 <= x1);

    if (y < rect_.y0 || y >= rect_.y1) {
        std::memset (line, 0, size_t (x1 - x0));
        return false;
    }

    //
    // Zero the parts of the span outside of the rectangle:
    //
    const int xa = std::clamp (rect_.x0, x0, x1);
    const int xb = std::clamp (rect_.x1, x0, x1);

    std::memset (line, 0, size_t (xa - x0));
    std::memset (line + (xb - x0), 0, size_t (x1 - xb));

    for (const auto& mask : masks_) {
        const auto src = mask->row (y);
        const int x_origin = mask->rect ().x0;

        for (int x = xa; x < xb; ++x) {
            auto& dst = line [x - x0];

            if (dst) {
                dst = mul255 (dst, src [x - x_origin]);
            }
        }
    }

    return std::any_of (line + (xa - x0), line + (xb - x0), [](auto c) {
        return c != 0;
    });
}

} // namespace vellum::raster
