// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <vellum/display_list.hh>
#include <utils/overload.hh>

namespace vellum {

void
display_list_t::run (
    device_t& dev, const matrix_t& ctm, const rect_t& scissor) const {
    for (const auto& cmd : commands_) {
        std::visit (overload_{
                [&](const fill_path_cmd_t& x) {
                    dev.fill_path (
                        x.path, x.even_odd, x.ctm.concat (ctm), x.cs, x.color,
                        x.alpha);
                },
                [&](const stroke_path_cmd_t& x) {
                    dev.stroke_path (
                        x.path, x.stroke, x.ctm.concat (ctm), x.cs, x.color,
                        x.alpha);
                },
                [&](const clip_path_cmd_t& x) {
                    dev.clip_path (
                        x.path, x.even_odd, x.ctm.concat (ctm),
                        intersect (scissor, x.scissor));
                },
                [&](const clip_stroke_path_cmd_t& x) {
                    dev.clip_stroke_path (
                        x.path, x.stroke, x.ctm.concat (ctm),
                        intersect (scissor, x.scissor));
                },
                [&](const fill_text_cmd_t& x) {
                    dev.fill_text (
                        x.text, x.ctm.concat (ctm), x.cs, x.color, x.alpha);
                },
                [&](const stroke_text_cmd_t& x) {
                    dev.stroke_text (
                        x.text, x.stroke, x.ctm.concat (ctm), x.cs, x.color,
                        x.alpha);
                },
                [&](const clip_text_cmd_t& x) {
                    dev.clip_text (
                        x.text, x.ctm.concat (ctm),
                        intersect (scissor, x.scissor));
                },
                [&](const clip_stroke_text_cmd_t& x) {
                    dev.clip_stroke_text (
                        x.text, x.stroke, x.ctm.concat (ctm),
                        intersect (scissor, x.scissor));
                },
                [&](const ignore_text_cmd_t& x) {
                    dev.ignore_text (x.text, x.ctm.concat (ctm));
                },
                [&](const fill_image_cmd_t& x) {
                    dev.fill_image (x.image, x.ctm.concat (ctm), x.alpha);
                },
                [&](const fill_image_mask_cmd_t& x) {
                    dev.fill_image_mask (
                        x.image, x.ctm.concat (ctm), x.cs, x.color, x.alpha);
                },
                [&](const clip_image_mask_cmd_t& x) {
                    dev.clip_image_mask (
                        x.image, x.ctm.concat (ctm),
                        intersect (scissor, x.scissor));
                },
                [&](const pop_clip_cmd_t&) { dev.pop_clip (); },
                [&](const begin_mask_cmd_t& x) {
                    dev.begin_mask (
                        transform (x.area, ctm), x.luminosity, x.cs, x.color);
                },
                [&](const end_mask_cmd_t&) { dev.end_mask (); },
                [&](const begin_group_cmd_t& x) {
                    dev.begin_group (
                        transform (x.area, ctm), x.cs, x.isolated, x.knockout,
                        x.blend_mode, x.alpha);
                },
                [&](const end_group_cmd_t&) { dev.end_group (); },
                [&](const begin_tile_cmd_t& x) {
                    dev.begin_tile (
                        x.area, x.view, x.xstep, x.ystep, x.ctm.concat (ctm));
                },
                [&](const end_tile_cmd_t&) { dev.end_tile (); }
            }, cmd);
    }
}

////////////////////////////////////////////////////////////////////////

void
list_device_t::fill_path (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    list_.append (fill_path_cmd_t{ path, even_odd, ctm, cs, color, alpha });
}

void
list_device_t::stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    list_.append (stroke_path_cmd_t{ path, stroke, ctm, cs, color, alpha });
}

void
list_device_t::clip_path (
    const path_t& path, bool even_odd, const matrix_t& ctm,
    const rect_t& scissor) {
    list_.append (clip_path_cmd_t{ path, even_odd, ctm, scissor });
}

void
list_device_t::clip_stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const rect_t& scissor) {
    list_.append (clip_stroke_path_cmd_t{ path, stroke, ctm, scissor });
}

void
list_device_t::fill_text (
    const text_t& text, const matrix_t& ctm, const colorspace_t& cs,
    const std::vector< double >& color, double alpha) {
    list_.append (fill_text_cmd_t{ text, ctm, cs, color, alpha });
}

void
list_device_t::stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t& cs, const std::vector< double >& color, double alpha) {
    list_.append (stroke_text_cmd_t{ text, stroke, ctm, cs, color, alpha });
}

void
list_device_t::clip_text (
    const text_t& text, const matrix_t& ctm, const rect_t& scissor) {
    list_.append (clip_text_cmd_t{ text, ctm, scissor });
}

void
list_device_t::clip_stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t& ctm,
    const rect_t& scissor) {
    list_.append (clip_stroke_text_cmd_t{ text, stroke, ctm, scissor });
}

void
list_device_t::ignore_text (const text_t& text, const matrix_t& ctm) {
    list_.append (ignore_text_cmd_t{ text, ctm });
}

void
list_device_t::fill_image (
    const image_t& image, const matrix_t& ctm, double alpha) {
    list_.append (fill_image_cmd_t{ image, ctm, alpha });
}

void
list_device_t::fill_image_mask (
    const image_t& image, const matrix_t& ctm, const colorspace_t& cs,
    const std::vector< double >& color, double alpha) {
    list_.append (fill_image_mask_cmd_t{ image, ctm, cs, color, alpha });
}

void
list_device_t::clip_image_mask (
    const image_t& image, const matrix_t& ctm, const rect_t& scissor) {
    list_.append (clip_image_mask_cmd_t{ image, ctm, scissor });
}

void
list_device_t::pop_clip () {
    list_.append (pop_clip_cmd_t{ });
}

void
list_device_t::begin_mask (
    const rect_t& area, bool luminosity, const colorspace_t& cs,
    const std::vector< double >& color) {
    list_.append (begin_mask_cmd_t{ area, luminosity, cs, color });
}

void
list_device_t::end_mask () {
    list_.append (end_mask_cmd_t{ });
}

void
list_device_t::begin_group (
    const rect_t& area, const std::optional< colorspace_t >& cs,
    bool isolated, bool knockout, blend_mode_t blend_mode, double alpha) {
    list_.append (begin_group_cmd_t{
            area, cs, isolated, knockout, blend_mode, alpha });
}

void
list_device_t::end_group () {
    list_.append (end_group_cmd_t{ });
}

int
list_device_t::begin_tile (
    const rect_t& area, const rect_t& view, double xstep, double ystep,
    const matrix_t& ctm) {
    list_.append (begin_tile_cmd_t{ area, view, xstep, ystep, ctm });
    return 0;
}

void
list_device_t::end_tile () {
    list_.append (end_tile_cmd_t{ });
}

} // namespace vellum
