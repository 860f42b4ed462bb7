// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <vellum/trace_device.hh>

#include <fmt/format.h>
using fmt::format;

namespace vellum {
namespace {

std::string
text_summary (const char* name, const text_t& text) {
    return format (
        "{} {} spans {} items", name, text.span_count (), text.item_count ());
}

} // anonymous

void
trace_device_t::write (const std::string& s) {
    out_ << std::string (size_t (depth_) * 2, ' ') << s << '\n';
}

void
trace_device_t::pop (const std::string& s) {
    if (depth_ > 0) {
        --depth_;
    }

    write (s);
}

void
trace_device_t::fill_path (
    const path_t& path, bool even_odd, const matrix_t&, const colorspace_t&,
    const std::vector< double >&, double alpha) {
    write (format (
        "fill_path {} elements even_odd={} alpha={}",
        path.size (), even_odd, alpha));
}

void
trace_device_t::stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t&,
    const colorspace_t&, const std::vector< double >&, double alpha) {
    write (format (
        "stroke_path {} elements linewidth={} alpha={}",
        path.size (), stroke.linewidth, alpha));
}

void
trace_device_t::clip_path (
    const path_t& path, bool even_odd, const matrix_t&, const rect_t&) {
    push (format ("clip_path {} elements even_odd={}", path.size (), even_odd));
}

void
trace_device_t::clip_stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t&,
    const rect_t&) {
    push (format (
        "clip_stroke_path {} elements linewidth={}",
        path.size (), stroke.linewidth));
}

void
trace_device_t::fill_text (
    const text_t& text, const matrix_t&, const colorspace_t&,
    const std::vector< double >&, double alpha) {
    write (format ("{} alpha={}", text_summary ("fill_text", text), alpha));
}

void
trace_device_t::stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t&,
    const colorspace_t&, const std::vector< double >&, double alpha) {
    write (format (
        "{} linewidth={} alpha={}",
        text_summary ("stroke_text", text), stroke.linewidth, alpha));
}

void
trace_device_t::clip_text (const text_t& text, const matrix_t&, const rect_t&) {
    push (text_summary ("clip_text", text));
}

void
trace_device_t::clip_stroke_text (
    const text_t& text, const stroke_state_t&, const matrix_t&,
    const rect_t&) {
    push (text_summary ("clip_stroke_text", text));
}

void
trace_device_t::ignore_text (const text_t& text, const matrix_t&) {
    write (text_summary ("ignore_text", text));
}

void
trace_device_t::fill_image (
    const image_t& image, const matrix_t&, double alpha) {
    write (format (
        "fill_image {}x{} alpha={}", image.width (), image.height (), alpha));
}

void
trace_device_t::fill_image_mask (
    const image_t& image, const matrix_t&, const colorspace_t&,
    const std::vector< double >&, double alpha) {
    write (format (
        "fill_image_mask {}x{} alpha={}",
        image.width (), image.height (), alpha));
}

void
trace_device_t::clip_image_mask (
    const image_t& image, const matrix_t&, const rect_t&) {
    push (format ("clip_image_mask {}x{}", image.width (), image.height ()));
}

void
trace_device_t::pop_clip () {
    pop ("pop_clip");
}

void
trace_device_t::begin_mask (
    const rect_t&, bool luminosity, const colorspace_t& cs,
    const std::vector< double >&) {
    push (format (
        "begin_mask luminosity={} colorspace={}", luminosity, cs.name ()));
}

void
trace_device_t::end_mask () {
    pop ("end_mask");
}

void
trace_device_t::begin_group (
    const rect_t&, const std::optional< colorspace_t >&, bool isolated,
    bool knockout, blend_mode_t blend_mode, double alpha) {
    push (format (
        "begin_group blend={} isolated={} knockout={} alpha={}",
        name_of (blend_mode), isolated, knockout, alpha));
}

void
trace_device_t::end_group () {
    pop ("end_group");
}

int
trace_device_t::begin_tile (
    const rect_t&, const rect_t&, double xstep, double ystep,
    const matrix_t&) {
    push (format ("begin_tile xstep={} ystep={}", xstep, ystep));
    return 0;
}

void
trace_device_t::end_tile () {
    pop ("end_tile");
}

void
trace_device_t::close () {
    write ("close");
}

} // namespace vellum
