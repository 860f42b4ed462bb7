// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <vellum/bbox_device.hh>

namespace vellum {

void
bbox_device_t::fill_path (
    const path_t& path, bool, const matrix_t& ctm, const colorspace_t&,
    const std::vector< double >&, double) {
    bounds_ += transform (path.bounds (), ctm);
}

void
bbox_device_t::stroke_path (
    const path_t& path, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t&, const std::vector< double >&, double) {
    bounds_ += transform (expand (path.bounds (), stroke.linewidth / 2), ctm);
}

void
bbox_device_t::fill_text (
    const text_t& text, const matrix_t& ctm, const colorspace_t&,
    const std::vector< double >&, double) {
    bounds_ += text.bounds (0, ctm);
}

void
bbox_device_t::stroke_text (
    const text_t& text, const stroke_state_t& stroke, const matrix_t& ctm,
    const colorspace_t&, const std::vector< double >&, double) {
    bounds_ += text.bounds (&stroke, ctm);
}

void
bbox_device_t::fill_image (const image_t&, const matrix_t& ctm, double) {
    bounds_ += transform (rect_t::unit (), ctm);
}

void
bbox_device_t::fill_image_mask (
    const image_t&, const matrix_t& ctm, const colorspace_t&,
    const std::vector< double >&, double) {
    bounds_ += transform (rect_t::unit (), ctm);
}

} // namespace vellum
