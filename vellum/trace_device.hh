// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_TRACE_DEVICE_HH
#define VELLUM_VELLUM_TRACE_DEVICE_HH

#include <defs.hh>

#include <iostream>
#include <string>

#include <vellum/device.hh>

namespace vellum {

//
// Writes one line per call, indented two spaces per open clip, mask, group
// or tile.
//
struct trace_device_t : device_t {
    explicit trace_device_t (std::ostream& out = std::cout)
        : out_ (out)
    { }

    int depth () const { return depth_; }

    void fill_path (
        const path_t&, bool, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void clip_path (
        const path_t&, bool, const matrix_t&, const rect_t&) override;

    void clip_stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const rect_t&) override;

    void fill_text (
        const text_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void clip_text (const text_t&, const matrix_t&, const rect_t&) override;

    void clip_stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t&,
        const rect_t&) override;

    void ignore_text (const text_t&, const matrix_t&) override;

    void fill_image (const image_t&, const matrix_t&, double) override;

    void fill_image_mask (
        const image_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void clip_image_mask (
        const image_t&, const matrix_t&, const rect_t&) override;

    void pop_clip () override;

    void begin_mask (
        const rect_t&, bool, const colorspace_t&,
        const std::vector< double >&) override;

    void end_mask () override;

    void begin_group (
        const rect_t&, const std::optional< colorspace_t >&, bool, bool,
        blend_mode_t, double) override;

    void end_group () override;

    int begin_tile (
        const rect_t&, const rect_t&, double, double,
        const matrix_t&) override;

    void end_tile () override;

    void close () override;

private:
    void write (const std::string&);

    void push (const std::string& s) { write (s); ++depth_; }
    void pop (const std::string&);

private:
    std::ostream& out_;
    int depth_ = 0;
};

} // namespace vellum

#endif // VELLUM_VELLUM_TRACE_DEVICE_HH
