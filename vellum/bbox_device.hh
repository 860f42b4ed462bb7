// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_BBOX_DEVICE_HH
#define VELLUM_VELLUM_BBOX_DEVICE_HH

#include <defs.hh>

#include <vellum/null_device.hh>

namespace vellum {

//
// Accumulates the device space bounds of everything painted. Clips, masks
// and groups are ignored, the result is a superset of the painted area.
//
struct bbox_device_t : null_device_t {
    const rect_t& bounds () const { return bounds_; }

    void reset () { bounds_ = rect_t::empty (); }

    void fill_path (
        const path_t&, bool, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_path (
        const path_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void fill_text (
        const text_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

    void stroke_text (
        const text_t&, const stroke_state_t&, const matrix_t&,
        const colorspace_t&, const std::vector< double >&, double) override;

    void fill_image (const image_t&, const matrix_t&, double) override;

    void fill_image_mask (
        const image_t&, const matrix_t&, const colorspace_t&,
        const std::vector< double >&, double) override;

private:
    rect_t bounds_ = rect_t::empty ();
};

} // namespace vellum

#endif // VELLUM_VELLUM_BBOX_DEVICE_HH
