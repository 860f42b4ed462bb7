// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_DISPLAY_LIST_HH
#define VELLUM_VELLUM_DISPLAY_LIST_HH

#include <defs.hh>

#include <optional>
#include <variant>
#include <vector>

#include <vellum/device.hh>

namespace vellum {

//
// One recorded device call each; the command owns copies of the arguments:
//
struct fill_path_cmd_t {
    path_t path;
    bool even_odd;
    matrix_t ctm;
    colorspace_t cs;
    std::vector< double > color;
    double alpha;

    friend bool operator== (
        const fill_path_cmd_t&, const fill_path_cmd_t&) = default;
};

struct stroke_path_cmd_t {
    path_t path;
    stroke_state_t stroke;
    matrix_t ctm;
    colorspace_t cs;
    std::vector< double > color;
    double alpha;

    friend bool operator== (
        const stroke_path_cmd_t&, const stroke_path_cmd_t&) = default;
};

struct clip_path_cmd_t {
    path_t path;
    bool even_odd;
    matrix_t ctm;
    rect_t scissor;

    friend bool operator== (
        const clip_path_cmd_t&, const clip_path_cmd_t&) = default;
};

struct clip_stroke_path_cmd_t {
    path_t path;
    stroke_state_t stroke;
    matrix_t ctm;
    rect_t scissor;

    friend bool operator== (
        const clip_stroke_path_cmd_t&, const clip_stroke_path_cmd_t&) = default;
};

struct fill_text_cmd_t {
    text_t text;
    matrix_t ctm;
    colorspace_t cs;
    std::vector< double > color;
    double alpha;

    friend bool operator== (
        const fill_text_cmd_t&, const fill_text_cmd_t&) = default;
};

struct stroke_text_cmd_t {
    text_t text;
    stroke_state_t stroke;
    matrix_t ctm;
    colorspace_t cs;
    std::vector< double > color;
    double alpha;

    friend bool operator== (
        const stroke_text_cmd_t&, const stroke_text_cmd_t&) = default;
};

struct clip_text_cmd_t {
    text_t text;
    matrix_t ctm;
    rect_t scissor;

    friend bool operator== (
        const clip_text_cmd_t&, const clip_text_cmd_t&) = default;
};

struct clip_stroke_text_cmd_t {
    text_t text;
    stroke_state_t stroke;
    matrix_t ctm;
    rect_t scissor;

    friend bool operator== (
        const clip_stroke_text_cmd_t&, const clip_stroke_text_cmd_t&) = default;
};

struct ignore_text_cmd_t {
    text_t text;
    matrix_t ctm;

    friend bool operator== (
        const ignore_text_cmd_t&, const ignore_text_cmd_t&) = default;
};

struct fill_image_cmd_t {
    image_t image;
    matrix_t ctm;
    double alpha;

    friend bool operator== (
        const fill_image_cmd_t&, const fill_image_cmd_t&) = default;
};

struct fill_image_mask_cmd_t {
    image_t image;
    matrix_t ctm;
    colorspace_t cs;
    std::vector< double > color;
    double alpha;

    friend bool operator== (
        const fill_image_mask_cmd_t&, const fill_image_mask_cmd_t&) = default;
};

struct clip_image_mask_cmd_t {
    image_t image;
    matrix_t ctm;
    rect_t scissor;

    friend bool operator== (
        const clip_image_mask_cmd_t&, const clip_image_mask_cmd_t&) = default;
};

struct pop_clip_cmd_t {
    friend bool operator== (
        const pop_clip_cmd_t&, const pop_clip_cmd_t&) = default;
};

struct begin_mask_cmd_t {
    rect_t area;
    bool luminosity;
    colorspace_t cs;
    std::vector< double > color;

    friend bool operator== (
        const begin_mask_cmd_t&, const begin_mask_cmd_t&) = default;
};

struct end_mask_cmd_t {
    friend bool operator== (
        const end_mask_cmd_t&, const end_mask_cmd_t&) = default;
};

struct begin_group_cmd_t {
    rect_t area;
    std::optional< colorspace_t > cs;
    bool isolated;
    bool knockout;
    blend_mode_t blend_mode;
    double alpha;

    friend bool operator== (
        const begin_group_cmd_t&, const begin_group_cmd_t&) = default;
};

struct end_group_cmd_t {
    friend bool operator== (
        const end_group_cmd_t&, const end_group_cmd_t&) = default;
};

struct begin_tile_cmd_t {
    rect_t area;
    rect_t view;
    double xstep;
    double ystep;
    matrix_t ctm;

    friend bool operator== (
        const begin_tile_cmd_t&, const begin_tile_cmd_t&) = default;
};

struct end_tile_cmd_t {
    friend bool operator== (
        const end_tile_cmd_t&, const end_tile_cmd_t&) = default;
};

using command_t = std::variant<
    fill_path_cmd_t, stroke_path_cmd_t, clip_path_cmd_t, clip_stroke_path_cmd_t,
    fill_text_cmd_t, stroke_text_cmd_t, clip_text_cmd_t, clip_stroke_text_cmd_t,
    ignore_text_cmd_t,
    fill_image_cmd_t, fill_image_mask_cmd_t, clip_image_mask_cmd_t,
    pop_clip_cmd_t,
    begin_mask_cmd_t, end_mask_cmd_t,
    begin_group_cmd_t, end_group_cmd_t,
    begin_tile_cmd_t, end_tile_cmd_t >;

//
// Recorded drawing, replayable any number of times against any device. A
// list is a plain value; concurrent replays of one list are safe as long as
// each targets its own device.
//
struct display_list_t {
    display_list_t () : mediabox_ (rect_t::empty ()) { }

    explicit display_list_t (const rect_t& mediabox)
        : mediabox_ (mediabox)
    { }

    const rect_t& mediabox () const { return mediabox_; }

    const std::vector< command_t >& commands () const { return commands_; }
    std::vector< command_t >& commands () { return commands_; }

    size_t size () const { return commands_.size (); }
    bool empty () const { return commands_.empty (); }

    void clear () { commands_.clear (); }

    void append (command_t cmd) { commands_.push_back (std::move (cmd)); }

    //
    // Replays the commands against `dev'. Recorded transforms are followed
    // by `ctm' and recorded scissors are intersected with `scissor'. Mask and
    // group areas are transformed by `ctm'; tile areas are in pattern space
    // and are left alone.
    //
    void run (
        device_t& dev, const matrix_t& ctm = matrix_t::identity (),
        const rect_t& scissor = rect_t::infinite ()) const;

private:
    rect_t mediabox_;
    std::vector< command_t > commands_;
};

inline bool
operator== (const display_list_t& lhs, const display_list_t& rhs) {
    return lhs.mediabox () == rhs.mediabox () &&
           lhs.commands () == rhs.commands ();
}

inline bool
operator!= (const display_list_t& lhs, const display_list_t& rhs) {
    return !(lhs == rhs);
}

////////////////////////////////////////////////////////////////////////

//
// Records every call into a display list:
//
struct list_device_t : device_t {
    explicit list_device_t (const rect_t& mediabox = rect_t::empty ())
        : list_ (mediabox)
    { }

    const display_list_t& display_list () const { return list_; }
    display_list_t& display_list () { return list_; }

    display_list_t into_display_list () && { return std::move (list_); }

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

private:
    display_list_t list_;
};

} // namespace vellum

#endif // VELLUM_VELLUM_DISPLAY_LIST_HH
