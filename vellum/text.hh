// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_TEXT_HH
#define VELLUM_VELLUM_TEXT_HH

#include <defs.hh>

#include <optional>
#include <string>
#include <vector>

#include <vellum/font.hh>
#include <vellum/geometry.hh>
#include <vellum/path.hh>

namespace vellum {

enum struct text_language_t {
    unset, ur, urd, ko, ja, zh, zh_hans, zh_hant
};

text_language_t text_language_from_name (const std::string&);
const char* name_of (text_language_t);

enum struct bidi_direction_t { unset, ltr, rtl };

struct text_item_t {
    double x, y;
    double advance;

    int gid;
    int ucs; // -1 when the glyph has no Unicode value
    int cid;
};

inline bool
operator== (const text_item_t& lhs, const text_item_t& rhs) {
    return lhs.x == rhs.x && lhs.y == rhs.y && lhs.advance == rhs.advance &&
           lhs.gid == rhs.gid && lhs.ucs == rhs.ucs && lhs.cid == rhs.cid;
}

//
// A run of glyphs sharing one font, one text rendering matrix (its linear
// part; the translation of each glyph lives in the item), writing mode, bidi
// level and language:
//
struct text_span_t {
    font_pointer font;
    matrix_t trm;

    bool wmode = false;
    int bidi_level = 0;

    bidi_direction_t markup_dir = bidi_direction_t::unset;
    text_language_t language = text_language_t::unset;

    std::vector< text_item_t > items;

    //
    // Glyph to user space transform for one item:
    //
    matrix_t glyph_matrix (const text_item_t& item) const {
        return { trm.a, trm.b, trm.c, trm.d, item.x, item.y };
    }

    rect_t bounds (const stroke_state_t* = 0) const;

    std::string text_content () const;
};

bool operator== (const text_span_t&, const text_span_t&);

struct text_t {
    void show_glyph (
        font_pointer font, const matrix_t& trm, int gid, int ucs,
        bool wmode = false, int bidi_level = 0,
        bidi_direction_t markup_dir = bidi_direction_t::unset,
        text_language_t language = text_language_t::unset);

    void show_glyph_with_advance (
        font_pointer font, const matrix_t& trm, double advance,
        int gid, int ucs, int cid,
        bool wmode = false, int bidi_level = 0,
        bidi_direction_t markup_dir = bidi_direction_t::unset,
        text_language_t language = text_language_t::unset);

    //
    // Shows every character of a UTF-8 string and returns the matrix advanced
    // past the last glyph:
    //
    matrix_t show_string (
        font_pointer font, matrix_t trm, const std::string& s,
        bool wmode = false, int bidi_level = 0,
        bidi_direction_t markup_dir = bidi_direction_t::unset,
        text_language_t language = text_language_t::unset);

    //
    // Device space bounds under `ctm'; stroked glyph boxes grow by half the
    // line width:
    //
    rect_t bounds (const stroke_state_t*, const matrix_t& ctm) const;

    std::string text_content () const;

    const std::vector< text_span_t >& spans () const { return spans_; }

    size_t span_count () const { return spans_.size (); }
    size_t item_count () const;

    bool empty () const { return spans_.empty (); }
    void clear () { spans_.clear (); }

private:
    text_span_t& span_for (
        const font_pointer&, const matrix_t&, bool, int, bidi_direction_t,
        text_language_t);

private:
    std::vector< text_span_t > spans_;
};

inline bool
operator== (const text_t& lhs, const text_t& rhs) {
    return lhs.spans () == rhs.spans ();
}

inline bool
operator!= (const text_t& lhs, const text_t& rhs) {
    return !(lhs == rhs);
}

} // namespace vellum

#endif // VELLUM_VELLUM_TEXT_HH
