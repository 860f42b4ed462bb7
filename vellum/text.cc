// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <string>

#include <vellum/text.hh>
#include <utils/string.hh>

#include <range/v3/all.hpp>
using namespace ranges;

namespace vellum {
namespace {

void
append_utf8 (std::string& s, char32_t c) {
    if (c < 0x80) {
        s += char (c);
    }
    else if (c < 0x800) {
        s += char (0xC0 | (c >> 6));
        s += char (0x80 | (c & 0x3F));
    }
    else if (c < 0x10000) {
        s += char (0xE0 | (c >> 12));
        s += char (0x80 | ((c >> 6) & 0x3F));
        s += char (0x80 | (c & 0x3F));
    }
    else {
        s += char (0xF0 | (c >> 18));
        s += char (0x80 | ((c >> 12) & 0x3F));
        s += char (0x80 | ((c >> 6) & 0x3F));
        s += char (0x80 | (c & 0x3F));
    }
}

inline bool
same_linear_part (const matrix_t& lhs, const matrix_t& rhs) {
    return lhs.a == rhs.a && lhs.b == rhs.b &&
           lhs.c == rhs.c && lhs.d == rhs.d;
}

} // anonymous

text_language_t
text_language_from_name (const std::string& s) {
    if (s == "ur") { return text_language_t::ur; }
    if (s == "urd") { return text_language_t::urd; }
    if (s == "ko") { return text_language_t::ko; }
    if (s == "ja") { return text_language_t::ja; }
    if (s == "zh") { return text_language_t::zh; }
    if (s == "zh-Hans" || s == "zhs") { return text_language_t::zh_hans; }
    if (s == "zh-Hant" || s == "zht") { return text_language_t::zh_hant; }

    return text_language_t::unset;
}

const char*
name_of (text_language_t language) {
    switch (language) {
    case text_language_t::unset:   return "";
    case text_language_t::ur:      return "ur";
    case text_language_t::urd:     return "urd";
    case text_language_t::ko:      return "ko";
    case text_language_t::ja:      return "ja";
    case text_language_t::zh:      return "zh";
    case text_language_t::zh_hans: return "zh-Hans";
    case text_language_t::zh_hant: return "zh-Hant";
    }

    return "";
}

////////////////////////////////////////////////////////////////////////

rect_t
text_span_t::bounds (const stroke_state_t* stroke) const {
    auto box = rect_t::empty ();

    const double ascender = font ? font->ascender () : 0.8;
    const double descender = font ? font->descender () : -0.2;

    for (const auto& item : items) {
        auto glyph_box = transform (
            rect_t{ 0, descender, item.advance, ascender },
            glyph_matrix (item));

        if (stroke) {
            glyph_box = expand (glyph_box, stroke->linewidth / 2);
        }

        box += glyph_box;
    }

    return box;
}

std::string
text_span_t::text_content () const {
    std::string s;

    for (const auto& item : items) {
        if (item.ucs >= 0) {
            append_utf8 (s, char32_t (item.ucs));
        }
    }

    return s;
}

bool
operator== (const text_span_t& lhs, const text_span_t& rhs) {
    return lhs.font       == rhs.font       &&
           lhs.trm        == rhs.trm        &&
           lhs.wmode      == rhs.wmode      &&
           lhs.bidi_level == rhs.bidi_level &&
           lhs.markup_dir == rhs.markup_dir &&
           lhs.language   == rhs.language   &&
           lhs.items      == rhs.items;
}

////////////////////////////////////////////////////////////////////////

text_span_t&
text_t::span_for (
    const font_pointer& font, const matrix_t& trm, bool wmode, int bidi_level,
    bidi_direction_t markup_dir, text_language_t language) {

    if (!spans_.empty ()) {
        auto& last = spans_.back ();

        if (last.font == font &&
            same_linear_part (last.trm, trm) &&
            last.wmode == wmode &&
            last.bidi_level == bidi_level &&
            last.markup_dir == markup_dir &&
            last.language == language) {
            return last;
        }
    }

    text_span_t span;

    span.font = font;
    span.trm = trm;
    span.wmode = wmode;
    span.bidi_level = bidi_level;
    span.markup_dir = markup_dir;
    span.language = language;

    return spans_.emplace_back (std::move (span));
}

void
text_t::show_glyph (
    font_pointer font, const matrix_t& trm, int gid, int ucs, bool wmode,
    int bidi_level, bidi_direction_t markup_dir, text_language_t language) {
    const double advance = font ? font->advance (gid) : 0;

    show_glyph_with_advance (
        std::move (font), trm, advance, gid, ucs, -1, wmode, bidi_level,
        markup_dir, language);
}

void
text_t::show_glyph_with_advance (
    font_pointer font, const matrix_t& trm, double advance, int gid, int ucs,
    int cid, bool wmode, int bidi_level, bidi_direction_t markup_dir,
    text_language_t language) {
    auto& span = span_for (
        font, trm, wmode, bidi_level, markup_dir, language);

    span.items.push_back (text_item_t{ trm.e, trm.f, advance, gid, ucs, cid });
}

matrix_t
text_t::show_string (
    font_pointer font, matrix_t trm, const std::string& s, bool wmode,
    int bidi_level, bidi_direction_t markup_dir, text_language_t language) {
    for (const auto c : utf8_decode (s)) {
        const int gid = font ? font->glyph_index (c) : int (c);
        const double advance = font ? font->advance (gid) : 0;

        show_glyph_with_advance (
            font, trm, advance, gid, int (c), -1, wmode, bidi_level,
            markup_dir, language);

        const auto step = wmode
            ? transform_vector (point_t{ 0, -advance }, trm)
            : transform_vector (point_t{ advance, 0 }, trm);

        trm.e += step.x;
        trm.f += step.y;
    }

    return trm;
}

rect_t
text_t::bounds (const stroke_state_t* stroke, const matrix_t& ctm) const {
    auto box = rect_t::empty ();

    for (const auto& span : spans_) {
        box += transform (span.bounds (stroke), ctm);
    }

    return box;
}

std::string
text_t::text_content () const {
    std::string s;

    for (const auto& span : spans_) {
        s += span.text_content ();
    }

    return s;
}

size_t
text_t::item_count () const {
    return accumulate (
        spans_ | views::transform ([](const auto& x) { return x.items.size (); }),
        size_t (0));
}

} // namespace vellum
