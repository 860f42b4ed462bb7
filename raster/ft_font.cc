// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#include <defs.hh>

#include <stdexcept>

#include <vellum/error.hh>
#include <raster/ft_font.hh>

#include FT_OUTLINE_H

#include <fmt/format.h>
using fmt::format;

namespace vellum::raster {
namespace {

FT_Face
open_face (FT_Library lib, const std::string& filename, int index) {
    FT_Face face = 0;

    if (FT_New_Face (lib, filename.c_str (), index, &face)) {
        throw argument_error (format ("couldn't open font file '{}'", filename));
    }

    return face;
}

//
// Outline decomposition, in font units scaled to em:
//
struct outline_builder_t {
    path_t path;
    double scale;
    bool open = false;

    point_t to_point (const FT_Vector* p) const {
        return { p->x * scale, p->y * scale };
    }

    static outline_builder_t& self (void* p) {
        return *reinterpret_cast< outline_builder_t* > (p);
    }

    static int move_to (const FT_Vector* to, void* user) {
        auto& b = self (user);

        if (b.open) {
            b.path.close ();
        }

        b.path.move_to (b.to_point (to));
        b.open = true;

        return 0;
    }

    static int line_to (const FT_Vector* to, void* user) {
        auto& b = self (user);
        b.path.line_to (b.to_point (to));
        return 0;
    }

    static int conic_to (const FT_Vector* c, const FT_Vector* to, void* user) {
        auto& b = self (user);
        b.path.quad_to (b.to_point (c), b.to_point (to));
        return 0;
    }

    static int cubic_to (
        const FT_Vector* c1, const FT_Vector* c2, const FT_Vector* to,
        void* user) {
        auto& b = self (user);
        b.path.curve_to (b.to_point (c1), b.to_point (c2), b.to_point (to));
        return 0;
    }
};

} // anonymous

ft_engine_t::ft_engine_t () {
    if (FT_Init_FreeType (&lib_)) {
        throw std::runtime_error ("FreeType initialization failed");
    }
}

ft_engine_t::~ft_engine_t () {
    FT_Done_FreeType (lib_);
}

////////////////////////////////////////////////////////////////////////

ft_font_t::ft_font_t (
    ft_engine_pointer engine, const std::string& filename, int index)
    : font_t (filename),
      engine_ (std::move (engine)),
      face_ (open_face (engine_->library (), filename, index)) {
    if (0 == face_->units_per_EM) {
        FT_Done_Face (face_);
        throw argument_error (
            format ("font file '{}' is not scalable", filename));
    }

    if (0 == face_->charmap && face_->num_charmaps > 0) {
        FT_Set_Charmap (face_, face_->charmaps [0]);
    }
}

ft_font_t::~ft_font_t () {
    FT_Done_Face (face_);
}

double
ft_font_t::ascender () const {
    return double (face_->ascender) / face_->units_per_EM;
}

double
ft_font_t::descender () const {
    return double (face_->descender) / face_->units_per_EM;
}

int
ft_font_t::glyph_index (char32_t c) const {
    std::lock_guard< std::mutex > lock (mutex_);
    return int (FT_Get_Char_Index (face_, FT_ULong (c)));
}

bool
ft_font_t::load (int gid) const {
    if (gid < 0 || gid >= face_->num_glyphs) {
        return false;
    }

    const auto flags = FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

    if (FT_Load_Glyph (face_, FT_UInt (gid), flags)) {
        error (errSyntaxWarning, "couldn't load glyph {} of '{}'", gid, name ());
        return false;
    }

    return true;
}

double
ft_font_t::advance (int gid) const {
    std::lock_guard< std::mutex > lock (mutex_);

    if (!load (gid)) {
        return font_t::advance (gid);
    }

    return double (face_->glyph->metrics.horiAdvance) / face_->units_per_EM;
}

std::optional< path_t >
ft_font_t::outline (int gid) const {
    std::lock_guard< std::mutex > lock (mutex_);

    if (!load (gid) || face_->glyph->format != FT_GLYPH_FORMAT_OUTLINE) {
        return { };
    }

    outline_builder_t builder{ { }, 1. / face_->units_per_EM };

    FT_Outline_Funcs funcs;

    funcs.move_to = &outline_builder_t::move_to;
    funcs.line_to = &outline_builder_t::line_to;
    funcs.conic_to = &outline_builder_t::conic_to;
    funcs.cubic_to = &outline_builder_t::cubic_to;
    funcs.shift = 0;
    funcs.delta = 0;

    if (FT_Outline_Decompose (&face_->glyph->outline, &funcs, &builder)) {
        error (errSyntaxWarning, "bad outline for glyph {} of '{}'", gid, name ());
        return { };
    }

    if (builder.open) {
        builder.path.close ();
    }

    return std::move (builder.path);
}

font_pointer
find_font (
    ft_engine_pointer engine, const std::string& name,
    const params_t& params) {
    const auto filename = params.font_file (name);

    if (!filename) {
        error (errConfig, "no font file configured for '{}'", name);
        return { };
    }

    try {
        return std::make_shared< ft_font_t > (std::move (engine), *filename);
    }
    catch (const argument_error& e) {
        error (errIO, "{}", e.what ());
    }

    return { };
}

} // namespace vellum::raster
