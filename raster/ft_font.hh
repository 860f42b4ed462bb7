// -*- mode: c++; -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#ifndef VELLUM_RASTER_FT_FONT_HH
#define VELLUM_RASTER_FT_FONT_HH

#include <defs.hh>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/noncopyable.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <vellum/font.hh>
#include <vellum/params.hh>

namespace vellum::raster {

//
// Owns the FreeType library handle; fonts keep their engine alive:
//
struct ft_engine_t : boost::noncopyable {
    ft_engine_t ();
    ~ft_engine_t ();

    FT_Library library () const { return lib_; }

private:
    FT_Library lib_;
};

using ft_engine_pointer = std::shared_ptr< ft_engine_t >;

//
// Font backed by a font file that FreeType can read (TrueType, OpenType,
// Type 1, CFF). Metrics and outlines are unhinted, in em units.
//
struct ft_font_t : font_t, boost::noncopyable {
    ft_font_t (ft_engine_pointer, const std::string& filename, int index = 0);
    ~ft_font_t ();

    double ascender () const override;
    double descender () const override;

    int glyph_index (char32_t) const override;

    double advance (int gid) const override;

    std::optional< path_t > outline (int gid) const override;

    int units_per_em () const { return face_->units_per_EM; }

    size_t glyph_count () const { return size_t (face_->num_glyphs); }

private:
    bool load (int gid) const;

private:
    ft_engine_pointer engine_;
    FT_Face face_;

    // loading a glyph mutates the face
    mutable std::mutex mutex_;
};

//
// Font configured under `name' by a fontFile command; null, with the error
// reported, when there is none or its file can't be opened:
//
font_pointer find_font (
    ft_engine_pointer, const std::string& name,
    const params_t& = global_params ());

} // namespace vellum::raster

#endif // VELLUM_RASTER_FT_FONT_HH
