// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_FONT_HH
#define VELLUM_VELLUM_FONT_HH

#include <defs.hh>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <vellum/path.hh>

namespace vellum {

//
// Font handle referenced by text spans. Metrics and outlines are expressed
// in em units, i.e., a glyph space where the font size is 1:
//
struct font_t {
    explicit font_t (std::string name)
        : name_ (std::move (name))
    { }

    virtual ~font_t () = default;

    const std::string& name () const { return name_; }

    virtual double ascender () const { return ascender_; }
    virtual double descender () const { return descender_; }

    void set_metrics (double ascender, double descender) {
        ascender_ = ascender;
        descender_ = descender;
    }

    virtual int glyph_index (char32_t c) const;

    virtual double advance (int gid) const;
    void set_advance (int gid, double value) { advances_ [gid] = value; }

    void set_default_advance (double value) { default_advance_ = value; }

    virtual std::optional< path_t > outline (int gid) const;

private:
    std::string name_;

    double ascender_ = 0.8, descender_ = -0.2, default_advance_ = 0.5;
    std::map< int, double > advances_;
};

using font_pointer = std::shared_ptr< const font_t >;

} // namespace vellum

#endif // VELLUM_VELLUM_FONT_HH
