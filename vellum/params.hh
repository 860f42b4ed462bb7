// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_PARAMS_HH
#define VELLUM_VELLUM_PARAMS_HH

#include <defs.hh>

#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vellum {

//
// Rasterization settings, read from a configuration file of the form:
//
//   # comment
//   flatness          0.25
//   maxCurveDepth     6
//   antialias         4
//   minSegmentLength  0.001
//   maxTileCount      256
//   strokeAdjust      yes
//   fontFile          Sans "/usr/share/fonts/sans.ttf"
//   include           other.conf
//
struct params_t {
    double flatness;
    int max_curve_depth;
    int aa_level;
    double min_segment_length;
    int max_tile_count;
    bool stroke_adjust;

    std::map< std::string, std::string > font_files;

    params_t ();

    void parse_line (
        const std::string& line, const std::string& filename, int lineno);

    void parse (std::istream&, const std::string& filename);

    //
    // False if the file could not be opened (and an I/O error is reported):
    //
    bool parse_file (const std::string& filename);

    std::optional< std::string > font_file (const std::string&) const;

private:
    void parse_yes_no (
        const char*, bool&, const std::vector< std::string >&,
        const std::string&, int);

    void parse_integer (
        const char*, int&, const std::vector< std::string >&,
        const std::string&, int);

    void parse_float (
        const char*, double&, const std::vector< std::string >&,
        const std::string&, int);

    void parse_font_file (
        const std::vector< std::string >&, const std::string&, int);

    void clamp ();

    int depth_ = 0;
};

//
// Process-wide defaults, used when a rasterizer is built without explicit
// settings:
//
params_t& global_params ();

} // namespace vellum

#endif // VELLUM_VELLUM_PARAMS_HH
