// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <cstdlib>

#include <algorithm>
#include <fstream>

#include <vellum/error.hh>
#include <vellum/params.hh>
#include <utils/string.hh>

namespace vellum {
namespace {

// `include' chains deeper than this are assumed to be cycles
constexpr int max_include_depth = 16;

bool
parse_yes_no2 (const std::string& token, bool& flag) {
    if (token == "yes") {
        flag = true;
    }
    else if (token == "no") {
        flag = false;
    }
    else {
        return false;
    }

    return true;
}

bool
all_of_digits (const std::string& s, bool allow_dot) {
    if (s.empty ()) {
        return false;
    }

    auto iter = s.begin ();

    if (*iter == '-') {
        ++iter;
    }

    if (iter == s.end ()) {
        return false;
    }

    return std::all_of (iter, s.end (), [=](char c) {
        return ('0' <= c && c <= '9') || (allow_dot && c == '.');
    });
}

} // anonymous

params_t::params_t ()
    : flatness (VELLUM_DEFAULT_FLATNESS),
      max_curve_depth (VELLUM_MAX_CURVE_DEPTH),
      aa_level (1),
      min_segment_length (VELLUM_MIN_SEGMENT_LENGTH),
      max_tile_count (1024),
      stroke_adjust (false)
{ }

void
params_t::clamp () {
    max_curve_depth = std::clamp (max_curve_depth, 1, VELLUM_MAX_CURVE_DEPTH);
    aa_level = std::clamp (aa_level, 1, VELLUM_MAX_AA_LEVEL);

    if (flatness <= 0) {
        flatness = VELLUM_DEFAULT_FLATNESS;
    }

    if (min_segment_length < 0) {
        min_segment_length = 0;
    }

    if (max_tile_count < 0) {
        max_tile_count = 0;
    }
}

void
params_t::parse_line (
    const std::string& line, const std::string& filename, int lineno) {
    const auto tokens = tokenize (line);

    if (tokens.empty () || tokens [0][0] == '#') {
        return;
    }

    const auto& cmd = tokens [0];

    if (cmd == "include") {
        if (tokens.size () == 2) {
            if (depth_ >= max_include_depth) {
                error (
                    errConfig,
                    "Too many nested includes: '{}' ({}:{})",
                    tokens [1], filename, lineno);
            }
            else {
                std::ifstream f (tokens [1]);

                if (f) {
                    ++depth_;
                    parse (f, tokens [1]);
                    --depth_;
                }
                else {
                    error (
                        errConfig,
                        "Couldn't find included config file: '{}' ({}:{})",
                        tokens [1], filename, lineno);
                }
            }
        }
        else {
            error (
                errConfig, "Bad 'include' config file command ({}:{})",
                filename, lineno);
        }
    }
    else if (cmd == "flatness") {
        parse_float ("flatness", flatness, tokens, filename, lineno);
    }
    else if (cmd == "maxCurveDepth") {
        parse_integer (
            "maxCurveDepth", max_curve_depth, tokens, filename, lineno);
    }
    else if (cmd == "antialias") {
        parse_integer ("antialias", aa_level, tokens, filename, lineno);
    }
    else if (cmd == "minSegmentLength") {
        parse_float (
            "minSegmentLength", min_segment_length, tokens, filename, lineno);
    }
    else if (cmd == "maxTileCount") {
        parse_integer (
            "maxTileCount", max_tile_count, tokens, filename, lineno);
    }
    else if (cmd == "strokeAdjust") {
        parse_yes_no ("strokeAdjust", stroke_adjust, tokens, filename, lineno);
    }
    else if (cmd == "fontFile") {
        parse_font_file (tokens, filename, lineno);
    }
    else {
        error (
            errConfig, "Unknown config file command '{}' ({}:{})",
            cmd, filename, lineno);
    }

    clamp ();
}

void
params_t::parse (std::istream& in, const std::string& filename) {
    std::string line;

    for (int lineno = 1; std::getline (in, line); ++lineno) {
        parse_line (line, filename, lineno);
    }
}

bool
params_t::parse_file (const std::string& filename) {
    std::ifstream f (filename);

    if (!f) {
        error (errIO, "Couldn't open config file '{}'", filename);
        return false;
    }

    parse (f, filename);
    return true;
}

std::optional< std::string >
params_t::font_file (const std::string& name) const {
    const auto iter = font_files.find (name);

    if (iter == font_files.end ()) {
        return { };
    }

    return iter->second;
}

void
params_t::parse_yes_no (
    const char* cmd, bool& flag, const std::vector< std::string >& tokens,
    const std::string& filename, int lineno) {
    if (tokens.size () != 2 || !parse_yes_no2 (tokens [1], flag)) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, lineno);
    }
}

void
params_t::parse_integer (
    const char* cmd, int& value, const std::vector< std::string >& tokens,
    const std::string& filename, int lineno) {
    if (tokens.size () != 2 || !all_of_digits (tokens [1], false)) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, lineno);
        return;
    }

    value = std::atoi (tokens [1].c_str ());
}

void
params_t::parse_float (
    const char* cmd, double& value, const std::vector< std::string >& tokens,
    const std::string& filename, int lineno) {
    if (tokens.size () != 2 || !all_of_digits (tokens [1], true)) {
        error (
            errConfig, "Bad '{}' config file command ({}:{})",
            cmd, filename, lineno);
        return;
    }

    value = std::atof (tokens [1].c_str ());
}

void
params_t::parse_font_file (
    const std::vector< std::string >& tokens, const std::string& filename,
    int lineno) {
    if (tokens.size () != 3) {
        error (
            errConfig, "Bad 'fontFile' config file command ({}:{})",
            filename, lineno);
        return;
    }

    font_files [tokens [1]] = tokens [2];
}

params_t&
global_params () {
    static params_t params;
    return params;
}

} // namespace vellum
