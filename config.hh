// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_CONFIG_HH
#define VELLUM_CONFIG_HH

// Autoconf-like macros
#define VELLUM_PACKAGE "vellum"
#define VELLUM_PACKAGE_NAME "vellum"
#define VELLUM_PACKAGE_STRING "vellum 0.4.0"
#define VELLUM_VERSION "0.4.0"

//------------------------------------------------------------------------
// rasterization defaults
//------------------------------------------------------------------------

// flatness tolerance, in device pixels
#define VELLUM_DEFAULT_FLATNESS 0.5

// hard cap on curve subdivision depth
#define VELLUM_MAX_CURVE_DEPTH 8

// largest supersampling factor
#define VELLUM_MAX_AA_LEVEL 8

// stroke segments shorter than this are dropped
#define VELLUM_MIN_SEGMENT_LENGTH 1e-3

#endif // VELLUM_CONFIG_HH
