// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef VELLUM_UTILS_STRING_HH
#define VELLUM_UTILS_STRING_HH

#include <defs.hh>

#include <string>
#include <vector>

namespace vellum {

//
// Breaks a configuration line into whitespace-separated tokens; a token that
// starts with a single or double quote extends up to the matching quote:
//
std::vector< std::string >
tokenize(const std::string &s);

//
// Decodes UTF-8 into code points; malformed sequences yield U+FFFD:
//
std::u32string
utf8_decode(const std::string &s);

} // namespace vellum

#endif // VELLUM_UTILS_STRING_HH
