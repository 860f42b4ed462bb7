// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_ERROR_HH
#define VELLUM_VELLUM_ERROR_HH

#include <defs.hh>

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace vellum {

enum error_category_t {
    errSyntaxWarning, // recoverable problem in caller-supplied data
    errSyntaxError,   // unrecoverable problem in caller-supplied data
    errConfig,        // error in a configuration file
    errIO,            // file could not be read
    errInternal       // broken invariant, e.g., an unbalanced clip stack
};

const char* name_of (error_category_t);

using error_callback_t = std::function< void (error_category_t, const std::string&) >;

//
// Installs a new error sink and returns the previous one; an empty callback
// restores the default, which writes to stderr:
//
error_callback_t set_error_callback (error_callback_t);

void report (error_category_t, const std::string&);

template< typename... Args >
inline void
error (error_category_t category, fmt::format_string< Args... > s,
       Args&&... args) {
    report (category, fmt::format (s, std::forward< Args > (args)...));
}

//
// Thrown by value-type constructors on bad dimensions or short buffers:
//
struct argument_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace vellum

#endif // VELLUM_VELLUM_ERROR_HH
