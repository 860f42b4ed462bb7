// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <iostream>
#include <mutex>

#include <vellum/error.hh>

namespace vellum {
namespace {

std::mutex error_mutex;

void
default_callback (error_category_t category, const std::string& s) {
    std::cerr << name_of (category) << ": " << s << std::endl;
}

error_callback_t&
callback () {
    static error_callback_t f = default_callback;
    return f;
}

} // anonymous

const char*
name_of (error_category_t category) {
    switch (category) {
    case errSyntaxWarning: return "Syntax Warning";
    case errSyntaxError:   return "Syntax Error";
    case errConfig:        return "Config Error";
    case errIO:            return "I/O Error";
    case errInternal:      return "Internal Error";
    }

    return "Error";
}

error_callback_t
set_error_callback (error_callback_t f) {
    std::lock_guard< std::mutex > lock (error_mutex);

    auto previous = std::move (callback ());
    callback () = f ? std::move (f) : error_callback_t (default_callback);

    return previous;
}

void
report (error_category_t category, const std::string& s) {
    std::lock_guard< std::mutex > lock (error_mutex);
    callback () (category, s);
}

} // namespace vellum
