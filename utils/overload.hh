// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef VELLUM_UTILS_OVERLOAD_HH
#define VELLUM_UTILS_OVERLOAD_HH

#include <defs.hh>

namespace vellum {

template< typename... Ts> struct overload_ : Ts... { using Ts::operator()...; };
template< typename... Ts> overload_(Ts...) -> overload_< Ts... >;

} // namespace vellum

#endif // VELLUM_UTILS_OVERLOAD_HH
