// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_DEFS_HH
#define VELLUM_DEFS_HH

#include <config.hh>

#include <boost/assert.hpp>

#define VELLUM_ASSERT BOOST_ASSERT

#endif // VELLUM_DEFS_HH
