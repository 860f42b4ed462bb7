// -*- mode: c++ -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vellum

#include <defs.hh>

#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <raster/stroke.hh>
#include <raster/xpath.hh>

using namespace vellum;
using namespace vellum::raster;

namespace {

using points_type = std::vector< point_t >;

stroke_state_t
dashed (std::vector< double > pattern, double phase = 0) {
    stroke_state_t stroke;

    stroke.dash_pattern = std::move (pattern);
    stroke.dash_phase = phase;

    return stroke;
}

std::vector< polyline_t >
line (const point_t& from, const point_t& to) {
    return { polyline_t{ { from, to }, false } };
}

} // anonymous

BOOST_AUTO_TEST_SUITE(dash_)

BOOST_AUTO_TEST_CASE(pieces) {
    const auto xs = dash (line ({ 0, 0 }, { 10, 0 }), dashed ({ 2, 3 }));

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    BOOST_TEST ((xs [0].points == points_type{ { 0, 0 }, { 2, 0 } }));
    BOOST_TEST ((xs [1].points == points_type{ { 5, 0 }, { 7, 0 } }));

    BOOST_TEST (!xs [0].closed);
}

BOOST_AUTO_TEST_CASE(phase) {
    //
    // Starts 3 units into the pattern, one unit into the gap:
    //
    const auto xs = dash (line ({ 0, 0 }, { 10, 0 }), dashed ({ 2, 3 }, 3));

    BOOST_TEST_REQUIRE (xs.size () == 2U);

    BOOST_TEST ((xs [0].points == points_type{ { 2, 0 }, { 4, 0 } }));
    BOOST_TEST ((xs [1].points == points_type{ { 7, 0 }, { 9, 0 } }));
}

BOOST_AUTO_TEST_CASE(phase_wraps) {
    const auto a = dash (line ({ 0, 0 }, { 10, 0 }), dashed ({ 2, 3 }, 3));
    const auto b = dash (line ({ 0, 0 }, { 10, 0 }), dashed ({ 2, 3 }, 13));

    BOOST_TEST_REQUIRE (a.size () == b.size ());

    for (size_t i = 0; i < a.size (); ++i) {
        BOOST_TEST ((a [i].points == b [i].points));
    }
}

BOOST_AUTO_TEST_CASE(dash_turns_corners) {
    const std::vector< polyline_t > xs{
        polyline_t{ { { 0, 0 }, { 3, 0 }, { 3, 4 } }, false }
    };

    const auto ys = dash (xs, dashed ({ 4, 10 }));

    BOOST_TEST_REQUIRE (ys.size () == 1U);
    BOOST_TEST ((ys [0].points == points_type{ { 0, 0 }, { 3, 0 }, { 3, 1 } }));
}

BOOST_AUTO_TEST_CASE(restart_per_subpath) {
    auto xs = line ({ 0, 0 }, { 10, 0 });
    xs.push_back ({ { { 0, 5 }, { 10, 5 } }, false });

    const auto ys = dash (xs, dashed ({ 2, 3 }));

    BOOST_TEST_REQUIRE (ys.size () == 4U);
    BOOST_TEST ((ys [2].points == points_type{ { 0, 5 }, { 2, 5 } }));
}

BOOST_AUTO_TEST_CASE(closed_subpath) {
    //
    // The closing segment is dashed as well:
    //
    const std::vector< polyline_t > xs{
        polyline_t{ { { 0, 0 }, { 4, 0 }, { 4, 4 }, { 0, 4 } }, true }
    };

    const auto ys = dash (xs, dashed ({ 2, 2 }));

    BOOST_TEST (ys.size () == 4U);
    BOOST_TEST ((ys.back ().points == points_type{ { 0, 4 }, { 0, 2 } }));
}

BOOST_AUTO_TEST_CASE(solid_patterns) {
    const std::vector< std::vector< double > > patterns{
        { 0, 0 }, { -1, 3 }, { 2, -2 }
    };

    const auto xs = line ({ 0, 0 }, { 10, 0 });

    for (size_t i = 0; i < patterns.size (); ++i) {
        BOOST_TEST_CONTEXT("pattern #" << i) {
            const auto ys = dash (xs, dashed (patterns [i]));

            BOOST_TEST_REQUIRE (ys.size () == 1U);
            BOOST_TEST ((ys [0].points == xs [0].points));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

////////////////////////////////////////////////////////////////////////

BOOST_AUTO_TEST_SUITE(expand_stroke_)

BOOST_AUTO_TEST_CASE(segment) {
    stroke_state_t stroke;
    stroke.linewidth = 4;

    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 }), stroke,
        matrix_t::identity (), params_t{ });

    BOOST_TEST (path.size () == 5U);
    BOOST_TEST ((path.bounds () == rect_t{ 0, -2, 10, 2 }));
}

BOOST_AUTO_TEST_CASE(closed_rectangle) {
    stroke_state_t stroke;
    stroke.linewidth = 2;

    const auto path = expand_stroke (
        path_t{ }.rect ({ 0, 0, 4, 4 }), stroke, matrix_t::identity (),
        params_t{ });

    // One quad per side:
    BOOST_TEST (path.size () == 20U);
    BOOST_TEST ((path.bounds () == rect_t{ -1, -1, 5, 5 }));
}

BOOST_AUTO_TEST_CASE(device_space_width) {
    stroke_state_t stroke;
    stroke.linewidth = 2;

    //
    // The normal is taken in device space, so a horizontal scale does not
    // widen a vertical line:
    //
    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 0, 10 }), stroke,
        matrix_t::scale (2, 1), params_t{ });

    BOOST_TEST ((path.bounds () == rect_t{ -1, 0, 1, 10 }));

    //
    // Nor does a uniform scale:
    //
    const auto scaled = expand_stroke (
        path_t{ }.move_to ({ 1, 2.5 }).line_to ({ 4, 2.5 }), stroke,
        matrix_t::scale (2, 2), params_t{ });

    BOOST_TEST ((scaled.bounds () == rect_t{ 2, 4, 8, 6 }));
}

BOOST_AUTO_TEST_CASE(dashed_stroke) {
    auto stroke = dashed ({ 2, 3 });
    stroke.linewidth = 2;

    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 }), stroke,
        matrix_t::identity (), params_t{ });

    BOOST_TEST (path.size () == 10U);
    BOOST_TEST ((path.bounds () == rect_t{ 0, -1, 7, 1 }));
}

BOOST_AUTO_TEST_CASE(dash_lengths_scale) {
    auto stroke = dashed ({ 2, 3 });
    stroke.linewidth = 2;

    //
    // Dashes 4 and gaps 6 device pixels long:
    //
    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 }), stroke,
        matrix_t::scale (2, 2), params_t{ });

    BOOST_TEST (path.size () == 10U);
    BOOST_TEST ((path.bounds () == rect_t{ 0, -1, 14, 1 }));
}

BOOST_AUTO_TEST_CASE(zero_length_segment) {
    const auto path = expand_stroke (
        path_t{ }.move_to ({ 1, 1 }).line_to ({ 1, 1 }), stroke_state_t{ },
        matrix_t::identity (), params_t{ });

    BOOST_TEST (path.empty ());
}

BOOST_AUTO_TEST_CASE(singular_matrix) {
    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 }), stroke_state_t{ },
        matrix_t::scale (0, 0), params_t{ });

    BOOST_TEST (path.empty ());
}

BOOST_AUTO_TEST_CASE(hairline) {
    stroke_state_t stroke;
    stroke.linewidth = 0;

    //
    // One device pixel wide whatever the scale:
    //
    const auto path = expand_stroke (
        path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 }), stroke,
        matrix_t::scale (2, 2), params_t{ });

    BOOST_TEST ((path.bounds () == rect_t{ 0, -0.5, 20, 0.5 }));
}

BOOST_AUTO_TEST_CASE(stroke_adjust) {
    stroke_state_t stroke;
    stroke.linewidth = 0.5;

    const auto path = path_t{ }.move_to ({ 0, 0 }).line_to ({ 10, 0 });

    params_t params;

    BOOST_TEST ((
        expand_stroke (path, stroke, matrix_t::identity (), params).bounds () ==
        rect_t{ 0, -0.25, 10, 0.25 }));

    params.stroke_adjust = true;

    BOOST_TEST ((
        expand_stroke (path, stroke, matrix_t::identity (), params).bounds () ==
        rect_t{ 0, -0.5, 10, 0.5 }));
}

BOOST_AUTO_TEST_SUITE_END()
