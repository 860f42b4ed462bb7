// -*- mode: c++ -*-
// Copyright 2019-2020 Thinkoid, LLC.

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vellum

#include <defs.hh>

#include <cmath>
#include <limits>
#include <tuple>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <vellum/geometry.hh>

using namespace vellum;

BOOST_AUTO_TEST_SUITE(geometry)

BOOST_AUTO_TEST_CASE(empty_and_infinite) {
    BOOST_TEST (rect_t::empty ().is_empty ());
    BOOST_TEST (!rect_t::empty ().is_infinite ());

    BOOST_TEST (rect_t::infinite ().is_infinite ());
    BOOST_TEST (!rect_t::infinite ().is_empty ());

    BOOST_TEST ((rect_t{ 0, 0, 0, 5 }).is_empty ());
    BOOST_TEST (!(rect_t{ 0, 0, 1, 1 }).is_empty ());
}

BOOST_AUTO_TEST_CASE(union_) {
    const rect_t a{ 0, 0, 2, 2 }, b{ 1, -1, 5, 1 };

    BOOST_TEST ((a + b == rect_t{ 0, -1, 5, 2 }));

    BOOST_TEST ((a + rect_t::empty () == a));
    BOOST_TEST ((rect_t::empty () + a == a));

    auto box = rect_t::empty ();
    box += a;
    box += b;

    BOOST_TEST ((box == rect_t{ 0, -1, 5, 2 }));
}

BOOST_AUTO_TEST_CASE(intersection) {
    const rect_t a{ 0, 0, 4, 4 }, b{ 2, 2, 6, 6 };

    BOOST_TEST ((intersect (a, b) == rect_t{ 2, 2, 4, 4 }));
    BOOST_TEST ((intersect (a, rect_t::infinite ()) == a));

    BOOST_TEST (intersect (a, rect_t{ 5, 5, 6, 6 }).is_empty ());
}

BOOST_AUTO_TEST_CASE(round_out_) {
    BOOST_TEST ((round_out (rect_t{ 0.5, 0.2, 2.1, 3 }) == irect_t{ 0, 0, 3, 3 }));
    BOOST_TEST ((round_out (rect_t::empty ()) == irect_t{ 0, 0, 0, 0 }));

    const auto big = round_out (rect_t::infinite ());

    BOOST_TEST (big.x0 < 0);
    BOOST_TEST (big.x1 > 0);
    BOOST_TEST (!big.is_empty ());
}

static const std::vector< std::tuple< matrix_t, matrix_t, point_t, point_t > >
concat_dataset{
    { matrix_t::translate (10, 0), matrix_t::scale (2, 2),
      { 1, 1 }, { 22, 2 } },

    { matrix_t::scale (2, 2), matrix_t::translate (10, 0),
      { 1, 1 }, { 12, 2 } },

    { matrix_t::rotate (90), matrix_t::translate (5, 5),
      { 1, 0 }, { 5, 6 } },

    { matrix_t::identity (), matrix_t::identity (),
      { 3, 4 }, { 3, 4 } }
};

BOOST_DATA_TEST_CASE(
    concat, data::make (concat_dataset), first, second, p, result) {
    //
    // The first matrix applies first:
    //
    const auto m = first.concat (second);
    const auto q = transform (p, m);

    BOOST_TEST (q.x == result.x, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (q.y == result.y, boost::test_tools::tolerance (1e-9));

    const auto r = transform (transform (p, first), second);

    BOOST_TEST (q.x == r.x, boost::test_tools::tolerance (1e-9));
    BOOST_TEST (q.y == r.y, boost::test_tools::tolerance (1e-9));
}

BOOST_AUTO_TEST_CASE(rotate_exact) {
    BOOST_TEST ((matrix_t::rotate (90) == matrix_t{ 0, 1, -1, 0, 0, 0 }));
    BOOST_TEST ((matrix_t::rotate (180) == matrix_t{ -1, 0, 0, -1, 0, 0 }));
    BOOST_TEST ((matrix_t::rotate (-90) == matrix_t{ 0, -1, 1, 0, 0, 0 }));
    BOOST_TEST ((matrix_t::rotate (360) == matrix_t::identity ()));
}

BOOST_AUTO_TEST_CASE(invert) {
    const auto m = matrix_t::scale (2, 4).concat (matrix_t::translate (3, 5));
    const auto inv = m.invert ();

    BOOST_TEST_REQUIRE (bool (inv));

    const auto p = transform (transform (point_t{ 7, -2 }, m), *inv);

    BOOST_TEST (p.x == 7., boost::test_tools::tolerance (1e-9));
    BOOST_TEST (p.y == -2., boost::test_tools::tolerance (1e-9));

    BOOST_TEST (!matrix_t::scale (0, 1).invert ());
}

BOOST_AUTO_TEST_CASE(predicates) {
    BOOST_TEST (matrix_t::identity ().is_identity ());
    BOOST_TEST (matrix_t::scale (2, 3).is_rectilinear ());
    BOOST_TEST (matrix_t::rotate (90).is_rectilinear ());
    BOOST_TEST (!matrix_t::rotate (30).is_rectilinear ());

    BOOST_TEST (matrix_t::scale (2, 8).expansion () == 4.);
}

BOOST_AUTO_TEST_CASE(transform_vector_) {
    const auto m = matrix_t::scale (2, 3).concat (matrix_t::translate (100, 100));
    const auto v = transform_vector (point_t{ 1, 1 }, m);

    BOOST_TEST ((v == point_t{ 2, 3 }));
}

BOOST_AUTO_TEST_CASE(transform_rect) {
    const rect_t box{ 0, 0, 2, 1 };

    BOOST_TEST ((transform (box, matrix_t::translate (1, 1)) ==
                 rect_t{ 1, 1, 3, 2 }));

    BOOST_TEST ((transform (box, matrix_t::rotate (90)) ==
                 rect_t{ -1, 0, 0, 2 }));

    const auto r = transform (rect_t::unit (), matrix_t::rotate (45));

    BOOST_TEST (r.x0 == -std::sqrt (0.5), boost::test_tools::tolerance (1e-9));
    BOOST_TEST (r.x1 ==  std::sqrt (0.5), boost::test_tools::tolerance (1e-9));
    BOOST_TEST (r.y0 == 0., boost::test_tools::tolerance (1e-9));
    BOOST_TEST (r.y1 == std::sqrt (2.), boost::test_tools::tolerance (1e-9));

    BOOST_TEST (transform (rect_t::empty (), matrix_t::scale (2, 2)).is_empty ());
    BOOST_TEST (transform (rect_t::infinite (), matrix_t::rotate (30)).is_infinite ());

    //
    // A degenerate box moves with the transform:
    //
    BOOST_TEST ((transform (rect_t{ 2, 5, 8, 5 }, matrix_t::rotate (90)) ==
                 rect_t{ -5, 2, -5, 8 }));
}

BOOST_AUTO_TEST_CASE(transform_half_infinite_rect) {
    constexpr auto inf = std::numeric_limits< double >::infinity ();

    const rect_t band{ 0, -inf, inf, inf };

    BOOST_TEST ((transform (band, matrix_t::scale (2, 3)) == band));

    const auto r = transform (band, matrix_t::translate (1, 2));

    BOOST_TEST (!std::isnan (r.x0));
    BOOST_TEST (!std::isnan (r.y0));
    BOOST_TEST (!std::isnan (r.x1));
    BOOST_TEST (!std::isnan (r.y1));

    BOOST_TEST ((r == rect_t{ 1, -inf, inf, inf }));

    //
    // Rotated a quarter turn the unbounded sides move to the other axis:
    //
    BOOST_TEST ((transform (rect_t{ 0, 0, inf, 1 }, matrix_t::rotate (90)) ==
                 rect_t{ -1, 0, 0, inf }));
}

BOOST_AUTO_TEST_CASE(expand_) {
    BOOST_TEST ((expand (rect_t{ 2, 5, 8, 5 }, 1) == rect_t{ 1, 4, 9, 6 }));
    BOOST_TEST (expand (rect_t::empty (), 1).is_empty ());
}

BOOST_AUTO_TEST_CASE(include_) {
    auto box = include (rect_t::empty (), point_t{ 1, 2 });
    BOOST_TEST ((box == rect_t{ 1, 2, 1, 2 }));

    box = include (box, point_t{ -1, 5 });
    BOOST_TEST ((box == rect_t{ -1, 2, 1, 5 }));
}

BOOST_AUTO_TEST_SUITE_END()
