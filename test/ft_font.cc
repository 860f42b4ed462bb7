// -*- mode: c++ -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vellum

#include <defs.hh>

#include <filesystem>
#include <memory>
#include <string>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <raster/draw_device.hh>
#include <raster/ft_font.hh>

#include <test/error_capture.hh>

using namespace vellum;
using namespace vellum::raster;

namespace {

const std::string font_path = "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";

struct font_available {
    boost::test_tools::assertion_result operator() (utf::test_unit_id) const {
        boost::test_tools::assertion_result result (
            std::filesystem::exists (font_path));

        result.message () << "skipped, no font at " << font_path;
        return result;
    }
};

std::shared_ptr< ft_font_t >
make_font () {
    return std::make_shared< ft_font_t > (
        std::make_shared< ft_engine_t > (), font_path);
}

} // anonymous

BOOST_AUTO_TEST_SUITE(ft_font)

BOOST_AUTO_TEST_CASE(missing_file) {
    BOOST_CHECK_THROW (
        ft_font_t (
            std::make_shared< ft_engine_t > (), "/nonexistent/font.ttf"),
        argument_error);
}

BOOST_AUTO_TEST_CASE(not_configured) {
    error_capture_t capture;

    BOOST_TEST (!find_font (
                    std::make_shared< ft_engine_t > (), "Nothing", params_t{ }));

    BOOST_TEST_REQUIRE (capture.errors.size () == 1U);
    BOOST_TEST (capture.errors [0].first == errConfig);
}

BOOST_AUTO_TEST_CASE(configured_file_missing) {
    params_t params;
    params.font_files ["Sans"] = "/nonexistent/font.ttf";

    error_capture_t capture;

    BOOST_TEST (!find_font (std::make_shared< ft_engine_t > (), "Sans", params));

    BOOST_TEST_REQUIRE (capture.errors.size () == 1U);
    BOOST_TEST (capture.errors [0].first == errIO);
    BOOST_TEST (capture.contains ("couldn't open font file"));
}

BOOST_AUTO_TEST_CASE(metrics, * utf::precondition (font_available ())) {
    const auto font = make_font ();

    BOOST_TEST (font->units_per_em () > 0);
    BOOST_TEST (font->glyph_count () > 100U);

    BOOST_TEST (font->ascender () > 0);
    BOOST_TEST (font->descender () < 0);
    BOOST_TEST (font->ascender () - font->descender () < 2);
}

BOOST_AUTO_TEST_CASE(glyphs, * utf::precondition (font_available ())) {
    const auto font = make_font ();

    const int gid = font->glyph_index ('A');

    BOOST_TEST (gid > 0);
    BOOST_TEST (font->glyph_index ('B') != gid);

    const auto advance = font->advance (gid);

    BOOST_TEST (advance > 0.3);
    BOOST_TEST (advance < 1.0);

    //
    // Out of range glyphs fall back to the default advance:
    //
    BOOST_TEST (font->advance (-1) == 0.5);
    BOOST_TEST (!font->outline (-1));
}

BOOST_AUTO_TEST_CASE(outline, * utf::precondition (font_available ())) {
    const auto font = make_font ();

    const auto path = font->outline (font->glyph_index ('A'));

    BOOST_TEST_REQUIRE (path.has_value ());
    BOOST_TEST (!path->empty ());

    const auto box = path->bounds ();

    BOOST_TEST (!box.is_empty ());
    BOOST_TEST (box.x0 > -0.5);
    BOOST_TEST (box.y0 > -0.5);
    BOOST_TEST (box.x1 < 1.5);
    BOOST_TEST (box.y1 < 1.5);

    //
    // A space has an outline without contours:
    //
    const auto space = font->outline (font->glyph_index (' '));

    BOOST_TEST_REQUIRE (space.has_value ());
    BOOST_TEST (space->empty ());
}

BOOST_AUTO_TEST_CASE(configured, * utf::precondition (font_available ())) {
    params_t params;
    params.font_files ["Sans"] = font_path;

    const auto font = find_font (
        std::make_shared< ft_engine_t > (), "Sans", params);

    BOOST_TEST_REQUIRE (bool (font));
    BOOST_TEST (font->name () == font_path);
}

BOOST_AUTO_TEST_CASE(draw_text, * utf::precondition (font_available ())) {
    pixmap_t canvas (colorspace_t::device_gray (), 50, 50, false);
    canvas.clear (255);

    text_t text;

    //
    // 40 pixel glyphs, baseline at y = 45, y axis flipped:
    //
    text.show_string (make_font (), { 40, 0, 0, -40, 5, 45 }, "H");

    draw_device_t dev (canvas);
    dev.fill_text (
        text, matrix_t::identity (), colorspace_t::device_gray (), { 0 }, 1);

    int black = 0;

    for (int y = 0; y < 50; ++y) {
        for (int x = 0; x < 50; ++x) {
            black += canvas.pixel (x, y) [0] == 0;
        }
    }

    BOOST_TEST (black > 50);
    BOOST_TEST (black < 50 * 50 / 2);

    // Nothing above the cap height or below the baseline
    BOOST_TEST (canvas.pixel (20, 2) [0] == 255);
    BOOST_TEST (canvas.pixel (20, 47) [0] == 255);
}

BOOST_AUTO_TEST_SUITE_END()
