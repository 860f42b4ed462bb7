// -*- mode: c++ -*-
// Copyright 2003-2013 Glyph & Cog, LLC

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE vellum

#include <defs.hh>

#include <memory>
#include <vector>

#include <boost/test/unit_test.hpp>
namespace utf = boost::unit_test;

#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>
namespace data = boost::unit_test::data;

#include <raster/clip.hh>
#include <raster/rasterizer.hh>

using namespace vellum;
using namespace vellum::raster;

namespace {

using bytes_type = std::vector< unsigned char >;

const bytes_type white{ 255, 255, 255 };
const bytes_type black{ 0, 0, 0 };

pixmap_t
make_canvas (int width = 10, int height = 10) {
    pixmap_t pixmap (colorspace_t::device_rgb (), width, height, false);
    pixmap.clear (255);
    return pixmap;
}

void
fill (const rasterizer_t& rasterizer, const path_t& path, pixmap_t& pixmap,
      bool even_odd = false, const clip_t* clip = 0) {
    rasterizer.fill_path (
        path, even_odd, matrix_t::identity (), colorspace_t::device_rgb (),
        { 0, 0, 0 }, 1, pixmap, clip);
}

//
// Number of pixels in the canvas equal to `value':
//
int
count_of (const pixmap_t& pixmap, const bytes_type& value) {
    int n = 0;

    for (int y = 0; y < pixmap.height (); ++y) {
        for (int x = 0; x < pixmap.width (); ++x) {
            n += pixmap.pixel (x, y) == value;
        }
    }

    return n;
}

//
// The 10x10 square spelled out with line segments and a close:
//
const path_t square_outline = path_t{ }
    .move_to ({ 0, 0 })
    .line_to ({ 10, 0 })
    .line_to ({ 10, 10 })
    .line_to ({ 0, 10 })
    .close ();

} // anonymous

BOOST_AUTO_TEST_SUITE(rasterizer_)

BOOST_AUTO_TEST_CASE(full_square) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path_t{ }.rect ({ 0, 0, 10, 10 }), canvas);

    BOOST_TEST (count_of (canvas, black) == 100);
}

BOOST_AUTO_TEST_CASE(clip_rectangle) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.set_clip ({ 0, 0, 5, 10 });

    fill (rasterizer, path_t{ }.rect ({ 0, 0, 10, 10 }), canvas);

    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            BOOST_TEST_CONTEXT("x=" << x << ", y=" << y) {
                BOOST_TEST ((canvas.pixel (x, y) == (x < 5 ? black : white)));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(full_square_outline) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, square_outline, canvas);

    BOOST_TEST (count_of (canvas, black) == 100);
}

BOOST_AUTO_TEST_CASE(clip_rectangle_outline) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.set_clip ({ 0, 0, 5, 10 });

    fill (rasterizer, square_outline, canvas);

    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            BOOST_TEST_CONTEXT("x=" << x << ", y=" << y) {
                BOOST_TEST ((canvas.pixel (x, y) == (x < 5 ? black : white)));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(close_returns_to_subpath_start) {
    //
    // Each close goes back to the move_to of its own subpath; closing the
    // second one to (0, 0) would cut a diagonal through the canvas:
    //
    const auto path = path_t{ }
        .move_to ({ 0, 0 }).line_to ({ 4, 0 }).line_to ({ 4, 4 })
        .line_to ({ 0, 4 }).close ()
        .move_to ({ 6, 0 }).line_to ({ 10, 0 }).line_to ({ 10, 10 })
        .line_to ({ 6, 10 }).close ();

    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path, canvas);

    BOOST_TEST (count_of (canvas, black) == 16 + 40);

    BOOST_TEST ((canvas.pixel (3, 3) == black));
    BOOST_TEST ((canvas.pixel (5, 5) == white));
    BOOST_TEST ((canvas.pixel (2, 7) == white));
    BOOST_TEST ((canvas.pixel (9, 9) == black));
}

BOOST_AUTO_TEST_CASE(inverted_rect) {
    //
    // Negative height, placed by a translation:
    //
    auto canvas = make_canvas (30, 10);

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.fill_path (
        path_t{ }.rect ({ 0, 10, 10, 0 }), false, matrix_t::translate (20, 0),
        colorspace_t::device_rgb (), { 0, 0, 0 }, 1, canvas);

    int left = 0, right = 0;

    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 30; ++x) {
            if (canvas.pixel (x, y) == black) {
                ++(x < 20 ? left : right);
            }
        }
    }

    BOOST_TEST (left == 0);
    BOOST_TEST (right == 100);
}

BOOST_AUTO_TEST_CASE(huge_coordinates) {
    const auto path = path_t{ }
        .move_to ({ 0, -3e9 })
        .line_to ({ 10, -3e9 })
        .line_to ({ 10, 10 })
        .line_to ({ 0, 10 })
        .close ();

    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path, canvas);

    BOOST_TEST (count_of (canvas, black) == 100);

    //
    // A slanted edge far above the canvas keeps its slope:
    //
    canvas = make_canvas ();

    fill (rasterizer, path_t{ }
          .move_to ({ 0, -1e10 })
          .line_to ({ 0, 10 })
          .line_to ({ 10, 10 })
          .close (), canvas);

    BOOST_TEST (count_of (canvas, black) > 0);
    BOOST_TEST ((canvas.pixel (0, 9) == black));
    BOOST_TEST ((canvas.pixel (9, 0) == white));
}

BOOST_AUTO_TEST_CASE(winding_rules) {
    const auto path = path_t{ }
        .rect ({ 0, 0, 6, 6 })
        .rect ({ 4, 4, 10, 10 });

    rasterizer_t rasterizer{ params_t{ } };

    {
        auto canvas = make_canvas ();
        fill (rasterizer, path, canvas, false);

        // Union of the two squares:
        BOOST_TEST (count_of (canvas, black) == 36 + 36 - 4);
        BOOST_TEST ((canvas.pixel (5, 5) == black));
    }

    {
        auto canvas = make_canvas ();
        fill (rasterizer, path, canvas, true);

        BOOST_TEST (count_of (canvas, black) == 36 + 36 - 8);

        for (int y = 4; y < 6; ++y) {
            for (int x = 4; x < 6; ++x) {
                BOOST_TEST ((canvas.pixel (x, y) == white));
            }
        }

        BOOST_TEST ((canvas.pixel (3, 3) == black));
        BOOST_TEST ((canvas.pixel (6, 6) == black));
    }
}

BOOST_AUTO_TEST_CASE(empty_path) {
    auto canvas = make_canvas ();
    const auto before = canvas.samples ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path_t{ }, canvas);

    BOOST_TEST ((canvas.samples () == before));
}

BOOST_AUTO_TEST_CASE(outside_of_destination) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path_t{ }.rect ({ 20, 20, 30, 30 }), canvas);
    fill (rasterizer, path_t{ }.rect ({ -10, -10, -1, 10 }), canvas);

    BOOST_TEST (count_of (canvas, white) == 100);
}

BOOST_AUTO_TEST_CASE(stroke) {
    auto canvas = make_canvas ();

    stroke_state_t stroke;
    stroke.linewidth = 2;

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.stroke_path (
        path_t{ }.move_to ({ 2, 5 }).line_to ({ 8, 5 }), stroke,
        matrix_t::identity (), colorspace_t::device_rgb (), { 0, 0, 0 }, 1,
        canvas);

    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 10; ++x) {
            const bool inside = 2 <= x && x < 8 && 4 <= y && y < 6;

            BOOST_TEST_CONTEXT("x=" << x << ", y=" << y) {
                BOOST_TEST ((canvas.pixel (x, y) == (inside ? black : white)));
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(stroke_width_in_device_pixels) {
    auto canvas = make_canvas ();

    stroke_state_t stroke;
    stroke.linewidth = 2;

    //
    // The segment lands on (2, 5) - (8, 5); the width stays 2 pixels:
    //
    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.stroke_path (
        path_t{ }.move_to ({ 1, 2.5 }).line_to ({ 4, 2.5 }), stroke,
        matrix_t::scale (2, 2), colorspace_t::device_rgb (), { 0, 0, 0 }, 1,
        canvas);

    BOOST_TEST (count_of (canvas, black) == 12);

    BOOST_TEST ((canvas.pixel (2, 4) == black));
    BOOST_TEST ((canvas.pixel (7, 5) == black));
    BOOST_TEST ((canvas.pixel (5, 3) == white));
    BOOST_TEST ((canvas.pixel (5, 6) == white));
}

BOOST_AUTO_TEST_CASE(transformed_fill) {
    auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.fill_path (
        path_t{ }.rect ({ 0, 0, 1, 1 }), false, matrix_t::scale (4, 2),
        colorspace_t::device_rgb (), { 0, 0, 0 }, 1, canvas);

    BOOST_TEST (count_of (canvas, black) == 8);
    BOOST_TEST ((canvas.pixel (3, 1) == black));
    BOOST_TEST ((canvas.pixel (4, 1) == white));
}

BOOST_AUTO_TEST_CASE(clip_mask) {
    auto canvas = make_canvas ();

    //
    // Mask letting through the left half of the canvas only:
    //
    auto mask = std::make_shared< mask_t > (irect_t{ 0, 0, 10, 10 });

    for (int y = 0; y < 10; ++y) {
        for (int x = 0; x < 5; ++x) {
            mask->row (y) [x] = 255;
        }
    }

    clip_t clip (canvas.bounds ());
    clip.clip_to_mask (mask);

    rasterizer_t rasterizer{ params_t{ } };
    fill (rasterizer, path_t{ }.rect ({ 0, 0, 10, 10 }), canvas, false, &clip);

    BOOST_TEST (count_of (canvas, black) == 50);
    BOOST_TEST ((canvas.pixel (4, 9) == black));
    BOOST_TEST ((canvas.pixel (5, 0) == white));
}

BOOST_AUTO_TEST_CASE(area) {
    const auto canvas = make_canvas ();

    rasterizer_t rasterizer{ params_t{ } };
    BOOST_TEST ((rasterizer.area_of (canvas) == irect_t{ 0, 0, 10, 10 }));

    rasterizer.set_clip ({ 2, 3, 20, 20 });
    BOOST_TEST ((rasterizer.area_of (canvas) == irect_t{ 2, 3, 10, 10 }));

    clip_t clip (irect_t{ 0, 0, 4, 4 });
    BOOST_TEST ((rasterizer.area_of (canvas, &clip) == irect_t{ 2, 3, 4, 4 }));
}

BOOST_AUTO_TEST_CASE(fill_mask) {
    rasterizer_t rasterizer{ params_t{ } };

    const auto mask = rasterizer.fill_mask (
        path_t{ }.rect ({ 2, 2, 4, 4 }), false, matrix_t::identity (),
        irect_t{ 0, 0, 8, 8 });

    BOOST_TEST ((mask.rect () == irect_t{ 0, 0, 8, 8 }));

    BOOST_TEST (mask.at (2, 2) == 255);
    BOOST_TEST (mask.at (3, 3) == 255);
    BOOST_TEST (mask.at (4, 3) == 0);
    BOOST_TEST (mask.at (1, 2) == 0);
    BOOST_TEST (mask.at (100, 100) == 0);
}

BOOST_AUTO_TEST_CASE(antialiasing) {
    pixmap_t canvas (colorspace_t::device_gray (), 4, 1, false);
    canvas.clear (0);

    params_t params;
    params.aa_level = 4;

    rasterizer_t rasterizer (params);
    BOOST_TEST (rasterizer.aa_level () == 4);

    //
    // Right edge halfway through the third pixel:
    //
    rasterizer.fill_path (
        path_t{ }.rect ({ 0, 0, 2.5, 1 }), false, matrix_t::identity (),
        colorspace_t::device_gray (), { 1 }, 1, canvas);

    BOOST_TEST (canvas.pixel (0, 0) [0] == 255);
    BOOST_TEST (canvas.pixel (1, 0) [0] == 255);
    BOOST_TEST (canvas.pixel (2, 0) [0] == 127);
    BOOST_TEST (canvas.pixel (3, 0) [0] == 0);
}

BOOST_DATA_TEST_CASE(
    aa_level_clamp,
    data::make (std::vector< int >{ -3, 0, 1, 4, 8, 1000 }) ^
    data::make (std::vector< int >{  1, 1, 1, 4, 8, VELLUM_MAX_AA_LEVEL }),
    level, expected) {
    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.set_aa_level (level);
    BOOST_TEST (rasterizer.aa_level () == expected);
}

BOOST_AUTO_TEST_CASE(alpha_channel) {
    pixmap_t canvas (colorspace_t::device_rgb (), 2, 2, true);
    canvas.clear (0);

    rasterizer_t rasterizer{ params_t{ } };
    rasterizer.fill_path (
        path_t{ }.rect ({ 0, 0, 1, 1 }), false, matrix_t::identity (),
        colorspace_t::device_rgb (), { 1, 0, 0 }, 0.5, canvas);

    BOOST_TEST ((canvas.pixel (0, 0) == bytes_type{ 255, 0, 0, 128 }));
    BOOST_TEST ((canvas.pixel (1, 1) == bytes_type{ 0, 0, 0, 0 }));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(color_conversion)

BOOST_AUTO_TEST_CASE(rgb_to_cmyk) {
    const auto pixel = convert_color (
        colorspace_t::device_rgb (), { 1, 0, 0 }, colorspace_t::device_cmyk (),
        false, 1);

    BOOST_TEST ((pixel == bytes_type{ 0, 255, 255, 0 }));
}

BOOST_AUTO_TEST_CASE(rgb_to_gray_with_alpha) {
    const auto pixel = convert_color (
        colorspace_t::device_rgb (), { 1, 0, 0 }, colorspace_t::device_gray (),
        true, 0.5);

    BOOST_TEST ((pixel == bytes_type{ 76, 128 }));
}

BOOST_AUTO_TEST_CASE(out_of_range_components) {
    const auto pixel = convert_color (
        colorspace_t::device_rgb (), { 2, -1, 0.5 },
        colorspace_t::device_rgb (), false, 1);

    BOOST_TEST ((pixel == bytes_type{ 255, 0, 128 }));
}

BOOST_AUTO_TEST_CASE(wrong_component_count) {
    const auto pixel = convert_color (
        colorspace_t::device_rgb (), { 1 }, colorspace_t::device_gray (),
        false, 1);

    BOOST_TEST ((pixel == bytes_type{ 0 }));
}

BOOST_AUTO_TEST_CASE(partial_coverage) {
    pixmap_t canvas (colorspace_t::device_gray (), 3, 1, false);
    canvas.clear (0);

    const unsigned char coverage[] = { 255, 51, 0 };
    composite (canvas, 0, 0, 3, coverage, { 255 });

    BOOST_TEST (canvas.pixel (0, 0) [0] == 255);
    BOOST_TEST (canvas.pixel (1, 0) [0] == 51);
    BOOST_TEST (canvas.pixel (2, 0) [0] == 0);
}

BOOST_AUTO_TEST_SUITE_END()
