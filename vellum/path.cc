// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#include <defs.hh>

#include <algorithm>

#include <variant>

#include <vellum/path.hh>
#include <utils/overload.hh>

namespace vellum {

rect_t
path_t::bounds () const {
    auto box = rect_t::empty ();

    for (const auto& element : elements_) {
        std::visit (overload_{
                [&](const move_to_t& x) { box = include (box, x.p); },
                [&](const line_to_t& x) { box = include (box, x.p); },
                [&](const quad_to_t& x) {
                    box = include (include (box, x.p1), x.p2);
                },
                [&](const curve_to_t& x) {
                    box = include (include (include (box, x.p1), x.p2), x.p3);
                },
                [&](const close_t&) { },
                [&](const rectangle_t& x) {
                    box = include (box, point_t{ x.r.x0, x.r.y0 });
                    box = include (box, point_t{ x.r.x1, x.r.y1 });
                }
            }, element);
    }

    return box;
}

std::optional< point_t >
path_t::current_point () const {
    std::optional< point_t > current, start;

    for (const auto& element : elements_) {
        std::visit (overload_{
                [&](const move_to_t& x) { current = start = x.p; },
                [&](const line_to_t& x) { current = x.p; },
                [&](const quad_to_t& x) { current = x.p2; },
                [&](const curve_to_t& x) { current = x.p3; },
                [&](const close_t&) { current = start; },
                [&](const rectangle_t& x) {
                    current = start = point_t{ x.r.x0, x.r.y0 };
                }
            }, element);
    }

    return current;
}

bool
path_t::is_rect_only () const {
    if (elements_.empty ()) {
        return false;
    }

    for (const auto& element : elements_) {
        if (!std::holds_alternative< rectangle_t > (element)) {
            return false;
        }
    }

    return true;
}

path_t
transform (const path_t& path, const matrix_t& m) {
    path_t result;

    const bool rectilinear = m.is_rectilinear ();

    for (const auto& element : path.elements ()) {
        std::visit (overload_{
                [&](const move_to_t& x) { result.move_to (transform (x.p, m)); },
                [&](const line_to_t& x) { result.line_to (transform (x.p, m)); },
                [&](const quad_to_t& x) {
                    result.quad_to (transform (x.p1, m), transform (x.p2, m));
                },
                [&](const curve_to_t& x) {
                    result.curve_to (
                        transform (x.p1, m), transform (x.p2, m),
                        transform (x.p3, m));
                },
                [&](const close_t&) { result.close (); },
                [&](const rectangle_t& x) {
                    if (rectilinear) {
                        //
                        // Corners may come in any order, e.g., a negative
                        // height:
                        //
                        const auto p = transform (point_t{ x.r.x0, x.r.y0 }, m);
                        const auto q = transform (point_t{ x.r.x1, x.r.y1 }, m);

                        result.rect ({
                                (std::min) (p.x, q.x), (std::min) (p.y, q.y),
                                (std::max) (p.x, q.x), (std::max) (p.y, q.y) });
                    }
                    else {
                        const auto& [ x0, y0, x1, y1 ] = x.r;

                        result.move_to (transform (point_t{ x0, y0 }, m));
                        result.line_to (transform (point_t{ x1, y0 }, m));
                        result.line_to (transform (point_t{ x1, y1 }, m));
                        result.line_to (transform (point_t{ x0, y1 }, m));
                        result.close ();
                    }
                }
            }, element);
    }

    return result;
}

const char*
name_of (line_cap_t cap) {
    switch (cap) {
    case line_cap_t::butt:     return "butt";
    case line_cap_t::round:    return "round";
    case line_cap_t::square:   return "square";
    case line_cap_t::triangle: return "triangle";
    }

    return "unknown";
}

const char*
name_of (line_join_t join) {
    switch (join) {
    case line_join_t::miter:     return "miter";
    case line_join_t::round:     return "round";
    case line_join_t::bevel:     return "bevel";
    case line_join_t::miter_xps: return "miter-xps";
    }

    return "unknown";
}

} // namespace vellum
