// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef VELLUM_VELLUM_PATH_HH
#define VELLUM_VELLUM_PATH_HH

#include <defs.hh>

#include <optional>
#include <variant>
#include <vector>

#include <vellum/geometry.hh>

namespace vellum {

struct move_to_t  { point_t p; };
struct line_to_t  { point_t p; };
struct quad_to_t  { point_t p1, p2; };
struct curve_to_t { point_t p1, p2, p3; };
struct close_t    { };
struct rectangle_t { rect_t r; };

inline bool operator== (const move_to_t& lhs, const move_to_t& rhs) {
    return lhs.p == rhs.p;
}

inline bool operator== (const line_to_t& lhs, const line_to_t& rhs) {
    return lhs.p == rhs.p;
}

inline bool operator== (const quad_to_t& lhs, const quad_to_t& rhs) {
    return lhs.p1 == rhs.p1 && lhs.p2 == rhs.p2;
}

inline bool operator== (const curve_to_t& lhs, const curve_to_t& rhs) {
    return lhs.p1 == rhs.p1 && lhs.p2 == rhs.p2 && lhs.p3 == rhs.p3;
}

inline bool operator== (const close_t&, const close_t&) { return true; }

inline bool operator== (const rectangle_t& lhs, const rectangle_t& rhs) {
    return lhs.r == rhs.r;
}

using path_element_t = std::variant<
    move_to_t, line_to_t, quad_to_t, curve_to_t, close_t, rectangle_t >;

//
// Ordered sequence of drawing elements. A line, curve or close continues
// from the last emitted point; a close returns to the start of the current
// subpath. A rectangle is a closed subpath of its own:
//
struct path_t {
    path_t& move_to (const point_t& p) {
        return elements_.emplace_back (move_to_t{ p }), *this;
    }

    path_t& line_to (const point_t& p) {
        return elements_.emplace_back (line_to_t{ p }), *this;
    }

    path_t& quad_to (const point_t& p1, const point_t& p2) {
        return elements_.emplace_back (quad_to_t{ p1, p2 }), *this;
    }

    path_t& curve_to (const point_t& p1, const point_t& p2, const point_t& p3) {
        return elements_.emplace_back (curve_to_t{ p1, p2, p3 }), *this;
    }

    path_t& close () {
        return elements_.emplace_back (close_t{ }), *this;
    }

    path_t& rect (const rect_t& r) {
        return elements_.emplace_back (rectangle_t{ r }), *this;
    }

    // Appends the subpaths of `other'
    path_t& append (const path_t& other) {
        elements_.insert (
            elements_.end (), other.elements_.begin (), other.elements_.end ());
        return *this;
    }

    const std::vector< path_element_t >& elements () const {
        return elements_;
    }

    size_t size () const { return elements_.size (); }
    bool empty () const { return elements_.empty (); }

    void clear () { elements_.clear (); }

    //
    // Box covering every point, control points included:
    //
    rect_t bounds () const;

    std::optional< point_t > current_point () const;

    bool is_rect_only () const;

private:
    std::vector< path_element_t > elements_;
};

inline bool
operator== (const path_t& lhs, const path_t& rhs) {
    return lhs.elements () == rhs.elements ();
}

inline bool
operator!= (const path_t& lhs, const path_t& rhs) {
    return !(lhs == rhs);
}

//
// Rectangles survive a rectilinear transform; otherwise they are spelled out
// as closed four-point subpaths:
//
path_t transform (const path_t&, const matrix_t&);

////////////////////////////////////////////////////////////////////////

enum struct line_cap_t { butt, round, square, triangle };
enum struct line_join_t { miter, round, bevel, miter_xps };

const char* name_of (line_cap_t);
const char* name_of (line_join_t);

struct stroke_state_t {
    double linewidth = 1;
    double miterlimit = 10;

    line_cap_t start_cap = line_cap_t::butt;
    line_cap_t dash_cap = line_cap_t::butt;
    line_cap_t end_cap = line_cap_t::butt;

    line_join_t linejoin = line_join_t::miter;

    double dash_phase = 0;
    std::vector< double > dash_pattern;

    bool is_dashed () const { return !dash_pattern.empty (); }
};

inline bool
operator== (const stroke_state_t& lhs, const stroke_state_t& rhs) {
    return lhs.linewidth    == rhs.linewidth    &&
           lhs.miterlimit   == rhs.miterlimit   &&
           lhs.start_cap    == rhs.start_cap    &&
           lhs.dash_cap     == rhs.dash_cap     &&
           lhs.end_cap      == rhs.end_cap      &&
           lhs.linejoin     == rhs.linejoin     &&
           lhs.dash_phase   == rhs.dash_phase   &&
           lhs.dash_pattern == rhs.dash_pattern;
}

inline bool
operator!= (const stroke_state_t& lhs, const stroke_state_t& rhs) {
    return !(lhs == rhs);
}

} // namespace vellum

#endif // VELLUM_VELLUM_PATH_HH
