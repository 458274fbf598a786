#pragma once

#include <array>
#include <optional>
#include <vector>

namespace archgraph::core {

/// 2D point or vector. Pixel space on input, metric after normalization.
struct Point2 {
  double x{0.0};
  double y{0.0};

  friend bool operator==(const Point2&, const Point2&) = default;
};

[[nodiscard]] constexpr Point2 operator+(Point2 a, Point2 b) noexcept {
  return {a.x + b.x, a.y + b.y};
}
[[nodiscard]] constexpr Point2 operator-(Point2 a, Point2 b) noexcept {
  return {a.x - b.x, a.y - b.y};
}
[[nodiscard]] constexpr Point2 operator*(Point2 a, double s) noexcept {
  return {a.x * s, a.y * s};
}

[[nodiscard]] constexpr double dot(Point2 a, Point2 b) noexcept {
  return a.x * b.x + a.y * b.y;
}
[[nodiscard]] constexpr double cross(Point2 a, Point2 b) noexcept {
  return a.x * b.y - a.y * b.x;
}
[[nodiscard]] double length(Point2 v) noexcept;
[[nodiscard]] double distance(Point2 a, Point2 b) noexcept;

/// Axis-aligned box given by its min and max corners.
struct Box2 {
  Point2 min;
  Point2 max;

  /// Box spanning two arbitrary corner points.
  [[nodiscard]] static Box2 from_corners(Point2 a, Point2 b) noexcept;

  [[nodiscard]] Point2 center() const noexcept {
    return {(min.x + max.x) * 0.5, (min.y + max.y) * 0.5};
  }
  [[nodiscard]] double width() const noexcept { return max.x - min.x; }
  [[nodiscard]] double height() const noexcept { return max.y - min.y; }
  [[nodiscard]] bool contains(Point2 p) const noexcept {
    return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
  }
  [[nodiscard]] std::array<Point2, 4> corners() const noexcept {
    return {min, Point2{max.x, min.y}, max, Point2{min.x, max.y}};
  }

  friend bool operator==(const Box2&, const Box2&) = default;
};

/// Projection of a point onto the line through segment (a, b).
struct SegmentProjection {
  double t{0.0};         // parameter along a->b; 0 at a, 1 at b (not clamped)
  double distance{0.0};  // perpendicular distance to the infinite line
  Point2 foot;           // foot of the perpendicular
};

/// Projects p onto the line through a and b. A zero-length segment yields t = 0
/// and the distance to a.
[[nodiscard]] SegmentProjection project_onto_segment(Point2 p, Point2 a, Point2 b) noexcept;

/// Intersection point of segments (p1, p2) and (q1, q2) when they cross at a single
/// point strictly inside both (endpoints excluded by eps in parameter space).
[[nodiscard]] std::optional<Point2> proper_intersection(Point2 p1, Point2 p2,
                                                        Point2 q1, Point2 q2,
                                                        double eps = 1e-9) noexcept;

/// Shoelace signed area; positive for counter-clockwise order in a y-up frame.
[[nodiscard]] double signed_area(const std::vector<Point2>& polygon) noexcept;

/// Area-weighted centroid; falls back to the vertex mean for degenerate polygons.
[[nodiscard]] Point2 polygon_centroid(const std::vector<Point2>& polygon) noexcept;

/// Even-odd point-in-polygon test.
[[nodiscard]] bool point_in_polygon(Point2 p, const std::vector<Point2>& polygon) noexcept;

/// True if no two non-adjacent edges of the closed polygon touch and no vertex repeats.
[[nodiscard]] bool is_simple_polygon(const std::vector<Point2>& polygon);

}  // namespace archgraph::core
