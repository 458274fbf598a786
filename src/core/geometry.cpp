#include <archgraph/core/geometry.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace archgraph::core {

namespace {

int orientation(Point2 a, Point2 b, Point2 c) {
  const double v = cross(b - a, c - a);
  if (v > 0.0) return 1;
  if (v < 0.0) return -1;
  return 0;
}

bool on_segment(Point2 a, Point2 b, Point2 p) {
  return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x) &&
         std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
}

bool segments_touch(Point2 p1, Point2 p2, Point2 q1, Point2 q2) {
  const int o1 = orientation(p1, p2, q1);
  const int o2 = orientation(p1, p2, q2);
  const int o3 = orientation(q1, q2, p1);
  const int o4 = orientation(q1, q2, p2);
  if (o1 != o2 && o3 != o4) return true;
  if (o1 == 0 && on_segment(p1, p2, q1)) return true;
  if (o2 == 0 && on_segment(p1, p2, q2)) return true;
  if (o3 == 0 && on_segment(q1, q2, p1)) return true;
  if (o4 == 0 && on_segment(q1, q2, p2)) return true;
  return false;
}

}  // namespace

double length(Point2 v) noexcept { return std::hypot(v.x, v.y); }

double distance(Point2 a, Point2 b) noexcept { return length(b - a); }

Box2 Box2::from_corners(Point2 a, Point2 b) noexcept {
  return Box2{{std::min(a.x, b.x), std::min(a.y, b.y)},
              {std::max(a.x, b.x), std::max(a.y, b.y)}};
}

SegmentProjection project_onto_segment(Point2 p, Point2 a, Point2 b) noexcept {
  const Point2 ab = b - a;
  const double len2 = dot(ab, ab);
  if (len2 <= 0.0) {
    return {0.0, distance(p, a), a};
  }
  const double t = dot(p - a, ab) / len2;
  const Point2 foot = a + ab * t;
  return {t, distance(p, foot), foot};
}

std::optional<Point2> proper_intersection(Point2 p1, Point2 p2, Point2 q1, Point2 q2,
                                          double eps) noexcept {
  const Point2 r = p2 - p1;
  const Point2 s = q2 - q1;
  const double denom = cross(r, s);
  if (std::abs(denom) < 1e-12) return std::nullopt;  // parallel or collinear

  const Point2 qp = q1 - p1;
  const double t = cross(qp, s) / denom;
  const double u = cross(qp, r) / denom;
  if (t <= eps || t >= 1.0 - eps || u <= eps || u >= 1.0 - eps) return std::nullopt;
  return p1 + r * t;
}

double signed_area(const std::vector<Point2>& polygon) noexcept {
  const std::size_t n = polygon.size();
  if (n < 3) return 0.0;
  double twice = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    twice += cross(polygon[i], polygon[(i + 1) % n]);
  }
  return 0.5 * twice;
}

Point2 polygon_centroid(const std::vector<Point2>& polygon) noexcept {
  const std::size_t n = polygon.size();
  if (n == 0) return {};

  const double area = signed_area(polygon);
  if (std::abs(area) < 1e-12) {
    Point2 mean;
    for (const auto& p : polygon) mean = mean + p;
    return mean * (1.0 / static_cast<double>(n));
  }

  double cx = 0.0;
  double cy = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Point2& p = polygon[i];
    const Point2& q = polygon[(i + 1) % n];
    const double c = cross(p, q);
    cx += (p.x + q.x) * c;
    cy += (p.y + q.y) * c;
  }
  const double factor = 1.0 / (6.0 * area);
  return {cx * factor, cy * factor};
}

bool point_in_polygon(Point2 p, const std::vector<Point2>& polygon) noexcept {
  bool inside = false;
  const std::size_t n = polygon.size();
  for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
    const Point2& a = polygon[i];
    const Point2& b = polygon[j];
    if ((a.y > p.y) != (b.y > p.y)) {
      const double x_cross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
      if (p.x < x_cross) inside = !inside;
    }
  }
  return inside;
}

bool is_simple_polygon(const std::vector<Point2>& polygon) {
  const std::size_t n = polygon.size();
  if (n < 3) return false;

  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      if (polygon[i] == polygon[j]) return false;
    }
  }

  for (std::size_t i = 0; i < n; ++i) {
    const Point2& a1 = polygon[i];
    const Point2& a2 = polygon[(i + 1) % n];
    for (std::size_t j = i + 1; j < n; ++j) {
      // Consecutive edges share a vertex by construction.
      if (j == i + 1 || (i == 0 && j == n - 1)) continue;
      const Point2& b1 = polygon[j];
      const Point2& b2 = polygon[(j + 1) % n];
      if (segments_touch(a1, a2, b1, b2)) return false;
    }
  }
  return true;
}

}  // namespace archgraph::core
