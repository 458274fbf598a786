#pragma once

#include <archgraph/core/geometry.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace archgraph::core {

using FaceId = std::size_t;

inline constexpr FaceId kNoFace = std::numeric_limits<FaceId>::max();

/// Bounded face of the wall graph: one candidate room.
struct Face {
  std::vector<HalfEdgeId> half_edges;  // boundary walk, counter-clockwise
  std::vector<CornerId> corners;       // corner at the start of each half-edge
  std::vector<Point2> polygon;
  std::vector<std::vector<Point2>> holes;  // clockwise rings of wall loops enclosed by the face
  std::vector<HalfEdgeId> hole_half_edges;  // outer walks of those loops
  double area{0.0};  // net of holes
  Point2 centroid;
  std::string label;
  std::vector<std::string> annotations;

  /// Inside the outer polygon and outside every hole.
  [[nodiscard]] bool contains(Point2 p) const;
};

/// Faces of one wall graph plus the per-half-edge face record.
struct FaceSet {
  std::vector<Face> faces;
  std::vector<FaceId> half_edge_face;  // kNoFace for outer, dangling or dropped walks

  /// Distinct bounded faces on either side of segment s (0, 1 or 2 entries).
  [[nodiscard]] std::vector<FaceId> faces_of_segment(SegmentId s) const;
};

}  // namespace archgraph::core
