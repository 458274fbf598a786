#pragma once

#include <archgraph/core/geometry.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace archgraph::core {

using CornerId = std::size_t;
using SegmentId = std::size_t;
using HalfEdgeId = std::size_t;

/// Undirected wall segment between two graph corners.
struct WallSegment {
  CornerId a{0};
  CornerId b{0};
  double thickness{0.0};
  std::optional<std::size_t> left_label;   // room-type label index left of a->b
  std::optional<std::size_t> right_label;
  std::size_t source_index{0};             // index of the raw wall this piece came from
};

/// Directed traversal of a segment. Half-edge 2*s runs a->b, 2*s+1 runs b->a.
struct HalfEdge {
  SegmentId segment{0};
  CornerId from{0};
  CornerId to{0};
};

/// Memory: arena storage; corners and segments are addressed by index and half-edges are
/// derived on demand, so the graph holds no pointers into itself and copies cheaply.
/// Invariant: every segment's endpoints are valid corner ids and differ from each other.
class WallGraph {
 public:
  CornerId add_corner(Point2 position);

  /// Adds a segment between existing, distinct corners. Returns its id.
  SegmentId add_segment(WallSegment segment);

  /// Corner within tolerance of p (closest one), if any.
  [[nodiscard]] std::optional<CornerId> find_corner(Point2 p, double tolerance) const;

  /// Replaces segment s by (a, at) and appends (at, b). Returns the id of the new piece.
  SegmentId split_segment(SegmentId s, CornerId at);

  void move_corner(CornerId c, Point2 position) { corners_[c] = position; }

  [[nodiscard]] const std::vector<Point2>& corners() const noexcept { return corners_; }
  [[nodiscard]] const std::vector<WallSegment>& segments() const noexcept { return segments_; }
  [[nodiscard]] Point2 corner(CornerId c) const { return corners_[c]; }
  [[nodiscard]] const WallSegment& segment(SegmentId s) const { return segments_[s]; }
  [[nodiscard]] const std::vector<SegmentId>& incident(CornerId c) const { return incident_[c]; }
  [[nodiscard]] std::size_t degree(CornerId c) const { return incident_[c].size(); }
  [[nodiscard]] double segment_length(SegmentId s) const;

  [[nodiscard]] std::size_t half_edge_count() const noexcept { return segments_.size() * 2; }
  [[nodiscard]] HalfEdge half_edge(HalfEdgeId h) const;
  [[nodiscard]] static constexpr HalfEdgeId twin(HalfEdgeId h) noexcept { return h ^ 1u; }

  /// Half-edges leaving corner c, in incidence order.
  [[nodiscard]] std::vector<HalfEdgeId> outgoing(CornerId c) const;

  /// Corner sets of the connected components that contain at least one segment,
  /// ordered by their smallest corner id.
  [[nodiscard]] std::vector<std::vector<CornerId>> connected_components() const;

  [[nodiscard]] bool empty() const noexcept { return segments_.empty(); }

 private:
  std::vector<Point2> corners_;
  std::vector<WallSegment> segments_;
  std::vector<std::vector<SegmentId>> incident_;
};

}  // namespace archgraph::core
