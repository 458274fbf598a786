#include <archgraph/recon/wall_graph_builder.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace archgraph::recon {

using namespace archgraph::core;

namespace {

bool label_in_range(const std::optional<std::size_t>& label, std::size_t count) {
  return !label || *label < count;
}

/// Splits segment s at corner c if c lies strictly inside it, away from both ends.
bool split_if_interior(WallGraph& graph, SegmentId s, CornerId c, double tolerance) {
  const WallSegment& seg = graph.segment(s);
  if (c == seg.a || c == seg.b) return false;
  const Point2 a = graph.corner(seg.a);
  const Point2 b = graph.corner(seg.b);
  const double len = distance(a, b);
  const auto proj = project_onto_segment(graph.corner(c), a, b);
  const double along = proj.t * len;
  if (proj.distance > tolerance || along <= tolerance || along >= len - tolerance) {
    return false;
  }
  graph.split_segment(s, c);
  return true;
}

}  // namespace

std::expected<WallGraph, ConversionError> build_wall_graph(
    const FloorplanInput& input, const ReconstructionConfig& config,
    std::vector<Anomaly>& anomalies) {
  const std::size_t label_count = config.room_type_labels.size();
  for (const auto& w : input.walls) {
    if (w.corner_a >= input.corners.size() || w.corner_b >= input.corners.size()) {
      return std::unexpected(ConversionError::InvalidGeometry);
    }
    if (!label_in_range(w.left_label, label_count) ||
        !label_in_range(w.right_label, label_count)) {
      return std::unexpected(ConversionError::InvalidConfig);
    }
  }

  WallGraph graph;
  std::vector<std::optional<CornerId>> node_of(input.corners.size());
  auto node_for = [&](std::size_t index) {
    if (!node_of[index]) {
      const Point2 p = input.corners[index];
      auto existing = graph.find_corner(p, config.corner_snap_tolerance);
      node_of[index] = existing ? *existing : graph.add_corner(p);
    }
    return *node_of[index];
  };

  for (std::size_t i = 0; i < input.walls.size(); ++i) {
    const auto& w = input.walls[i];
    const CornerId a = node_for(w.corner_a);
    const CornerId b = node_for(w.corner_b);
    if (a == b) {
      anomalies.push_back(Anomaly{AnomalyKind::DegenerateSegment,
                                  "wall " + std::to_string(i) + " collapses to a point", i});
      continue;
    }
    WallSegment seg;
    seg.a = a;
    seg.b = b;
    seg.thickness = w.thickness > 0.0 ? w.thickness : config.default_wall_thickness;
    seg.left_label = w.left_label;
    seg.right_label = w.right_label;
    seg.source_index = i;
    graph.add_segment(std::move(seg));
  }

  if (config.straighten_walls) {
    straighten_walls(graph, config.straighten_cutoff_gradient, config.straighten_max_iterations);
  }
  if (config.split_walls) {
    split_at_junctions(graph, config.corner_snap_tolerance, config.split_walls_max_iterations);
  }
  return merge_duplicate_segments(graph);
}

std::size_t split_at_junctions(WallGraph& graph, double tolerance, std::size_t max_iterations) {
  std::size_t splits = 0;
  for (std::size_t iter = 0; iter < max_iterations; ++iter) {
    bool changed = false;

    for (SegmentId s = 0; s < graph.segments().size(); ++s) {
      for (CornerId c = 0; c < graph.corners().size(); ++c) {
        if (graph.degree(c) == 0) continue;
        if (split_if_interior(graph, s, c, tolerance)) {
          ++splits;
          changed = true;
        }
      }
    }

    for (SegmentId s = 0; s < graph.segments().size(); ++s) {
      for (SegmentId u = s + 1; u < graph.segments().size(); ++u) {
        const WallSegment& p = graph.segment(s);
        const WallSegment& q = graph.segment(u);
        if (p.a == q.a || p.a == q.b || p.b == q.a || p.b == q.b) continue;
        const auto hit = proper_intersection(graph.corner(p.a), graph.corner(p.b),
                                             graph.corner(q.a), graph.corner(q.b));
        if (!hit) continue;

        const auto existing = graph.find_corner(*hit, tolerance);
        const CornerId k = existing ? *existing : graph.add_corner(*hit);
        const bool split_s = split_if_interior(graph, s, k, tolerance);
        const bool split_u = split_if_interior(graph, u, k, tolerance);
        if (split_s || split_u) {
          splits += static_cast<std::size_t>(split_s) + static_cast<std::size_t>(split_u);
          changed = true;
        }
      }
    }

    if (!changed) break;
  }
  return splits;
}

std::size_t straighten_walls(WallGraph& graph, double cutoff_gradient,
                             std::size_t max_iterations) {
  std::size_t moved = 0;
  for (std::size_t iter = 0; iter < max_iterations; ++iter) {
    bool found = false;
    for (SegmentId s = 0; s < graph.segments().size() && !found; ++s) {
      const WallSegment& seg = graph.segment(s);
      const Point2 a = graph.corner(seg.a);
      const Point2 b = graph.corner(seg.b);
      const double len = distance(a, b);
      if (len <= 0.0) continue;

      const double gx = std::abs(a.x - b.x) / len;
      const double gy = std::abs(a.y - b.y) / len;
      if (gx > 0.0 && gx < cutoff_gradient) {
        // Near-vertical: align the upper corner onto the lower one's x.
        if (a.y > b.y) graph.move_corner(seg.a, {b.x, a.y});
        else graph.move_corner(seg.b, {a.x, b.y});
        found = true;
      } else if (gy > 0.0 && gy < cutoff_gradient) {
        if (a.x < b.x) graph.move_corner(seg.a, {a.x, b.y});
        else graph.move_corner(seg.b, {b.x, a.y});
        found = true;
      }
    }
    if (!found) break;
    ++moved;
  }
  return moved;
}

WallGraph merge_duplicate_segments(const WallGraph& graph) {
  std::vector<WallSegment> kept;
  std::map<std::pair<CornerId, CornerId>, std::size_t> index_of;

  for (const auto& seg : graph.segments()) {
    const auto key = std::minmax(seg.a, seg.b);
    const auto it = index_of.find({key.first, key.second});
    if (it == index_of.end()) {
      index_of.emplace(std::make_pair(key.first, key.second), kept.size());
      kept.push_back(seg);
      continue;
    }
    WallSegment& target = kept[it->second];
    const bool reversed = target.a != seg.a;
    const auto& left = reversed ? seg.right_label : seg.left_label;
    const auto& right = reversed ? seg.left_label : seg.right_label;
    target.thickness = std::max(target.thickness, seg.thickness);
    if (!target.left_label) target.left_label = left;
    if (!target.right_label) target.right_label = right;
  }

  WallGraph out;
  for (const auto& c : graph.corners()) out.add_corner(c);
  for (auto& seg : kept) out.add_segment(std::move(seg));
  return out;
}

WallGraphStage::WallGraphStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> WallGraphStage::process(ReconstructionState& state) {
  auto graph = build_wall_graph(state.input, config_, state.anomalies);
  if (!graph) {
    return std::unexpected(graph.error());
  }
  state.graph = std::move(*graph);
  return {};
}

}  // namespace archgraph::recon
