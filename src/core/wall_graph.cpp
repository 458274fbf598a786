#include <archgraph/core/wall_graph.hpp>
#include <algorithm>
#include <limits>

namespace archgraph::core {

CornerId WallGraph::add_corner(Point2 position) {
  corners_.push_back(position);
  incident_.emplace_back();
  return corners_.size() - 1;
}

SegmentId WallGraph::add_segment(WallSegment segment) {
  const SegmentId id = segments_.size();
  incident_[segment.a].push_back(id);
  incident_[segment.b].push_back(id);
  segments_.push_back(std::move(segment));
  return id;
}

std::optional<CornerId> WallGraph::find_corner(Point2 p, double tolerance) const {
  std::optional<CornerId> best;
  double best_dist = std::numeric_limits<double>::max();
  for (CornerId c = 0; c < corners_.size(); ++c) {
    const double d = distance(p, corners_[c]);
    if (d <= tolerance && d < best_dist) {
      best = c;
      best_dist = d;
    }
  }
  return best;
}

SegmentId WallGraph::split_segment(SegmentId s, CornerId at) {
  WallSegment tail = segments_[s];
  const CornerId old_b = tail.b;
  tail.a = at;

  auto& old_incident = incident_[old_b];
  old_incident.erase(std::find(old_incident.begin(), old_incident.end(), s));
  segments_[s].b = at;
  incident_[at].push_back(s);

  return add_segment(std::move(tail));
}

double WallGraph::segment_length(SegmentId s) const {
  const auto& seg = segments_[s];
  return distance(corners_[seg.a], corners_[seg.b]);
}

HalfEdge WallGraph::half_edge(HalfEdgeId h) const {
  const SegmentId s = h / 2;
  const auto& seg = segments_[s];
  if ((h & 1u) == 0) return {s, seg.a, seg.b};
  return {s, seg.b, seg.a};
}

std::vector<HalfEdgeId> WallGraph::outgoing(CornerId c) const {
  std::vector<HalfEdgeId> out;
  out.reserve(incident_[c].size());
  for (SegmentId s : incident_[c]) {
    out.push_back(segments_[s].a == c ? 2 * s : 2 * s + 1);
  }
  return out;
}

std::vector<std::vector<CornerId>> WallGraph::connected_components() const {
  std::vector<std::vector<CornerId>> components;
  std::vector<bool> seen(corners_.size(), false);
  std::vector<CornerId> stack;

  for (CornerId start = 0; start < corners_.size(); ++start) {
    if (seen[start] || incident_[start].empty()) continue;
    std::vector<CornerId> component;
    seen[start] = true;
    stack.push_back(start);
    while (!stack.empty()) {
      const CornerId c = stack.back();
      stack.pop_back();
      component.push_back(c);
      for (SegmentId s : incident_[c]) {
        const CornerId other = segments_[s].a == c ? segments_[s].b : segments_[s].a;
        if (!seen[other]) {
          seen[other] = true;
          stack.push_back(other);
        }
      }
    }
    std::sort(component.begin(), component.end());
    components.push_back(std::move(component));
  }
  return components;
}

}  // namespace archgraph::core
