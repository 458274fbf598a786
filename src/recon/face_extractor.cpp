#include <archgraph/recon/face_extractor.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <utility>

namespace archgraph::recon {

using namespace archgraph::core;

namespace {

constexpr double kMinFaceArea = 1e-12;

/// Angle-sorted outgoing half-edges per corner, restricted to active segments.
struct Rotation {
  std::vector<std::vector<HalfEdgeId>> ring;
  std::vector<std::size_t> position;  // index of each half-edge in its origin's ring
};

Rotation build_rotation(const WallGraph& graph, const std::vector<bool>& active) {
  Rotation r;
  r.ring.resize(graph.corners().size());
  r.position.assign(graph.half_edge_count(), 0);

  for (CornerId c = 0; c < graph.corners().size(); ++c) {
    auto& ring = r.ring[c];
    for (HalfEdgeId h : graph.outgoing(c)) {
      if (active[h / 2]) ring.push_back(h);
    }
    const Point2 origin = graph.corner(c);
    auto angle = [&](HalfEdgeId h) {
      const Point2 d = graph.corner(graph.half_edge(h).to) - origin;
      return std::atan2(d.y, d.x);
    };
    std::sort(ring.begin(), ring.end(), [&](HalfEdgeId lhs, HalfEdgeId rhs) {
      const double al = angle(lhs);
      const double ar = angle(rhs);
      if (al != ar) return al < ar;
      return lhs < rhs;
    });
    for (std::size_t i = 0; i < ring.size(); ++i) r.position[ring[i]] = i;
  }
  return r;
}

/// Half-edge after h on the face to h's left: the one preceding twin(h) in
/// counter-clockwise order around h's end corner.
HalfEdgeId next_half_edge(const WallGraph& graph, const Rotation& r, HalfEdgeId h) {
  const CornerId at = graph.half_edge(h).to;
  const auto& ring = r.ring[at];
  const std::size_t n = ring.size();
  return ring[(r.position[WallGraph::twin(h)] + n - 1) % n];
}

void prune_dangling(const WallGraph& graph, std::vector<bool>& active) {
  std::vector<std::size_t> degree(graph.corners().size(), 0);
  for (SegmentId s = 0; s < graph.segments().size(); ++s) {
    if (!active[s]) continue;
    ++degree[graph.segment(s).a];
    ++degree[graph.segment(s).b];
  }

  std::vector<CornerId> leaves;
  for (CornerId c = 0; c < degree.size(); ++c) {
    if (degree[c] == 1) leaves.push_back(c);
  }
  while (!leaves.empty()) {
    const CornerId c = leaves.back();
    leaves.pop_back();
    for (SegmentId s : graph.incident(c)) {
      if (!active[s]) continue;
      active[s] = false;
      const CornerId other = graph.segment(s).a == c ? graph.segment(s).b : graph.segment(s).a;
      --degree[c];
      if (--degree[other] == 1) leaves.push_back(other);
    }
  }
}

/// Attaches each component's outer walk to the smallest face of another component that
/// encloses it, as a hole, and nets the hole out of that face's area and centroid.
void attach_holes(const WallGraph& graph, const std::vector<std::vector<HalfEdgeId>>& outer_walks,
                  FaceSet& out) {
  if (outer_walks.empty() || out.faces.empty()) return;

  std::vector<std::size_t> component_of(graph.corners().size(), 0);
  const auto components = graph.connected_components();
  for (std::size_t i = 0; i < components.size(); ++i) {
    for (CornerId c : components[i]) component_of[c] = i;
  }

  std::vector<FaceId> parent(outer_walks.size(), kNoFace);
  for (std::size_t w = 0; w < outer_walks.size(); ++w) {
    const CornerId first = graph.half_edge(outer_walks[w].front()).from;
    const Point2 sample = graph.corner(first);
    double best_area = std::numeric_limits<double>::max();
    for (FaceId f = 0; f < out.faces.size(); ++f) {
      const Face& face = out.faces[f];
      if (component_of[face.corners.front()] == component_of[first]) continue;
      if (face.area < best_area && point_in_polygon(sample, face.polygon)) {
        parent[w] = f;
        best_area = face.area;
      }
    }
  }

  for (std::size_t w = 0; w < outer_walks.size(); ++w) {
    if (parent[w] == kNoFace) continue;
    Face& face = out.faces[parent[w]];
    std::vector<Point2> ring;
    for (HalfEdgeId e : outer_walks[w]) {
      ring.push_back(graph.corner(graph.half_edge(e).from));
      out.half_edge_face[e] = parent[w];
      face.hole_half_edges.push_back(e);
    }
    face.holes.push_back(std::move(ring));
  }

  for (auto& face : out.faces) {
    if (face.holes.empty()) continue;
    double area = face.area;
    Point2 moment = face.centroid * face.area;
    for (const auto& hole : face.holes) {
      const double a = signed_area(hole);  // negative: holes wind clockwise
      area += a;
      moment = moment + polygon_centroid(hole) * a;
    }
    face.area = area;
    if (area > kMinFaceArea) face.centroid = Point2{moment.x / area, moment.y / area};
  }
}

}  // namespace

std::vector<bool> face_bounding_segments(const WallGraph& graph) {
  std::vector<bool> active(graph.segments().size(), true);

  while (true) {
    prune_dangling(graph, active);
    const Rotation r = build_rotation(graph, active);

    // Label every active half-edge with the walk it belongs to. next_half_edge is a
    // permutation of the active half-edges, so every walk closes.
    constexpr std::size_t kUnset = static_cast<std::size_t>(-1);
    std::vector<std::size_t> walk_of(graph.half_edge_count(), kUnset);
    std::size_t walk = 0;
    for (HalfEdgeId start = 0; start < graph.half_edge_count(); ++start) {
      if (!active[start / 2] || walk_of[start] != kUnset) continue;
      HalfEdgeId h = start;
      do {
        walk_of[h] = walk;
        h = next_half_edge(graph, r, h);
      } while (h != start);
      ++walk;
    }

    bool removed = false;
    for (SegmentId s = 0; s < graph.segments().size(); ++s) {
      if (active[s] && walk_of[2 * s] == walk_of[2 * s + 1]) {
        active[s] = false;
        removed = true;
      }
    }
    if (!removed) break;
  }
  return active;
}

FaceSet extract_faces(const WallGraph& graph, std::size_t max_steps,
                      std::vector<Anomaly>& anomalies) {
  const std::vector<bool> active = face_bounding_segments(graph);
  const Rotation r = build_rotation(graph, active);
  const std::size_t half_edges = graph.half_edge_count();

  FaceSet out;
  out.half_edge_face.assign(half_edges, kNoFace);
  std::vector<bool> visited(half_edges, false);
  std::vector<std::vector<HalfEdgeId>> outer_walks;
  for (HalfEdgeId h = 0; h < half_edges; ++h) {
    if (!active[h / 2]) visited[h] = true;
  }

  for (HalfEdgeId start = 0; start < half_edges; ++start) {
    if (visited[start]) continue;

    std::vector<HalfEdgeId> walk;
    HalfEdgeId h = start;
    bool closed = false;
    while (walk.size() < max_steps) {
      walk.push_back(h);
      visited[h] = true;
      h = next_half_edge(graph, r, h);
      if (h == start) {
        closed = true;
        break;
      }
    }

    if (!closed) {
      // Consume the rest of the cycle so it is reported once.
      for (std::size_t guard = 0; h != start && guard < half_edges; ++guard) {
        visited[h] = true;
        h = next_half_edge(graph, r, h);
      }
      anomalies.push_back(Anomaly{
          AnomalyKind::Topology,
          "face walk from half-edge " + std::to_string(start) + " did not close within " +
              std::to_string(max_steps) + " steps",
          start});
      continue;
    }

    Face face;
    face.half_edges = std::move(walk);
    for (HalfEdgeId e : face.half_edges) {
      const CornerId c = graph.half_edge(e).from;
      face.corners.push_back(c);
      face.polygon.push_back(graph.corner(c));
    }
    face.area = signed_area(face.polygon);
    if (face.area < -kMinFaceArea) {
      outer_walks.push_back(std::move(face.half_edges));  // outside of a component
      continue;
    }
    if (face.area <= kMinFaceArea) continue;

    if (!is_simple_polygon(face.polygon)) {
      anomalies.push_back(Anomaly{
          AnomalyKind::DegenerateFace,
          "face walk from half-edge " + std::to_string(start) + " is not a simple polygon",
          start});
      continue;
    }

    face.centroid = polygon_centroid(face.polygon);
    const FaceId id = out.faces.size();
    for (HalfEdgeId e : face.half_edges) out.half_edge_face[e] = id;
    out.faces.push_back(std::move(face));
  }
  attach_holes(graph, outer_walks, out);
  return out;
}

FaceExtractStage::FaceExtractStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> FaceExtractStage::process(ReconstructionState& state) {
  state.faces = extract_faces(state.graph, config_.max_face_steps, state.anomalies);
  return {};
}

}  // namespace archgraph::recon
