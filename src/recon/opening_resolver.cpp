#include <archgraph/recon/opening_resolver.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace archgraph::recon {

using namespace archgraph::core;

namespace {

bool matches_orientation(Point2 a, Point2 b, const std::optional<OrientationHint>& hint) {
  if (!hint) return true;
  const double dx = std::abs(b.x - a.x);
  const double dy = std::abs(b.y - a.y);
  return *hint == OrientationHint::Horizontal ? dx >= dy : dy >= dx;
}

/// Strict weak order on candidates: distance, then length per tie_break, then id.
bool better(const HostCandidate& lhs, const HostCandidate& rhs, HostTieBreak tie_break) {
  if (lhs.distance != rhs.distance) return lhs.distance < rhs.distance;
  if (lhs.length != rhs.length) {
    return tie_break == HostTieBreak::ShorterWall ? lhs.length < rhs.length
                                                  : lhs.length > rhs.length;
  }
  return lhs.segment < rhs.segment;
}

}  // namespace

std::optional<HostCandidate> find_host_wall(const WallGraph& graph, const IconDetection& icon,
                                            double tolerance, HostTieBreak tie_break) {
  const Point2 center = icon.box.center();
  std::optional<HostCandidate> best;

  for (SegmentId s = 0; s < graph.segments().size(); ++s) {
    const WallSegment& seg = graph.segment(s);
    const Point2 a = graph.corner(seg.a);
    const Point2 b = graph.corner(seg.b);
    if (!matches_orientation(a, b, icon.orientation)) continue;

    const auto proj = project_onto_segment(center, a, b);
    if (proj.t < 0.0 || proj.t > 1.0) continue;
    if (proj.distance > seg.thickness * 0.5 + tolerance) continue;

    const HostCandidate candidate{s, proj.distance, distance(a, b)};
    if (!best || better(candidate, *best, tie_break)) best = candidate;
  }
  return best;
}

OpeningResolution resolve_openings(const WallGraph& graph, const FaceSet& faces,
                                   const FloorplanInput& input,
                                   const ReconstructionConfig& config,
                                   std::vector<Anomaly>& anomalies) {
  OpeningResolution out;

  for (std::size_t i = 0; i < input.icons.size(); ++i) {
    const IconDetection& icon = input.icons[i];
    if (!config.is_opening_category(icon.category)) continue;

    const auto host = find_host_wall(graph, icon, config.opening_match_tolerance,
                                     config.host_tie_break);
    if (!host) {
      anomalies.push_back(Anomaly{AnomalyKind::UnmatchedOpening,
                                  icon.category + " icon " + std::to_string(i) +
                                      " has no host wall within tolerance",
                                  i});
      out.fallback_objects.push_back(ObjectBox{icon.category, icon.box});
      continue;
    }

    const WallSegment& seg = graph.segment(host->segment);
    const Point2 a = graph.corner(seg.a);
    const Point2 b = graph.corner(seg.b);
    const double len = host->length;

    double lo = len;
    double hi = 0.0;
    for (const Point2& p : icon.box.corners()) {
      const double along = std::clamp(project_onto_segment(p, a, b).t * len, 0.0, len);
      lo = std::min(lo, along);
      hi = std::max(hi, along);
    }

    ResolvedOpening opening;
    opening.icon_index = i;
    opening.category = icon.category;
    opening.kind =
        config.is_window_category(icon.category) ? OpeningClass::Window : OpeningClass::Door;
    opening.host = host->segment;
    opening.span_start = lo;
    opening.span_end = hi;
    opening.position = std::clamp(project_onto_segment(icon.box.center(), a, b).t, 0.0, 1.0);
    opening.rooms = faces.faces_of_segment(host->segment);

    if (opening.rooms.empty()) {
      anomalies.push_back(Anomaly{AnomalyKind::UnattachedWall,
                                  icon.category + " icon " + std::to_string(i) +
                                      " sits on a wall that bounds no room",
                                  i});
    }
    out.openings.push_back(std::move(opening));
  }
  return out;
}

OpeningResolveStage::OpeningResolveStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> OpeningResolveStage::process(ReconstructionState& state) {
  auto resolution =
      resolve_openings(state.graph, state.faces, state.input, config_, state.anomalies);
  state.openings = std::move(resolution.openings);
  for (auto& box : resolution.fallback_objects) {
    state.objects.push_back(std::move(box));
  }
  return {};
}

}  // namespace archgraph::recon
