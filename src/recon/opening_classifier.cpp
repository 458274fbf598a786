#include <archgraph/recon/opening_classifier.hpp>
#include <archgraph/recon/room_labeler.hpp>
#include <algorithm>
#include <limits>
#include <optional>

namespace archgraph::recon {

using namespace archgraph::core;

namespace {

/// Distance from p to the stretch of the host wall the opening occupies.
double distance_to_opening(const WallGraph& graph, const ResolvedOpening& opening, Point2 p) {
  const WallSegment& seg = graph.segment(opening.host);
  const Point2 a = graph.corner(seg.a);
  const Point2 b = graph.corner(seg.b);
  const double len = distance(a, b);
  if (len <= 0.0) return distance(p, a);

  const Point2 dir = (b - a) * (1.0 / len);
  const Point2 start = a + dir * opening.span_start;
  const Point2 end = a + dir * opening.span_end;
  const auto proj = project_onto_segment(p, start, end);
  if (proj.t <= 0.0) return distance(p, start);
  if (proj.t >= 1.0) return distance(p, end);
  return proj.distance;
}

}  // namespace

void classify_openings(std::vector<ResolvedOpening>& openings, const WallGraph& graph,
                       const FaceSet& faces, const FloorplanInput& input,
                       const ReconstructionConfig& config) {
  std::vector<std::optional<OpeningClass>> decided(openings.size());
  for (std::size_t i = 0; i < openings.size(); ++i) {
    if (openings[i].rooms.size() == 2) decided[i] = OpeningClass::Door;
  }

  for (const auto& icon : input.icons) {
    if (!config.is_annotation_category(icon.category)) continue;
    const auto room = face_containing(faces, icon.box.center());
    if (!room) continue;

    std::optional<std::size_t> closest;
    double closest_dist = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < openings.size(); ++i) {
      if (decided[i]) continue;
      const auto& rooms = openings[i].rooms;
      if (std::find(rooms.begin(), rooms.end(), *room) == rooms.end()) continue;
      const double d = distance_to_opening(graph, openings[i], icon.box.center());
      if (d < closest_dist) {
        closest = i;
        closest_dist = d;
      }
    }
    if (closest) decided[*closest] = OpeningClass::Door;
  }

  for (std::size_t i = 0; i < openings.size(); ++i) {
    openings[i].kind = decided[i].value_or(OpeningClass::Window);
  }
}

OpeningClassifyStage::OpeningClassifyStage(const ReconstructionConfig& config)
    : config_(config) {}

std::expected<void, ConversionError> OpeningClassifyStage::process(ReconstructionState& state) {
  if (config_.classify_openings) {
    classify_openings(state.openings, state.graph, state.faces, state.input, config_);
  }
  return {};
}

}  // namespace archgraph::recon
