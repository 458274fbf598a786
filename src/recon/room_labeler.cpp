#include <archgraph/recon/room_labeler.hpp>
#include <limits>
#include <vector>

namespace archgraph::recon {

using namespace archgraph::core;

std::optional<std::size_t> side_label_vote(const WallGraph& graph, const Face& face,
                                           const ReconstructionConfig& config) {
  const std::size_t exterior = config.label_index(config.exterior_room_label);
  std::vector<std::size_t> votes(config.room_type_labels.size(), 0);
  bool any = false;

  // The face lies left of its boundary and hole half-edges.
  auto vote = [&](HalfEdgeId h) {
    const WallSegment& seg = graph.segment(h / 2);
    const auto& label = (h & 1u) == 0 ? seg.left_label : seg.right_label;
    if (!label || *label == exterior || *label >= votes.size()) return;
    ++votes[*label];
    any = true;
  };
  for (HalfEdgeId h : face.half_edges) vote(h);
  for (HalfEdgeId h : face.hole_half_edges) vote(h);
  if (!any) return std::nullopt;

  std::size_t best = 0;
  for (std::size_t i = 1; i < votes.size(); ++i) {
    if (votes[i] > votes[best]) best = i;
  }
  return best;
}

std::optional<FaceId> face_containing(const FaceSet& faces, Point2 p) {
  for (FaceId f = 0; f < faces.faces.size(); ++f) {
    if (faces.faces[f].contains(p)) return f;
  }
  return std::nullopt;
}

void label_faces(FaceSet& faces, const WallGraph& graph, const FloorplanInput& input,
                 const ReconstructionConfig& config) {
  for (auto& face : faces.faces) {
    if (const auto vote = side_label_vote(graph, face, config)) {
      face.label = config.room_type_labels[*vote];
      continue;
    }

    const RoomLabelPrediction* nearest = nullptr;
    double nearest_dist = std::numeric_limits<double>::max();
    for (const auto& prediction : input.room_labels) {
      const Point2 c = prediction.box.center();
      if (!face.contains(c)) continue;
      const double d = distance(c, face.centroid);
      if (d < nearest_dist) {
        nearest = &prediction;
        nearest_dist = d;
      }
    }
    face.label = nearest ? nearest->label : config.unknown_room_label;
  }

  for (const auto& icon : input.icons) {
    if (!config.is_annotation_category(icon.category)) continue;
    if (const auto f = face_containing(faces, icon.box.center())) {
      faces.faces[*f].annotations.push_back(icon.category);
    }
  }
}

RoomLabelStage::RoomLabelStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> RoomLabelStage::process(ReconstructionState& state) {
  label_faces(state.faces, state.graph, state.input, config_);
  return {};
}

}  // namespace archgraph::recon
