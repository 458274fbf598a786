#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <cstddef>
#include <expected>
#include <optional>

namespace archgraph::recon {

/// Label index voted by the side labels of the face's boundary walls, if any.
/// The exterior label does not vote; ties go to the lower index.
[[nodiscard]] std::optional<std::size_t> side_label_vote(
    const archgraph::core::WallGraph& graph, const archgraph::core::Face& face,
    const archgraph::core::ReconstructionConfig& config);

/// Assigns a type label to every face: the side-label vote when the walls carry one,
/// otherwise the label prediction inside the face nearest its centroid, otherwise the
/// configured unknown label. Annotation icons are attached to the face containing
/// their box centre.
void label_faces(archgraph::core::FaceSet& faces, const archgraph::core::WallGraph& graph,
                 const archgraph::core::FloorplanInput& input,
                 const archgraph::core::ReconstructionConfig& config);

/// Face containing p, if any.
[[nodiscard]] std::optional<archgraph::core::FaceId> face_containing(
    const archgraph::core::FaceSet& faces, archgraph::core::Point2 p);

class RoomLabelStage : public archgraph::core::IPipelineStage {
 public:
  explicit RoomLabelStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
