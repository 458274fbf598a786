#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace archgraph::recon {

/// Segments that can bound a face: everything except dangling chains (repeatedly removed
/// degree-1 ends) and bridges (segments whose two sides lie on the same walk).
[[nodiscard]] std::vector<bool> face_bounding_segments(const archgraph::core::WallGraph& graph);

/// Enumerates the bounded faces of the wall graph by a half-edge walk.
///
/// Outgoing half-edges at each corner are ordered by angle; from a half-edge a->b the walk
/// continues with the half-edge that follows b->a clockwise around b, so bounded faces
/// come out counter-clockwise with positive signed area. The walk around each connected
/// component's outside has negative area. When another component's face encloses it, that
/// walk becomes a hole of the smallest such face (area and centroid net of the hole);
/// otherwise it is discarded.
///
/// A walk that does not close within max_steps records a Topology anomaly; a closed walk
/// with positive area that is not a simple polygon records a DegenerateFace anomaly. In
/// both cases the face is skipped and its half-edges map to kNoFace.
[[nodiscard]] archgraph::core::FaceSet extract_faces(
    const archgraph::core::WallGraph& graph, std::size_t max_steps,
    std::vector<archgraph::core::Anomaly>& anomalies);

class FaceExtractStage : public archgraph::core::IPipelineStage {
 public:
  explicit FaceExtractStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
