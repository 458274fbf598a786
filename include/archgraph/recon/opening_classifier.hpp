#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/opening.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <expected>
#include <vector>

namespace archgraph::recon {

/// Reclassifies openings from room topology instead of icon category:
/// openings between two rooms are doors; for each entrance annotation the exterior
/// opening of its room closest to the annotation becomes a door; the rest are windows.
void classify_openings(std::vector<archgraph::core::ResolvedOpening>& openings,
                       const archgraph::core::WallGraph& graph,
                       const archgraph::core::FaceSet& faces,
                       const archgraph::core::FloorplanInput& input,
                       const archgraph::core::ReconstructionConfig& config);

/// Runs only when config.classify_openings is set.
class OpeningClassifyStage : public archgraph::core::IPipelineStage {
 public:
  explicit OpeningClassifyStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
