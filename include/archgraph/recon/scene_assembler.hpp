#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/scene.hpp>
#include <expected>

namespace archgraph::recon {

/// Composes the final scene from the run state.
///
/// Ordering is a pure function of the input: rooms by centroid along the primary axis,
/// then the other axis (ids room_0, room_1, ...); walls in graph order (wall_<segment>);
/// openings by host wall then span start (opening_0, ...); objects by category, then
/// min x, then min y. Anomalies are moved into the result.
[[nodiscard]] archgraph::core::SceneResult assemble_scene(
    archgraph::core::ReconstructionState& state,
    const archgraph::core::ReconstructionConfig& config);

/// Final stage; sets state.result.
class SceneAssembleStage : public archgraph::core::IPipelineStage {
 public:
  explicit SceneAssembleStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
