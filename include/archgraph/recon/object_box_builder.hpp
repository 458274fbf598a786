#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/scene.hpp>
#include <expected>
#include <vector>

namespace archgraph::recon {

/// Object boxes for icons that are neither openings, room labels, annotations nor ignored
/// categories. Boxes are taken as-is from the normalized input.
[[nodiscard]] std::vector<archgraph::core::ObjectBox> build_object_boxes(
    const archgraph::core::FloorplanInput& input,
    const archgraph::core::ReconstructionConfig& config);

/// Appends to state.objects, after any unmatched-opening fallbacks.
class ObjectBoxStage : public archgraph::core::IPipelineStage {
 public:
  explicit ObjectBoxStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
