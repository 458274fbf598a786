#include <archgraph/app/pipeline_factory.hpp>
#include <archgraph/recon/coordinate_normalizer.hpp>
#include <archgraph/recon/face_extractor.hpp>
#include <archgraph/recon/object_box_builder.hpp>
#include <archgraph/recon/opening_classifier.hpp>
#include <archgraph/recon/opening_resolver.hpp>
#include <archgraph/recon/room_labeler.hpp>
#include <archgraph/recon/scene_assembler.hpp>
#include <archgraph/recon/wall_graph_builder.hpp>
#include <memory>

namespace archgraph::app {

std::expected<core::Pipeline, core::ConversionError> make_pipeline(
    const core::ReconstructionConfig& config) {
  if (auto valid = core::validate_config(config); !valid) {
    return std::unexpected(valid.error());
  }

  core::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<recon::NormalizeStage>(config));
  pipeline.add_stage(std::make_unique<recon::WallGraphStage>(config));
  pipeline.add_stage(std::make_unique<recon::FaceExtractStage>(config));
  pipeline.add_stage(std::make_unique<recon::RoomLabelStage>(config));
  pipeline.add_stage(std::make_unique<recon::OpeningResolveStage>(config));
  pipeline.add_stage(std::make_unique<recon::OpeningClassifyStage>(config));
  pipeline.add_stage(std::make_unique<recon::ObjectBoxStage>(config));
  pipeline.add_stage(std::make_unique<recon::SceneAssembleStage>(config));
  return pipeline;
}

}  // namespace archgraph::app
