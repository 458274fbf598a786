#include <archgraph/core/pipeline.hpp>
#include <chrono>

namespace archgraph::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<SceneResult, ConversionError> Pipeline::run(
    const FloorplanInput& input,
    StageTimingCallback* timing_cb) {
  ReconstructionState state(input);

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(state);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }
  }

  if (state.result) {
    return std::move(*state.result);
  }
  return std::unexpected(ConversionError::InvalidConfig);
}

}  // namespace archgraph::core
