#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/scene.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace archgraph::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages over one floorplan until the scene is assembled.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one floorplan; returns the assembled scene or the first fatal error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  /// Thread-safe: safe to call run() from multiple threads concurrently
  /// (stages keep no per-run state).
  [[nodiscard]] std::expected<SceneResult, ConversionError> run(
      const FloorplanInput& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace archgraph::core
