#pragma once

#include <archgraph/app/pipeline_runner.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline.hpp>
#include <vector>

#ifdef ARCHGRAPH_HAS_TBB

namespace archgraph::app {

/// Runs one shared pipeline over a batch of floorplans in parallel using TBB.
///
/// Floorplans are independent and the stages keep no per-run state, so a single pipeline
/// serves all TBB tasks. Callbacks may be invoked from TBB worker threads and must be
/// thread-safe; the index passed is the floorplan's position in \p floorplans.
void run_pipeline_batch_tbb(archgraph::core::Pipeline& pipeline,
                            const std::vector<archgraph::core::FloorplanInput>& floorplans,
                            SceneResultCallback callback,
                            ConversionErrorCallback on_error = nullptr);

}  // namespace archgraph::app

#endif  // ARCHGRAPH_HAS_TBB
