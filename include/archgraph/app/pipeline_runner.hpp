#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline.hpp>
#include <archgraph/core/scene.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace archgraph::app {

/// Callback for each successful SceneResult with the index of its floorplan in the batch.
/// Must be thread-safe if using run_pipeline_batch_parallel.
using SceneResultCallback =
    std::function<void(std::size_t index, const archgraph::core::SceneResult&)>;

/// Callback for each floorplan that failed with a fatal error.
using ConversionErrorCallback =
    std::function<void(std::size_t index, archgraph::core::ConversionError)>;

/// Optional per-stage timing: (stage_index, duration_ms). Pass to run_pipeline to get timings.
using StageTimingCallback = archgraph::core::StageTimingCallback;

/// Runs pipeline on a single floorplan. No threading; direct call.
/// If timing_cb is non-null, it is invoked for each stage with (stage_index, duration_ms).
[[nodiscard]] std::expected<archgraph::core::SceneResult, archgraph::core::ConversionError>
run_pipeline(archgraph::core::Pipeline& pipeline,
             const archgraph::core::FloorplanInput& floorplan,
             StageTimingCallback* timing_cb = nullptr);

/// Runs pipeline on multiple floorplans sequentially; calls callback for each result and
/// on_error (if set) for each failure.
void run_pipeline_batch(archgraph::core::Pipeline& pipeline,
                        const std::vector<archgraph::core::FloorplanInput>& floorplans,
                        SceneResultCallback callback,
                        ConversionErrorCallback on_error = nullptr);

/// Runs pipeline on multiple floorplans in parallel using a thread pool.
/// Pipeline::run() is called from worker threads; callbacks may be invoked
/// from any worker (must be thread-safe). num_workers 0 = use hardware concurrency.
void run_pipeline_batch_parallel(
    archgraph::core::Pipeline& pipeline,
    const std::vector<archgraph::core::FloorplanInput>& floorplans,
    SceneResultCallback callback,
    std::size_t num_workers = 0,
    ConversionErrorCallback on_error = nullptr);

/// Output directory name per floorplan of a batch: the floorplan name, with "_<index>"
/// appended where names repeat, so no two entries share a directory.
[[nodiscard]] std::vector<std::string> batch_output_names(
    const std::vector<archgraph::core::FloorplanInput>& floorplans);

}  // namespace archgraph::app
