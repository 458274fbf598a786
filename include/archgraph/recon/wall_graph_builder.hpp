#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <cstddef>
#include <expected>
#include <vector>

namespace archgraph::recon {

/// Builds the wall graph from normalized corners and walls.
/// Corners within corner_snap_tolerance merge into one node; walls that collapse to a
/// point are dropped with a DegenerateSegment anomaly; duplicate walls merge into one
/// segment. Fails with InvalidGeometry on an out-of-range corner index and with
/// InvalidConfig on a side label outside room_type_labels.
[[nodiscard]] std::expected<archgraph::core::WallGraph, archgraph::core::ConversionError>
build_wall_graph(const archgraph::core::FloorplanInput& input,
                 const archgraph::core::ReconstructionConfig& config,
                 std::vector<archgraph::core::Anomaly>& anomalies);

/// Splits segments at T-junctions (a corner lying on another segment's interior within
/// tolerance) and at proper crossings. Repeats full passes until nothing changes or
/// max_iterations passes ran. Returns the number of splits.
std::size_t split_at_junctions(archgraph::core::WallGraph& graph, double tolerance,
                               std::size_t max_iterations);

/// Makes nearly axis-aligned segments exactly axis-aligned, one segment per iteration.
/// Near-vertical: the upper corner takes the other's x. Near-horizontal: the left corner
/// takes the other's y. Returns the number of corners moved.
std::size_t straighten_walls(archgraph::core::WallGraph& graph, double cutoff_gradient,
                             std::size_t max_iterations);

/// Copy of graph with segments joining the same corner pair merged. The kept segment has
/// the larger thickness; missing side labels are filled from the duplicates.
[[nodiscard]] archgraph::core::WallGraph merge_duplicate_segments(
    const archgraph::core::WallGraph& graph);

class WallGraphStage : public archgraph::core::IPipelineStage {
 public:
  explicit WallGraphStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
