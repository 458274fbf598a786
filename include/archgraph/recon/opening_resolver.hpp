#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/opening.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/scene.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <expected>
#include <optional>
#include <vector>

namespace archgraph::recon {

/// A wall that could host an opening icon.
struct HostCandidate {
  archgraph::core::SegmentId segment{0};
  double distance{0.0};  // icon centre to the wall centreline
  double length{0.0};
};

/// Host wall for an icon box: among segments whose extent covers the projection of the box
/// centre and whose centreline lies within thickness / 2 + tolerance, the one with the
/// smallest distance; ties go to the shorter (or longer, per tie_break) wall, then to
/// the lower segment id. An orientation hint excludes walls running the other way.
[[nodiscard]] std::optional<HostCandidate> find_host_wall(
    const archgraph::core::WallGraph& graph, const archgraph::core::IconDetection& icon,
    double tolerance, archgraph::core::HostTieBreak tie_break);

/// Output of opening resolution for one floorplan.
struct OpeningResolution {
  std::vector<archgraph::core::ResolvedOpening> openings;
  std::vector<archgraph::core::ObjectBox> fallback_objects;  // unmatched opening icons
};

/// Resolves every opening-category icon to a host wall and to the rooms on either side.
/// No host: UnmatchedOpening anomaly and an object box fallback. Host bounding no room:
/// UnattachedWall anomaly; the opening is still emitted.
[[nodiscard]] OpeningResolution resolve_openings(
    const archgraph::core::WallGraph& graph, const archgraph::core::FaceSet& faces,
    const archgraph::core::FloorplanInput& input,
    const archgraph::core::ReconstructionConfig& config,
    std::vector<archgraph::core::Anomaly>& anomalies);

class OpeningResolveStage : public archgraph::core::IPipelineStage {
 public:
  explicit OpeningResolveStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
