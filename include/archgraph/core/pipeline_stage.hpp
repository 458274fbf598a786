#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/opening.hpp>
#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/scene.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace archgraph::core {

/// Per-run working state. Created by Pipeline::run from a copy of the input and released
/// when the run returns; stages read what earlier stages produced and fill in their part.
struct ReconstructionState {
  ReconstructionState() = default;
  explicit ReconstructionState(FloorplanInput in) : raw(in), input(std::move(in)) {}

  FloorplanInput raw;    // as supplied by the caller
  FloorplanInput input;  // normalized in place by the coordinate stage
  WallGraph graph;
  FaceSet faces;
  std::vector<ResolvedOpening> openings;
  std::vector<ObjectBox> objects;
  std::vector<Anomaly> anomalies;
  std::optional<SceneResult> result;

  void record(AnomalyKind kind, std::string detail,
              std::optional<std::size_t> source_index = std::nullopt) {
    anomalies.push_back(Anomaly{kind, std::move(detail), source_index});
  }
};

/// Abstract pipeline stage: transforms the run state in place. A returned error is fatal
/// and aborts the run; non-fatal problems go to state.anomalies.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<void, ConversionError> process(
      ReconstructionState& state) = 0;
};

}  // namespace archgraph::core
