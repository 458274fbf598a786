#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace nc = archgraph::core;

namespace {

class CountCornersStage : public nc::IPipelineStage {
 public:
  std::expected<void, nc::ConversionError> process(nc::ReconstructionState& state) override {
    state.record(nc::AnomalyKind::Topology, "corners", state.input.corners.size());
    return {};
  }
};

class AssembleStage : public nc::IPipelineStage {
 public:
  std::expected<void, nc::ConversionError> process(nc::ReconstructionState& state) override {
    nc::SceneResult r;
    r.architecture.id = state.input.name;
    r.anomalies = std::move(state.anomalies);
    state.result = std::move(r);
    return {};
  }
};

class FailStage : public nc::IPipelineStage {
 public:
  std::expected<void, nc::ConversionError> process(nc::ReconstructionState&) override {
    return std::unexpected(nc::ConversionError::InvalidGeometry);
  }
};

nc::FloorplanInput make_input() {
  nc::FloorplanInput in;
  in.name = "plan";
  in.corners = {{0, 0}, {1, 0}};
  return in;
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  nc::Pipeline p;
  auto result = p.run(make_input());
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::ConversionError::InvalidConfig);
}

TEST(Pipeline, StagesShareStateUntilAssembled) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<CountCornersStage>());
  p.add_stage(std::make_unique<AssembleStage>());
  auto result = p.run(make_input());
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->architecture.id, "plan");
  ASSERT_EQ(result->anomalies.size(), 1u);
  ASSERT_TRUE(result->anomalies[0].source_index.has_value());
  EXPECT_EQ(*result->anomalies[0].source_index, 2u);
  EXPECT_FALSE(result->clean());
}

TEST(Pipeline, FatalErrorStopsRun) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<FailStage>());
  p.add_stage(std::make_unique<AssembleStage>());
  auto result = p.run(make_input());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::ConversionError::InvalidGeometry);
}

TEST(Pipeline, NullStageIgnored) {
  nc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, TimingCallbackCalledPerStage) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<CountCornersStage>());
  p.add_stage(std::make_unique<AssembleStage>());
  std::vector<std::size_t> indices;
  nc::StageTimingCallback cb = [&](std::size_t i, double ms) {
    indices.push_back(i);
    EXPECT_GE(ms, 0.0);
  };
  auto result = p.run(make_input(), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1}));
}
