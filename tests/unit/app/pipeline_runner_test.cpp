#include <archgraph/app/pipeline_factory.hpp>
#include <archgraph/app/pipeline_runner.hpp>
#include "floorplan_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace na = archgraph::app;
namespace nc = archgraph::core;
namespace fx = archgraph::fixtures;

namespace {

nc::Pipeline identity_pipeline() {
  auto p = na::make_pipeline(fx::identity_config());
  EXPECT_TRUE(p.has_value());
  return p ? std::move(*p) : nc::Pipeline{};
}

/// Alternating good and bad floorplans; odd ones reference a missing corner.
std::vector<nc::FloorplanInput> mixed_batch(std::size_t n) {
  std::vector<nc::FloorplanInput> plans;
  for (std::size_t i = 0; i < n; ++i) {
    auto plan = fx::two_rooms_with_door();
    if (i % 2 == 1) fx::add_wall(plan, 0, 99);
    plans.push_back(std::move(plan));
  }
  return plans;
}

}  // namespace

TEST(PipelineRunner, SingleRunWithTiming) {
  nc::Pipeline pipeline = identity_pipeline();
  std::vector<std::size_t> stages;
  nc::StageTimingCallback cb = [&](std::size_t i, double ms) {
    stages.push_back(i);
    EXPECT_GE(ms, 0.0);
  };
  auto result = na::run_pipeline(pipeline, fx::two_rooms_with_door(), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->architecture.rooms.size(), 2u);
  EXPECT_EQ(stages.size(), pipeline.stage_count());
}

TEST(PipelineRunner, BatchReportsResultsAndErrorsByIndex) {
  nc::Pipeline pipeline = identity_pipeline();
  std::vector<std::size_t> ok;
  std::vector<std::size_t> failed;
  na::run_pipeline_batch(
      pipeline, mixed_batch(4),
      [&](std::size_t i, const nc::SceneResult& r) {
        ok.push_back(i);
        EXPECT_EQ(r.architecture.openings.size(), 1u);
      },
      [&](std::size_t i, nc::ConversionError e) {
        failed.push_back(i);
        EXPECT_EQ(e, nc::ConversionError::InvalidGeometry);
      });
  EXPECT_EQ(ok, (std::vector<std::size_t>{0, 2}));
  EXPECT_EQ(failed, (std::vector<std::size_t>{1, 3}));
}

TEST(PipelineRunner, ParallelBatchMatchesSequential) {
  nc::Pipeline pipeline = identity_pipeline();
  std::vector<std::size_t> ok;
  std::vector<std::size_t> failed;
  std::mutex mutex;
  na::run_pipeline_batch_parallel(
      pipeline, mixed_batch(9),
      [&](std::size_t i, const nc::SceneResult& r) {
        EXPECT_EQ(r.architecture.adjacency.size(), 1u);
        std::lock_guard lock(mutex);
        ok.push_back(i);
      },
      3,
      [&](std::size_t i, nc::ConversionError) {
        std::lock_guard lock(mutex);
        failed.push_back(i);
      });
  std::sort(ok.begin(), ok.end());
  std::sort(failed.begin(), failed.end());
  EXPECT_EQ(ok, (std::vector<std::size_t>{0, 2, 4, 6, 8}));
  EXPECT_EQ(failed, (std::vector<std::size_t>{1, 3, 5, 7}));
}

TEST(PipelineRunner, EmptyBatchDoesNotCallCallback) {
  nc::Pipeline pipeline = identity_pipeline();
  std::size_t calls = 0;
  na::run_pipeline_batch_parallel(
      pipeline, {}, [&](std::size_t, const nc::SceneResult&) { ++calls; }, 4);
  EXPECT_EQ(calls, 0u);
}

TEST(PipelineRunner, BatchOutputNamesNeverCollide) {
  std::vector<nc::FloorplanInput> plans(5);
  plans[0].name = "plan";
  plans[1].name = "other";
  plans[2].name = "plan";
  plans[3].name = "plan_2";
  plans[4].name = "plan";

  const auto names = na::batch_output_names(plans);
  ASSERT_EQ(names.size(), 5u);
  EXPECT_EQ(names[0], "plan_0");
  EXPECT_EQ(names[1], "other");
  EXPECT_EQ(names[2], "plan_2_2");
  EXPECT_EQ(names[3], "plan_2");
  EXPECT_EQ(names[4], "plan_4");

  std::vector<std::string> sorted = names;
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(std::adjacent_find(sorted.begin(), sorted.end()), sorted.end());
}
