#ifdef ARCHGRAPH_HAS_TBB

#include <archgraph/app/pipeline_factory.hpp>
#include <archgraph/app/pipeline_runner_tbb.hpp>
#include "floorplan_fixtures.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <vector>

namespace {

archgraph::core::Pipeline make_identity_pipeline() {
  auto p = archgraph::app::make_pipeline(archgraph::fixtures::identity_config());
  EXPECT_TRUE(p.has_value());
  return p ? std::move(*p) : archgraph::core::Pipeline{};
}

}  // namespace

TEST(PipelineRunnerTbbTest, RunsCallbackPerFloorplan) {
  archgraph::core::Pipeline pipeline = make_identity_pipeline();
  std::vector<archgraph::core::FloorplanInput> plans(6, archgraph::fixtures::two_rooms_with_door());
  plans[4] = archgraph::fixtures::single_room();

  std::atomic<std::size_t> call_count{0};
  std::vector<std::size_t> indices;
  std::mutex mutex;
  archgraph::app::run_pipeline_batch_tbb(
      pipeline, plans,
      [&](std::size_t i, const archgraph::core::SceneResult& r) {
        call_count++;
        EXPECT_EQ(r.architecture.rooms.size(), i == 4 ? 1u : 2u);
        std::lock_guard lock(mutex);
        indices.push_back(i);
      });
  EXPECT_EQ(call_count.load(), 6u);
  std::sort(indices.begin(), indices.end());
  EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1, 2, 3, 4, 5}));
}

TEST(PipelineRunnerTbbTest, ErrorsGoToErrorCallback) {
  archgraph::core::Pipeline pipeline = make_identity_pipeline();
  auto bad = archgraph::fixtures::single_room();
  archgraph::fixtures::add_wall(bad, 0, 42);
  std::vector<archgraph::core::FloorplanInput> plans{archgraph::fixtures::single_room(), bad};

  std::atomic<std::size_t> ok{0};
  std::atomic<std::size_t> failed{0};
  archgraph::app::run_pipeline_batch_tbb(
      pipeline, plans,
      [&](std::size_t, const archgraph::core::SceneResult&) { ok++; },
      [&](std::size_t i, archgraph::core::ConversionError e) {
        EXPECT_EQ(i, 1u);
        EXPECT_EQ(e, archgraph::core::ConversionError::InvalidGeometry);
        failed++;
      });
  EXPECT_EQ(ok.load(), 1u);
  EXPECT_EQ(failed.load(), 1u);
}

TEST(PipelineRunnerTbbTest, EmptyBatchDoesNotCallCallback) {
  archgraph::core::Pipeline pipeline = make_identity_pipeline();
  std::atomic<std::size_t> calls{0};
  archgraph::app::run_pipeline_batch_tbb(
      pipeline, {}, [&calls](std::size_t, const archgraph::core::SceneResult&) { calls++; });
  EXPECT_EQ(calls.load(), 0u);
}

#endif  // ARCHGRAPH_HAS_TBB
