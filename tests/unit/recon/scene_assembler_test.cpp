#include <archgraph/recon/object_box_builder.hpp>
#include <archgraph/recon/opening_resolver.hpp>
#include <archgraph/recon/scene_assembler.hpp>
#include "floorplan_fixtures.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nc = archgraph::core;
namespace nr = archgraph::recon;
namespace fx = archgraph::fixtures;

namespace {

nc::SceneResult assemble(const nc::FloorplanInput& plan, const nc::ReconstructionConfig& config) {
  auto state = fx::labelled_state(plan, config);
  EXPECT_TRUE(nr::OpeningResolveStage(config).process(state).has_value());
  EXPECT_TRUE(nr::ObjectBoxStage(config).process(state).has_value());
  EXPECT_TRUE(nr::SceneAssembleStage(config).process(state).has_value());
  EXPECT_TRUE(state.result.has_value());
  return state.result.value_or(nc::SceneResult{});
}

/// Tall room on the left (x 0..4, y 0..6), short room on the right (x 4..8, y 0..3).
nc::FloorplanInput tall_and_short() {
  nc::FloorplanInput plan;
  plan.name = "ell";
  fx::add_corner(plan, 0, 0);  // 0
  fx::add_corner(plan, 4, 0);  // 1
  fx::add_corner(plan, 8, 0);  // 2
  fx::add_corner(plan, 8, 3);  // 3
  fx::add_corner(plan, 4, 3);  // 4
  fx::add_corner(plan, 4, 6);  // 5
  fx::add_corner(plan, 0, 6);  // 6
  fx::add_wall(plan, 0, 1);
  fx::add_wall(plan, 1, 2);
  fx::add_wall(plan, 2, 3);
  fx::add_wall(plan, 3, 4);
  fx::add_wall(plan, 4, 5);
  fx::add_wall(plan, 5, 6);
  fx::add_wall(plan, 6, 0);
  fx::add_wall(plan, 1, 4);
  return plan;
}

}  // namespace

TEST(SceneAssembler, RoomsOrderedAlongPrimaryAxis) {
  auto config = fx::identity_config();
  const auto by_x = assemble(tall_and_short(), config);
  ASSERT_EQ(by_x.architecture.rooms.size(), 2u);
  EXPECT_EQ(by_x.architecture.rooms[0].id, "room_0");
  EXPECT_NEAR(by_x.architecture.rooms[0].centroid.x, 2.0, 1e-9);
  EXPECT_NEAR(by_x.architecture.rooms[1].centroid.x, 6.0, 1e-9);

  config.room_order_primary_axis = nc::Axis::Y;
  const auto by_y = assemble(tall_and_short(), config);
  ASSERT_EQ(by_y.architecture.rooms.size(), 2u);
  EXPECT_NEAR(by_y.architecture.rooms[0].centroid.y, 1.5, 1e-9);
  EXPECT_NEAR(by_y.architecture.rooms[1].centroid.y, 3.0, 1e-9);
}

TEST(SceneAssembler, WallsKeepGraphOrderAndRoomIds) {
  const auto result = assemble(fx::two_rooms(), fx::identity_config());
  const auto& arch = result.architecture;
  EXPECT_EQ(arch.id, "pair");
  ASSERT_EQ(arch.walls.size(), 7u);
  for (std::size_t i = 0; i < arch.walls.size(); ++i) {
    EXPECT_EQ(arch.walls[i].id, "wall_" + std::to_string(i));
  }
  EXPECT_EQ(arch.walls[6].room_ids, (std::vector<std::string>{"room_0", "room_1"}));
  EXPECT_EQ(arch.walls[0].room_ids, (std::vector<std::string>{"room_0"}));
  EXPECT_EQ(arch.walls[2].room_ids, (std::vector<std::string>{"room_1"}));
  EXPECT_DOUBLE_EQ(arch.walls[0].thickness, 0.2);

  ASSERT_EQ(arch.rooms.size(), 2u);
  EXPECT_EQ(arch.rooms[0].wall_ids.size(), 4u);
  EXPECT_EQ(arch.rooms[0].type, "unknown");
  EXPECT_DOUBLE_EQ(arch.rooms[0].area, 12.0);
  EXPECT_TRUE(result.clean());
}

TEST(SceneAssembler, OpeningsOrderedByWallThenSpan) {
  auto plan = fx::two_rooms();
  fx::add_icon(plan, "door", 3.9, 1.2, 4.1, 1.8);     // shared wall 6
  fx::add_icon(plan, "window", 2.6, -0.05, 3.4, 0.05);  // wall 0, x = 3
  fx::add_icon(plan, "window", 0.6, -0.05, 1.4, 0.05);  // wall 0, x = 1
  const auto result = assemble(plan, fx::identity_config());
  const auto& openings = result.architecture.openings;

  ASSERT_EQ(openings.size(), 3u);
  EXPECT_EQ(openings[0].id, "opening_0");
  EXPECT_EQ(openings[0].wall_id, "wall_0");
  EXPECT_NEAR(openings[0].span_start, 0.6, 1e-9);
  EXPECT_EQ(openings[1].wall_id, "wall_0");
  EXPECT_NEAR(openings[1].span_start, 2.6, 1e-9);
  EXPECT_EQ(openings[2].wall_id, "wall_6");
  EXPECT_TRUE(openings[2].interior());
  EXPECT_FALSE(openings[0].interior());

  ASSERT_EQ(result.architecture.adjacency.size(), 1u);
  const auto& edge = result.architecture.adjacency[0];
  EXPECT_EQ(edge.room_a, "room_0");
  EXPECT_EQ(edge.room_b, "room_1");
  EXPECT_EQ(edge.opening_id, "opening_2");
  EXPECT_EQ(edge.kind, nc::OpeningClass::Door);
}

TEST(SceneAssembler, OverlaysListDoorNeighboursAndOpenings) {
  auto plan = fx::two_rooms_with_door();
  fx::add_icon(plan, "window", 7.95, 1.0, 8.05, 2.0);  // right room outer wall
  const auto result = assemble(plan, fx::identity_config());

  ASSERT_EQ(result.overlays.size(), 2u);
  EXPECT_EQ(result.overlays[0].room_id, "room_0");
  EXPECT_EQ(result.overlays[0].door_neighbours, (std::vector<std::string>{"room_1"}));
  EXPECT_EQ(result.overlays[0].opening_ids, (std::vector<std::string>{"opening_1"}));
  EXPECT_EQ(result.overlays[1].door_neighbours, (std::vector<std::string>{"room_0"}));
  EXPECT_EQ(result.overlays[1].opening_ids,
            (std::vector<std::string>{"opening_0", "opening_1"}));
}

TEST(SceneAssembler, InteriorWindowIsAdjacencyButNotDoorNeighbour) {
  auto plan = fx::two_rooms();
  fx::add_icon(plan, "window", 3.9, 1.2, 4.1, 1.8);
  const auto result = assemble(plan, fx::identity_config());

  ASSERT_EQ(result.architecture.adjacency.size(), 1u);
  EXPECT_EQ(result.architecture.adjacency[0].kind, nc::OpeningClass::Window);
  EXPECT_TRUE(result.overlays[0].door_neighbours.empty());
}

TEST(SceneAssembler, ObjectsSortedByCategoryThenPosition) {
  auto plan = fx::two_rooms();
  fx::add_icon(plan, "sofa", 5, 1, 6, 2);
  fx::add_icon(plan, "bathtub", 6, 0.5, 7, 1);
  fx::add_icon(plan, "sofa", 1, 1, 2, 2);
  const auto result = assemble(plan, fx::identity_config());

  ASSERT_EQ(result.objects.size(), 3u);
  EXPECT_EQ(result.objects[0].category, "bathtub");
  EXPECT_EQ(result.objects[1].category, "sofa");
  EXPECT_DOUBLE_EQ(result.objects[1].box.min.x, 1.0);
  EXPECT_DOUBLE_EQ(result.objects[2].box.min.x, 5.0);
}

TEST(SceneAssembler, AnomaliesMoveIntoResult) {
  auto plan = fx::single_room();
  fx::add_icon(plan, "door", 1.8, 1.3, 2.2, 1.7);
  const auto result = assemble(plan, fx::identity_config());
  EXPECT_FALSE(result.clean());
  ASSERT_EQ(result.anomalies.size(), 1u);
  EXPECT_EQ(result.anomalies[0].kind, nc::AnomalyKind::UnmatchedOpening);
  ASSERT_EQ(result.objects.size(), 1u);
  EXPECT_EQ(result.objects[0].category, "door");
}

TEST(SceneResult, FindsRoomsAndWallsById) {
  const auto result = assemble(fx::two_rooms(), fx::identity_config());
  ASSERT_NE(result.find_room("room_1"), nullptr);
  EXPECT_NEAR(result.find_room("room_1")->centroid.x, 6.0, 1e-9);
  ASSERT_NE(result.find_wall("wall_6"), nullptr);
  EXPECT_EQ(result.find_room("room_9"), nullptr);
  EXPECT_EQ(result.find_wall("nope"), nullptr);
}
