#include <archgraph/recon/opening_resolver.hpp>
#include "floorplan_fixtures.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace nc = archgraph::core;
namespace nr = archgraph::recon;
namespace fx = archgraph::fixtures;

namespace {

nr::OpeningResolution resolve(const nc::FloorplanInput& plan,
                              const nc::ReconstructionConfig& config,
                              std::vector<nc::Anomaly>& anomalies) {
  auto state = fx::labelled_state(plan, config);
  return nr::resolve_openings(state.graph, state.faces, state.input, config, anomalies);
}

/// Two parallel walls 0.25 apart: (0,0)-(10,0) and (0,0.25)-(2,0.25).
nc::WallGraph parallel_walls() {
  nc::WallGraph g;
  const auto a = g.add_corner({0, 0});
  const auto b = g.add_corner({10, 0});
  const auto c = g.add_corner({0, 0.25});
  const auto d = g.add_corner({2, 0.25});
  g.add_segment({a, b, 0.2, std::nullopt, std::nullopt, 0});
  g.add_segment({c, d, 0.2, std::nullopt, std::nullopt, 1});
  return g;
}

}  // namespace

TEST(OpeningResolver, DoorOnSharedWallJoinsBothRooms) {
  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(fx::two_rooms_with_door(), fx::identity_config(), anomalies);

  ASSERT_EQ(out.openings.size(), 1u);
  const auto& door = out.openings[0];
  EXPECT_EQ(door.host, 6u);
  EXPECT_EQ(door.kind, nc::OpeningClass::Door);
  EXPECT_EQ(door.category, "door");
  EXPECT_NEAR(door.span_start, 1.2, 1e-9);
  EXPECT_NEAR(door.span_end, 1.8, 1e-9);
  EXPECT_NEAR(door.position, 0.5, 1e-9);
  EXPECT_EQ(door.rooms.size(), 2u);
  EXPECT_TRUE(out.fallback_objects.empty());
  EXPECT_TRUE(anomalies.empty());
}

TEST(OpeningResolver, WindowCategoryGivesWindow) {
  auto plan = fx::single_room();
  fx::add_icon(plan, "window", 1.5, -0.05, 2.5, 0.05);
  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(plan, fx::identity_config(), anomalies);
  ASSERT_EQ(out.openings.size(), 1u);
  EXPECT_EQ(out.openings[0].kind, nc::OpeningClass::Window);
  EXPECT_EQ(out.openings[0].host, 0u);
  EXPECT_EQ(out.openings[0].rooms.size(), 1u);
}

TEST(OpeningResolver, ConfiguredWindowCategories) {
  auto plan = fx::single_room();
  fx::add_icon(plan, "skylight", 1.5, -0.05, 2.5, 0.05);
  fx::add_icon(plan, "sliding_door", 3.95, 1.2, 4.05, 1.8);
  auto config = fx::identity_config();
  config.opening_categories = {"skylight", "sliding_door"};
  config.window_categories = {"skylight"};

  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(plan, config, anomalies);
  ASSERT_EQ(out.openings.size(), 2u);
  EXPECT_EQ(out.openings[0].category, "skylight");
  EXPECT_EQ(out.openings[0].kind, nc::OpeningClass::Window);
  EXPECT_EQ(out.openings[1].category, "sliding_door");
  EXPECT_EQ(out.openings[1].kind, nc::OpeningClass::Door);
}

TEST(OpeningResolver, FarIconBecomesObjectBox) {
  auto plan = fx::single_room();
  fx::add_icon(plan, "door", 1.8, 1.3, 2.2, 1.7);  // middle of the room
  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(plan, fx::identity_config(), anomalies);

  EXPECT_TRUE(out.openings.empty());
  ASSERT_EQ(out.fallback_objects.size(), 1u);
  EXPECT_EQ(out.fallback_objects[0].category, "door");
  ASSERT_EQ(anomalies.size(), 1u);
  EXPECT_EQ(anomalies[0].kind, nc::AnomalyKind::UnmatchedOpening);
  EXPECT_EQ(*anomalies[0].source_index, 0u);
}

TEST(OpeningResolver, IconOnDanglingWallIsUnattached) {
  auto plan = fx::single_room();
  const auto far = fx::add_corner(plan, 4, -3);
  fx::add_wall(plan, 1, far);
  fx::add_icon(plan, "door", 3.9, -2.0, 4.1, -1.0);
  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(plan, fx::identity_config(), anomalies);

  ASSERT_EQ(out.openings.size(), 1u);
  EXPECT_TRUE(out.openings[0].rooms.empty());
  ASSERT_EQ(anomalies.size(), 1u);
  EXPECT_EQ(anomalies[0].kind, nc::AnomalyKind::UnattachedWall);
}

TEST(OpeningResolver, NonOpeningIconsAreIgnored) {
  auto plan = fx::single_room();
  fx::add_icon(plan, "toilet", 3.9, 1.0, 4.1, 1.2);
  std::vector<nc::Anomaly> anomalies;
  const auto out = resolve(plan, fx::identity_config(), anomalies);
  EXPECT_TRUE(out.openings.empty());
  EXPECT_TRUE(out.fallback_objects.empty());
}

TEST(FindHostWall, EqualDistanceUsesTieBreak) {
  const auto g = parallel_walls();
  const nc::IconDetection icon{"door", nc::Box2::from_corners({0.8, 0.0}, {1.2, 0.25}),
                               std::nullopt};

  const auto shorter = nr::find_host_wall(g, icon, 0.1, nc::HostTieBreak::ShorterWall);
  ASSERT_TRUE(shorter.has_value());
  EXPECT_EQ(shorter->segment, 1u);

  const auto longer = nr::find_host_wall(g, icon, 0.1, nc::HostTieBreak::LongerWall);
  ASSERT_TRUE(longer.has_value());
  EXPECT_EQ(longer->segment, 0u);
}

TEST(FindHostWall, ClosestWallWins) {
  const auto g = parallel_walls();
  const nc::IconDetection icon{"door", nc::Box2::from_corners({0.8, 0.2}, {1.2, 0.26}),
                               std::nullopt};
  const auto host = nr::find_host_wall(g, icon, 0.5, nc::HostTieBreak::LongerWall);
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(host->segment, 1u);
  EXPECT_NEAR(host->distance, 0.02, 1e-9);
  EXPECT_DOUBLE_EQ(host->length, 2.0);
}

TEST(FindHostWall, OrientationHintExcludesCrossingWalls) {
  nc::WallGraph g;
  const auto o = g.add_corner({0, 0});
  const auto x = g.add_corner({2, 0});
  const auto y = g.add_corner({0, 2});
  g.add_segment({o, x, 0.2, std::nullopt, std::nullopt, 0});
  g.add_segment({o, y, 0.2, std::nullopt, std::nullopt, 1});

  nc::IconDetection icon{"door", nc::Box2::from_corners({-0.05, -0.05}, {0.05, 0.05}),
                         nc::OrientationHint::Vertical};
  const auto vertical = nr::find_host_wall(g, icon, 0.1, nc::HostTieBreak::ShorterWall);
  ASSERT_TRUE(vertical.has_value());
  EXPECT_EQ(vertical->segment, 1u);

  icon.orientation = nc::OrientationHint::Horizontal;
  const auto horizontal = nr::find_host_wall(g, icon, 0.1, nc::HostTieBreak::ShorterWall);
  ASSERT_TRUE(horizontal.has_value());
  EXPECT_EQ(horizontal->segment, 0u);
}

TEST(FindHostWall, ProjectionOutsideWallIsRejected) {
  const auto g = parallel_walls();
  const nc::IconDetection icon{"door", nc::Box2::from_corners({10.5, -0.1}, {11.0, 0.1}),
                               std::nullopt};
  EXPECT_FALSE(nr::find_host_wall(g, icon, 0.1, nc::HostTieBreak::ShorterWall).has_value());
}
