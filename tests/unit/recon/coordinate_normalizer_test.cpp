#include <archgraph/recon/coordinate_normalizer.hpp>
#include "floorplan_fixtures.hpp"
#include <gtest/gtest.h>

namespace nc = archgraph::core;
namespace nr = archgraph::recon;
namespace fx = archgraph::fixtures;

TEST(CoordinateTransform, RejectsNonPositiveScale) {
  auto zero = nr::CoordinateTransform::create(0.0, true, 0, 0);
  ASSERT_FALSE(zero.has_value());
  EXPECT_EQ(zero.error(), nc::ConversionError::InvalidConfig);
  EXPECT_FALSE(nr::CoordinateTransform::create(-0.5, false, 0, 0).has_value());
}

TEST(CoordinateTransform, ScalesFlipsAndShifts) {
  auto t = nr::CoordinateTransform::create(0.01, true, 100, 50);
  ASSERT_TRUE(t.has_value());
  const auto m = t->normalize(nc::Point2{300, 250});
  EXPECT_DOUBLE_EQ(m.x, 2.0);
  EXPECT_DOUBLE_EQ(m.y, -2.0);
  EXPECT_TRUE(t->mirrors());
}

TEST(CoordinateTransform, DenormalizeInvertsNormalize) {
  auto t = nr::CoordinateTransform::create(0.0254, true, 12.5, -7.0);
  ASSERT_TRUE(t.has_value());
  for (const nc::Point2 p : {nc::Point2{0, 0}, nc::Point2{123.5, 456.25}, nc::Point2{-3, 1e4}}) {
    const auto back = t->denormalize(t->normalize(p));
    EXPECT_NEAR(back.x, p.x, 1e-9);
    EXPECT_NEAR(back.y, p.y, 1e-9);
  }
}

TEST(CoordinateTransform, BoxStaysOrderedUnderFlip) {
  auto t = nr::CoordinateTransform::create(0.5, true, 0, 0);
  ASSERT_TRUE(t.has_value());
  const auto b = t->normalize(nc::Box2::from_corners({2, 2}, {4, 6}));
  EXPECT_EQ(b.min, (nc::Point2{1, -3}));
  EXPECT_EQ(b.max, (nc::Point2{2, -1}));
}

TEST(NormalizeFloorplan, ScalesThicknessAndSwapsSidesWhenMirrored) {
  auto plan = fx::single_room();
  plan.walls[0].thickness = 20;
  plan.walls[0].left_label = 3;
  plan.walls[0].right_label = 0;
  fx::add_icon(plan, "sofa", 10, 10, 20, 30);

  auto t = nr::CoordinateTransform::create(0.01, true, 0, 0);
  ASSERT_TRUE(t.has_value());
  const auto out = nr::normalize_floorplan(plan, *t);
  EXPECT_DOUBLE_EQ(out.walls[0].thickness, 0.2);
  EXPECT_DOUBLE_EQ(out.walls[1].thickness, 0.0);
  EXPECT_EQ(out.walls[0].left_label.value_or(99), 0u);
  EXPECT_EQ(out.walls[0].right_label.value_or(99), 3u);
  EXPECT_DOUBLE_EQ(out.corners[2].x, 0.04);
  EXPECT_DOUBLE_EQ(out.corners[2].y, -0.03);
  EXPECT_DOUBLE_EQ(out.icons[0].box.min.y, -0.3);
  EXPECT_EQ(out.name, plan.name);
}

TEST(NormalizeStage, InvalidScaleIsFatal) {
  nc::ReconstructionConfig c;
  c.scale_factor = 0.0;
  nr::NormalizeStage stage(c);
  nc::ReconstructionState state(fx::single_room());
  auto r = stage.process(state);
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error(), nc::ConversionError::InvalidConfig);
}
