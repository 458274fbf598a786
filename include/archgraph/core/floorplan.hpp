#pragma once

#include <archgraph/core/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace archgraph::core {

/// Orientation hint attached to an icon by the detector.
enum class OrientationHint : std::uint8_t {
  Horizontal,
  Vertical,
};

/// Raw wall segment: a pair of corner indices plus thickness.
/// left_label / right_label index the configured room-type label list and describe the
/// room on each side of a->b; "left" is the side of the normal (-dy, dx) in the frame the
/// coordinates are expressed in.
struct WallSegmentInput {
  std::size_t corner_a{0};
  std::size_t corner_b{0};
  double thickness{0.0};  // <= 0 means "use the configured default"
  std::optional<std::size_t> left_label;
  std::optional<std::size_t> right_label;
};

/// Icon detection: door, window, annotation or furniture box.
struct IconDetection {
  std::string category;
  Box2 box;
  std::optional<OrientationHint> orientation;
};

/// Room-type prediction located by a box (e.g. a "bedroom" label icon).
struct RoomLabelPrediction {
  std::string label;
  Box2 box;
};

/// Memory: one FloorplanInput per conversion run, copied into the run state and
/// normalized there; the caller's copy is never modified.
/// Detector output for one floorplan, already parsed from its native format.
struct FloorplanInput {
  std::string name;  // scene id used by the serializers
  std::vector<Point2> corners;
  std::vector<WallSegmentInput> walls;
  std::vector<IconDetection> icons;
  std::vector<RoomLabelPrediction> room_labels;
};

}  // namespace archgraph::core
