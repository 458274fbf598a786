#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/scene.hpp>
#include <jsoncpp/json/json.h>
#include <array>
#include <expected>
#include <string>
#include <vector>

namespace archgraph::io {

/// Architectural defaults for the 3D scene description. Heights and depths are metric.
struct ArchDefaults {
  std::string version{"arch@1.0.2"};
  std::array<double, 3> up{0.0, 1.0, 0.0};
  std::array<double, 3> front{0.0, 0.0, 1.0};
  double scale_to_meters{1.0};
  std::string asset_source{"3dfModel"};

  double wall_height{2.8};
  double short_wall_height{1.0};
  double wall_depth{0.1};
  double wall_extra_height{0.035};
  double ceiling_depth{0.05};
  double floor_depth{0.05};

  double door_min_y{0.0};
  double door_max_y{2.1};
  double window_min_y{0.9};
  double window_max_y{2.1};

  bool adjust_short_walls{true};
  std::vector<std::string> short_wall_room_types{"balcony"};
};

/// scene.json document in the "sceneState" format: Floor and Ceiling elements per room,
/// one Wall element per wall with its openings as holes, the room list and the
/// room-door-room triples (exterior doors have a null target).
[[nodiscard]] Json::Value scene_to_json(const archgraph::core::SceneResult& scene,
                                        const ArchDefaults& defaults);

/// objectaabb.json document: {"objects": [{"type", "bound_box": {"p1", "p2"}}]}.
[[nodiscard]] Json::Value objects_to_json(const archgraph::core::SceneResult& scene);

/// Deterministic pretty-printed serialization.
[[nodiscard]] std::string to_json_string(const Json::Value& value);

[[nodiscard]] std::expected<void, archgraph::core::ConversionError> write_json_file(
    const Json::Value& value, const std::string& path);

}  // namespace archgraph::io
