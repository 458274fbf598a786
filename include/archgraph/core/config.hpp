#pragma once

#include <archgraph/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace archgraph::core {

enum class Axis : std::uint8_t {
  X,
  Y,
};

/// Preference between equally distant host wall candidates.
enum class HostTieBreak : std::uint8_t {
  ShorterWall,
  LongerWall,
};

/// Reconstruction parameters. Passed by const reference into every stage; never mutated
/// during a run, so one instance can back any number of concurrent runs.
struct ReconstructionConfig {
  // Coordinate frame: metric = (pixel - origin) * scale_factor, y negated when flip_y.
  double scale_factor{0.01};
  bool flip_y{true};
  double origin_x{0.0};
  double origin_y{0.0};

  std::vector<std::string> room_type_labels{
      "outside", "living_room", "kitchen", "bedroom", "bathroom",
      "restroom", "balcony", "closet", "corridor", "washing_room",
      "PS", "stairs"};
  std::string unknown_room_label{"unknown"};
  std::string exterior_room_label{"outside"};

  // Metric units (after normalization).
  double default_wall_thickness{0.1};
  double opening_match_tolerance{0.1};
  double corner_snap_tolerance{0.02};

  std::size_t max_face_steps{500};

  bool split_walls{true};
  std::size_t split_walls_max_iterations{100};

  bool straighten_walls{false};
  double straighten_cutoff_gradient{0.05};
  std::size_t straighten_max_iterations{10};

  bool classify_openings{false};
  std::vector<std::string> opening_categories{"door", "window"};
  // Opening categories resolved as windows; every other opening category is a door.
  std::vector<std::string> window_categories{"window"};
  std::vector<std::string> annotation_categories{"entrance"};
  std::vector<std::string> ignored_categories{"wall"};

  Axis room_order_primary_axis{Axis::X};
  HostTieBreak host_tie_break{HostTieBreak::ShorterWall};

  /// Index of label in room_type_labels, or room_type_labels.size() if absent.
  [[nodiscard]] std::size_t label_index(const std::string& label) const;
  [[nodiscard]] bool is_room_label(const std::string& category) const;
  [[nodiscard]] bool is_opening_category(const std::string& category) const;
  [[nodiscard]] bool is_window_category(const std::string& category) const;
  [[nodiscard]] bool is_annotation_category(const std::string& category) const;
  [[nodiscard]] bool is_ignored_category(const std::string& category) const;
};

/// Rejects scale factor <= 0, negative tolerances or thickness, empty or duplicate
/// labels, an empty unknown label and a zero face step bound.
[[nodiscard]] std::expected<void, ConversionError> validate_config(
    const ReconstructionConfig& config);

}  // namespace archgraph::core
