#include <archgraph/core/config.hpp>
#include <algorithm>
#include <set>

namespace archgraph::core {

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

}  // namespace

std::size_t ReconstructionConfig::label_index(const std::string& label) const {
  const auto it = std::find(room_type_labels.begin(), room_type_labels.end(), label);
  return static_cast<std::size_t>(it - room_type_labels.begin());
}

bool ReconstructionConfig::is_room_label(const std::string& category) const {
  return contains(room_type_labels, category);
}

bool ReconstructionConfig::is_opening_category(const std::string& category) const {
  return contains(opening_categories, category);
}

bool ReconstructionConfig::is_window_category(const std::string& category) const {
  return contains(window_categories, category);
}

bool ReconstructionConfig::is_annotation_category(const std::string& category) const {
  return contains(annotation_categories, category);
}

bool ReconstructionConfig::is_ignored_category(const std::string& category) const {
  return contains(ignored_categories, category);
}

std::expected<void, ConversionError> validate_config(const ReconstructionConfig& config) {
  if (!(config.scale_factor > 0.0)) {
    return std::unexpected(ConversionError::InvalidConfig);
  }
  if (config.corner_snap_tolerance < 0.0 || config.opening_match_tolerance < 0.0 ||
      config.default_wall_thickness < 0.0 || config.straighten_cutoff_gradient < 0.0) {
    return std::unexpected(ConversionError::InvalidConfig);
  }
  if (config.max_face_steps == 0 || config.unknown_room_label.empty()) {
    return std::unexpected(ConversionError::InvalidConfig);
  }

  std::set<std::string> seen;
  for (const auto& label : config.room_type_labels) {
    if (label.empty() || !seen.insert(label).second) {
      return std::unexpected(ConversionError::InvalidConfig);
    }
  }
  return {};
}

}  // namespace archgraph::core
