#include <archgraph/app/config.hpp>
#include <charconv>
#include <fstream>
#include <string_view>

namespace archgraph::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

std::vector<std::string> parse_list(const std::string& value) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto comma = value.find(',', start);
    std::string item = value.substr(start, comma == std::string::npos ? std::string::npos
                                                                      : comma - start);
    trim(item);
    if (!item.empty()) out.push_back(std::move(item));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

/// Parses value into out; on failure leaves out untouched and records a warning.
template <typename T>
void set_number(const std::string& key, const std::string& value, T& out,
                std::vector<std::string>& warnings) {
  T parsed{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    warnings.push_back("invalid value for " + key + ": '" + value + "'");
    return;
  }
  out = parsed;
}

void set_bool(const std::string& key, const std::string& value, bool& out,
              std::vector<std::string>& warnings) {
  if (value == "true" || value == "1" || value == "yes") out = true;
  else if (value == "false" || value == "0" || value == "no") out = false;
  else warnings.push_back("invalid value for " + key + ": '" + value + "'");
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.write_previews = true;
  c.skip_objects = false;
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    c.warnings.push_back("cannot open config file " + path + ", using defaults");
    return c;
  }

  auto& r = c.reconstruction;
  auto& a = c.arch;
  auto& w = c.warnings;
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "scale_factor") set_number(key, value, r.scale_factor, w);
    else if (key == "flip_y") set_bool(key, value, r.flip_y, w);
    else if (key == "origin_x") set_number(key, value, r.origin_x, w);
    else if (key == "origin_y") set_number(key, value, r.origin_y, w);
    else if (key == "room_type_labels") r.room_type_labels = parse_list(value);
    else if (key == "unknown_room_label") r.unknown_room_label = value;
    else if (key == "exterior_room_label") r.exterior_room_label = value;
    else if (key == "default_wall_thickness") set_number(key, value, r.default_wall_thickness, w);
    else if (key == "opening_match_tolerance") set_number(key, value, r.opening_match_tolerance, w);
    else if (key == "corner_snap_tolerance") set_number(key, value, r.corner_snap_tolerance, w);
    else if (key == "max_face_steps") set_number(key, value, r.max_face_steps, w);
    else if (key == "split_walls") set_bool(key, value, r.split_walls, w);
    else if (key == "split_walls_max_iterations") set_number(key, value, r.split_walls_max_iterations, w);
    else if (key == "straighten_walls") set_bool(key, value, r.straighten_walls, w);
    else if (key == "straighten_cutoff_gradient") set_number(key, value, r.straighten_cutoff_gradient, w);
    else if (key == "straighten_max_iterations") set_number(key, value, r.straighten_max_iterations, w);
    else if (key == "classify_openings") set_bool(key, value, r.classify_openings, w);
    else if (key == "opening_categories") r.opening_categories = parse_list(value);
    else if (key == "window_categories") r.window_categories = parse_list(value);
    else if (key == "annotation_categories") r.annotation_categories = parse_list(value);
    else if (key == "ignored_categories") r.ignored_categories = parse_list(value);
    else if (key == "room_order_primary_axis") {
      if (value == "x") r.room_order_primary_axis = core::Axis::X;
      else if (value == "y") r.room_order_primary_axis = core::Axis::Y;
      else w.push_back("invalid value for " + key + ": '" + value + "'");
    }
    else if (key == "host_tie_break") {
      if (value == "shorter") r.host_tie_break = core::HostTieBreak::ShorterWall;
      else if (value == "longer") r.host_tie_break = core::HostTieBreak::LongerWall;
      else w.push_back("invalid value for " + key + ": '" + value + "'");
    }
    else if (key == "arch_version") a.version = value;
    else if (key == "scale_to_meters") set_number(key, value, a.scale_to_meters, w);
    else if (key == "wall_height") set_number(key, value, a.wall_height, w);
    else if (key == "short_wall_height") set_number(key, value, a.short_wall_height, w);
    else if (key == "wall_depth") set_number(key, value, a.wall_depth, w);
    else if (key == "wall_extra_height") set_number(key, value, a.wall_extra_height, w);
    else if (key == "ceiling_depth") set_number(key, value, a.ceiling_depth, w);
    else if (key == "floor_depth") set_number(key, value, a.floor_depth, w);
    else if (key == "door_min_y") set_number(key, value, a.door_min_y, w);
    else if (key == "door_max_y") set_number(key, value, a.door_max_y, w);
    else if (key == "window_min_y") set_number(key, value, a.window_min_y, w);
    else if (key == "window_max_y") set_number(key, value, a.window_max_y, w);
    else if (key == "adjust_short_walls") set_bool(key, value, a.adjust_short_walls, w);
    else if (key == "short_wall_room_types") a.short_wall_room_types = parse_list(value);
    else if (key == "write_previews") set_bool(key, value, c.write_previews, w);
    else if (key == "skip_objects") set_bool(key, value, c.skip_objects, w);
  }
  return c;
}

}  // namespace archgraph::app
