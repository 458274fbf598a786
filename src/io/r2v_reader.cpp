#include <archgraph/io/r2v_reader.hpp>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace archgraph::io {

using namespace archgraph::core;

namespace {

constexpr std::string_view kWallCategory = "wall";

std::vector<std::string> split_fields(const std::string& line) {
  std::vector<std::string> fields;
  std::string field;
  for (char ch : line) {
    if (ch == '\t') {
      fields.push_back(std::move(field));
      field.clear();
    } else if (ch != '\r' && ch != '\n') {
      field.push_back(ch);
    }
  }
  fields.push_back(std::move(field));
  return fields;
}

template <typename T>
std::optional<T> parse_number(std::string_view s) {
  while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
  while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
  T value{};
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

bool blank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

/// Accumulates rows into a FloorplanInput, deduplicating corners by exact position.
class FloorplanBuilder {
 public:
  FloorplanBuilder(const ReconstructionConfig& config, const std::string& name)
      : config_(config) {
    plan_.name = name;
  }

  bool add_wall(const std::vector<std::string>& f, std::optional<std::size_t> left,
                std::optional<std::size_t> right) {
    const auto p = parse_box_corners(f);
    if (!p) return false;
    WallSegmentInput w;
    w.corner_a = corner(p->first);
    w.corner_b = corner(p->second);
    w.left_label = left;
    w.right_label = right;
    plan_.walls.push_back(w);
    return true;
  }

  bool add_icon(const std::vector<std::string>& f) {
    const auto p = parse_box_corners(f);
    if (!p || f.size() < 5 || f[4].empty()) return false;
    const Box2 box = Box2::from_corners(p->first, p->second);
    if (config_.is_room_label(f[4])) {
      plan_.room_labels.push_back(RoomLabelPrediction{f[4], box});
    } else {
      plan_.icons.push_back(IconDetection{f[4], box, std::nullopt});
    }
    return true;
  }

  FloorplanInput take() { return std::move(plan_); }

 private:
  static std::optional<std::pair<Point2, Point2>> parse_box_corners(
      const std::vector<std::string>& f) {
    if (f.size() < 4) return std::nullopt;
    const auto x1 = parse_number<double>(f[0]);
    const auto y1 = parse_number<double>(f[1]);
    const auto x2 = parse_number<double>(f[2]);
    const auto y2 = parse_number<double>(f[3]);
    if (!x1 || !y1 || !x2 || !y2) return std::nullopt;
    return std::make_pair(Point2{*x1, *y1}, Point2{*x2, *y2});
  }

  std::size_t corner(Point2 p) {
    const auto key = std::make_pair(p.x, p.y);
    const auto it = corner_index_.find(key);
    if (it != corner_index_.end()) return it->second;
    plan_.corners.push_back(p);
    corner_index_.emplace(key, plan_.corners.size() - 1);
    return plan_.corners.size() - 1;
  }

  const ReconstructionConfig& config_;
  FloorplanInput plan_;
  std::map<std::pair<double, double>, std::size_t> corner_index_;
};

std::string file_stem(const std::string& path) {
  return std::filesystem::path(path).stem().string();
}

}  // namespace

std::expected<FloorplanInput, ConversionError> read_r2v_output(
    std::istream& in, const ReconstructionConfig& config, const std::string& name) {
  FloorplanBuilder builder(config, name);
  std::string line;

  if (!std::getline(in, line)) return std::unexpected(ConversionError::InvalidGeometry);
  if (!std::getline(in, line)) return std::unexpected(ConversionError::InvalidGeometry);
  const auto wall_count = parse_number<std::size_t>(split_fields(line)[0]);
  if (!wall_count) return std::unexpected(ConversionError::InvalidGeometry);

  std::size_t walls_read = 0;
  while (std::getline(in, line)) {
    if (blank(line)) continue;
    const auto fields = split_fields(line);
    if (walls_read < *wall_count) {
      if (fields.size() != 6) return std::unexpected(ConversionError::InvalidGeometry);
      // The first label column names the (dy, -dx) side of the pixel-frame wall: its right.
      const auto right = parse_number<std::size_t>(fields[4]);
      const auto left = parse_number<std::size_t>(fields[5]);
      if (!left || !right || !builder.add_wall(fields, left, right)) {
        return std::unexpected(ConversionError::InvalidGeometry);
      }
      ++walls_read;
      continue;
    }
    if (fields.size() != 7 || !builder.add_icon(fields)) {
      return std::unexpected(ConversionError::InvalidGeometry);
    }
  }

  if (walls_read != *wall_count) return std::unexpected(ConversionError::InvalidGeometry);
  return builder.take();
}

std::expected<FloorplanInput, ConversionError> read_r2v_annotation(
    std::istream& in, const ReconstructionConfig& config, const std::string& name) {
  FloorplanBuilder builder(config, name);
  std::string line;
  while (std::getline(in, line)) {
    if (blank(line)) continue;
    const auto fields = split_fields(line);
    if (fields.size() != 7) return std::unexpected(ConversionError::InvalidGeometry);
    const bool ok = fields[4] == kWallCategory
                        ? builder.add_wall(fields, std::nullopt, std::nullopt)
                        : builder.add_icon(fields);
    if (!ok) return std::unexpected(ConversionError::InvalidGeometry);
  }
  return builder.take();
}

std::expected<FloorplanInput, ConversionError> read_r2v_output_file(
    const std::string& path, const ReconstructionConfig& config) {
  std::ifstream f(path);
  if (!f) return std::unexpected(ConversionError::ReadFailed);
  return read_r2v_output(f, config, file_stem(path));
}

std::expected<FloorplanInput, ConversionError> read_r2v_annotation_file(
    const std::string& path, const ReconstructionConfig& config) {
  std::ifstream f(path);
  if (!f) return std::unexpected(ConversionError::ReadFailed);
  return read_r2v_annotation(f, config, file_stem(path));
}

}  // namespace archgraph::io
