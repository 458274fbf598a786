#include <archgraph/io/sketch_renderer.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <limits>
#include <vector>

namespace archgraph::io {

using namespace archgraph::core;

namespace {

/// Metric plan -> image pixels; image rows grow downward.
class Canvas {
 public:
  Canvas(const SceneResult& scene, const SketchStyle& style) : style_(style) {
    double min_x = std::numeric_limits<double>::max();
    double min_y = min_x;
    double max_x = std::numeric_limits<double>::lowest();
    double max_y = max_x;
    auto extend = [&](Point2 p) {
      min_x = std::min(min_x, p.x);
      min_y = std::min(min_y, p.y);
      max_x = std::max(max_x, p.x);
      max_y = std::max(max_y, p.y);
    };
    for (const auto& w : scene.architecture.walls) {
      extend(w.start);
      extend(w.end);
    }
    for (const auto& r : scene.architecture.rooms) {
      for (const auto& p : r.polygon) extend(p);
    }
    if (min_x > max_x) {
      min_x = min_y = max_x = max_y = 0.0;
    }
    min_ = {min_x, min_y};
    max_ = {max_x, max_y};
  }

  [[nodiscard]] cv::Mat blank() const {
    const int w = static_cast<int>(std::ceil((max_.x - min_.x) * style_.pixels_per_meter)) +
                  2 * style_.margin + 1;
    const int h = static_cast<int>(std::ceil((max_.y - min_.y) * style_.pixels_per_meter)) +
                  2 * style_.margin + 1;
    return cv::Mat(h, w, CV_8UC3, style_.background);
  }

  [[nodiscard]] cv::Point to_pixel(Point2 p) const {
    return {static_cast<int>(std::lround((p.x - min_.x) * style_.pixels_per_meter)) +
                style_.margin,
            static_cast<int>(std::lround((max_.y - p.y) * style_.pixels_per_meter)) +
                style_.margin};
  }

  [[nodiscard]] std::vector<cv::Point> to_pixels(const std::vector<Point2>& polygon) const {
    std::vector<cv::Point> out;
    out.reserve(polygon.size());
    for (const auto& p : polygon) out.push_back(to_pixel(p));
    return out;
  }

 private:
  const SketchStyle& style_;
  Point2 min_;
  Point2 max_;
};

void fill_room(cv::Mat& img, const Canvas& canvas, const Room& room, const cv::Scalar& color) {
  std::vector<std::vector<cv::Point>> contours{canvas.to_pixels(room.polygon)};
  for (const auto& hole : room.holes) contours.push_back(canvas.to_pixels(hole));
  cv::fillPoly(img, contours, color);
}

}  // namespace

cv::Mat render_sketch(const SceneResult& scene, const std::string& focus_room_id,
                      const SketchStyle& style) {
  const Canvas canvas(scene, style);
  cv::Mat img = canvas.blank();

  std::vector<std::string> neighbours;
  for (const auto& overlay : scene.overlays) {
    if (overlay.room_id == focus_room_id) neighbours = overlay.door_neighbours;
  }

  for (const auto& room : scene.architecture.rooms) {
    cv::Scalar color = style.room_fill;
    if (room.id == focus_room_id) {
      color = style.focus_fill;
    } else if (std::find(neighbours.begin(), neighbours.end(), room.id) != neighbours.end()) {
      color = style.neighbour_fill;
    }
    fill_room(img, canvas, room, color);
  }

  for (const auto& wall : scene.architecture.walls) {
    cv::line(img, canvas.to_pixel(wall.start), canvas.to_pixel(wall.end), style.wall_color,
             style.wall_width, cv::LINE_AA);
  }

  for (const auto& opening : scene.architecture.openings) {
    const Wall* wall = scene.find_wall(opening.wall_id);
    if (!wall) continue;
    const double len = distance(wall->start, wall->end);
    if (len <= 0.0) continue;
    const Point2 dir = (wall->end - wall->start) * (1.0 / len);
    const Point2 a = wall->start + dir * opening.span_start;
    const Point2 b = wall->start + dir * opening.span_end;
    const cv::Scalar& color =
        opening.kind == OpeningClass::Door ? style.door_color : style.window_color;
    cv::line(img, canvas.to_pixel(a), canvas.to_pixel(b), color, style.opening_width);
  }
  return img;
}

std::expected<void, ConversionError> write_sketches(const SceneResult& scene,
                                                    const std::string& dir,
                                                    const SketchStyle& style) {
  const std::filesystem::path root(dir);
  auto save = [](const std::filesystem::path& path, const cv::Mat& img) {
    try {
      return cv::imwrite(path.string(), img);
    } catch (const cv::Exception&) {
      return false;  // unsupported extension or unwritable path
    }
  };

  for (const auto& room : scene.architecture.rooms) {
    if (!save(root / (room.id + ".png"), render_sketch(scene, room.id, style))) {
      return std::unexpected(ConversionError::WriteFailed);
    }
  }
  if (!save(root / "overview.png", render_sketch(scene, {}, style))) {
    return std::unexpected(ConversionError::WriteFailed);
  }
  return {};
}

}  // namespace archgraph::io
