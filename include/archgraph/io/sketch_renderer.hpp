#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/scene.hpp>
#include <opencv2/core/mat.hpp>
#include <opencv2/core/types.hpp>
#include <expected>
#include <string>

namespace archgraph::io {

/// Colours are BGR.
struct SketchStyle {
  double pixels_per_meter{50.0};
  int margin{20};
  int wall_width{2};
  int opening_width{4};
  cv::Scalar background{255, 255, 255};
  cv::Scalar room_fill{220, 220, 220};
  cv::Scalar focus_fill{80, 180, 80};
  cv::Scalar neighbour_fill{200, 160, 80};
  cv::Scalar wall_color{0, 0, 0};
  cv::Scalar door_color{0, 0, 255};
  cv::Scalar window_color{255, 128, 0};
};

/// Plan sketch with focus_room_id filled, its door-connected neighbours filled in a
/// second colour and every door and window marked on its wall. An empty or unknown
/// focus id draws the plain overview.
[[nodiscard]] cv::Mat render_sketch(const archgraph::core::SceneResult& scene,
                                    const std::string& focus_room_id,
                                    const SketchStyle& style = {});

/// Writes <dir>/<room id>.png for every room plus <dir>/overview.png.
[[nodiscard]] std::expected<void, archgraph::core::ConversionError> write_sketches(
    const archgraph::core::SceneResult& scene, const std::string& dir,
    const SketchStyle& style = {});

}  // namespace archgraph::io
