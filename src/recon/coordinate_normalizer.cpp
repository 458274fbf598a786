#include <archgraph/recon/coordinate_normalizer.hpp>
#include <utility>

namespace archgraph::recon {

using namespace archgraph::core;

std::expected<CoordinateTransform, ConversionError> CoordinateTransform::create(
    double scale_factor, bool flip_y, double origin_x, double origin_y) {
  if (!(scale_factor > 0.0)) {
    return std::unexpected(ConversionError::InvalidConfig);
  }
  return CoordinateTransform(scale_factor, flip_y, Point2{origin_x, origin_y});
}

std::expected<CoordinateTransform, ConversionError> CoordinateTransform::from_config(
    const ReconstructionConfig& config) {
  return create(config.scale_factor, config.flip_y, config.origin_x, config.origin_y);
}

Point2 CoordinateTransform::normalize(Point2 pixel) const noexcept {
  const Point2 shifted = pixel - origin_;
  return {shifted.x * scale_, (flip_y_ ? -shifted.y : shifted.y) * scale_};
}

Point2 CoordinateTransform::denormalize(Point2 metric) const noexcept {
  const double y = metric.y / scale_;
  return Point2{metric.x / scale_, flip_y_ ? -y : y} + origin_;
}

Box2 CoordinateTransform::normalize(const Box2& pixel) const noexcept {
  return Box2::from_corners(normalize(pixel.min), normalize(pixel.max));
}

FloorplanInput normalize_floorplan(const FloorplanInput& input,
                                   const CoordinateTransform& transform) {
  FloorplanInput out;
  out.name = input.name;

  out.corners.reserve(input.corners.size());
  for (const auto& c : input.corners) {
    out.corners.push_back(transform.normalize(c));
  }

  out.walls = input.walls;
  for (auto& w : out.walls) {
    if (w.thickness > 0.0) {
      w.thickness = transform.normalize_length(w.thickness);
    }
    if (transform.mirrors()) {
      std::swap(w.left_label, w.right_label);
    }
  }

  out.icons = input.icons;
  for (auto& icon : out.icons) {
    icon.box = transform.normalize(icon.box);
  }

  out.room_labels = input.room_labels;
  for (auto& label : out.room_labels) {
    label.box = transform.normalize(label.box);
  }
  return out;
}

NormalizeStage::NormalizeStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> NormalizeStage::process(ReconstructionState& state) {
  auto transform = CoordinateTransform::from_config(config_);
  if (!transform) {
    return std::unexpected(transform.error());
  }
  state.input = normalize_floorplan(state.raw, *transform);
  return {};
}

}  // namespace archgraph::recon
