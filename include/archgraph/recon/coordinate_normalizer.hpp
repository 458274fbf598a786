#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/geometry.hpp>
#include <archgraph/core/pipeline_stage.hpp>
#include <expected>

namespace archgraph::recon {

/// Pixel -> metric affine map: metric = (pixel - origin) * scale, with y negated when
/// flip_y is set (image rows grow downward, scene y grows upward).
class CoordinateTransform {
 public:
  /// Fails with InvalidConfig if scale_factor <= 0.
  [[nodiscard]] static std::expected<CoordinateTransform, archgraph::core::ConversionError>
  create(double scale_factor, bool flip_y, double origin_x, double origin_y);

  [[nodiscard]] static std::expected<CoordinateTransform, archgraph::core::ConversionError>
  from_config(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] archgraph::core::Point2 normalize(archgraph::core::Point2 pixel) const noexcept;
  [[nodiscard]] archgraph::core::Point2 denormalize(archgraph::core::Point2 metric) const noexcept;
  [[nodiscard]] archgraph::core::Box2 normalize(const archgraph::core::Box2& pixel) const noexcept;
  [[nodiscard]] double normalize_length(double pixels) const noexcept { return pixels * scale_; }

  /// True when the map reverses orientation, swapping the left and right sides of a wall.
  [[nodiscard]] bool mirrors() const noexcept { return flip_y_; }
  [[nodiscard]] double scale_factor() const noexcept { return scale_; }

 private:
  CoordinateTransform(double scale, bool flip_y, archgraph::core::Point2 origin)
      : scale_(scale), flip_y_(flip_y), origin_(origin) {}

  double scale_;
  bool flip_y_;
  archgraph::core::Point2 origin_;
};

/// Applies the transform to corners, icon boxes, label boxes and wall thickness.
/// Positive thicknesses are scaled; non-positive ones are left for the graph builder.
[[nodiscard]] archgraph::core::FloorplanInput normalize_floorplan(
    const archgraph::core::FloorplanInput& input, const CoordinateTransform& transform);

/// Normalizes state.input in place. Must run before every other stage.
class NormalizeStage : public archgraph::core::IPipelineStage {
 public:
  explicit NormalizeStage(const archgraph::core::ReconstructionConfig& config);

  [[nodiscard]] std::expected<void, archgraph::core::ConversionError> process(
      archgraph::core::ReconstructionState& state) override;

 private:
  archgraph::core::ReconstructionConfig config_;
};

}  // namespace archgraph::recon
