#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <expected>
#include <istream>
#include <string>

namespace archgraph::io {

/// Parses raster-to-vector detector output (tab separated):
///   line 0: image width and height (ignored)
///   line 1: wall count N
///   N wall rows: x1 y1 x2 y2 right_label left_label
///     (right is the (dy, -dx) side in pixel coordinates, left the (-dy, dx) side)
///   icon rows:   x1 y1 x2 y2 category d1 d2
/// Wall endpoints are deduplicated by exact coordinate into corners. Icons whose
/// category is a configured room type become room label predictions.
/// Malformed rows fail with InvalidGeometry.
[[nodiscard]] std::expected<archgraph::core::FloorplanInput, archgraph::core::ConversionError>
read_r2v_output(std::istream& in, const archgraph::core::ReconstructionConfig& config,
                const std::string& name);

/// Parses a raster-to-vector annotation file: every row is x1 y1 x2 y2 category d1 d2;
/// rows with category "wall" are walls without side labels.
[[nodiscard]] std::expected<archgraph::core::FloorplanInput, archgraph::core::ConversionError>
read_r2v_annotation(std::istream& in, const archgraph::core::ReconstructionConfig& config,
                    const std::string& name);

/// File overloads. The scene name is the file stem. Unreadable file: ReadFailed.
[[nodiscard]] std::expected<archgraph::core::FloorplanInput, archgraph::core::ConversionError>
read_r2v_output_file(const std::string& path, const archgraph::core::ReconstructionConfig& config);

[[nodiscard]] std::expected<archgraph::core::FloorplanInput, archgraph::core::ConversionError>
read_r2v_annotation_file(const std::string& path,
                         const archgraph::core::ReconstructionConfig& config);

}  // namespace archgraph::io
