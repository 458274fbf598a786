#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/pipeline.hpp>
#include <expected>

namespace archgraph::app {

/// Validates config, then wires the reconstruction stages in order: normalize, wall graph,
/// faces, room labels, openings, opening classification (no-op unless enabled), object
/// boxes, scene assembly. Invalid config: InvalidConfig, before any geometry work.
[[nodiscard]] std::expected<archgraph::core::Pipeline, archgraph::core::ConversionError>
make_pipeline(const archgraph::core::ReconstructionConfig& config);

}  // namespace archgraph::app
