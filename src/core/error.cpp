#include <archgraph/core/error.hpp>

namespace archgraph::core {

std::string_view error_name(ConversionError e) noexcept {
  switch (e) {
    case ConversionError::None:
      return "None";
    case ConversionError::InvalidConfig:
      return "ConfigError";
    case ConversionError::InvalidGeometry:
      return "GeometryError";
    case ConversionError::ReadFailed:
      return "ReadFailed";
    case ConversionError::WriteFailed:
      return "WriteFailed";
    default:
      return "Unknown";
  }
}

std::string_view anomaly_name(AnomalyKind k) noexcept {
  switch (k) {
    case AnomalyKind::Topology:
      return "TopologyError";
    case AnomalyKind::DegenerateFace:
      return "DegenerateFace";
    case AnomalyKind::DegenerateSegment:
      return "DegenerateSegment";
    case AnomalyKind::UnmatchedOpening:
      return "UnmatchedOpeningError";
    case AnomalyKind::UnattachedWall:
      return "UnattachedWallError";
    default:
      return "Unknown";
  }
}

}  // namespace archgraph::core
