#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace archgraph::core {

/// Fatal conversion errors; used with std::expected. A run that hits one produces no output.
enum class ConversionError {
  None = 0,
  InvalidConfig,    // non-positive scale factor, malformed label list, ...
  InvalidGeometry,  // out-of-range corner index, malformed detector rows
  ReadFailed,
  WriteFailed,
};

/// Non-fatal anomaly kinds, recorded while the run continues.
enum class AnomalyKind : std::uint8_t {
  Topology,           // half-edge trace did not close within the step bound
  DegenerateFace,     // closed walk that is not a simple polygon
  DegenerateSegment,  // zero-length wall after corner snapping
  UnmatchedOpening,   // opening icon with no host wall; emitted as an object box
  UnattachedWall,     // opening hosted by a wall that bounds no room
};

/// One recorded anomaly. source_index refers to the input element that caused it
/// (wall index, icon index or half-edge id, depending on kind).
struct Anomaly {
  AnomalyKind kind{AnomalyKind::Topology};
  std::string detail;
  std::optional<std::size_t> source_index;
};

[[nodiscard]] std::string_view error_name(ConversionError e) noexcept;
[[nodiscard]] std::string_view anomaly_name(AnomalyKind k) noexcept;

}  // namespace archgraph::core
