#pragma once

#include <archgraph/core/room_faces.hpp>
#include <archgraph/core/wall_graph.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace archgraph::core {

enum class OpeningClass : std::uint8_t {
  Door,
  Window,
};

[[nodiscard]] std::string_view opening_class_name(OpeningClass c) noexcept;

/// Opening bound to its host wall segment.
struct ResolvedOpening {
  std::size_t icon_index{0};
  std::string category;
  OpeningClass kind{OpeningClass::Door};
  SegmentId host{0};
  double span_start{0.0};  // metric offset from the host's corner a
  double span_end{0.0};
  double position{0.0};    // normalized centre along the host, 0..1
  std::vector<FaceId> rooms;
};

}  // namespace archgraph::core
