#pragma once

#include <archgraph/core/error.hpp>
#include <archgraph/core/geometry.hpp>
#include <archgraph/core/opening.hpp>
#include <optional>
#include <string>
#include <vector>

namespace archgraph::core {

struct Room {
  std::string id;
  std::string type;
  std::vector<Point2> polygon;  // counter-clockwise, metric
  std::vector<std::vector<Point2>> holes;  // clockwise, enclosed wall loops
  Point2 centroid;
  double area{0.0};
  std::vector<std::string> wall_ids;
  std::vector<std::string> annotations;
};

struct Wall {
  std::string id;
  Point2 start;
  Point2 end;
  double thickness{0.0};
  std::vector<std::string> room_ids;  // 0..2 rooms bounded by this wall
};

struct Opening {
  std::string id;
  OpeningClass kind{OpeningClass::Door};
  std::string category;
  std::string wall_id;
  double position{0.0};    // normalized centre along the wall
  double span_start{0.0};  // metric offsets from the wall start
  double span_end{0.0};
  std::vector<std::string> room_ids;  // 0..2

  [[nodiscard]] bool interior() const noexcept { return room_ids.size() == 2; }
};

/// Unordered room pair joined by an interior opening.
struct AdjacencyEdge {
  std::string room_a;
  std::string room_b;
  std::string opening_id;
  OpeningClass kind{OpeningClass::Door};
};

struct ArchitectureScene {
  std::string id;
  std::vector<Room> rooms;
  std::vector<Wall> walls;
  std::vector<Opening> openings;
  std::vector<AdjacencyEdge> adjacency;
};

struct ObjectBox {
  std::string category;
  Box2 box;
};

/// Per-room summary for the debug sketch renderer.
struct RoomOverlay {
  std::string room_id;
  std::vector<std::string> door_neighbours;
  std::vector<std::string> opening_ids;
};

/// Final output of one conversion run.
struct SceneResult {
  ArchitectureScene architecture;
  std::vector<ObjectBox> objects;
  std::vector<RoomOverlay> overlays;
  std::vector<Anomaly> anomalies;

  /// True when the run recorded no anomalies.
  [[nodiscard]] bool clean() const noexcept { return anomalies.empty(); }

  [[nodiscard]] const Room* find_room(const std::string& id) const;
  [[nodiscard]] const Wall* find_wall(const std::string& id) const;
};

}  // namespace archgraph::core
