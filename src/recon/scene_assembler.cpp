#include <archgraph/recon/scene_assembler.hpp>
#include <algorithm>
#include <numeric>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace archgraph::recon {

using namespace archgraph::core;

namespace {

std::string wall_id(SegmentId s) { return "wall_" + std::to_string(s); }

}  // namespace

SceneResult assemble_scene(ReconstructionState& state, const ReconstructionConfig& config) {
  const auto& faces = state.faces.faces;
  const WallGraph& graph = state.graph;
  SceneResult result;
  ArchitectureScene& arch = result.architecture;
  arch.id = state.input.name;

  // Rooms
  std::vector<FaceId> face_order(faces.size());
  std::iota(face_order.begin(), face_order.end(), FaceId{0});
  const bool x_first = config.room_order_primary_axis == Axis::X;
  std::sort(face_order.begin(), face_order.end(), [&](FaceId l, FaceId r) {
    const Point2 cl = faces[l].centroid;
    const Point2 cr = faces[r].centroid;
    const auto kl = x_first ? std::tie(cl.x, cl.y, l) : std::tie(cl.y, cl.x, l);
    const auto kr = x_first ? std::tie(cr.x, cr.y, r) : std::tie(cr.y, cr.x, r);
    return kl < kr;
  });

  std::vector<std::size_t> rank_of(faces.size());
  std::vector<std::string> room_id_of(faces.size());
  for (std::size_t k = 0; k < face_order.size(); ++k) {
    rank_of[face_order[k]] = k;
    room_id_of[face_order[k]] = "room_" + std::to_string(k);
  }

  for (FaceId f : face_order) {
    const Face& face = faces[f];
    Room room;
    room.id = room_id_of[f];
    room.type = face.label;
    room.polygon = face.polygon;
    room.holes = face.holes;
    room.centroid = face.centroid;
    room.area = face.area;
    room.annotations = face.annotations;
    auto add_wall = [&](HalfEdgeId h) {
      std::string id = wall_id(h / 2);
      if (std::find(room.wall_ids.begin(), room.wall_ids.end(), id) == room.wall_ids.end()) {
        room.wall_ids.push_back(std::move(id));
      }
    };
    for (HalfEdgeId h : face.half_edges) add_wall(h);
    for (HalfEdgeId h : face.hole_half_edges) add_wall(h);
    arch.rooms.push_back(std::move(room));
  }

  // Room ids of faces, in room order.
  auto room_ids = [&](std::vector<FaceId> fs) {
    std::sort(fs.begin(), fs.end(), [&](FaceId l, FaceId r) { return rank_of[l] < rank_of[r]; });
    std::vector<std::string> ids;
    for (FaceId f : fs) ids.push_back(room_id_of[f]);
    return ids;
  };

  // Walls
  for (SegmentId s = 0; s < graph.segments().size(); ++s) {
    const WallSegment& seg = graph.segment(s);
    Wall wall;
    wall.id = wall_id(s);
    wall.start = graph.corner(seg.a);
    wall.end = graph.corner(seg.b);
    wall.thickness = seg.thickness;
    wall.room_ids = room_ids(state.faces.faces_of_segment(s));
    arch.walls.push_back(std::move(wall));
  }

  // Openings
  auto openings = state.openings;
  std::sort(openings.begin(), openings.end(),
            [](const ResolvedOpening& l, const ResolvedOpening& r) {
              return std::tie(l.host, l.span_start, l.icon_index) <
                     std::tie(r.host, r.span_start, r.icon_index);
            });
  for (std::size_t k = 0; k < openings.size(); ++k) {
    const ResolvedOpening& src = openings[k];
    Opening opening;
    opening.id = "opening_" + std::to_string(k);
    opening.kind = src.kind;
    opening.category = src.category;
    opening.wall_id = wall_id(src.host);
    opening.position = src.position;
    opening.span_start = src.span_start;
    opening.span_end = src.span_end;
    opening.room_ids = room_ids(src.rooms);

    if (opening.interior()) {
      arch.adjacency.push_back(
          AdjacencyEdge{opening.room_ids[0], opening.room_ids[1], opening.id, opening.kind});
    }
    arch.openings.push_back(std::move(opening));
  }

  // Objects
  result.objects = std::move(state.objects);
  std::stable_sort(result.objects.begin(), result.objects.end(),
                   [](const ObjectBox& l, const ObjectBox& r) {
                     return std::tie(l.category, l.box.min.x, l.box.min.y) <
                            std::tie(r.category, r.box.min.x, r.box.min.y);
                   });

  // Overlays
  for (const Room& room : arch.rooms) {
    RoomOverlay overlay;
    overlay.room_id = room.id;
    std::set<std::string> neighbours;
    for (const auto& edge : arch.adjacency) {
      if (edge.kind != OpeningClass::Door) continue;
      if (edge.room_a == room.id) neighbours.insert(edge.room_b);
      if (edge.room_b == room.id) neighbours.insert(edge.room_a);
    }
    overlay.door_neighbours.assign(neighbours.begin(), neighbours.end());
    for (const auto& opening : arch.openings) {
      if (std::find(room.wall_ids.begin(), room.wall_ids.end(), opening.wall_id) !=
          room.wall_ids.end()) {
        overlay.opening_ids.push_back(opening.id);
      }
    }
    result.overlays.push_back(std::move(overlay));
  }

  result.anomalies = std::move(state.anomalies);
  return result;
}

SceneAssembleStage::SceneAssembleStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> SceneAssembleStage::process(ReconstructionState& state) {
  state.result = assemble_scene(state, config_);
  return {};
}

}  // namespace archgraph::recon
