#include <archgraph/io/scene_json_writer.hpp>
#include <algorithm>
#include <fstream>

namespace archgraph::io {

using namespace archgraph::core;

namespace {

/// Plan point (x, y) lifted to the floor plane of the y-up scene.
Json::Value point3(Point2 p) {
  Json::Value v(Json::arrayValue);
  v.append(p.x);
  v.append(0.0);
  v.append(p.y);
  return v;
}

Json::Value vec3(const std::array<double, 3>& a) {
  Json::Value v(Json::arrayValue);
  for (double c : a) v.append(c);
  return v;
}

Json::Value xyz(const std::array<double, 3>& a) {
  Json::Value v(Json::objectValue);
  v["x"] = a[0];
  v["y"] = a[1];
  v["z"] = a[2];
  return v;
}

Json::Value pair2(double a, double b) {
  Json::Value v(Json::arrayValue);
  v.append(a);
  v.append(b);
  return v;
}

Json::Value ring_points(const std::vector<Point2>& polygon) {
  Json::Value ring(Json::arrayValue);
  for (const auto& p : polygon) ring.append(point3(p));
  return ring;
}

/// Outline ring first, then one ring per hole.
Json::Value room_points(const Room& room) {
  Json::Value points(Json::arrayValue);
  points.append(ring_points(room.polygon));
  for (const auto& hole : room.holes) points.append(ring_points(hole));
  return points;
}

bool short_walled(const Room& room, const ArchDefaults& defaults) {
  const auto& types = defaults.short_wall_room_types;
  return std::find(types.begin(), types.end(), room.type) != types.end();
}

/// A wall is short when every room it bounds is short-walled.
bool is_short_wall(const SceneResult& scene, const Wall& wall, const ArchDefaults& defaults) {
  if (!defaults.adjust_short_walls || wall.room_ids.empty()) return false;
  return std::all_of(wall.room_ids.begin(), wall.room_ids.end(), [&](const std::string& id) {
    const Room* room = scene.find_room(id);
    return room && short_walled(*room, defaults);
  });
}

Json::Value wall_element(const SceneResult& scene, const Wall& wall,
                         const ArchDefaults& defaults) {
  Json::Value e(Json::objectValue);
  Json::Value room_ids(Json::arrayValue);
  for (const auto& id : wall.room_ids) room_ids.append(id);
  e["roomId"] = room_ids;
  e["id"] = wall.id;
  e["type"] = "Wall";

  Json::Value points(Json::arrayValue);
  points.append(point3(wall.start));
  points.append(point3(wall.end));
  e["points"] = points;

  Json::Value holes(Json::arrayValue);
  for (const auto& opening : scene.architecture.openings) {
    if (opening.wall_id != wall.id) continue;
    const bool door = opening.kind == OpeningClass::Door;
    Json::Value hole(Json::objectValue);
    hole["id"] = opening.id;
    hole["type"] = door ? "Door" : "Window";
    Json::Value box(Json::objectValue);
    box["min"] = pair2(opening.span_start, door ? defaults.door_min_y : defaults.window_min_y);
    box["max"] = pair2(opening.span_end, door ? defaults.door_max_y : defaults.window_max_y);
    hole["box"] = box;
    holes.append(hole);
  }
  e["holes"] = holes;

  e["height"] = is_short_wall(scene, wall, defaults) ? defaults.short_wall_height
                                                     : defaults.wall_height;
  e["depth"] = wall.thickness > 0.0 ? wall.thickness : defaults.wall_depth;
  e["extra_height"] = defaults.wall_extra_height;
  return e;
}

}  // namespace

Json::Value scene_to_json(const SceneResult& scene, const ArchDefaults& defaults) {
  const ArchitectureScene& arch_in = scene.architecture;
  Json::Value elements(Json::arrayValue);
  Json::Value rooms(Json::arrayValue);

  for (const auto& room : arch_in.rooms) {
    Json::Value ceiling(Json::objectValue);
    ceiling["id"] = room.id + "_c";
    ceiling["roomId"] = room.id;
    ceiling["points"] = room_points(room);
    ceiling["type"] = "Ceiling";
    ceiling["offset"] = vec3({0.0, defaults.wall_height, 0.0});
    ceiling["depth"] = defaults.ceiling_depth;
    elements.append(ceiling);

    Json::Value floor(Json::objectValue);
    floor["id"] = room.id + "_f";
    floor["roomId"] = room.id;
    floor["points"] = room_points(room);
    floor["type"] = "Floor";
    floor["depth"] = defaults.floor_depth;
    elements.append(floor);

    Json::Value r(Json::objectValue);
    r["id"] = room.id;
    Json::Value types(Json::arrayValue);
    types.append(room.type);
    r["types"] = types;
    rooms.append(r);
  }

  for (const auto& wall : arch_in.walls) {
    elements.append(wall_element(scene, wall, defaults));
  }

  Json::Value rdr(Json::arrayValue);
  for (const auto& opening : arch_in.openings) {
    if (opening.kind != OpeningClass::Door || opening.room_ids.empty()) continue;
    auto triple = [&](const std::string& from, const Json::Value& to) {
      Json::Value t(Json::arrayValue);
      t.append(from);
      t.append(opening.id);
      t.append(to);
      rdr.append(t);
    };
    if (opening.interior()) {
      triple(opening.room_ids[0], Json::Value(opening.room_ids[1]));
      triple(opening.room_ids[1], Json::Value(opening.room_ids[0]));
    } else {
      triple(opening.room_ids[0], Json::Value(Json::nullValue));
    }
  }

  Json::Value wall_defaults(Json::objectValue);
  wall_defaults["depth"] = defaults.wall_depth;
  wall_defaults["extraHeight"] = defaults.wall_extra_height;
  Json::Value arch_defaults(Json::objectValue);
  arch_defaults["Wall"] = wall_defaults;
  arch_defaults["Ceiling"]["depth"] = defaults.ceiling_depth;
  arch_defaults["Floor"]["depth"] = defaults.floor_depth;

  Json::Value arch(Json::objectValue);
  arch["id"] = arch_in.id;
  arch["version"] = defaults.version;
  arch["defaults"] = arch_defaults;
  arch["elements"] = elements;
  arch["rooms"] = rooms;
  arch["rdr"] = rdr;

  Json::Value s(Json::objectValue);
  s["up"] = xyz(defaults.up);
  s["front"] = xyz(defaults.front);
  s["unit"] = defaults.scale_to_meters;
  s["assetSource"] = Json::Value(Json::arrayValue);
  s["assetSource"].append(defaults.asset_source);
  s["arch"] = arch;
  s["object"] = Json::Value(Json::arrayValue);

  Json::Value root(Json::objectValue);
  root["format"] = "sceneState";
  root["scene"] = s;
  root["selected"] = Json::Value(Json::arrayValue);
  return root;
}

Json::Value objects_to_json(const SceneResult& scene) {
  Json::Value objects(Json::arrayValue);
  for (const auto& obj : scene.objects) {
    Json::Value o(Json::objectValue);
    o["type"] = obj.category;
    o["bound_box"]["p1"] = pair2(obj.box.min.x, obj.box.min.y);
    o["bound_box"]["p2"] = pair2(obj.box.max.x, obj.box.max.y);
    objects.append(o);
  }
  Json::Value root(Json::objectValue);
  root["objects"] = objects;
  return root;
}

std::string to_json_string(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  builder["precision"] = 10;
  return Json::writeString(builder, value);
}

std::expected<void, ConversionError> write_json_file(const Json::Value& value,
                                                     const std::string& path) {
  std::ofstream f(path);
  if (!f) return std::unexpected(ConversionError::WriteFailed);
  f << to_json_string(value) << '\n';
  if (!f) return std::unexpected(ConversionError::WriteFailed);
  return {};
}

}  // namespace archgraph::io
