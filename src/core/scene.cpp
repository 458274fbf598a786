#include <archgraph/core/scene.hpp>
#include <algorithm>

namespace archgraph::core {

std::string_view opening_class_name(OpeningClass c) noexcept {
  switch (c) {
    case OpeningClass::Door:
      return "door";
    case OpeningClass::Window:
      return "window";
    default:
      return "unknown";
  }
}

const Room* SceneResult::find_room(const std::string& id) const {
  const auto& rooms = architecture.rooms;
  const auto it = std::find_if(rooms.begin(), rooms.end(),
                               [&](const Room& r) { return r.id == id; });
  return it == rooms.end() ? nullptr : &*it;
}

const Wall* SceneResult::find_wall(const std::string& id) const {
  const auto& walls = architecture.walls;
  const auto it = std::find_if(walls.begin(), walls.end(),
                               [&](const Wall& w) { return w.id == id; });
  return it == walls.end() ? nullptr : &*it;
}

}  // namespace archgraph::core
