#include <archgraph/core/room_faces.hpp>

namespace archgraph::core {

bool Face::contains(Point2 p) const {
  if (!point_in_polygon(p, polygon)) return false;
  for (const auto& hole : holes) {
    if (point_in_polygon(p, hole)) return false;
  }
  return true;
}

std::vector<FaceId> FaceSet::faces_of_segment(SegmentId s) const {
  std::vector<FaceId> out;
  const HalfEdgeId forward = 2 * s;
  if (forward + 1 >= half_edge_face.size()) return out;
  const FaceId left = half_edge_face[forward];
  const FaceId right = half_edge_face[forward + 1];
  if (left != kNoFace) out.push_back(left);
  if (right != kNoFace && right != left) out.push_back(right);
  return out;
}

}  // namespace archgraph::core
