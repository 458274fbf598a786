#include <archgraph/recon/object_box_builder.hpp>
#include <utility>

namespace archgraph::recon {

using namespace archgraph::core;

std::vector<ObjectBox> build_object_boxes(const FloorplanInput& input,
                                          const ReconstructionConfig& config) {
  std::vector<ObjectBox> out;
  for (const auto& icon : input.icons) {
    if (config.is_opening_category(icon.category) || config.is_room_label(icon.category) ||
        config.is_annotation_category(icon.category) ||
        config.is_ignored_category(icon.category)) {
      continue;
    }
    out.push_back(ObjectBox{icon.category, icon.box});
  }
  return out;
}

ObjectBoxStage::ObjectBoxStage(const ReconstructionConfig& config) : config_(config) {}

std::expected<void, ConversionError> ObjectBoxStage::process(ReconstructionState& state) {
  for (auto& box : build_object_boxes(state.input, config_)) {
    state.objects.push_back(std::move(box));
  }
  return {};
}

}  // namespace archgraph::recon
