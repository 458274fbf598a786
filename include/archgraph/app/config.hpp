#pragma once

#include <archgraph/core/config.hpp>
#include <archgraph/io/scene_json_writer.hpp>
#include <string>
#include <vector>

namespace archgraph::app {

/// Application configuration: reconstruction parameters, scene defaults, output switches.
struct AppConfig {
  archgraph::core::ReconstructionConfig reconstruction;
  archgraph::io::ArchDefaults arch;
  bool write_previews{true};
  bool skip_objects{false};
  std::vector<std::string> warnings;  // unreadable file or malformed entries; defaults kept
};

/// Load config from a simple key=value file (one per line, '#' comments, lists comma
/// separated) on top of default_config(). Unknown keys are ignored.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

}  // namespace archgraph::app
