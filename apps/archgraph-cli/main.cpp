/**
 * archgraph-cli: convert raster-to-vector floorplan output into scene.json / objectaabb.json.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/archgraph_cli [options] <output_dir> <source> [<source> ...]
 * One source writes into output_dir; several sources write into output_dir/<source stem>/.
 */

#include <archgraph/app/config.hpp>
#include <archgraph/app/pipeline_factory.hpp>
#include <archgraph/app/pipeline_runner.hpp>
#include <archgraph/core/error.hpp>
#include <archgraph/core/floorplan.hpp>
#include <archgraph/core/pipeline.hpp>
#include <archgraph/core/scene.hpp>
#include <archgraph/io/r2v_reader.hpp>
#include <archgraph/io/scene_json_writer.hpp>
#include <archgraph/io/sketch_renderer.hpp>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: archgraph_cli [options] <output_dir> <source> [<source> ...]\n"
            << "  --config <path>        Config (key=value file); default: built-in\n"
            << "  --annot                Sources are R2V annotation files, not R2V output\n"
            << "  --scale-factor <f>     Override metres per pixel\n"
            << "  --classify-openings    Classify doors/windows from room topology\n"
            << "  --no-previews          Do not write PNG sketches\n"
            << "  --skip-objects         Do not write objectaabb.json\n"
            << "  --workers <n>          Parallel workers for several sources (0 = all cores)\n";
}

void report_anomalies(const std::string& name, const archgraph::core::SceneResult& scene) {
  for (const auto& a : scene.anomalies) {
    std::cerr << "Warning: " << name << ": " << archgraph::core::anomaly_name(a.kind) << ": "
              << a.detail << "\n";
  }
}

/// Writes the outputs of one floorplan; returns false on the first write failure.
bool save_outputs(const archgraph::core::SceneResult& scene, const archgraph::app::AppConfig& cfg,
                  const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    std::cerr << "Failed to create " << dir << ": " << ec.message() << "\n";
    return false;
  }

  const auto scene_path = (dir / "scene.json").string();
  if (!archgraph::io::write_json_file(archgraph::io::scene_to_json(scene, cfg.arch), scene_path)) {
    std::cerr << "Failed to write " << scene_path << "\n";
    return false;
  }
  std::cout << "Saved " << scene_path << "\n";

  if (!cfg.skip_objects) {
    const auto objects_path = (dir / "objectaabb.json").string();
    if (!archgraph::io::write_json_file(archgraph::io::objects_to_json(scene), objects_path)) {
      std::cerr << "Failed to write " << objects_path << "\n";
      return false;
    }
    std::cout << "Saved " << objects_path << "\n";
  }

  if (cfg.write_previews) {
    const auto preview_dir = dir / "previews";
    std::filesystem::create_directories(preview_dir, ec);
    if (ec || !archgraph::io::write_sketches(scene, preview_dir.string())) {
      std::cerr << "Failed to write sketches to " << preview_dir << "\n";
      return false;
    }
    std::cout << "Saved sketches to " << preview_dir << "\n";
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string scale_override;
  bool annotation_input = false;
  bool classify_override = false;
  bool no_previews = false;
  bool skip_objects = false;
  std::string workers_arg;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--scale-factor" && i + 1 < argc) {
      scale_override = argv[++i];
    } else if (arg == "--workers" && i + 1 < argc) {
      workers_arg = argv[++i];
    } else if (arg == "--annot") {
      annotation_input = true;
    } else if (arg == "--classify-openings") {
      classify_override = true;
    } else if (arg == "--no-previews") {
      no_previews = true;
    } else if (arg == "--skip-objects") {
      skip_objects = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option " << arg << "\n";
      print_usage();
      return 1;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() < 2) {
    print_usage();
    return 1;
  }

  archgraph::app::AppConfig cfg = config_path.empty() ? archgraph::app::default_config()
                                                      : archgraph::app::load_config(config_path);
  for (const auto& w : cfg.warnings) {
    std::cerr << "Warning: " << w << "\n";
  }
  if (!scale_override.empty()) {
    try {
      cfg.reconstruction.scale_factor = std::stod(scale_override);
    } catch (const std::exception&) {
      std::cerr << "Invalid --scale-factor " << scale_override << "\n";
      return 1;
    }
  }
  std::size_t workers = 0;
  if (!workers_arg.empty()) {
    try {
      workers = static_cast<std::size_t>(std::stoul(workers_arg));
    } catch (const std::exception&) {
      std::cerr << "Invalid --workers " << workers_arg << "\n";
      return 1;
    }
  }
  if (classify_override) cfg.reconstruction.classify_openings = true;
  if (no_previews) cfg.write_previews = false;
  if (skip_objects) cfg.skip_objects = true;

  auto pipeline = archgraph::app::make_pipeline(cfg.reconstruction);
  if (!pipeline) {
    std::cerr << "Pipeline error: " << archgraph::core::error_name(pipeline.error()) << "\n";
    return 1;
  }

  const std::filesystem::path output_dir(positional[0]);
  const std::vector<std::string> sources(positional.begin() + 1, positional.end());

  std::vector<archgraph::core::FloorplanInput> floorplans;
  for (const auto& source : sources) {
    auto loaded = annotation_input
                      ? archgraph::io::read_r2v_annotation_file(source, cfg.reconstruction)
                      : archgraph::io::read_r2v_output_file(source, cfg.reconstruction);
    if (!loaded) {
      std::cerr << "Failed to load " << source << ": "
                << archgraph::core::error_name(loaded.error()) << "\n";
      return 1;
    }
    std::cout << "Loaded " << source << "\n";
    floorplans.push_back(std::move(*loaded));
  }

  if (floorplans.size() == 1) {
    auto result = archgraph::app::run_pipeline(*pipeline, floorplans.front());
    if (!result) {
      std::cerr << "Pipeline error: " << archgraph::core::error_name(result.error()) << "\n";
      return 1;
    }
    report_anomalies(floorplans.front().name, *result);
    return save_outputs(*result, cfg, output_dir) ? 0 : 1;
  }

  const std::vector<std::string> output_names = archgraph::app::batch_output_names(floorplans);
  std::mutex io_mutex;
  bool failed = false;
  archgraph::app::run_pipeline_batch_parallel(
      *pipeline, floorplans,
      [&](std::size_t i, const archgraph::core::SceneResult& scene) {
        std::lock_guard lock(io_mutex);
        report_anomalies(floorplans[i].name, scene);
        if (!save_outputs(scene, cfg, output_dir / output_names[i])) failed = true;
      },
      workers,
      [&](std::size_t i, archgraph::core::ConversionError e) {
        std::lock_guard lock(io_mutex);
        std::cerr << "Pipeline error: " << sources[i] << ": " << archgraph::core::error_name(e)
                  << "\n";
        failed = true;
      });
  return failed ? 1 : 0;
}
